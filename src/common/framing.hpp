// SPDX-License-Identifier: Apache-2.0
// Length-prefixed framing: 4-byte big-endian payload length followed by the payload bytes.
#pragma once
#include <arpa/inet.h>

#include <cstdint>
#include <cstring>
#include <string>
#include <string_view>
#include <vector>

namespace ttt::netutil {

// Largest accepted payload; a full game_state with every entity stays far below this.
inline constexpr uint32_t kMaxFramePayload = 1u << 20;

inline void append_frame(std::string &out, std::string_view payload)
{
    uint32_t net = htonl(static_cast<uint32_t>(payload.size()));
    size_t offset = out.size();
    out.resize(offset + 4 + payload.size());
    std::memcpy(out.data() + offset, &net, 4);
    if (!payload.empty())
        std::memcpy(out.data() + offset + 4, payload.data(), payload.size());
}

inline std::string build_frame(std::string_view payload)
{
    std::string frame;
    frame.reserve(4 + payload.size());
    append_frame(frame, payload);
    return frame;
}

enum class ExtractResult
{
    need_more,
    frame,
    invalid
};

struct FrameParseState
{
    std::vector<char> buffer; // bytes received but not yet consumed
    size_t consumed{0}; // prefix of buffer already handed out
};

// Extracts the next complete payload into out. `invalid` means the stream is corrupt
// (zero or oversized length) and the connection should be dropped.
inline ExtractResult try_extract(FrameParseState &st, std::string &out)
{
    size_t avail = st.buffer.size() - st.consumed;
    if (avail < 4)
        return ExtractResult::need_more;
    uint32_t net;
    std::memcpy(&net, st.buffer.data() + st.consumed, 4);
    uint32_t len = ntohl(net);
    if (len == 0 || len > kMaxFramePayload)
        return ExtractResult::invalid;
    if (avail < 4 + static_cast<size_t>(len))
        return ExtractResult::need_more;
    out.assign(st.buffer.data() + st.consumed + 4, len);
    st.consumed += 4 + len;
    if (st.consumed == st.buffer.size()) {
        st.buffer.clear();
        st.consumed = 0;
    } else if (st.consumed > 64 * 1024) {
        st.buffer.erase(st.buffer.begin(), st.buffer.begin() + static_cast<std::ptrdiff_t>(st.consumed));
        st.consumed = 0;
    }
    return ExtractResult::frame;
}

} // namespace ttt::netutil
