// SPDX-License-Identifier: Apache-2.0
// event_sink.hpp - Outbound half of the transport boundary.
#pragma once
#include "game.pb.h"

#include <string>

namespace ttt::game {

class IEventSink
{
public:
    virtual ~IEventSink() = default;
    // Delivers to one session; unknown ids (bots, closed sessions) are dropped.
    virtual void send_to(const std::string &session_id, const ttt::ServerMessage &msg) = 0;
    // Delivers to every session except `except` (empty = nobody excluded).
    virtual void broadcast(const ttt::ServerMessage &msg, const std::string &except = {}) = 0;
};

} // namespace ttt::game
