// SPDX-License-Identifier: Apache-2.0
#include "server/net/listener.hpp"

#include "common/framing.hpp"
#include "common/logger.hpp"
#include "game.pb.h"
#include "server/net/session_manager.hpp"

#include <coro/coro.hpp>
#include <coro/net/tcp/client.hpp>
#include <coro/net/tcp/server.hpp>
#include <coro/poll.hpp>

#include <span>
#include <string>
#include <vector>

namespace ttt::net {

static coro::task<void> connection_loop(
    std::shared_ptr<coro::io_scheduler> scheduler,
    std::shared_ptr<Session> session,
    std::chrono::milliseconds flush_interval);

coro::task<void> run_listener(
    std::shared_ptr<coro::io_scheduler> scheduler, uint16_t port, std::chrono::milliseconds flush_interval)
{
    co_await scheduler->schedule();
    ttt::log::info("[listener] listening on port {}", port);
    coro::net::tcp::server server{scheduler, coro::net::tcp::server::options{.port = port}};
    while (true) {
        auto status = co_await server.poll();
        if (status == coro::poll_status::event) {
            auto client = server.accept();
            if (client.socket().is_valid()) {
                auto session = instance().add_connection(std::move(client));
                scheduler->spawn(connection_loop(scheduler, session, flush_interval));
            }
        } else if (status == coro::poll_status::error || status == coro::poll_status::closed) {
            ttt::log::error("[listener] poll error/closed, exiting listener loop");
            co_return;
        }
    }
}

// Returns false when the peer is gone.
static coro::task<bool> send_all(coro::net::tcp::client &client, std::span<const char> data)
{
    std::span<const char> rest = data;
    while (!rest.empty()) {
        co_await client.poll(coro::poll_op::write);
        auto [s, remaining] = client.send(rest);
        if (s == coro::net::send_status::ok || s == coro::net::send_status::would_block) {
            rest = remaining;
            continue;
        }
        co_return false;
    }
    co_return true;
}

static coro::task<bool> flush_outbound(Session &session, std::vector<ttt::ServerMessage> pending)
{
    if (pending.empty())
        co_return true;
    std::string batch;
    batch.reserve(pending.size() * 64);
    std::string out;
    for (auto &msg : pending) {
        out.clear();
        if (!msg.SerializeToString(&out)) {
            ttt::log::warn("[conn] failed to serialize message for id={}", session.session_id);
            continue;
        }
        ttt::netutil::append_frame(batch, out);
    }
    co_return co_await send_all(*session.client, std::span<const char>(batch.data(), batch.size()));
}

static uint64_t wall_clock_ms()
{
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                     std::chrono::system_clock::now().time_since_epoch())
                                     .count());
}

static coro::task<void> connection_loop(
    std::shared_ptr<coro::io_scheduler> scheduler,
    std::shared_ptr<Session> session,
    std::chrono::milliseconds flush_interval)
{
    co_await scheduler->schedule();
    auto &mgr = instance();
    ttt::log::info("[conn] new connection id={}", session->session_id);
    ttt::netutil::FrameParseState fps;
    std::string tmp(4096, '\0');
    while (true) {
        if (!co_await flush_outbound(*session, mgr.drain_messages(session))) {
            ttt::log::info("[conn] send failed id={}", session->session_id);
            break;
        }
        if (mgr.is_closed(session))
            co_return; // closed by the heartbeat monitor
        auto pstat = co_await session->client->poll(coro::poll_op::read, flush_interval);
        if (pstat == coro::poll_status::timeout)
            continue;
        auto [rstatus, span] = session->client->recv(tmp);
        if (rstatus == coro::net::recv_status::closed) {
            ttt::log::info("[conn] closed by peer id={}", session->session_id);
            break;
        }
        if (rstatus != coro::net::recv_status::ok && rstatus != coro::net::recv_status::would_block) {
            ttt::log::warn("[conn] recv error id={}", session->session_id);
            break;
        }
        if (rstatus == coro::net::recv_status::ok)
            fps.buffer.insert(fps.buffer.end(), span.begin(), span.end());
        bool drop = false;
        std::string payload;
        while (!drop) {
            auto res = ttt::netutil::try_extract(fps, payload);
            if (res == ttt::netutil::ExtractResult::need_more)
                break;
            if (res == ttt::netutil::ExtractResult::invalid) {
                ttt::log::warn("[conn] invalid frame length, dropping id={}", session->session_id);
                drop = true;
                break;
            }
            ttt::ClientMessage cmsg;
            if (!cmsg.ParseFromArray(payload.data(), static_cast<int>(payload.size()))) {
                ttt::log::warn("[conn] failed to parse protobuf, dropping id={}", session->session_id);
                drop = true;
                break;
            }
            mgr.update_heartbeat(session);
            if (cmsg.has_heartbeat()) {
                ttt::ServerMessage hb;
                auto *hbr = hb.mutable_heartbeat_resp();
                hbr->set_session_id(session->session_id);
                hbr->set_client_time_ms(cmsg.heartbeat().time_ms());
                hbr->set_server_time_ms(wall_clock_ms());
                mgr.push_message(session, hb);
                continue;
            }
            mgr.post_message(session, std::move(cmsg));
        }
        if (drop)
            break;
    }
    mgr.disconnect_session(session);
}

} // namespace ttt::net
