// SPDX-License-Identifier: Apache-2.0
// session_manager.hpp - Transport-side session registry. Bridges connection coroutines and the
// single simulation coroutine: inbound events are queued here, outbound messages are queued per session.
#pragma once

#include "game.pb.h"
#include "server/game/event_sink.hpp"

#include <coro/net/tcp/client.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace ttt::net {

struct Session
{
    std::string session_id;
    bool closed{false};
    bool joined{false}; // set once the game_state snapshot is queued; broadcasts skip it until then
    std::chrono::steady_clock::time_point last_heartbeat{};
    std::unique_ptr<coro::net::tcp::client> client; // nullptr for sessions without a socket (tests)
    std::vector<ttt::ServerMessage> outgoing; // pending outbound messages

    Session(std::string sid, std::unique_ptr<coro::net::tcp::client> c)
        : session_id(std::move(sid)), client(std::move(c))
    {}
};

struct InboundEvent
{
    enum class Kind
    {
        Open,
        Close,
        Message
    };

    Kind kind{Kind::Message};
    std::string session_id;
    ttt::ClientMessage msg;
};

class SessionManager : public ttt::game::IEventSink
{
public:
    std::shared_ptr<Session> add_connection(coro::net::tcp::client client);
    // Registers a session (client may be null), assigns p_<n> and queues an Open event.
    std::shared_ptr<Session> add_session(std::unique_ptr<coro::net::tcp::client> client);
    // Removes the session and queues a Close event; repeated calls are no-ops.
    void disconnect_session(const std::shared_ptr<Session> &s);
    bool is_closed(const std::shared_ptr<Session> &s);

    void post_message(const std::shared_ptr<Session> &s, ttt::ClientMessage msg);
    std::vector<InboundEvent> drain_inbound();

    void push_message(const std::shared_ptr<Session> &s, const ttt::ServerMessage &msg);
    std::vector<ttt::ServerMessage> drain_messages(const std::shared_ptr<Session> &s);

    void update_heartbeat(const std::shared_ptr<Session> &s);
    // Open sessions whose last heartbeat is older than timeout at `now`.
    std::vector<std::shared_ptr<Session>> expired(
        std::chrono::steady_clock::time_point now, std::chrono::seconds timeout);
    std::vector<std::shared_ptr<Session>> snapshot_all_sessions();
    std::shared_ptr<Session> find(const std::string &session_id);

    // Queuing a game_state marks the session joined.
    void send_to(const std::string &session_id, const ttt::ServerMessage &msg) override;
    // Reaches joined sessions only.
    void broadcast(const ttt::ServerMessage &msg, const std::string &except = {}) override;

private:
    std::mutex m_mutex;
    uint64_t m_session_counter{0};
    std::unordered_map<std::string, std::shared_ptr<Session>> m_by_session;
    std::vector<InboundEvent> m_inbound;
};

// Global accessor used by the listener, heartbeat monitor and simulation loop.
SessionManager &instance();

} // namespace ttt::net
