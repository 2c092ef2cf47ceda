// SPDX-License-Identifier: Apache-2.0
#include "server/net/session_manager.hpp"

#include "common/logger.hpp"
#include "common/metrics.hpp"

namespace ttt::net {

SessionManager &instance()
{
    static SessionManager inst;
    return inst;
}

std::shared_ptr<Session> SessionManager::add_connection(coro::net::tcp::client client)
{
    return add_session(std::make_unique<coro::net::tcp::client>(std::move(client)));
}

std::shared_ptr<Session> SessionManager::add_session(std::unique_ptr<coro::net::tcp::client> client)
{
    std::scoped_lock lk{m_mutex};
    std::string sid = "p_" + std::to_string(++m_session_counter);
    auto s = std::make_shared<Session>(sid, std::move(client));
    s->last_heartbeat = std::chrono::steady_clock::now();
    // session_info must precede anything the simulation sends for this id.
    ttt::ServerMessage info;
    info.mutable_session_info()->set_session_id(sid);
    s->outgoing.push_back(std::move(info));
    m_by_session.emplace(sid, s);
    m_inbound.push_back(InboundEvent{InboundEvent::Kind::Open, sid, {}});
    ttt::metrics::runtime().connected_players.fetch_add(1, std::memory_order_relaxed);
    ttt::log::debug("[session] open id={} socket={}", sid, s->client != nullptr);
    return s;
}

void SessionManager::disconnect_session(const std::shared_ptr<Session> &s)
{
    std::scoped_lock lk{m_mutex};
    if (s->closed)
        return;
    s->closed = true;
    s->outgoing.clear();
    m_by_session.erase(s->session_id);
    m_inbound.push_back(InboundEvent{InboundEvent::Kind::Close, s->session_id, {}});
    ttt::log::debug("[session] close id={}", s->session_id);
    auto &cp = ttt::metrics::runtime().connected_players;
    if (cp.load(std::memory_order_relaxed) > 0)
        cp.fetch_sub(1, std::memory_order_relaxed);
}

bool SessionManager::is_closed(const std::shared_ptr<Session> &s)
{
    std::scoped_lock lk{m_mutex};
    return s->closed;
}

void SessionManager::post_message(const std::shared_ptr<Session> &s, ttt::ClientMessage msg)
{
    std::scoped_lock lk{m_mutex};
    if (s->closed) {
        ttt::metrics::runtime().inbound_dropped.fetch_add(1, std::memory_order_relaxed);
        return;
    }
    ttt::metrics::runtime().inbound_messages.fetch_add(1, std::memory_order_relaxed);
    m_inbound.push_back(InboundEvent{InboundEvent::Kind::Message, s->session_id, std::move(msg)});
}

std::vector<InboundEvent> SessionManager::drain_inbound()
{
    std::scoped_lock lk{m_mutex};
    std::vector<InboundEvent> out;
    out.swap(m_inbound);
    return out;
}

void SessionManager::push_message(const std::shared_ptr<Session> &s, const ttt::ServerMessage &msg)
{
    std::scoped_lock lk{m_mutex};
    if (s->closed)
        return;
    s->outgoing.push_back(msg);
}

std::vector<ttt::ServerMessage> SessionManager::drain_messages(const std::shared_ptr<Session> &s)
{
    std::scoped_lock lk{m_mutex};
    std::vector<ttt::ServerMessage> out;
    out.swap(s->outgoing);
    return out;
}

void SessionManager::update_heartbeat(const std::shared_ptr<Session> &s)
{
    std::scoped_lock lk{m_mutex};
    s->last_heartbeat = std::chrono::steady_clock::now();
}

std::vector<std::shared_ptr<Session>> SessionManager::expired(
    std::chrono::steady_clock::time_point now, std::chrono::seconds timeout)
{
    std::scoped_lock lk{m_mutex};
    std::vector<std::shared_ptr<Session>> res;
    for (auto &kv : m_by_session) {
        if (now - kv.second->last_heartbeat > timeout)
            res.push_back(kv.second);
    }
    return res;
}

std::vector<std::shared_ptr<Session>> SessionManager::snapshot_all_sessions()
{
    std::scoped_lock lk{m_mutex};
    std::vector<std::shared_ptr<Session>> res;
    res.reserve(m_by_session.size());
    for (auto &kv : m_by_session)
        res.push_back(kv.second);
    return res;
}

std::shared_ptr<Session> SessionManager::find(const std::string &session_id)
{
    std::scoped_lock lk{m_mutex};
    auto it = m_by_session.find(session_id);
    return it == m_by_session.end() ? nullptr : it->second;
}

void SessionManager::send_to(const std::string &session_id, const ttt::ServerMessage &msg)
{
    std::scoped_lock lk{m_mutex};
    auto it = m_by_session.find(session_id);
    if (it == m_by_session.end())
        return; // bots and sessions that already left
    if (msg.has_game_state())
        it->second->joined = true;
    it->second->outgoing.push_back(msg);
    ttt::metrics::runtime().events_direct.fetch_add(1, std::memory_order_relaxed);
}

void SessionManager::broadcast(const ttt::ServerMessage &msg, const std::string &except)
{
    std::scoped_lock lk{m_mutex};
    for (auto &kv : m_by_session) {
        if (kv.first == except || !kv.second->joined)
            continue;
        kv.second->outgoing.push_back(msg);
    }
    ttt::metrics::runtime().events_broadcast.fetch_add(1, std::memory_order_relaxed);
}

} // namespace ttt::net
