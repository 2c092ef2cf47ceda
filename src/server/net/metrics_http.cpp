// SPDX-License-Identifier: Apache-2.0
#include "server/net/metrics_http.hpp"

#include "common/logger.hpp"
#include "common/metrics.hpp"

#include <coro/net/tcp/client.hpp>
#include <coro/net/tcp/server.hpp>
#include <coro/poll.hpp>

#include <atomic>
#include <span>
#include <sstream>
#include <string>

namespace ttt::net {

namespace {

void gauge(std::ostringstream &oss, const char *name, uint64_t v)
{
    oss << "# TYPE ttt_" << name << " gauge\n";
    oss << "ttt_" << name << ' ' << v << "\n";
}

void counter(std::ostringstream &oss, const char *name, const std::atomic<uint64_t> &v)
{
    oss << "# TYPE ttt_" << name << " counter\n";
    oss << "ttt_" << name << ' ' << v.load(std::memory_order_relaxed) << "\n";
}

} // namespace

std::string build_metrics_body()
{
    std::ostringstream oss;
    auto &rt = ttt::metrics::runtime();
    gauge(oss, "connected_players", rt.connected_players.load(std::memory_order_relaxed));
    gauge(oss, "bots_alive", rt.bots_alive.load(std::memory_order_relaxed));
    gauge(oss, "bullets_active", rt.bullets_active.load(std::memory_order_relaxed));
    gauge(oss, "enemies_active", rt.enemies_active.load(std::memory_order_relaxed));
    gauge(oss, "orbs_active", rt.orbs_active.load(std::memory_order_relaxed));
    gauge(oss, "avg_tick_ns", ttt::metrics::mean_tick_ns());
    gauge(oss, "p99_tick_ns", ttt::metrics::approx_tick_p99());
    gauge(oss, "wait_mean_ns", ttt::metrics::mean_wait_ns());
    counter(oss, "ticks_overrun", rt.ticks_overrun);
    counter(oss, "events_broadcast", rt.events_broadcast);
    counter(oss, "events_direct", rt.events_direct);
    counter(oss, "inbound_messages", rt.inbound_messages);
    counter(oss, "inbound_dropped", rt.inbound_dropped);
    counter(oss, "handler_errors", rt.handler_errors);
    counter(oss, "level_ups", rt.level_ups);
    counter(oss, "player_deaths", rt.player_deaths);
    counter(oss, "enemy_kills", rt.enemy_kills);
    // Tick duration histogram, geometric buckets starting at 0.25ms.
    oss << "# TYPE ttt_tick_duration_ns histogram\n";
    uint64_t cumulative = 0;
    constexpr uint64_t base = 250000;
    for (int i = 0; i < ttt::metrics::RuntimeCounters::TICK_BUCKETS; ++i) {
        cumulative += rt.tick_hist[i].load(std::memory_order_relaxed);
        oss << "ttt_tick_duration_ns_bucket{le=\"" << (base << i) << "\"} " << cumulative << "\n";
    }
    oss << "ttt_tick_duration_ns_bucket{le=\"+Inf\"} " << cumulative << "\n";
    oss << "ttt_tick_duration_ns_sum " << rt.tick_duration_ns_accum.load(std::memory_order_relaxed) << "\n";
    oss << "ttt_tick_duration_ns_count " << rt.tick_samples.load(std::memory_order_relaxed) << "\n";
    return oss.str();
}

static coro::task<void> handle_client(std::shared_ptr<coro::io_scheduler> scheduler, coro::net::tcp::client client)
{
    co_await scheduler->schedule();
    auto pol = co_await client.poll(coro::poll_op::read, std::chrono::milliseconds(200));
    if (pol != coro::poll_status::event)
        co_return;
    std::string buf(1024, '\0');
    auto [rs, span] = client.recv(buf);
    if (rs != coro::net::recv_status::ok)
        co_return;
    std::string_view req(span.data(), span.size());
    bool metrics = req.rfind("GET /metrics", 0) == 0;
    std::string body = metrics ? build_metrics_body() : std::string("not found\n");
    std::ostringstream resp;
    resp << "HTTP/1.1 " << (metrics ? "200 OK" : "404 Not Found") << "\r\n";
    resp << "Content-Type: text/plain; version=0.0.4\r\n";
    resp << "Content-Length: " << body.size() << "\r\n";
    resp << "Connection: close\r\n\r\n";
    resp << body;
    auto s = resp.str();
    std::span<const char> out{s.data(), s.size()};
    while (!out.empty()) {
        co_await client.poll(coro::poll_op::write);
        auto [st, rest] = client.send(out);
        if (st != coro::net::send_status::ok && st != coro::net::send_status::would_block)
            break;
        out = rest;
    }
}

coro::task<void> run_metrics_endpoint(std::shared_ptr<coro::io_scheduler> scheduler, uint16_t port)
{
    co_await scheduler->schedule();
    ttt::log::info("[metrics] HTTP endpoint on port {}", port);
    coro::net::tcp::server server{scheduler, coro::net::tcp::server::options{.port = port}};
    while (true) {
        auto st = co_await server.poll();
        if (st == coro::poll_status::event) {
            auto client = server.accept();
            if (client.socket().is_valid())
                scheduler->spawn(handle_client(scheduler, std::move(client)));
        } else if (st == coro::poll_status::error || st == coro::poll_status::closed) {
            ttt::log::error("[metrics] server poll error/closed");
            co_return;
        }
    }
}

} // namespace ttt::net
