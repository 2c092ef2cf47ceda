// SPDX-License-Identifier: Apache-2.0
#include "server/game/sim_loop.hpp"

#include "common/log_rate_limit.hpp"
#include "common/logger.hpp"
#include "common/metrics.hpp"

#include <chrono>
#include <exception>

namespace ttt::game {

size_t dispatch_inbound(Simulation &sim, std::vector<ttt::net::InboundEvent> events)
{
    size_t failures = 0;
    for (auto &ev : events) {
        try {
            switch (ev.kind) {
                case ttt::net::InboundEvent::Kind::Open:
                    sim.on_session_open(ev.session_id);
                    break;
                case ttt::net::InboundEvent::Kind::Close:
                    sim.on_session_close(ev.session_id);
                    break;
                case ttt::net::InboundEvent::Kind::Message:
                    sim.handle_message(ev.session_id, ev.msg);
                    break;
            }
        } catch (const std::exception &ex) {
            ++failures;
            ttt::metrics::runtime().handler_errors.fetch_add(1, std::memory_order_relaxed);
            ttt::log::error("[sim] handler failed session={} error={}", ev.session_id, ex.what());
        }
    }
    return failures;
}

void publish_gauges(const Simulation &sim)
{
    auto &rt = ttt::metrics::runtime();
    const World &w = sim.world();
    size_t bots_alive = 0;
    for (const auto &[id, p] : w.players()) {
        if (p.is_bot && p.alive())
            ++bots_alive;
    }
    rt.bots_alive.store(bots_alive, std::memory_order_relaxed);
    rt.bullets_active.store(w.bullets().size(), std::memory_order_relaxed);
    rt.enemies_active.store(w.enemies().size(), std::memory_order_relaxed);
    rt.orbs_active.store(w.orbs().size(), std::memory_order_relaxed);
}

coro::task<void> run_simulation(
    std::shared_ptr<coro::io_scheduler> scheduler,
    std::shared_ptr<Simulation> sim,
    ttt::net::SessionManager &sessions,
    const std::atomic_bool &stop)
{
    co_await scheduler->schedule();
    using clock = std::chrono::steady_clock;
    const auto tick_interval = std::chrono::milliseconds(sim->config().tick_ms);
    ttt::log::info("[sim] loop start tick_ms={}", sim->config().tick_ms);
    auto next = clock::now();
    while (!stop.load()) {
        auto now = clock::now();
        if (now < next) {
            auto wait_dur = next - now;
            ttt::metrics::add_wait_duration(std::chrono::duration_cast<std::chrono::nanoseconds>(wait_dur).count());
            co_await scheduler->yield_for(std::chrono::duration_cast<std::chrono::milliseconds>(wait_dur));
            continue;
        }
        if (now - next > tick_interval)
            ttt::metrics::runtime().ticks_overrun.fetch_add(1, std::memory_order_relaxed);
        auto tick_start = now;
        next += tick_interval;
        // Fell far behind (e.g. debugger pause): resynchronise instead of bursting.
        if (now - next > tick_interval * 10)
            next = now + tick_interval;

        dispatch_inbound(*sim, sessions.drain_inbound());
        sim->tick();
        publish_gauges(*sim);

        auto tick_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(clock::now() - tick_start).count();
        ttt::metrics::add_tick_duration(static_cast<uint64_t>(tick_ns));
        TTT_LOG_EVERY_N(
            trace,
            1200,
            "[sim] t={}ms players={} bullets={}",
            sim->now_ms(),
            sim->world().players().size(),
            sim->world().bullets().size());
    }
    ttt::log::info("[sim] loop stop t={}ms", sim->now_ms());
    co_return;
}

} // namespace ttt::game
