// SPDX-License-Identifier: Apache-2.0
// sim_loop.hpp - Fixed-step driver owning the Simulation on the io_scheduler.
#pragma once
#include "server/game/simulation.hpp"
#include "server/net/session_manager.hpp"

#include <coro/coro.hpp>
#include <coro/io_scheduler.hpp>

#include <atomic>
#include <memory>
#include <vector>

namespace ttt::game {

// Applies queued transport events in arrival order. A handler that throws is logged and skipped;
// the remaining events are still applied. Returns the number of events that threw.
size_t dispatch_inbound(Simulation &sim, std::vector<ttt::net::InboundEvent> events);

// Publishes world population gauges to the runtime counters.
void publish_gauges(const Simulation &sim);

// Drains inbound events then ticks, once per cfg.tick_ms, until stop becomes true.
coro::task<void> run_simulation(
    std::shared_ptr<coro::io_scheduler> scheduler,
    std::shared_ptr<Simulation> sim,
    ttt::net::SessionManager &sessions,
    const std::atomic_bool &stop);

} // namespace ttt::game
