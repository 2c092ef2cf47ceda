// SPDX-License-Identifier: Apache-2.0
// metrics.hpp
// Process-wide runtime counters (atomics, no dynamic allocation). Written by the simulation loop
// and the transport; read by the Prometheus endpoint and the periodic runtime log line.
#pragma once
#include <atomic>
#include <cstdint>

namespace ttt::metrics {

struct RuntimeCounters
{
    // Simulation step duration (CPU time spent inside one tick).
    std::atomic<uint64_t> tick_duration_ns_accum{0};
    std::atomic<uint64_t> tick_samples{0};
    // Power-of-two buckets (base 250us): bucket i counts ticks shorter than 250us << i.
    static constexpr int TICK_BUCKETS = 10;
    std::atomic<uint64_t> tick_hist[TICK_BUCKETS]{};
    std::atomic<uint64_t> ticks_overrun{0}; // ticks that started later than one interval behind schedule
    // Idle time between ticks.
    std::atomic<uint64_t> wait_duration_ns_accum{0};
    std::atomic<uint64_t> wait_samples{0};
    // World gauges (refreshed once per tick)
    std::atomic<uint64_t> connected_players{0};
    std::atomic<uint64_t> bots_alive{0};
    std::atomic<uint64_t> bullets_active{0};
    std::atomic<uint64_t> enemies_active{0};
    std::atomic<uint64_t> orbs_active{0};
    // Event counters
    std::atomic<uint64_t> events_broadcast{0};
    std::atomic<uint64_t> events_direct{0};
    std::atomic<uint64_t> inbound_messages{0};
    std::atomic<uint64_t> inbound_dropped{0}; // messages for unknown/closed sessions
    std::atomic<uint64_t> handler_errors{0};
    std::atomic<uint64_t> level_ups{0};
    std::atomic<uint64_t> player_deaths{0};
    std::atomic<uint64_t> enemy_kills{0};
};

inline RuntimeCounters &runtime()
{
    static RuntimeCounters inst;
    return inst;
}

inline void add_tick_duration(uint64_t ns)
{
    auto &rt = runtime();
    rt.tick_duration_ns_accum.fetch_add(ns, std::memory_order_relaxed);
    rt.tick_samples.fetch_add(1, std::memory_order_relaxed);
    constexpr uint64_t base = 250000; // 0.25ms
    for (int i = 0; i < RuntimeCounters::TICK_BUCKETS; ++i) {
        if (ns < (base << i)) {
            rt.tick_hist[i].fetch_add(1, std::memory_order_relaxed);
            return;
        }
    }
    rt.tick_hist[RuntimeCounters::TICK_BUCKETS - 1].fetch_add(1, std::memory_order_relaxed);
}

// Upper bound of the bucket containing the 99th percentile tick.
inline uint64_t approx_tick_p99()
{
    auto &rt = runtime();
    uint64_t total = rt.tick_samples.load(std::memory_order_relaxed);
    if (total == 0)
        return 0;
    uint64_t target = (total * 99 + 99) / 100;
    constexpr uint64_t base = 250000;
    uint64_t cumulative = 0;
    for (int i = 0; i < RuntimeCounters::TICK_BUCKETS; ++i) {
        cumulative += rt.tick_hist[i].load(std::memory_order_relaxed);
        if (cumulative >= target)
            return base << i;
    }
    return base << (RuntimeCounters::TICK_BUCKETS - 1);
}

inline void add_wait_duration(uint64_t ns)
{
    auto &rt = runtime();
    rt.wait_duration_ns_accum.fetch_add(ns, std::memory_order_relaxed);
    rt.wait_samples.fetch_add(1, std::memory_order_relaxed);
}

inline uint64_t mean_tick_ns()
{
    auto &rt = runtime();
    uint64_t samples = rt.tick_samples.load(std::memory_order_relaxed);
    return samples ? rt.tick_duration_ns_accum.load(std::memory_order_relaxed) / samples : 0;
}

inline uint64_t mean_wait_ns()
{
    auto &rt = runtime();
    uint64_t samples = rt.wait_samples.load(std::memory_order_relaxed);
    return samples ? rt.wait_duration_ns_accum.load(std::memory_order_relaxed) / samples : 0;
}

} // namespace ttt::metrics
