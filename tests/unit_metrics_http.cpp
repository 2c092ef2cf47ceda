// SPDX-License-Identifier: Apache-2.0
#include "common/metrics.hpp"
#include "server/net/metrics_http.hpp"

#include <cassert>
#include <iostream>

int main()
{
    auto &rt = ttt::metrics::runtime();
    rt.connected_players.store(3);
    rt.enemies_active.store(7);
    rt.level_ups.fetch_add(2);
    ttt::metrics::add_tick_duration(100000); // first bucket
    ttt::metrics::add_tick_duration(600000); // third bucket

    std::string body = ttt::net::build_metrics_body();
    assert(body.find("# TYPE ttt_connected_players gauge\nttt_connected_players 3\n") != std::string::npos);
    assert(body.find("ttt_enemies_active 7\n") != std::string::npos);
    assert(body.find("# TYPE ttt_level_ups counter\nttt_level_ups 2\n") != std::string::npos);
    assert(body.find("ttt_tick_duration_ns_bucket{le=\"250000\"} 1\n") != std::string::npos);
    assert(body.find("ttt_tick_duration_ns_bucket{le=\"500000\"} 1\n") != std::string::npos);
    assert(body.find("ttt_tick_duration_ns_bucket{le=\"1000000\"} 2\n") != std::string::npos);
    assert(body.find("ttt_tick_duration_ns_bucket{le=\"+Inf\"} 2\n") != std::string::npos);
    assert(body.find("ttt_tick_duration_ns_count 2\n") != std::string::npos);
    assert(ttt::metrics::mean_tick_ns() == 350000);
    assert(ttt::metrics::approx_tick_p99() == 1000000);

    std::cout << "unit_metrics_http OK" << std::endl;
    return 0;
}
