// SPDX-License-Identifier: Apache-2.0
// metrics_http.hpp
// Prometheus text-format endpoint (GET /metrics) over plain HTTP/1.1.
#pragma once
#include <coro/coro.hpp>
#include <coro/io_scheduler.hpp>

#include <cstdint>
#include <memory>
#include <string>

namespace ttt::net {

// Renders the current counters in Prometheus exposition format.
std::string build_metrics_body();

coro::task<void> run_metrics_endpoint(std::shared_ptr<coro::io_scheduler> scheduler, uint16_t port);

} // namespace ttt::net
