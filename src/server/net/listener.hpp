// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <coro/coro.hpp>
#include <coro/io_scheduler.hpp>

#include <chrono>
#include <cstdint>
#include <memory>

namespace ttt::net {

// Starts the TCP accept loop on the given port. Each connection gets its own coroutine that
// flushes queued outbound frames and forwards decoded ClientMessages to the session manager.
// flush_interval bounds how long a connection waits for input before flushing again.
coro::task<void> run_listener(
    std::shared_ptr<coro::io_scheduler> scheduler,
    uint16_t port,
    std::chrono::milliseconds flush_interval = std::chrono::milliseconds(50));

} // namespace ttt::net
