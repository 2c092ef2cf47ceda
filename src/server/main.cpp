// SPDX-License-Identifier: Apache-2.0
#include "common/logger.hpp"
#include "common/metrics.hpp"
#include "server/game/sim_loop.hpp"
#include "server/game/simulation.hpp"
#include "server/game/world_config.hpp"
#include "server/net/listener.hpp"
#include "server/net/metrics_http.hpp"
#include "server/net/session_manager.hpp"

#include <coro/default_executor.hpp>
#include <coro/io_scheduler.hpp>
#include <yaml-cpp/yaml.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <memory>
#include <random>
#include <sstream>
#include <thread>

namespace ttt {

std::atomic_bool g_shutdown{false};

struct ServerConfig
{
    uint16_t listen_port{3000};
    uint32_t heartbeat_timeout_seconds{15};
    std::string log_level{"info"};
    bool log_json{false};
    uint16_t metrics_port{0}; // 0 disables
    uint32_t seed{0}; // 0 picks a random seed
    bool spawn_bots{true};
    game::WorldConfig world{};
};

static ServerConfig load_config(const std::string &path)
{
    YAML::Node root = YAML::LoadFile(path);
    ServerConfig cfg;
    if (root["listen_port"])
        cfg.listen_port = root["listen_port"].as<uint16_t>();
    if (root["heartbeat_timeout_seconds"])
        cfg.heartbeat_timeout_seconds = root["heartbeat_timeout_seconds"].as<uint32_t>();
    if (root["log_level"])
        cfg.log_level = root["log_level"].as<std::string>();
    if (root["log_json"])
        cfg.log_json = root["log_json"].as<bool>();
    if (root["metrics_port"])
        cfg.metrics_port = root["metrics_port"].as<uint16_t>();
    if (root["seed"])
        cfg.seed = root["seed"].as<uint32_t>();
    if (root["spawn_bots"])
        cfg.spawn_bots = root["spawn_bots"].as<bool>();
    cfg.world = game::load_world_config(root["world"]);
    return cfg;
}

} // namespace ttt

static void handle_signal(int)
{
    ttt::g_shutdown.store(true);
}

static coro::task<void> heartbeat_monitor(std::shared_ptr<coro::io_scheduler> sched, uint32_t timeout_sec)
{
    co_await sched->schedule();
    auto &mgr = ttt::net::instance();
    while (!ttt::g_shutdown.load()) {
        auto stale = mgr.expired(std::chrono::steady_clock::now(), std::chrono::seconds(timeout_sec));
        for (auto &s : stale) {
            ttt::log::warn("[hb] disconnect timeout session={}", s->session_id);
            mgr.disconnect_session(s);
        }
        co_await sched->yield_for(std::chrono::seconds(1));
    }
    co_return;
}

static void log_runtime(const char *tag)
{
    auto &rt = ttt::metrics::runtime();
    std::ostringstream j;
    j << "{\"metric\":\"" << tag << "\"";
    j << ",\"avg_tick_ns\":" << ttt::metrics::mean_tick_ns();
    j << ",\"p99_tick_ns\":" << ttt::metrics::approx_tick_p99();
    j << ",\"wait_mean_ns\":" << ttt::metrics::mean_wait_ns();
    j << ",\"ticks\":" << rt.tick_samples.load(std::memory_order_relaxed);
    j << ",\"ticks_overrun\":" << rt.ticks_overrun.load(std::memory_order_relaxed);
    j << ",\"connected_players\":" << rt.connected_players.load(std::memory_order_relaxed);
    j << ",\"bots_alive\":" << rt.bots_alive.load(std::memory_order_relaxed);
    j << ",\"bullets_active\":" << rt.bullets_active.load(std::memory_order_relaxed);
    j << ",\"enemies_active\":" << rt.enemies_active.load(std::memory_order_relaxed);
    j << ",\"orbs_active\":" << rt.orbs_active.load(std::memory_order_relaxed);
    j << ",\"level_ups\":" << rt.level_ups.load(std::memory_order_relaxed);
    j << ",\"handler_errors\":" << rt.handler_errors.load(std::memory_order_relaxed);
    j << "}";
    ttt::log::info("{}", j.str());
}

int main(int argc, char **argv)
{
    ttt::ServerConfig cfg;
    std::string config_path = "config/server.yaml";
    bool cli_port_override = false;
    bool cli_no_bots = false;
    uint16_t port_override = 0;
    int duration_override_sec = 0; // 0 means run until signal
    // First non-flag argument is the config path.
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--no-bots") {
            cli_no_bots = true;
        } else if (a == "--port" && i + 1 < argc) {
            try {
                port_override = static_cast<uint16_t>(std::stoi(argv[++i]));
                cli_port_override = true;
            } catch (const std::exception &) {
                ttt::log::warn("Invalid --port value '{}', ignoring", argv[i]);
            }
        } else if (a == "--duration" && i + 1 < argc) {
            try {
                duration_override_sec = std::stoi(argv[++i]);
            } catch (const std::exception &) {
                ttt::log::warn("Invalid --duration value '{}', ignoring", argv[i]);
            }
        } else if (!a.empty() && a[0] != '-') {
            config_path = a;
        }
    }
    try {
        cfg = ttt::load_config(config_path);
    } catch (const std::exception &ex) {
        ttt::log::error("Failed to load config '{}': {}", config_path, ex.what());
        return 1;
    }
    if (cli_no_bots || std::getenv("TTT_NO_BOTS"))
        cfg.spawn_bots = false;
    if (cli_port_override)
        cfg.listen_port = port_override;
    if (cfg.seed == 0)
        cfg.seed = std::random_device{}();

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    // Apply logging config via environment before first log init; an explicit external setting wins.
    if (!cfg.log_level.empty() && std::getenv("TTT_LOG_LEVEL") == nullptr)
        setenv("TTT_LOG_LEVEL", cfg.log_level.c_str(), 1);
    if (cfg.log_json)
        setenv("TTT_LOG_JSON", "1", 1);
    ttt::log::init();
    ttt::log::info("ttt server starting config={} seed={}", config_path, cfg.seed);
    ttt::log::info("Listening on port: {}", cfg.listen_port);
    ttt::log::info("Tick: {} ms, bots: {}", cfg.world.tick_ms, cfg.spawn_bots ? cfg.world.bot_count : 0);
    if (duration_override_sec > 0)
        ttt::log::info("CLI override: auto-shutdown after {} seconds", duration_override_sec);

    auto scheduler = coro::default_executor::io_executor();
    auto &sessions = ttt::net::instance();
    auto sim = std::make_shared<ttt::game::Simulation>(cfg.world, sessions, cfg.seed);
    sim->start(cfg.spawn_bots);

    scheduler->spawn(ttt::net::run_listener(scheduler, cfg.listen_port, std::chrono::milliseconds(cfg.world.tick_ms)));
    scheduler->spawn(ttt::game::run_simulation(scheduler, sim, sessions, ttt::g_shutdown));
    scheduler->spawn(heartbeat_monitor(scheduler, cfg.heartbeat_timeout_seconds));
    if (cfg.metrics_port != 0)
        scheduler->spawn(ttt::net::run_metrics_endpoint(scheduler, cfg.metrics_port));

    auto run_start = std::chrono::steady_clock::now();
    auto last_metrics = run_start;
    while (!ttt::g_shutdown.load()) {
        std::this_thread::sleep_for(std::chrono::seconds(1));
        auto now = std::chrono::steady_clock::now();
        if (duration_override_sec > 0) {
            auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(now - run_start).count();
            if (elapsed >= duration_override_sec) {
                ttt::log::info("Duration reached ({}s); initiating shutdown", elapsed);
                ttt::g_shutdown.store(true);
            }
        }
        if (now - last_metrics >= std::chrono::seconds(60)) {
            last_metrics = now;
            log_runtime("runtime");
        }
    }
    ttt::log::info("Shutdown complete.");
    log_runtime("runtime_final");
    return 0;
}
