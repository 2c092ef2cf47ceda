// SPDX-License-Identifier: Apache-2.0
// simulation.hpp - Authoritative arena simulation. Single writer: every method must be called from
// the simulation coroutine (or a test driving it directly).
#pragma once
#include "game.pb.h"
#include "server/game/event_sink.hpp"
#include "server/game/upgrades.hpp"
#include "server/game/world.hpp"
#include "server/game/world_config.hpp"

#include <cstdint>
#include <random>
#include <string>
#include <vector>

namespace ttt::game {

class Simulation
{
public:
    Simulation(const WorldConfig &cfg, IEventSink &sink, uint32_t seed);

    // Seeds the ambient orb population and, when enabled, the bot population.
    void start(bool spawn_bots = true);

    uint64_t now_ms() const { return m_now_ms; }
    World &world() { return m_world; }
    const World &world() const { return m_world; }
    const WorldConfig &config() const { return m_cfg; }

    void on_session_open(const std::string &session_id);
    void on_session_close(const std::string &session_id);
    // Routes one decoded client intent. Unknown sessions and empty payloads are ignored.
    void handle_message(const std::string &session_id, const ttt::ClientMessage &msg);

    void on_move(const std::string &id, float x, float y, float angle);
    void on_shoot(const std::string &id, float x, float y, float angle);
    void on_select_upgrade(const std::string &id, const std::string &upgrade_id);
    void on_respawn(const std::string &id);
    void on_debug_level_up(const std::string &id);

    // Advances the clock by one tick_ms step and runs every periodic driver that is due.
    void tick();

    // Spawns a volley from origin (x, y) along angle using the shooter's current stats.
    void fire(Player &shooter, float x, float y, float angle);
    void check_level_up(Player &p);
    // Returns true when the hit was lethal. Dead or immune victims are not damaged.
    bool apply_damage(Player &victim, float amount);
    void respawn(Player &p);

    Player *spawn_bot();
    Enemy *spawn_enemy();
    Orb *spawn_orb();
    Orb &drop_orb(float x, float y, uint32_t value);

    void step_bullets();
    void step_enemies();
    void step_bots();
    void regen();

private:
    Player make_player(const std::string &id, bool is_bot);
    void reset_progress(Player &p);
    void collect_orbs(Player &p);
    void level_up(Player &p, const UpgradeDef *def);
    void handle_death(Player &p);
    // Bullet step helpers; true when the bullet must be removed.
    bool resolve_player_hits(const Bullet &b);
    bool resolve_enemy_hits(const Bullet &b);
    void award_exp(const std::string &player_id, uint32_t amount);
    void process_orb_respawns();
    float dt_seconds() const { return static_cast<float>(m_cfg.tick_ms) / 1000.f; }

    const WorldConfig &m_cfg;
    IEventSink &m_sink;
    World m_world;
    std::mt19937 m_rng;
    uint64_t m_now_ms{0};
    uint64_t m_last_regen_ms{0};
    uint64_t m_last_enemy_spawn_ms{0};
    std::vector<uint64_t> m_orb_respawn_due; // deadlines for replacement orbs, one per pickup
};

} // namespace ttt::game
