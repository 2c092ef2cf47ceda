// SPDX-License-Identifier: Apache-2.0
// Hostile spawning and per-tick seek / contact damage.
#include "common/log_rate_limit.hpp"
#include "common/logger.hpp"
#include "server/game/events.hpp"
#include "server/game/geometry.hpp"
#include "server/game/simulation.hpp"

#include <box2d/box2d.h>

#include <cmath>
#include <limits>

namespace ttt::game {

Enemy *Simulation::spawn_enemy()
{
    if (m_world.enemies().size() >= m_cfg.enemy_cap)
        return nullptr;
    auto pos = random_free_point(m_cfg, m_rng, m_cfg.entity_spawn_margin, m_cfg.enemy_radius);
    if (!pos)
        return nullptr;
    std::uniform_real_distribution<float> jitter(0.f, m_cfg.enemy_speed_jitter);
    Enemy e;
    e.id = m_world.next_id("e");
    e.x = pos->x;
    e.y = pos->y;
    e.hp = m_cfg.enemy_hp;
    e.max_hp = m_cfg.enemy_hp;
    e.speed = m_cfg.enemy_min_speed + (m_cfg.enemy_speed_jitter > 0.f ? jitter(m_rng) : 0.f);
    e.radius = m_cfg.enemy_radius;
    e.contact_damage = m_cfg.enemy_contact_damage;
    e.exp_value = m_cfg.enemy_exp;
    Enemy &added = m_world.add_enemy(std::move(e));
    ttt::log::trace("[enemy] spawn id={} pos=({}, {}) speed={}", added.id, added.x, added.y, added.speed);
    m_sink.broadcast(make_enemy_spawned(added));
    return &added;
}

void Simulation::step_enemies()
{
    auto &enemies = m_world.enemies();
    if (enemies.empty())
        return;
    const float dt = dt_seconds();
    for (auto &e : enemies) {
        Player *target = nullptr;
        float best = std::numeric_limits<float>::max();
        for (auto &[id, p] : m_world.players()) {
            if (!p.alive())
                continue;
            float d2 = b2DistanceSquared(b2Vec2{e.x, e.y}, b2Vec2{p.x, p.y});
            if (d2 < best) {
                best = d2;
                target = &p;
            }
        }
        if (!target)
            continue;
        float dx = target->x - e.x;
        float dy = target->y - e.y;
        float dist = std::sqrt(dx * dx + dy * dy);
        if (dist > 1.f) {
            float nx = e.x + dx / dist * e.speed * dt;
            float ny = e.y + dy / dist * e.speed * dt;
            if (!is_blocked(m_cfg, nx, ny, e.radius)) {
                e.x = nx;
                e.y = ny;
                dist = b2Distance(b2Vec2{e.x, e.y}, b2Vec2{target->x, target->y});
            }
        }
        if (dist < e.radius + m_cfg.tank_radius)
            apply_damage(*target, e.contact_damage);
    }
    TTT_LOG_EVERY_N(debug, 200, "[enemy] alive={} players={}", enemies.size(), m_world.players().size());
    m_sink.broadcast(make_enemies_moved(enemies));
}

} // namespace ttt::game
