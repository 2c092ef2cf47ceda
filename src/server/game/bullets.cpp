// SPDX-License-Identifier: Apache-2.0
// Shot intake, volley construction and the per-tick bullet table step.
#include "common/logger.hpp"
#include "common/metrics.hpp"
#include "server/game/events.hpp"
#include "server/game/geometry.hpp"
#include "server/game/simulation.hpp"

#include <box2d/box2d.h>

#include <algorithm>
#include <cmath>
#include <numbers>

namespace ttt::game {

namespace {

constexpr float kDegToRad = std::numbers::pi_v<float> / 180.f;
// Rear guard shell leaves from behind the hull.
constexpr float kRearGuardOffset = 80.f;

} // namespace

void Simulation::on_shoot(const std::string &id, float x, float y, float angle)
{
    Player *p = m_world.find_player(id);
    if (!p || p->is_bot || !p->alive() || !std::isfinite(angle))
        return;
    b2Vec2 origin{x, y};
    const float max_d = m_cfg.max_shot_origin_distance;
    if (!std::isfinite(x) || !std::isfinite(y) || b2DistanceSquared(origin, b2Vec2{p->x, p->y}) > max_d * max_d) {
        origin = {p->x + std::cos(angle) * m_cfg.muzzle_offset, p->y + std::sin(angle) * m_cfg.muzzle_offset};
    }
    fire(*p, origin.x, origin.y, angle);
}

void Simulation::fire(Player &shooter, float x, float y, float angle)
{
    const StatBlock &s = shooter.stats;
    auto spawn = [&](float ox, float oy, float a) {
        Bullet b;
        b.id = m_world.next_id("b");
        b.x = ox;
        b.y = oy;
        b.angle = a;
        b.owner_id = shooter.id;
        b.damage = s.bullet_damage;
        b.speed = s.bullet_speed;
        b.expires_at_ms = m_now_ms + static_cast<uint64_t>(std::max(0.f, s.bullet_life_time_ms));
        m_sink.broadcast(make_bullet_shot(m_world.add_bullet(std::move(b))));
    };
    const uint32_t count = std::max<uint32_t>(1, s.bullet_count);
    if (count == 1) {
        spawn(x, y, angle);
    } else {
        const float spread = s.spread_angle_deg * kDegToRad;
        const float step = spread / static_cast<float>(count - 1);
        for (uint32_t i = 0; i < count; ++i)
            spawn(x, y, angle - spread * 0.5f + step * static_cast<float>(i));
    }
    if (s.rear_guard) {
        spawn(
            x - std::cos(angle) * kRearGuardOffset,
            y - std::sin(angle) * kRearGuardOffset,
            angle + std::numbers::pi_v<float>);
    }
    shooter.last_shot_ms = m_now_ms;
    shooter.has_shot = true;
}

void Simulation::award_exp(const std::string &player_id, uint32_t amount)
{
    Player *p = m_world.find_player(player_id);
    if (!p)
        return;
    p->exp += amount;
    check_level_up(*p);
    m_sink.broadcast(make_exp_update(*p, false));
}

bool Simulation::resolve_player_hits(const Bullet &b)
{
    const float hit_r = m_cfg.tank_radius + m_cfg.bullet_radius;
    for (auto &[id, victim] : m_world.players()) {
        if (id == b.owner_id || !victim.alive())
            continue;
        if (b2DistanceSquared(b2Vec2{b.x, b.y}, b2Vec2{victim.x, victim.y}) >= hit_r * hit_r)
            continue;
        // Immune victims absorb the shell without damage.
        if (apply_damage(victim, b.damage)) {
            ttt::log::debug("[bullet] kill victim={} shooter={}", victim.id, b.owner_id);
            award_exp(b.owner_id, m_cfg.kill_exp);
        }
        return true;
    }
    return false;
}

bool Simulation::resolve_enemy_hits(const Bullet &b)
{
    auto &enemies = m_world.enemies();
    for (auto it = enemies.begin(); it != enemies.end(); ++it) {
        const float hit_r = it->radius + m_cfg.bullet_radius;
        if (b2DistanceSquared(b2Vec2{b.x, b.y}, b2Vec2{it->x, it->y}) >= hit_r * hit_r)
            continue;
        it->hp -= b.damage;
        if (it->hp <= 0.f) {
            Enemy dead = std::move(*it);
            enemies.erase(it);
            ttt::metrics::runtime().enemy_kills.fetch_add(1, std::memory_order_relaxed);
            m_sink.broadcast(make_enemy_died(dead.id));
            award_exp(b.owner_id, dead.exp_value);
            drop_orb(dead.x, dead.y, m_cfg.enemy_drop_orb_value);
        }
        return true;
    }
    return false;
}

void Simulation::step_bullets()
{
    const float dt = dt_seconds();
    auto &bullets = m_world.bullets();
    size_t i = 0;
    while (i < bullets.size()) {
        Bullet &b = bullets[i];
        b.x += std::cos(b.angle) * b.speed * dt;
        b.y += std::sin(b.angle) * b.speed * dt;
        // Hit resolution never adds or removes bullets, so b stays valid until erased below.
        bool remove = resolve_player_hits(b) || resolve_enemy_hits(b)
            || is_blocked(m_cfg, b.x, b.y, m_cfg.bullet_radius) || m_now_ms >= b.expires_at_ms;
        if (!remove) {
            ++i;
            continue;
        }
        m_sink.broadcast(make_bullet_removed(b.id));
        bullets.erase(bullets.begin() + static_cast<std::ptrdiff_t>(i));
    }
}

} // namespace ttt::game
