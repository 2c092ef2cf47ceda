// SPDX-License-Identifier: Apache-2.0
// Server-driven tanks: population seeding and the per-tick steering / firing policy.
#include "common/logger.hpp"
#include "server/game/events.hpp"
#include "server/game/geometry.hpp"
#include "server/game/simulation.hpp"

#include <box2d/box2d.h>

#include <cmath>

namespace ttt::game {

Player *Simulation::spawn_bot()
{
    Player &bot = m_world.insert_player(make_player(m_world.next_id("bot"), true));
    ttt::log::debug("[bot] spawn id={} pos=({}, {})", bot.id, bot.x, bot.y);
    m_sink.broadcast(make_player_joined(bot));
    return &bot;
}

void Simulation::step_bots()
{
    const float dt = dt_seconds();
    std::uniform_real_distribution<float> unit(0.f, 1.f);
    for (auto &entry : m_world.players()) {
        Player &bot = entry.second;
        if (!bot.is_bot || !bot.alive())
            continue;
        const b2Vec2 pos{bot.x, bot.y};
        auto try_move = [&](float dir, float speed) {
            float nx = bot.x + std::cos(bot.angle) * speed * dt * dir;
            float ny = bot.y + std::sin(bot.angle) * speed * dt * dir;
            if (!is_blocked(m_cfg, nx, ny, m_cfg.tank_radius)) {
                bot.x = nx;
                bot.y = ny;
            }
        };

        // Nearest living human that can currently be hurt.
        const Player *target = nullptr;
        float best = m_cfg.bot_sense_range * m_cfg.bot_sense_range;
        for (const auto &[oid, other] : m_world.players()) {
            if (other.is_bot || !other.alive() || other.immune(m_now_ms))
                continue;
            float d2 = b2DistanceSquared(pos, b2Vec2{other.x, other.y});
            if (d2 < best) {
                best = d2;
                target = &other;
            }
        }

        if (target) {
            float dist = std::sqrt(best);
            float desired = std::atan2(target->y - bot.y, target->x - bot.x);
            bot.angle += wrap_angle(desired - bot.angle) * m_cfg.bot_turn_gain;
            if (dist > m_cfg.bot_advance_distance)
                try_move(1.f, bot.stats.move_speed);
            else if (dist < m_cfg.bot_retreat_distance)
                try_move(-1.f, bot.stats.move_speed);
            bool cooled = !bot.has_shot
                || static_cast<float>(m_now_ms - bot.last_shot_ms) > bot.stats.fire_rate_ms;
            if (cooled && std::fabs(wrap_angle(desired - bot.angle)) < m_cfg.bot_fire_tolerance_rad) {
                fire(
                    bot,
                    bot.x + std::cos(bot.angle) * m_cfg.muzzle_offset,
                    bot.y + std::sin(bot.angle) * m_cfg.muzzle_offset,
                    bot.angle);
            }
        } else {
            const Orb *orb = nullptr;
            float orb_best = m_cfg.bot_orb_sense_range * m_cfg.bot_orb_sense_range;
            for (const auto &o : m_world.orbs()) {
                float d2 = b2DistanceSquared(pos, b2Vec2{o.x, o.y});
                if (d2 < orb_best) {
                    orb_best = d2;
                    orb = &o;
                }
            }
            if (orb) {
                float desired = std::atan2(orb->y - bot.y, orb->x - bot.x);
                bot.angle += wrap_angle(desired - bot.angle) * m_cfg.bot_orb_turn_gain;
                try_move(1.f, bot.stats.move_speed);
            } else {
                bot.angle += (unit(m_rng) - 0.5f) * m_cfg.bot_wander_jitter_rad;
                try_move(1.f, bot.stats.move_speed * 0.5f);
            }
        }

        collect_orbs(bot);
        m_sink.broadcast(make_player_moved(bot));
    }
}

} // namespace ttt::game
