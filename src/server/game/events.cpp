// SPDX-License-Identifier: Apache-2.0
#include "server/game/events.hpp"

namespace ttt::game {

void fill_stats(ttt::Stats &out, const StatBlock &s)
{
    out.set_max_hp(s.max_hp);
    out.set_fire_rate_ms(s.fire_rate_ms);
    out.set_bullet_count(s.bullet_count);
    out.set_bullet_damage(s.bullet_damage);
    out.set_bullet_speed(s.bullet_speed);
    out.set_move_speed(s.move_speed);
    out.set_pickup_range(s.pickup_range);
    out.set_rear_guard(s.rear_guard);
    out.set_bullet_life_time_ms(s.bullet_life_time_ms);
    out.set_spread_angle_deg(s.spread_angle_deg);
    out.set_regen_rate(s.regen_rate);
}

void fill_player_state(ttt::PlayerState &out, const Player &p)
{
    out.set_id(p.id);
    out.set_x(p.x);
    out.set_y(p.y);
    out.set_angle(p.angle);
    out.set_color(p.color);
    out.set_hp(p.hp);
    out.set_max_hp(p.max_hp);
    out.set_exp(p.exp);
    out.set_max_exp(p.max_exp);
    out.set_level(p.level);
    fill_stats(*out.mutable_stats(), p.stats);
    out.set_immune_until_ms(p.immune_until_ms);
    for (const auto &u : p.upgrades)
        out.add_upgrades(u);
    out.set_is_bot(p.is_bot);
}

void fill_bullet_state(ttt::BulletState &out, const Bullet &b)
{
    out.set_id(b.id);
    out.set_x(b.x);
    out.set_y(b.y);
    out.set_angle(b.angle);
    out.set_owner_id(b.owner_id);
    out.set_damage(b.damage);
}

void fill_orb_state(ttt::OrbState &out, const Orb &o)
{
    out.set_id(o.id);
    out.set_x(o.x);
    out.set_y(o.y);
    out.set_value(o.value);
}

void fill_enemy_state(ttt::EnemyState &out, const Enemy &e)
{
    out.set_id(e.id);
    out.set_x(e.x);
    out.set_y(e.y);
    out.set_hp(e.hp);
    out.set_max_hp(e.max_hp);
    out.set_speed(e.speed);
    out.set_radius(e.radius);
    out.set_contact_damage(e.contact_damage);
    out.set_exp_value(e.exp_value);
}

ttt::ServerMessage make_game_state(const World &world, const WorldConfig &cfg, uint64_t now_ms)
{
    ttt::ServerMessage msg;
    auto *gs = msg.mutable_game_state();
    for (const auto &[id, p] : world.players())
        fill_player_state(*gs->add_players(), p);
    for (const auto &b : world.bullets())
        fill_bullet_state(*gs->add_bullets(), b);
    for (const auto &o : world.orbs())
        fill_orb_state(*gs->add_orbs(), o);
    for (const auto &e : world.enemies())
        fill_enemy_state(*gs->add_enemies(), e);
    gs->set_map_width(cfg.map_width);
    gs->set_map_height(cfg.map_height);
    for (const auto &box : cfg.obstacles) {
        auto *ob = gs->add_obstacles();
        ob->set_x(box.lowerBound.x);
        ob->set_y(box.lowerBound.y);
        ob->set_width(box.upperBound.x - box.lowerBound.x);
        ob->set_height(box.upperBound.y - box.lowerBound.y);
    }
    gs->set_server_time_ms(now_ms);
    return msg;
}

ttt::ServerMessage make_player_joined(const Player &p)
{
    ttt::ServerMessage msg;
    fill_player_state(*msg.mutable_player_joined(), p);
    return msg;
}

ttt::ServerMessage make_player_left(const std::string &id)
{
    ttt::ServerMessage msg;
    msg.mutable_player_left()->set_id(id);
    return msg;
}

ttt::ServerMessage make_player_moved(const Player &p)
{
    ttt::ServerMessage msg;
    auto *m = msg.mutable_player_moved();
    m->set_id(p.id);
    m->set_x(p.x);
    m->set_y(p.y);
    m->set_angle(p.angle);
    m->set_hp(p.hp);
    m->set_max_hp(p.max_hp);
    m->set_exp(p.exp);
    m->set_level(p.level);
    m->set_max_exp(p.max_exp);
    return msg;
}

ttt::ServerMessage make_player_hit(const Player &p)
{
    ttt::ServerMessage msg;
    auto *h = msg.mutable_player_hit();
    h->set_id(p.id);
    h->set_hp(p.hp);
    h->set_max_hp(p.max_hp);
    h->set_x(p.x);
    h->set_y(p.y);
    return msg;
}

ttt::ServerMessage make_exp_update(const Player &p, bool with_stats)
{
    ttt::ServerMessage msg;
    auto *u = msg.mutable_player_exp_update();
    u->set_id(p.id);
    u->set_exp(p.exp);
    u->set_max_exp(p.max_exp);
    u->set_level(p.level);
    u->set_hp(p.hp);
    u->set_max_hp(p.max_hp);
    if (with_stats) {
        fill_stats(*u->mutable_stats(), p.stats);
        for (const auto &id : p.upgrades)
            u->add_upgrades(id);
    }
    return msg;
}

ttt::ServerMessage make_immunity(const Player &p)
{
    ttt::ServerMessage msg;
    msg.mutable_player_immunity()->set_id(p.id);
    msg.mutable_player_immunity()->set_immune_until_ms(p.immune_until_ms);
    return msg;
}

ttt::ServerMessage make_player_died(const Player &p)
{
    ttt::ServerMessage msg;
    msg.mutable_player_died()->set_id(p.id);
    return msg;
}

ttt::ServerMessage make_bullet_shot(const Bullet &b)
{
    ttt::ServerMessage msg;
    fill_bullet_state(*msg.mutable_bullet_shot(), b);
    return msg;
}

ttt::ServerMessage make_bullet_removed(const std::string &id)
{
    ttt::ServerMessage msg;
    msg.mutable_bullet_removed()->set_id(id);
    return msg;
}

ttt::ServerMessage make_orb_spawned(const Orb &o)
{
    ttt::ServerMessage msg;
    fill_orb_state(*msg.mutable_orb_spawned(), o);
    return msg;
}

ttt::ServerMessage make_orb_collected(const std::string &id)
{
    ttt::ServerMessage msg;
    msg.mutable_orb_collected()->set_id(id);
    return msg;
}

ttt::ServerMessage make_enemy_spawned(const Enemy &e)
{
    ttt::ServerMessage msg;
    fill_enemy_state(*msg.mutable_enemy_spawned(), e);
    return msg;
}

ttt::ServerMessage make_enemies_moved(const std::vector<Enemy> &enemies)
{
    ttt::ServerMessage msg;
    auto *em = msg.mutable_enemies_moved();
    for (const auto &e : enemies)
        fill_enemy_state(*em->add_enemies(), e);
    return msg;
}

ttt::ServerMessage make_enemy_died(const std::string &id)
{
    ttt::ServerMessage msg;
    msg.mutable_enemy_died()->set_id(id);
    return msg;
}

} // namespace ttt::game
