// SPDX-License-Identifier: Apache-2.0
#include "server/game/simulation.hpp"

#include "common/logger.hpp"
#include "common/metrics.hpp"
#include "server/game/events.hpp"
#include "server/game/geometry.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>

namespace ttt::game {

Simulation::Simulation(const WorldConfig &cfg, IEventSink &sink, uint32_t seed)
    : m_cfg(cfg)
    , m_sink(sink)
    , m_rng(seed)
{
}

void Simulation::start(bool spawn_bots)
{
    for (uint32_t i = 0; i < m_cfg.orb_target; ++i)
        spawn_orb();
    if (spawn_bots) {
        for (uint32_t i = 0; i < m_cfg.bot_count; ++i)
            spawn_bot();
    }
    ttt::log::info(
        "[sim] started orbs={} bots={} map={}x{} obstacles={}",
        m_world.orbs().size(),
        m_world.bot_count(),
        m_cfg.map_width,
        m_cfg.map_height,
        m_cfg.obstacles.size());
}

Player Simulation::make_player(const std::string &id, bool is_bot)
{
    Player p;
    p.id = id;
    p.is_bot = is_bot;
    if (!m_cfg.palette.empty()) {
        std::uniform_int_distribution<size_t> pick(0, m_cfg.palette.size() - 1);
        p.color = m_cfg.palette[pick(m_rng)];
    }
    reset_progress(p);
    auto pos = random_free_point(m_cfg, m_rng, m_cfg.player_spawn_margin, m_cfg.tank_radius);
    if (pos) {
        p.x = pos->x;
        p.y = pos->y;
    } else {
        p.x = m_cfg.map_width * 0.5f;
        p.y = m_cfg.map_height * 0.5f;
    }
    return p;
}

void Simulation::reset_progress(Player &p)
{
    p.stats = p.is_bot ? m_cfg.bot_stats : m_cfg.human_stats;
    p.max_hp = p.stats.max_hp;
    p.hp = p.max_hp;
    p.exp = 0;
    p.max_exp = m_cfg.base_max_exp;
    p.level = 1;
    p.pending_level_up = false;
    p.offered.clear();
    p.upgrades.clear();
}

void Simulation::on_session_open(const std::string &session_id)
{
    if (session_id.empty() || m_world.find_player(session_id))
        return;
    Player &p = m_world.insert_player(make_player(session_id, false));
    ttt::log::info("[sim] join id={} pos=({}, {}) color={}", p.id, p.x, p.y, p.color);
    m_sink.send_to(p.id, make_game_state(m_world, m_cfg, m_now_ms));
    m_sink.broadcast(make_player_joined(p), p.id);
}

void Simulation::on_session_close(const std::string &session_id)
{
    Player *p = m_world.find_player(session_id);
    if (!p || p->is_bot)
        return;
    for (const auto &bid : m_world.erase_bullets_owned_by(session_id))
        m_sink.broadcast(make_bullet_removed(bid));
    m_world.erase_player(session_id);
    ttt::log::info("[sim] leave id={} remaining={}", session_id, m_world.human_count());
    m_sink.broadcast(make_player_left(session_id));
}

void Simulation::handle_message(const std::string &session_id, const ttt::ClientMessage &msg)
{
    switch (msg.payload_case()) {
        case ttt::ClientMessage::kPlayerMove:
            on_move(session_id, msg.player_move().x(), msg.player_move().y(), msg.player_move().angle());
            break;
        case ttt::ClientMessage::kShoot:
            on_shoot(session_id, msg.shoot().x(), msg.shoot().y(), msg.shoot().angle());
            break;
        case ttt::ClientMessage::kSelectUpgrade:
            on_select_upgrade(session_id, msg.select_upgrade().upgrade_id());
            break;
        case ttt::ClientMessage::kRespawn:
            on_respawn(session_id);
            break;
        case ttt::ClientMessage::kDebugLevelUp:
            on_debug_level_up(session_id);
            break;
        case ttt::ClientMessage::kHeartbeat: // answered by the transport
        case ttt::ClientMessage::PAYLOAD_NOT_SET:
            break;
    }
}

void Simulation::on_move(const std::string &id, float x, float y, float angle)
{
    Player *p = m_world.find_player(id);
    if (!p || p->is_bot || !p->alive())
        return;
    if (std::isfinite(angle))
        p->angle = angle;
    if (!is_blocked(m_cfg, x, y, m_cfg.tank_radius)) {
        p->x = x;
        p->y = y;
    }
    collect_orbs(*p);
    m_sink.broadcast(make_player_moved(*p), p->id);
}

void Simulation::collect_orbs(Player &p)
{
    auto taken = m_world.take_orbs_within(p.x, p.y, p.stats.pickup_range);
    for (const auto &orb : taken) {
        p.exp += orb.value;
        check_level_up(p);
        m_orb_respawn_due.push_back(m_now_ms + m_cfg.orb_respawn_delay_ms);
        m_sink.broadcast(make_orb_collected(orb.id));
        m_sink.broadcast(make_exp_update(p, false));
    }
}

void Simulation::check_level_up(Player &p)
{
    // Dead tanks bank exp but never level until they respawn.
    if (!p.alive() || p.exp < p.max_exp || p.pending_level_up)
        return;
    p.pending_level_up = true;
    if (p.is_bot) {
        auto pick = generate_upgrades(1, p.upgrades, m_rng);
        level_up(p, pick.empty() ? nullptr : pick.front());
        return;
    }
    auto draft = generate_upgrades(m_cfg.draft_size, p.upgrades, m_rng);
    if (draft.empty()) {
        level_up(p, nullptr);
        return;
    }
    p.offered.clear();
    ttt::ServerMessage opts;
    for (const UpgradeDef *def : draft) {
        p.offered.emplace_back(def->id);
        fill_option(*opts.mutable_level_up_options()->add_options(), *def);
    }
    p.immune_until_ms = m_now_ms + m_cfg.levelup_immunity_ms;
    ttt::log::debug("[sim] level draft id={} level={} options={}", p.id, p.level, p.offered.size());
    m_sink.broadcast(make_immunity(p));
    m_sink.send_to(p.id, opts);
}

void Simulation::level_up(Player &p, const UpgradeDef *def)
{
    if (def) {
        apply_effect(p.stats, def->effect);
        p.upgrades.emplace_back(def->id);
    }
    p.level += 1;
    if (p.is_bot)
        p.exp = 0;
    else
        p.exp = p.exp > p.max_exp ? p.exp - p.max_exp : 0;
    p.max_exp = static_cast<uint32_t>(std::floor(static_cast<double>(p.max_exp) * m_cfg.max_exp_growth));
    p.max_hp = p.stats.max_hp;
    if (p.alive())
        p.hp = p.max_hp;
    p.pending_level_up = false;
    p.offered.clear();
    ttt::metrics::runtime().level_ups.fetch_add(1, std::memory_order_relaxed);
    ttt::log::debug("[sim] level up id={} level={} upgrade={}", p.id, p.level, def ? def->id : "none");
    m_sink.broadcast(make_exp_update(p, true));
    if (!p.is_bot) {
        p.immune_until_ms = 0;
        m_sink.broadcast(make_immunity(p));
    }
    check_level_up(p);
}

void Simulation::on_select_upgrade(const std::string &id, const std::string &upgrade_id)
{
    Player *p = m_world.find_player(id);
    if (!p || p->is_bot || !p->alive() || !p->pending_level_up)
        return;
    if (std::find(p->offered.begin(), p->offered.end(), upgrade_id) == p->offered.end())
        return;
    const UpgradeDef *def = find_upgrade(upgrade_id);
    if (!def)
        return;
    level_up(*p, def);
}

void Simulation::on_debug_level_up(const std::string &id)
{
    Player *p = m_world.find_player(id);
    if (!p || p->is_bot || !p->alive())
        return;
    if (p->exp < p->max_exp)
        p->exp = p->max_exp;
    check_level_up(*p);
    m_sink.broadcast(make_exp_update(*p, false));
}

bool Simulation::apply_damage(Player &victim, float amount)
{
    if (!victim.alive() || victim.immune(m_now_ms) || amount <= 0.f)
        return false;
    victim.hp = std::max(0.f, victim.hp - amount);
    m_sink.broadcast(make_player_hit(victim));
    if (victim.alive())
        return false;
    handle_death(victim);
    return true;
}

void Simulation::handle_death(Player &p)
{
    ttt::metrics::runtime().player_deaths.fetch_add(1, std::memory_order_relaxed);
    ttt::log::debug("[sim] death id={} bot={} level={}", p.id, p.is_bot, p.level);
    if (p.is_bot) {
        respawn(p);
        return;
    }
    // An open draft dies with the tank.
    p.pending_level_up = false;
    p.offered.clear();
    m_sink.send_to(p.id, make_player_died(p));
}

void Simulation::on_respawn(const std::string &id)
{
    Player *p = m_world.find_player(id);
    if (!p || p->is_bot || p->alive())
        return;
    respawn(*p);
}

void Simulation::respawn(Player &p)
{
    reset_progress(p);
    if (auto pos = random_free_point(m_cfg, m_rng, m_cfg.player_spawn_margin, m_cfg.tank_radius)) {
        p.x = pos->x;
        p.y = pos->y;
    }
    p.immune_until_ms = m_now_ms + m_cfg.respawn_immunity_ms;
    m_sink.broadcast(make_player_hit(p));
    m_sink.broadcast(make_player_moved(p));
    m_sink.broadcast(make_immunity(p));
    m_sink.broadcast(make_exp_update(p, true));
}

void Simulation::regen()
{
    for (auto &[id, p] : m_world.players()) {
        if (!p.alive() || p.hp >= p.max_hp || p.stats.regen_rate <= 0.f)
            continue;
        p.hp = std::min(p.hp + p.stats.regen_rate, p.max_hp);
        m_sink.broadcast(make_player_hit(p));
    }
}

Orb *Simulation::spawn_orb()
{
    auto pos = random_free_point(m_cfg, m_rng, m_cfg.entity_spawn_margin, m_cfg.orb_radius);
    if (!pos)
        return nullptr;
    Orb o;
    o.id = m_world.next_id("o");
    o.x = pos->x;
    o.y = pos->y;
    o.value = m_cfg.orb_value;
    Orb &added = m_world.add_orb(std::move(o));
    m_sink.broadcast(make_orb_spawned(added));
    return &added;
}

Orb &Simulation::drop_orb(float x, float y, uint32_t value)
{
    Orb o;
    o.id = m_world.next_id("o");
    o.x = x;
    o.y = y;
    o.value = value;
    Orb &added = m_world.add_orb(std::move(o));
    m_sink.broadcast(make_orb_spawned(added));
    return added;
}

void Simulation::process_orb_respawns()
{
    auto due = std::partition(
        m_orb_respawn_due.begin(), m_orb_respawn_due.end(), [&](uint64_t at) { return at > m_now_ms; });
    size_t count = static_cast<size_t>(std::distance(due, m_orb_respawn_due.end()));
    m_orb_respawn_due.erase(due, m_orb_respawn_due.end());
    for (size_t i = 0; i < count; ++i)
        spawn_orb();
}

void Simulation::tick()
{
    m_now_ms += m_cfg.tick_ms;
    process_orb_respawns();
    step_bullets();
    step_enemies();
    step_bots();
    if (m_now_ms - m_last_regen_ms >= m_cfg.regen_interval_ms) {
        m_last_regen_ms = m_now_ms;
        regen();
    }
    if (m_now_ms - m_last_enemy_spawn_ms >= m_cfg.enemy_spawn_interval_ms) {
        m_last_enemy_spawn_ms = m_now_ms;
        spawn_enemy();
    }
}

} // namespace ttt::game
