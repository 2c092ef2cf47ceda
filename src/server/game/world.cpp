// SPDX-License-Identifier: Apache-2.0
#include "server/game/world.hpp"

#include <algorithm>
#include <iterator>

namespace ttt::game {

std::string World::next_id(const char *prefix)
{
    return std::string(prefix) + "_" + std::to_string(++m_id_counter);
}

Player *World::find_player(const std::string &id)
{
    auto it = m_players.find(id);
    return it == m_players.end() ? nullptr : &it->second;
}

Player &World::insert_player(Player p)
{
    std::string key = p.id;
    auto [it, inserted] = m_players.insert_or_assign(std::move(key), std::move(p));
    (void)inserted;
    return it->second;
}

bool World::erase_player(const std::string &id)
{
    return m_players.erase(id) > 0;
}

Bullet &World::add_bullet(Bullet b)
{
    m_bullets.push_back(std::move(b));
    return m_bullets.back();
}

std::vector<std::string> World::erase_bullets_owned_by(const std::string &owner_id)
{
    std::vector<std::string> removed;
    auto it = std::remove_if(m_bullets.begin(), m_bullets.end(), [&](const Bullet &b) {
        if (b.owner_id != owner_id)
            return false;
        removed.push_back(b.id);
        return true;
    });
    m_bullets.erase(it, m_bullets.end());
    return removed;
}

Orb &World::add_orb(Orb o)
{
    m_orbs.push_back(std::move(o));
    return m_orbs.back();
}

std::vector<Orb> World::take_orbs_within(float x, float y, float range)
{
    std::vector<Orb> taken;
    const float r2 = range * range;
    auto it = std::stable_partition(m_orbs.begin(), m_orbs.end(), [&](const Orb &o) {
        float dx = x - o.x;
        float dy = y - o.y;
        return dx * dx + dy * dy >= r2;
    });
    std::move(it, m_orbs.end(), std::back_inserter(taken));
    m_orbs.erase(it, m_orbs.end());
    return taken;
}

Enemy &World::add_enemy(Enemy e)
{
    m_enemies.push_back(std::move(e));
    return m_enemies.back();
}

size_t World::human_count() const
{
    return static_cast<size_t>(
        std::count_if(m_players.begin(), m_players.end(), [](const auto &kv) { return !kv.second.is_bot; }));
}

size_t World::bot_count() const
{
    return m_players.size() - human_count();
}

} // namespace ttt::game
