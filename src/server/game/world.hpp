// SPDX-License-Identifier: Apache-2.0
// world.hpp - Authoritative entity registry. Owned by the simulation; nothing else keeps copies.
#pragma once
#include "server/game/world_config.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace ttt::game {

struct Player
{
    std::string id; // session id for humans, bot_<n> for bots
    float x{0.f};
    float y{0.f};
    float angle{0.f}; // radians
    std::string color;
    float hp{100.f};
    float max_hp{100.f};
    uint32_t exp{0};
    uint32_t max_exp{100};
    uint32_t level{1};
    StatBlock stats{};
    uint64_t immune_until_ms{0};
    bool pending_level_up{false};
    std::vector<std::string> offered; // ids of the open draft (humans only)
    std::vector<std::string> upgrades; // acquisition order
    bool is_bot{false};
    uint64_t last_shot_ms{0};
    bool has_shot{false};

    bool alive() const { return hp > 0.f; }
    bool immune(uint64_t now_ms) const { return now_ms < immune_until_ms; }
};

struct Bullet
{
    std::string id;
    float x{0.f};
    float y{0.f};
    float angle{0.f};
    std::string owner_id;
    // Copied from the shooter at fire time.
    float damage{0.f};
    float speed{0.f};
    uint64_t expires_at_ms{0};
};

struct Orb
{
    std::string id;
    float x{0.f};
    float y{0.f};
    uint32_t value{0};
};

struct Enemy
{
    std::string id;
    float x{0.f};
    float y{0.f};
    float hp{0.f};
    float max_hp{0.f};
    float speed{0.f};
    float radius{20.f};
    float contact_damage{1.f};
    uint32_t exp_value{0};
};

class World
{
public:
    std::string next_id(const char *prefix);

    std::map<std::string, Player> &players() { return m_players; }
    const std::map<std::string, Player> &players() const { return m_players; }
    Player *find_player(const std::string &id);
    Player &insert_player(Player p);
    bool erase_player(const std::string &id);

    std::vector<Bullet> &bullets() { return m_bullets; }
    const std::vector<Bullet> &bullets() const { return m_bullets; }
    Bullet &add_bullet(Bullet b);
    // Removes every bullet owned by owner_id; returns the removed ids.
    std::vector<std::string> erase_bullets_owned_by(const std::string &owner_id);

    std::vector<Orb> &orbs() { return m_orbs; }
    const std::vector<Orb> &orbs() const { return m_orbs; }
    Orb &add_orb(Orb o);
    // Removes and returns orbs strictly closer than range to (x, y).
    std::vector<Orb> take_orbs_within(float x, float y, float range);

    std::vector<Enemy> &enemies() { return m_enemies; }
    const std::vector<Enemy> &enemies() const { return m_enemies; }
    Enemy &add_enemy(Enemy e);

    size_t human_count() const;
    size_t bot_count() const;

private:
    uint64_t m_id_counter{0};
    std::map<std::string, Player> m_players;
    std::vector<Bullet> m_bullets;
    std::vector<Orb> m_orbs;
    std::vector<Enemy> m_enemies;
};

} // namespace ttt::game
