// SPDX-License-Identifier: Apache-2.0
// world_config.hpp - Immutable world/tuning parameters, loaded once at startup.
#pragma once
#include <box2d/box2d.h>

#include <cstdint>
#include <string>
#include <vector>

namespace YAML {
class Node;
}

namespace ttt::game {

struct StatBlock
{
    float max_hp{100.f};
    float fire_rate_ms{300.f}; // cooldown between volleys
    uint32_t bullet_count{1};
    float bullet_damage{10.f};
    float bullet_speed{360.f}; // units per second
    float move_speed{240.f};
    float pickup_range{35.f};
    bool rear_guard{false};
    float bullet_life_time_ms{3000.f};
    float spread_angle_deg{0.f};
    float regen_rate{0.f}; // hp per second
};

struct WorldConfig
{
    float map_width{4000.f};
    float map_height{4000.f};
    // Static obstacles as axis-aligned boxes (lowerBound = top-left corner in map coordinates).
    std::vector<b2AABB> obstacles{
        {{400.f, 300.f}, {520.f, 340.f}},
        {{900.f, 600.f}, {960.f, 800.f}},
        {{1400.f, 450.f}, {1600.f, 510.f}},
        {{700.f, 1100.f}, {1000.f, 1140.f}},
    };
    std::vector<std::string> palette{"#ff6b6b", "#4ecdc4", "#45b7d1", "#96ceb4", "#feca57", "#ff9ff3"};

    float tank_radius{20.f};
    float bullet_radius{5.f};
    float orb_radius{10.f};
    float player_spawn_margin{100.f};
    float entity_spawn_margin{50.f};

    // Fixed step of every periodic driver (bullets, enemy AI, bot AI).
    uint32_t tick_ms{50};
    uint32_t regen_interval_ms{1000};
    uint32_t enemy_spawn_interval_ms{2000};
    uint32_t orb_respawn_delay_ms{1000};
    uint32_t levelup_immunity_ms{10000};
    uint32_t respawn_immunity_ms{3000};

    uint32_t orb_target{50};
    uint32_t orb_value{20};
    uint32_t enemy_drop_orb_value{10};
    uint32_t kill_exp{50};
    uint32_t base_max_exp{100};
    float max_exp_growth{1.2f};
    uint32_t draft_size{3};

    uint32_t bot_count{8};
    float bot_sense_range{1000.f};
    float bot_orb_sense_range{500.f};
    float bot_advance_distance{200.f};
    float bot_retreat_distance{150.f};
    float bot_turn_gain{0.3f};
    float bot_orb_turn_gain{0.2f};
    float bot_fire_tolerance_rad{0.2f};
    float bot_wander_jitter_rad{0.5f};
    float muzzle_offset{40.f};
    // Client supplied shot origins farther than this from the shooter are replaced by the muzzle point.
    float max_shot_origin_distance{80.f};

    uint32_t enemy_cap{50};
    float enemy_hp{30.f};
    float enemy_radius{20.f};
    float enemy_min_speed{100.f};
    float enemy_speed_jitter{50.f};
    float enemy_contact_damage{1.f}; // hp per AI tick while touching
    uint32_t enemy_exp{15};

    StatBlock human_stats{};
    StatBlock bot_stats{100.f, 800.f, 1, 8.f, 300.f, 150.f, 35.f, false, 3000.f, 0.f, 1.f};
};

// Overrides defaults with the keys present in node (a mapping); absent keys keep defaults.
// Throws YAML::Exception on type mismatches.
WorldConfig load_world_config(const YAML::Node &node, WorldConfig base = {});
WorldConfig load_world_config_file(const std::string &path);

} // namespace ttt::game
