// SPDX-License-Identifier: Apache-2.0
#include "server/game/world_config.hpp"

#include <yaml-cpp/yaml.h>

namespace ttt::game {

namespace {

template <typename T>
void read(const YAML::Node &node, const char *key, T &out)
{
    if (node[key])
        out = node[key].as<T>();
}

void read_stats(const YAML::Node &node, StatBlock &s)
{
    if (!node || !node.IsMap())
        return;
    read(node, "max_hp", s.max_hp);
    read(node, "fire_rate_ms", s.fire_rate_ms);
    read(node, "bullet_count", s.bullet_count);
    read(node, "bullet_damage", s.bullet_damage);
    read(node, "bullet_speed", s.bullet_speed);
    read(node, "move_speed", s.move_speed);
    read(node, "pickup_range", s.pickup_range);
    read(node, "rear_guard", s.rear_guard);
    read(node, "bullet_life_time_ms", s.bullet_life_time_ms);
    read(node, "spread_angle_deg", s.spread_angle_deg);
    read(node, "regen_rate", s.regen_rate);
}

} // namespace

WorldConfig load_world_config(const YAML::Node &node, WorldConfig cfg)
{
    if (!node || !node.IsMap())
        return cfg;
    read(node, "map_width", cfg.map_width);
    read(node, "map_height", cfg.map_height);
    if (node["obstacles"]) {
        // Each entry: {x, y, width, height}
        cfg.obstacles.clear();
        for (const auto &o : node["obstacles"]) {
            float x = o["x"].as<float>();
            float y = o["y"].as<float>();
            float w = o["width"].as<float>();
            float h = o["height"].as<float>();
            cfg.obstacles.push_back(b2AABB{{x, y}, {x + w, y + h}});
        }
    }
    if (node["palette"])
        cfg.palette = node["palette"].as<std::vector<std::string>>();
    read(node, "tank_radius", cfg.tank_radius);
    read(node, "bullet_radius", cfg.bullet_radius);
    read(node, "orb_radius", cfg.orb_radius);
    read(node, "player_spawn_margin", cfg.player_spawn_margin);
    read(node, "entity_spawn_margin", cfg.entity_spawn_margin);
    read(node, "tick_ms", cfg.tick_ms);
    read(node, "regen_interval_ms", cfg.regen_interval_ms);
    read(node, "enemy_spawn_interval_ms", cfg.enemy_spawn_interval_ms);
    read(node, "orb_respawn_delay_ms", cfg.orb_respawn_delay_ms);
    read(node, "levelup_immunity_ms", cfg.levelup_immunity_ms);
    read(node, "respawn_immunity_ms", cfg.respawn_immunity_ms);
    read(node, "orb_target", cfg.orb_target);
    read(node, "orb_value", cfg.orb_value);
    read(node, "enemy_drop_orb_value", cfg.enemy_drop_orb_value);
    read(node, "kill_exp", cfg.kill_exp);
    read(node, "base_max_exp", cfg.base_max_exp);
    read(node, "max_exp_growth", cfg.max_exp_growth);
    read(node, "draft_size", cfg.draft_size);
    read(node, "bot_count", cfg.bot_count);
    read(node, "bot_sense_range", cfg.bot_sense_range);
    read(node, "bot_orb_sense_range", cfg.bot_orb_sense_range);
    read(node, "bot_advance_distance", cfg.bot_advance_distance);
    read(node, "bot_retreat_distance", cfg.bot_retreat_distance);
    read(node, "bot_turn_gain", cfg.bot_turn_gain);
    read(node, "bot_orb_turn_gain", cfg.bot_orb_turn_gain);
    read(node, "bot_fire_tolerance_rad", cfg.bot_fire_tolerance_rad);
    read(node, "bot_wander_jitter_rad", cfg.bot_wander_jitter_rad);
    read(node, "muzzle_offset", cfg.muzzle_offset);
    read(node, "max_shot_origin_distance", cfg.max_shot_origin_distance);
    read(node, "enemy_cap", cfg.enemy_cap);
    read(node, "enemy_hp", cfg.enemy_hp);
    read(node, "enemy_radius", cfg.enemy_radius);
    read(node, "enemy_min_speed", cfg.enemy_min_speed);
    read(node, "enemy_speed_jitter", cfg.enemy_speed_jitter);
    read(node, "enemy_contact_damage", cfg.enemy_contact_damage);
    read(node, "enemy_exp", cfg.enemy_exp);
    read_stats(node["human_stats"], cfg.human_stats);
    read_stats(node["bot_stats"], cfg.bot_stats);
    if (cfg.tick_ms == 0)
        cfg.tick_ms = 50;
    // A zero threshold or shrinking curve would let a level up satisfy its own check again.
    if (cfg.base_max_exp == 0)
        cfg.base_max_exp = 1;
    if (!(cfg.max_exp_growth >= 1.f))
        cfg.max_exp_growth = 1.f;
    return cfg;
}

WorldConfig load_world_config_file(const std::string &path)
{
    YAML::Node root = YAML::LoadFile(path);
    return load_world_config(root["world"]);
}

} // namespace ttt::game
