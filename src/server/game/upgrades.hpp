// SPDX-License-Identifier: Apache-2.0
// upgrades.hpp - Upgrade catalog (data only), effect interpreter and draft generation.
#pragma once
#include "game.pb.h"
#include "server/game/world_config.hpp"

#include <cstdint>
#include <random>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace ttt::game {

enum class Rarity : uint8_t
{
    Common,
    Uncommon,
    Rare,
    Epic,
    Legendary
};

enum class EffectKind : uint8_t
{
    ScaleMaxHp,
    ScaleFireRate,
    ScaleMoveSpeed,
    ScaleBulletDamage,
    ScalePickupRange,
    ScaleBulletSpeed,
    ScaleBulletLifeTime,
    AddBulletCount, // value = pellets added
    SetBulletCount, // value = pellet count
    EnableRearGuard,
    AddRegen // value = hp/sec added
};

struct UpgradeEffect
{
    EffectKind kind;
    float value{0.f};
    // Bullet count effects raise spread to at least this many degrees.
    float min_spread_deg{0.f};
};

struct UpgradeDef
{
    std::string_view id;
    std::string_view name;
    std::string_view description;
    Rarity rarity;
    std::string_view prerequisite; // empty when none
    UpgradeEffect effect;
};

const std::vector<UpgradeDef> &upgrade_catalog();
const UpgradeDef *find_upgrade(std::string_view id);

void apply_effect(StatBlock &stats, const UpgradeEffect &effect);

// Rarity bucket for a uniform draw u in [0, 1).
Rarity rarity_for_roll(double u);

// Catalog entries not owned whose prerequisite (if any) is owned, in catalog order.
std::vector<const UpgradeDef *> eligible_upgrades(std::span<const std::string> owned);

// Up to count distinct eligible upgrades, each slot biased by a rarity roll.
std::vector<const UpgradeDef *> generate_upgrades(size_t count, std::span<const std::string> owned, std::mt19937 &rng);

ttt::Rarity to_proto(Rarity r);
void fill_option(ttt::UpgradeOption &out, const UpgradeDef &def);

} // namespace ttt::game
