// SPDX-License-Identifier: Apache-2.0
#include "server/game/upgrades.hpp"

#include <algorithm>
#include <iterator>

namespace ttt::game {

const std::vector<UpgradeDef> &upgrade_catalog()
{
    using K = EffectKind;
    using R = Rarity;
    static const std::vector<UpgradeDef> catalog = {
        {"titan_hull_1", "Titan Hull I", "+20% Max HP", R::Common, "", {K::ScaleMaxHp, 1.2f}},
        {"rapid_fire_1", "Rapid Fire I", "+10% Fire Rate", R::Common, "", {K::ScaleFireRate, 0.9f}},
        {"swiftness_1", "Swiftness I", "+10% Move Speed", R::Common, "", {K::ScaleMoveSpeed, 1.1f}},
        {"high_caliber_1", "High Caliber I", "+10% Damage", R::Common, "", {K::ScaleBulletDamage, 1.1f}},
        {"magnetism_1", "Magnetism I", "+20% Pickup Range", R::Common, "", {K::ScalePickupRange, 1.2f}},

        {"titan_hull_2", "Titan Hull II", "+40% Max HP", R::Rare, "titan_hull_1", {K::ScaleMaxHp, 1.4f}},
        {"rapid_fire_2", "Rapid Fire II", "+20% Fire Rate", R::Rare, "rapid_fire_1", {K::ScaleFireRate, 0.8f}},
        {"double_barrel_1", "Double Barrel", "+1 Bullet", R::Rare, "", {K::AddBulletCount, 1.f, 15.f}},

        {"titan_hull_3", "Titan Hull III", "+60% Max HP", R::Epic, "titan_hull_2", {K::ScaleMaxHp, 1.6f}},
        {"rear_guard", "Rear Guard", "Back Cannon", R::Epic, "", {K::EnableRearGuard}},

        {"titan_hull_4", "Titan Hull IV", "+100% Max HP", R::Legendary, "titan_hull_3", {K::ScaleMaxHp, 2.0f}},

        {"velocity_1", "Velocity I", "+20% Bullet Speed", R::Common, "", {K::ScaleBulletSpeed, 1.2f}},
        {"velocity_2", "Velocity II", "+30% Bullet Speed", R::Rare, "velocity_1", {K::ScaleBulletSpeed, 1.3f}},

        {"sniper_1", "Sniper Scope", "+50% Range", R::Rare, "", {K::ScaleBulletLifeTime, 1.5f}},

        {"triple_shot", "Triple Shot", "Fire 3 bullets", R::Legendary, "", {K::SetBulletCount, 3.f, 30.f}},

        {"regen_1", "Regeneration I", "+2 HP/sec", R::Common, "", {K::AddRegen, 2.f}},
        {"regen_2", "Regeneration II", "+5 HP/sec", R::Rare, "regen_1", {K::AddRegen, 5.f}},
        {"regen_3", "Regeneration III", "+10 HP/sec", R::Epic, "regen_2", {K::AddRegen, 10.f}},

        {"heavy_shells", "Heavy Shells", "+20% Damage", R::Rare, "", {K::ScaleBulletDamage, 1.2f}},
        {"turbo_engine", "Turbo Engine", "+20% Move Speed", R::Rare, "", {K::ScaleMoveSpeed, 1.2f}},
    };
    return catalog;
}

const UpgradeDef *find_upgrade(std::string_view id)
{
    const auto &cat = upgrade_catalog();
    auto it = std::find_if(cat.begin(), cat.end(), [&](const UpgradeDef &u) { return u.id == id; });
    return it == cat.end() ? nullptr : &*it;
}

void apply_effect(StatBlock &stats, const UpgradeEffect &effect)
{
    switch (effect.kind) {
        case EffectKind::ScaleMaxHp:
            stats.max_hp *= effect.value;
            break;
        case EffectKind::ScaleFireRate:
            stats.fire_rate_ms *= effect.value;
            break;
        case EffectKind::ScaleMoveSpeed:
            stats.move_speed *= effect.value;
            break;
        case EffectKind::ScaleBulletDamage:
            stats.bullet_damage *= effect.value;
            break;
        case EffectKind::ScalePickupRange:
            stats.pickup_range *= effect.value;
            break;
        case EffectKind::ScaleBulletSpeed:
            stats.bullet_speed *= effect.value;
            break;
        case EffectKind::ScaleBulletLifeTime:
            stats.bullet_life_time_ms *= effect.value;
            break;
        case EffectKind::AddBulletCount:
            stats.bullet_count += static_cast<uint32_t>(effect.value);
            stats.spread_angle_deg = std::max(stats.spread_angle_deg, effect.min_spread_deg);
            break;
        case EffectKind::SetBulletCount:
            stats.bullet_count = static_cast<uint32_t>(effect.value);
            stats.spread_angle_deg = std::max(stats.spread_angle_deg, effect.min_spread_deg);
            break;
        case EffectKind::EnableRearGuard:
            stats.rear_guard = true;
            break;
        case EffectKind::AddRegen:
            stats.regen_rate += effect.value;
            break;
    }
}

Rarity rarity_for_roll(double u)
{
    if (u > 0.98)
        return Rarity::Legendary;
    if (u > 0.90)
        return Rarity::Epic;
    if (u > 0.70)
        return Rarity::Rare;
    if (u > 0.50)
        return Rarity::Uncommon;
    return Rarity::Common;
}

std::vector<const UpgradeDef *> eligible_upgrades(std::span<const std::string> owned)
{
    auto has = [&](std::string_view id) { return std::find(owned.begin(), owned.end(), id) != owned.end(); };
    std::vector<const UpgradeDef *> out;
    for (const auto &u : upgrade_catalog()) {
        if (has(u.id))
            continue;
        if (!u.prerequisite.empty() && !has(u.prerequisite))
            continue;
        out.push_back(&u);
    }
    return out;
}

std::vector<const UpgradeDef *> generate_upgrades(size_t count, std::span<const std::string> owned, std::mt19937 &rng)
{
    auto available = eligible_upgrades(owned);
    std::vector<const UpgradeDef *> options;
    std::uniform_real_distribution<double> roll(0.0, 1.0);
    for (size_t i = 0; i < count && !available.empty(); ++i) {
        Rarity r = rarity_for_roll(roll(rng));
        std::vector<const UpgradeDef *> pool;
        std::copy_if(available.begin(), available.end(), std::back_inserter(pool), [&](const UpgradeDef *u) {
            return u->rarity == r;
        });
        if (pool.empty())
            pool = available;
        std::uniform_int_distribution<size_t> pick(0, pool.size() - 1);
        const UpgradeDef *selected = pool[pick(rng)];
        options.push_back(selected);
        available.erase(std::find(available.begin(), available.end(), selected));
    }
    return options;
}

ttt::Rarity to_proto(Rarity r)
{
    switch (r) {
        case Rarity::Common:
            return ttt::RARITY_COMMON;
        case Rarity::Uncommon:
            return ttt::RARITY_UNCOMMON;
        case Rarity::Rare:
            return ttt::RARITY_RARE;
        case Rarity::Epic:
            return ttt::RARITY_EPIC;
        case Rarity::Legendary:
            return ttt::RARITY_LEGENDARY;
    }
    return ttt::RARITY_COMMON;
}

void fill_option(ttt::UpgradeOption &out, const UpgradeDef &def)
{
    out.set_id(std::string(def.id));
    out.set_name(std::string(def.name));
    out.set_description(std::string(def.description));
    out.set_rarity(to_proto(def.rarity));
}

} // namespace ttt::game
