// SPDX-License-Identifier: Apache-2.0
#include "server/game/upgrades.hpp"

#include <algorithm>
#include <cassert>
#include <cmath>
#include <iostream>
#include <set>
#include <string>
#include <vector>

using namespace ttt::game;

static std::vector<std::string> all_ids()
{
    std::vector<std::string> ids;
    for (const auto &u : upgrade_catalog())
        ids.emplace_back(u.id);
    return ids;
}

int main()
{
    assert(upgrade_catalog().size() == 20);
    assert(find_upgrade("titan_hull_4") != nullptr);
    assert(find_upgrade("titan_hull_4")->prerequisite == "titan_hull_3");
    assert(find_upgrade("no_such_upgrade") == nullptr);
    // Every prerequisite refers to a catalog entry.
    for (const auto &u : upgrade_catalog())
        assert(u.prerequisite.empty() || find_upgrade(u.prerequisite) != nullptr);

    // Rarity thresholds.
    assert(rarity_for_roll(0.0) == Rarity::Common);
    assert(rarity_for_roll(0.50) == Rarity::Common);
    assert(rarity_for_roll(0.51) == Rarity::Uncommon);
    assert(rarity_for_roll(0.70) == Rarity::Uncommon);
    assert(rarity_for_roll(0.75) == Rarity::Rare);
    assert(rarity_for_roll(0.90) == Rarity::Rare);
    assert(rarity_for_roll(0.95) == Rarity::Epic);
    assert(rarity_for_roll(0.98) == Rarity::Epic);
    assert(rarity_for_roll(0.99) == Rarity::Legendary);

    std::mt19937 rng(42);
    {
        // Fresh player: never offered a gated tier, never duplicates.
        std::vector<std::string> owned;
        for (int i = 0; i < 2000; ++i) {
            auto opts = generate_upgrades(3, owned, rng);
            assert(opts.size() == 3);
            std::set<std::string_view> ids;
            for (auto *o : opts) {
                assert(o->prerequisite.empty());
                assert(o->id != "titan_hull_2");
                ids.insert(o->id);
            }
            assert(ids.size() == 3);
        }
    }
    {
        // Owned entries are excluded, unlocked tiers become eligible.
        std::vector<std::string> owned{"titan_hull_1", "velocity_1"};
        auto elig = eligible_upgrades(owned);
        auto has = [&](std::string_view id) {
            return std::any_of(elig.begin(), elig.end(), [&](const UpgradeDef *u) { return u->id == id; });
        };
        assert(!has("titan_hull_1") && !has("velocity_1"));
        assert(has("titan_hull_2") && has("velocity_2"));
        assert(!has("titan_hull_3") && !has("rapid_fire_2"));
        for (int i = 0; i < 500; ++i) {
            for (auto *o : generate_upgrades(3, owned, rng)) {
                assert(std::find(owned.begin(), owned.end(), o->id) == owned.end());
                assert(o->prerequisite.empty()
                       || std::find(owned.begin(), owned.end(), o->prerequisite) != owned.end());
            }
        }
    }
    {
        // Pool smaller than the draft size: fewer options, all distinct.
        auto owned = all_ids();
        owned.erase(std::find(owned.begin(), owned.end(), "regen_3"));
        owned.erase(std::find(owned.begin(), owned.end(), "turbo_engine"));
        auto opts = generate_upgrades(3, owned, rng);
        assert(opts.size() == 2);
        assert(opts[0] != opts[1]);
        assert(generate_upgrades(3, all_ids(), rng).empty());
    }
    {
        // Effects compose in acquisition order.
        StatBlock a;
        apply_effect(a, find_upgrade("double_barrel_1")->effect);
        assert(a.bullet_count == 2 && a.spread_angle_deg == 15.f);
        apply_effect(a, find_upgrade("triple_shot")->effect);
        assert(a.bullet_count == 3 && a.spread_angle_deg == 30.f);

        StatBlock b;
        apply_effect(b, find_upgrade("triple_shot")->effect);
        apply_effect(b, find_upgrade("double_barrel_1")->effect);
        assert(b.bullet_count == 4 && b.spread_angle_deg == 30.f);
    }
    {
        StatBlock s;
        apply_effect(s, find_upgrade("titan_hull_1")->effect);
        assert(std::fabs(s.max_hp - 120.f) < 1e-3f);
        apply_effect(s, find_upgrade("rapid_fire_1")->effect);
        assert(std::fabs(s.fire_rate_ms - 270.f) < 1e-3f);
        apply_effect(s, find_upgrade("regen_1")->effect);
        apply_effect(s, find_upgrade("regen_2")->effect);
        assert(std::fabs(s.regen_rate - 7.f) < 1e-5f);
        apply_effect(s, find_upgrade("rear_guard")->effect);
        assert(s.rear_guard);
        apply_effect(s, find_upgrade("sniper_1")->effect);
        assert(std::fabs(s.bullet_life_time_ms - 4500.f) < 1e-2f);
    }
    {
        ttt::UpgradeOption opt;
        fill_option(opt, *find_upgrade("triple_shot"));
        assert(opt.id() == "triple_shot");
        assert(opt.name() == "Triple Shot");
        assert(opt.rarity() == ttt::RARITY_LEGENDARY);
    }
    std::cout << "unit_upgrades OK" << std::endl;
    return 0;
}
