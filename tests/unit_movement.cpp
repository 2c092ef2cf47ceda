// SPDX-License-Identifier: Apache-2.0
// Join/leave, movement validation, orb pickup and the first level-up draft.
#include "server/game/simulation.hpp"
#include "test_sink.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>
#include <set>

using ttt::ServerMessage;
using ttt::game::Orb;
using ttt::game::Simulation;

int main()
{
    ttt::test::RecordingSink sink;
    auto cfg = ttt::test::quiet_world();
    Simulation sim(cfg, sink, 1234);
    sim.start();
    assert(sim.world().players().empty() && sim.world().orbs().empty());

    // Join: snapshot to the newcomer only, playerJoined to the others.
    sim.on_session_open("p_1");
    assert(sink.count_for("p_1", ServerMessage::kGameState) == 1);
    assert(sink.count_for("p_1", ServerMessage::kPlayerJoined) == 0);
    sim.on_session_open("p_2");
    assert(sink.count_for("p_2", ServerMessage::kGameState) == 1);
    assert(sink.count_for("p_1", ServerMessage::kPlayerJoined) == 1);
    assert(sink.count_for("p_2", ServerMessage::kPlayerJoined) == 0);
    {
        auto gs = sink.of(ServerMessage::kGameState).back().game_state();
        assert(gs.players_size() == 2);
        assert(gs.obstacles_size() == 4);
        assert(gs.map_width() == 4000.f);
        auto *p = sim.world().find_player("p_2");
        assert(p && p->hp == 100.f && p->level == 1 && p->max_exp == 100 && !p->color.empty());
        assert(p->x >= 100.f && p->x <= 3900.f && p->y >= 100.f && p->y <= 3900.f);
    }
    // Duplicate open is ignored.
    size_t before = sink.sent.size();
    sim.on_session_open("p_1");
    assert(sink.sent.size() == before);

    auto &p1 = *sim.world().find_player("p_1");
    p1.x = 350.f;
    p1.y = 320.f;

    // Blocked by obstacle (400,300,120,40): position kept, angle accepted, still broadcast.
    sink.clear();
    sim.on_move("p_1", 450.f, 320.f, 1.25f);
    assert(p1.x == 350.f && p1.y == 320.f);
    assert(p1.angle == 1.25f);
    assert(sink.count_for("p_2", ServerMessage::kPlayerMoved) == 1);
    assert(sink.count_for("p_1", ServerMessage::kPlayerMoved) == 0);

    // Out of bounds and non-finite positions are rejected.
    sim.on_move("p_1", 5.f, 5.f, 0.f);
    assert(p1.x == 350.f && p1.y == 320.f);
    const float nan = std::numeric_limits<float>::quiet_NaN();
    sim.on_move("p_1", nan, 100.f, nan);
    assert(p1.x == 350.f && p1.angle == 0.f);

    // Valid move.
    sim.on_move("p_1", 2000.f, 2000.f, 0.5f);
    assert(p1.x == 2000.f && p1.y == 2000.f && p1.angle == 0.5f);

    // Unknown session and dead players are ignored.
    sink.clear();
    sim.on_move("p_9", 2100.f, 2100.f, 0.f);
    auto &p2 = *sim.world().find_player("p_2");
    p2.hp = 0.f;
    float p2x = p2.x;
    sim.on_move("p_2", 2200.f, 2200.f, 0.f);
    assert(p2.x == p2x);
    assert(sink.sent.empty());
    p2.hp = 100.f;
    p2.x = 3000.f;
    p2.y = 3000.f;

    // Five 20-exp orbs at the player's feet: exactly one draft, sent to the player only.
    for (int i = 0; i < 5; ++i) {
        Orb o;
        o.id = "o_test_" + std::to_string(i);
        o.x = 2010.f;
        o.y = 2000.f + static_cast<float>(i);
        o.value = 20;
        sim.world().add_orb(o);
    }
    // Outside pickup range (35): untouched.
    {
        Orb far;
        far.id = "o_far";
        far.x = 2040.f;
        far.y = 2000.f;
        far.value = 20;
        sim.world().add_orb(far);
    }
    sink.clear();
    sim.on_move("p_1", 2000.f, 2000.f, 0.5f);
    assert(p1.exp == 100);
    assert(sim.world().orbs().size() == 1);
    assert(sink.count(ServerMessage::kOrbCollected) == 5);
    assert(sink.count(ServerMessage::kPlayerExpUpdate) == 5);
    assert(sink.count(ServerMessage::kLevelUpOptions) == 1);
    assert(sink.count_for("p_1", ServerMessage::kLevelUpOptions) == 1);
    assert(sink.count_for("p_2", ServerMessage::kLevelUpOptions) == 0);
    {
        auto opts = sink.of(ServerMessage::kLevelUpOptions).front().level_up_options();
        assert(opts.options_size() == 3);
        std::set<std::string> ids;
        for (const auto &o : opts.options())
            ids.insert(o.id());
        assert(ids.size() == 3);
        assert(ids.count("titan_hull_2") == 0);
    }
    assert(p1.pending_level_up && p1.offered.size() == 3);
    assert(p1.immune_until_ms == sim.now_ms() + cfg.levelup_immunity_ms);
    assert(sink.count(ServerMessage::kPlayerImmunity) == 1);

    // While pending, more exp never opens a second draft.
    {
        Orb o;
        o.id = "o_extra";
        o.x = 2000.f;
        o.y = 2000.f;
        o.value = 20;
        sim.world().add_orb(o);
    }
    sink.clear();
    sim.on_move("p_1", 2000.f, 2000.f, 0.5f);
    assert(p1.exp == 120);
    assert(sink.count(ServerMessage::kLevelUpOptions) == 0);
    assert(p1.level == 1);

    // Every pickup is replaced one second later; nothing appears earlier.
    assert(sim.world().orbs().size() == 1);
    for (int i = 0; i < 19; ++i)
        sim.tick();
    assert(sim.world().orbs().size() == 1);
    sim.tick();
    assert(sim.world().orbs().size() == 7);

    // Leave: playerLeft to the rest, entity gone, second close ignored.
    sink.clear();
    sim.on_session_close("p_2");
    assert(sim.world().find_player("p_2") == nullptr);
    assert(sink.count(ServerMessage::kPlayerLeft) == 1);
    sim.on_session_close("p_2");
    assert(sink.count(ServerMessage::kPlayerLeft) == 1);
    std::cout << "unit_movement OK" << std::endl;
    return 0;
}
