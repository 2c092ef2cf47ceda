// SPDX-License-Identifier: Apache-2.0
// Bot steering: engage range bands, fire cadence, orb seeking and wandering.
#include "server/game/simulation.hpp"
#include "test_sink.hpp"

#include <cassert>
#include <cmath>
#include <iostream>

using ttt::ServerMessage;
using ttt::game::Orb;
using ttt::game::Player;
using ttt::game::Simulation;

static size_t shots_by(const ttt::test::RecordingSink &sink, const std::string &owner)
{
    size_t n = 0;
    for (const auto &m : sink.of(ServerMessage::kBulletShot))
        n += m.bullet_shot().owner_id() == owner ? 1 : 0;
    return n;
}

struct Arena
{
    ttt::test::RecordingSink sink;
    ttt::game::WorldConfig cfg = ttt::test::quiet_world();
    Simulation sim{cfg, sink, 31};
    Player *bot{nullptr};
    Player *human{nullptr};

    Arena(float human_dx)
    {
        bot = sim.spawn_bot();
        bot->x = 2000.f;
        bot->y = 2000.f;
        bot->angle = 0.f;
        sim.on_session_open("p_1");
        human = sim.world().find_player("p_1");
        human->x = 2000.f + human_dx;
        human->y = 2000.f;
        sink.clear();
    }
};

static void advance_and_fire()
{
    Arena a(500.f);
    a.sim.tick();
    // Facing the target: advances at move_speed and fires at once.
    assert(std::fabs(a.bot->x - 2007.5f) < 1e-3f);
    assert(shots_by(a.sink, a.bot->id) == 1);
    const auto &b = a.sim.world().bullets()[0];
    assert(b.owner_id == a.bot->id && b.damage == 8.f && b.speed == 300.f);
    assert(a.sink.count(ServerMessage::kPlayerMoved) == 1);
    // Cooldown 800 ms: next shot strictly after it elapses.
    for (int i = 0; i < 16; ++i)
        a.sim.tick();
    assert(a.sim.now_ms() == 850);
    assert(shots_by(a.sink, a.bot->id) == 1);
    a.sim.tick();
    assert(shots_by(a.sink, a.bot->id) == 2);
}

static void retreat_and_hold()
{
    {
        Arena a(100.f);
        a.sim.tick();
        assert(std::fabs(a.bot->x - 1992.5f) < 1e-3f);
    }
    {
        Arena a(175.f);
        a.sim.tick();
        assert(a.bot->x == 2000.f);
    }
}

static void turns_toward_target()
{
    Arena a(0.f);
    a.human->x = 2000.f;
    a.human->y = 2600.f;
    a.sim.tick();
    // 30% of the heading error per tick, no shot while misaligned.
    assert(std::fabs(a.bot->angle - 0.3f * 1.5707963f) < 1e-4f);
    assert(shots_by(a.sink, a.bot->id) == 0);
}

static void ignores_immune_and_far()
{
    Arena a(300.f);
    a.human->immune_until_ms = 100000;
    for (int i = 0; i < 20; ++i)
        a.sim.tick();
    assert(shots_by(a.sink, a.bot->id) == 0);
    a.human->immune_until_ms = 0;
    a.human->x = 3500.f;
    for (int i = 0; i < 20; ++i)
        a.sim.tick();
    assert(shots_by(a.sink, a.bot->id) == 0);
}

static void seeks_orbs()
{
    Arena a(0.f);
    a.sim.on_session_close("p_1");
    Orb o;
    o.id = "o_bait";
    o.x = 2300.f;
    o.y = 2000.f;
    o.value = 20;
    a.sim.world().add_orb(o);
    // Reached after 36 ticks; the replacement orb appears 20 ticks later.
    for (int i = 0; i < 50; ++i)
        a.sim.tick();
    assert(a.bot->exp == 20);
    bool bait_left = false;
    for (const auto &orb : a.sim.world().orbs())
        bait_left = bait_left || orb.id == "o_bait";
    assert(!bait_left);
}

static void wanders_at_half_speed()
{
    Arena a(0.f);
    a.sim.on_session_close("p_1");
    a.sim.tick();
    float dx = a.bot->x - 2000.f;
    float dy = a.bot->y - 2000.f;
    assert(std::fabs(std::sqrt(dx * dx + dy * dy) - 3.75f) < 1e-3f);
    assert(std::fabs(a.bot->angle) <= 0.25f);
}

static void ignores_client_input()
{
    Arena a(0.f);
    a.sim.on_session_close("p_1");
    a.sim.on_move(a.bot->id, 100.f, 100.f, 1.f);
    a.sim.on_shoot(a.bot->id, 2000.f, 2000.f, 0.f);
    assert(a.bot->x == 2000.f && a.bot->y == 2000.f && a.bot->angle == 0.f);
    assert(a.sim.world().bullets().empty());
}

int main()
{
    advance_and_fire();
    retreat_and_hold();
    turns_toward_target();
    ignores_immune_and_far();
    seeks_orbs();
    wanders_at_half_speed();
    ignores_client_input();
    std::cout << "unit_bot_ai OK" << std::endl;
    return 0;
}
