// SPDX-License-Identifier: Apache-2.0
// Hostile spawn cadence and cap, seeking and contact damage.
#include "server/game/simulation.hpp"
#include "test_sink.hpp"

#include <cassert>
#include <cmath>
#include <iostream>

using ttt::ServerMessage;
using ttt::game::Enemy;
using ttt::game::Simulation;

static Enemy make_enemy(const std::string &id, float x, float y, float speed, float contact)
{
    Enemy e;
    e.id = id;
    e.x = x;
    e.y = y;
    e.hp = 30.f;
    e.max_hp = 30.f;
    e.speed = speed;
    e.radius = 20.f;
    e.contact_damage = contact;
    e.exp_value = 15;
    return e;
}

static void spawn_cadence_and_cap()
{
    ttt::test::RecordingSink sink;
    auto cfg = ttt::test::quiet_world();
    cfg.enemy_cap = 3;
    Simulation sim(cfg, sink, 21);
    for (int i = 0; i < 39; ++i)
        sim.tick();
    assert(sim.world().enemies().empty());
    sim.tick();
    assert(sim.world().enemies().size() == 1);
    assert(sink.count(ServerMessage::kEnemySpawned) == 1);
    const Enemy &e = sim.world().enemies()[0];
    assert(e.hp == 30.f && e.max_hp == 30.f && e.radius == 20.f && e.exp_value == 15);
    assert(e.speed >= 100.f && e.speed < 150.f);
    assert(e.x >= 50.f && e.x <= 3950.f && e.y >= 50.f && e.y <= 3950.f);
    // Cap holds no matter how long the timer runs.
    for (int i = 0; i < 400; ++i)
        sim.tick();
    assert(sim.world().enemies().size() == 3);
    assert(sim.spawn_enemy() == nullptr);
}

static void seek_and_contact()
{
    ttt::test::RecordingSink sink;
    auto cfg = ttt::test::quiet_world();
    Simulation sim(cfg, sink, 22);
    sim.on_session_open("p_1");
    sim.on_session_open("p_2");
    auto &near = *sim.world().find_player("p_1");
    auto &far = *sim.world().find_player("p_2");
    near.x = 2300.f;
    near.y = 2000.f;
    far.x = 1000.f;
    far.y = 3000.f;
    sim.world().add_enemy(make_enemy("e_seek", 2000.f, 2000.f, 100.f, 1.f));

    sink.clear();
    sim.tick();
    const Enemy &e = sim.world().enemies()[0];
    // Moves speed * dt straight at the nearest living player.
    assert(std::fabs(e.x - 2005.f) < 1e-3f && std::fabs(e.y - 2000.f) < 1e-3f);
    assert(sink.count(ServerMessage::kEnemiesMoved) == 1);
    assert(sink.of(ServerMessage::kEnemiesMoved)[0].enemies_moved().enemies_size() == 1);
    assert(near.hp == 100.f);

    // Dead players are not targeted: the hostile turns toward p_2.
    near.hp = 0.f;
    float x0 = e.x;
    sim.tick();
    assert(e.x < x0 && e.y > 2000.f);
    near.hp = 100.f;

    // Contact damage honours the per-hostile value, once per tick.
    sim.world().enemies().clear();
    sim.world().add_enemy(make_enemy("e_touch", 2270.f, 2000.f, 100.f, 7.f));
    sink.clear();
    sim.tick();
    assert(near.hp == 93.f);
    assert(sink.count(ServerMessage::kPlayerHit) == 1);
    sim.tick();
    assert(near.hp == 86.f);

    // Immune players take no contact damage.
    near.immune_until_ms = sim.now_ms() + 10000;
    sim.tick();
    assert(near.hp == 86.f);
    near.immune_until_ms = 0;

    // Lethal contact kills without awarding anyone.
    near.hp = 5.f;
    sink.clear();
    sim.tick();
    assert(near.hp == 0.f);
    assert(sink.count_for("p_1", ServerMessage::kPlayerDied) == 1);
}

static void blocked_by_walls()
{
    ttt::test::RecordingSink sink;
    auto cfg = ttt::test::quiet_world();
    Simulation sim(cfg, sink, 23);
    sim.on_session_open("p_1");
    auto &p = *sim.world().find_player("p_1");
    // Obstacle (900,600,60,200) stands between hostile and player.
    p.x = 1100.f;
    p.y = 700.f;
    sim.world().add_enemy(make_enemy("e_wall", 879.f, 700.f, 100.f, 1.f));
    sim.tick();
    assert(sim.world().enemies()[0].x == 879.f);
}

static void idle_without_players()
{
    ttt::test::RecordingSink sink;
    auto cfg = ttt::test::quiet_world();
    Simulation sim(cfg, sink, 24);
    sim.world().add_enemy(make_enemy("e_idle", 2000.f, 2000.f, 100.f, 1.f));
    sim.tick();
    assert(sim.world().enemies()[0].x == 2000.f && sim.world().enemies()[0].y == 2000.f);
    assert(sink.count(ServerMessage::kEnemiesMoved) == 1);
}

int main()
{
    spawn_cadence_and_cap();
    seek_and_contact();
    blocked_by_walls();
    idle_without_players();
    std::cout << "unit_enemy_ai OK" << std::endl;
    return 0;
}
