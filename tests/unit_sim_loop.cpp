// SPDX-License-Identifier: Apache-2.0
// Inbound dispatch from the session queue into the simulation, and gauge publication.
#include "common/metrics.hpp"
#include "server/game/sim_loop.hpp"
#include "test_sink.hpp"

#include <cassert>
#include <iostream>

using ttt::ServerMessage;

static size_t count_case(const std::vector<ServerMessage> &msgs, ServerMessage::PayloadCase c)
{
    size_t n = 0;
    for (const auto &m : msgs)
        n += m.payload_case() == c ? 1 : 0;
    return n;
}

int main()
{
    ttt::game::WorldConfig cfg = ttt::test::quiet_world();
    cfg.orb_target = 4;
    ttt::net::SessionManager mgr;
    ttt::game::Simulation sim(cfg, mgr, 5);
    sim.start(false);

    auto s1 = mgr.add_session(nullptr);
    auto s2 = mgr.add_session(nullptr);
    assert(ttt::game::dispatch_inbound(sim, mgr.drain_inbound()) == 0);
    assert(sim.world().human_count() == 2);

    // Each client: session_info, then its own game_state. p_2 only learns of p_1 from the snapshot;
    // p_1, already joined, is told about p_2.
    auto out1 = mgr.drain_messages(s1);
    auto out2 = mgr.drain_messages(s2);
    assert(out1.size() == 3);
    assert(out1[0].payload_case() == ServerMessage::kSessionInfo);
    assert(out1[1].payload_case() == ServerMessage::kGameState);
    assert(out1[1].game_state().orbs_size() == 4);
    assert(out1[2].player_joined().id() == "p_2");
    assert(out2.size() == 2);
    assert(out2[0].session_info().session_id() == "p_2");
    assert(out2[1].game_state().players_size() == 2);

    // A session whose open has not been applied yet receives no world events.
    auto s3 = mgr.add_session(nullptr);
    sim.on_move("p_1", 1900.f, 1900.f, 0.f);
    sim.tick();
    auto pending = mgr.drain_messages(s3);
    assert(pending.size() == 1 && pending[0].has_session_info());
    ttt::game::dispatch_inbound(sim, mgr.drain_inbound());
    auto out3 = mgr.drain_messages(s3);
    assert(out3.size() == 1 && out3[0].has_game_state());
    mgr.disconnect_session(s3);
    ttt::game::dispatch_inbound(sim, mgr.drain_inbound());
    mgr.drain_messages(s1);
    mgr.drain_messages(s2);

    // Moves are routed by session id and fanned out to everyone else.
    ttt::ClientMessage mv;
    mv.mutable_player_move()->set_x(2000.f);
    mv.mutable_player_move()->set_y(2100.f);
    mv.mutable_player_move()->set_angle(0.5f);
    mgr.post_message(s1, mv);
    ttt::game::dispatch_inbound(sim, mgr.drain_inbound());
    const auto *p1 = sim.world().find_player("p_1");
    assert(p1 && p1->x == 2000.f && p1->y == 2100.f);
    out1 = mgr.drain_messages(s1);
    out2 = mgr.drain_messages(s2);
    assert(count_case(out1, ServerMessage::kPlayerMoved) == 0);
    assert(count_case(out2, ServerMessage::kPlayerMoved) == 1);

    // Heartbeats never reach game logic.
    ttt::ClientMessage hb;
    hb.mutable_heartbeat()->set_time_ms(1);
    mgr.post_message(s1, hb);
    assert(ttt::game::dispatch_inbound(sim, mgr.drain_inbound()) == 0);
    assert(mgr.drain_messages(s1).empty() && mgr.drain_messages(s2).empty());

    mgr.disconnect_session(s1);
    ttt::game::dispatch_inbound(sim, mgr.drain_inbound());
    assert(sim.world().human_count() == 1);
    out2 = mgr.drain_messages(s2);
    assert(count_case(out2, ServerMessage::kPlayerLeft) == 1);
    assert(out2.back().player_left().id() == "p_1");

    sim.tick();
    ttt::game::publish_gauges(sim);
    auto &rt = ttt::metrics::runtime();
    assert(rt.orbs_active.load() == sim.world().orbs().size());
    assert(rt.bullets_active.load() == 0);
    assert(rt.enemies_active.load() == 0);
    assert(rt.bots_alive.load() == 0);

    std::cout << "unit_sim_loop OK" << std::endl;
    return 0;
}
