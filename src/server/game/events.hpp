// SPDX-License-Identifier: Apache-2.0
// events.hpp - Builders translating world entities into outbound protobuf messages.
#pragma once
#include "game.pb.h"
#include "server/game/world.hpp"

namespace ttt::game {

void fill_stats(ttt::Stats &out, const StatBlock &s);
void fill_player_state(ttt::PlayerState &out, const Player &p);
void fill_bullet_state(ttt::BulletState &out, const Bullet &b);
void fill_orb_state(ttt::OrbState &out, const Orb &o);
void fill_enemy_state(ttt::EnemyState &out, const Enemy &e);

ttt::ServerMessage make_game_state(const World &world, const WorldConfig &cfg, uint64_t now_ms);
ttt::ServerMessage make_player_joined(const Player &p);
ttt::ServerMessage make_player_left(const std::string &id);
ttt::ServerMessage make_player_moved(const Player &p);
ttt::ServerMessage make_player_hit(const Player &p);
// with_stats adds the stat block and owned upgrade ids (sent when they changed).
ttt::ServerMessage make_exp_update(const Player &p, bool with_stats);
ttt::ServerMessage make_immunity(const Player &p);
ttt::ServerMessage make_player_died(const Player &p);
ttt::ServerMessage make_bullet_shot(const Bullet &b);
ttt::ServerMessage make_bullet_removed(const std::string &id);
ttt::ServerMessage make_orb_spawned(const Orb &o);
ttt::ServerMessage make_orb_collected(const std::string &id);
ttt::ServerMessage make_enemy_spawned(const Enemy &e);
ttt::ServerMessage make_enemies_moved(const std::vector<Enemy> &enemies);
ttt::ServerMessage make_enemy_died(const std::string &id);

} // namespace ttt::game
