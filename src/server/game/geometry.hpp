// SPDX-License-Identifier: Apache-2.0
// geometry.hpp - Circle vs map bounds / static obstacle tests shared by every mover.
#pragma once
#include "server/game/world_config.hpp"

#include <box2d/box2d.h>

#include <optional>
#include <random>

namespace ttt::game {

// True if a circle at (x, y) would leave [r, W-r] x [r, H-r] or overlap any obstacle.
bool is_blocked(const WorldConfig &cfg, float x, float y, float radius);

// Closest point of box to p (p itself when inside).
b2Vec2 closest_point(const b2AABB &box, b2Vec2 p);

// Uniform rejection sampling inside [margin, W-margin] x [margin, H-margin] until the circle is free.
std::optional<b2Vec2> random_free_point(const WorldConfig &cfg, std::mt19937 &rng, float margin, float radius);

// Wraps an angle difference to (-pi, pi].
float wrap_angle(float a);

} // namespace ttt::game
