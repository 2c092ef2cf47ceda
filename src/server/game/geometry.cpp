// SPDX-License-Identifier: Apache-2.0
#include "server/game/geometry.hpp"

#include <algorithm>
#include <cmath>

namespace ttt::game {

namespace {
constexpr int kMaxSpawnAttempts = 1000;
}

b2Vec2 closest_point(const b2AABB &box, b2Vec2 p)
{
    return b2Clamp(p, box.lowerBound, box.upperBound);
}

bool is_blocked(const WorldConfig &cfg, float x, float y, float radius)
{
    if (!std::isfinite(x) || !std::isfinite(y))
        return true;
    if (x < radius || x > cfg.map_width - radius || y < radius || y > cfg.map_height - radius)
        return true;
    const b2Vec2 c{x, y};
    const float r2 = radius * radius;
    return std::any_of(cfg.obstacles.begin(), cfg.obstacles.end(), [&](const b2AABB &box) {
        return b2DistanceSquared(c, closest_point(box, c)) < r2;
    });
}

std::optional<b2Vec2> random_free_point(const WorldConfig &cfg, std::mt19937 &rng, float margin, float radius)
{
    float max_x = std::max(margin, cfg.map_width - margin);
    float max_y = std::max(margin, cfg.map_height - margin);
    std::uniform_real_distribution<float> dx(margin, max_x);
    std::uniform_real_distribution<float> dy(margin, max_y);
    for (int attempt = 0; attempt < kMaxSpawnAttempts; ++attempt) {
        float x = dx(rng);
        float y = dy(rng);
        if (!is_blocked(cfg, x, y, radius))
            return b2Vec2{x, y};
    }
    return std::nullopt;
}

float wrap_angle(float a)
{
    return std::atan2(std::sin(a), std::cos(a));
}

} // namespace ttt::game
