#pragma once

#include <cmath>

namespace wiggle
{

struct Vec2
{
    float x = 0.0f;
    float y = 0.0f;

    Vec2 operator-(const Vec2& o) const { return {x - o.x, y - o.y}; }
    bool operator==(const Vec2& o) const { return x == o.x && y == o.y; }
    bool operator!=(const Vec2& o) const { return !(*this == o); }

    float dot(const Vec2& o) const { return x * o.x + y * o.y; }
    float length() const { return std::sqrt(x * x + y * y); }
};

// One position observation of an entity. Timestamps are in seconds.
struct Sample
{
    Vec2 position;
    double timestamp = 0.0;
};

}  // namespace wiggle
