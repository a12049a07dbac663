
#pragma once

#include "shotform/skeleton/person-pose.hpp"
#include "shotform/utils/math.hpp"

namespace shotform::testing
{
inline Keypoint
kp(skeleton::KeypointName name, real x, real y, std::optional<real> s = 0.9)
{
   return Keypoint{name, Vector2{x, y}, s};
}

// The point C, `len` away from B, such that angle ABC is `degrees`
inline Vector2
place(const Vector2& a, const Vector2& b, real degrees, real len) noexcept
{
   const auto u = (a - b) / (a - b).norm();
   const auto t = to_radians(degrees);
   return b
          + len
                * Vector2{u.x * std::cos(t) - u.y * std::sin(t),
                          u.x * std::sin(t) + u.y * std::cos(t)};
}

} // namespace shotform::testing
