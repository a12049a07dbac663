
#pragma once

#include <algorithm>
#include <cmath>
#include <concepts>
#include <iterator>
#include <limits>

#include "shotform/foundation.hpp"

namespace shotform
{
constexpr double dNAN = std::numeric_limits<double>::quiet_NaN();

// -------------------------------------------------------------------- Float-Eq

namespace detail
{
   template<typename T> inline T default_is_close_epsilon() noexcept
   {
      if constexpr(sizeof(T) == 4)
         return 1e-4f;
      else
         return 1e-6;
   }
} // namespace detail

template<typename T>
inline T relative_epsilon(T a, T b, T relative_tolerance = T(NAN)) noexcept
{
   if(std::isnan(relative_tolerance))
      relative_tolerance = detail::default_is_close_epsilon<T>();
   return relative_tolerance * T(std::max(std::fabs(a), std::fabs(b)));
}

template<typename T>
inline bool is_close(T a, T b, T relative_tolerance = T(NAN)) noexcept
{
   return std::isfinite(a) and std::isfinite(b)
          and T(std::fabs(a - b)) <= relative_epsilon(a, b, relative_tolerance);
}

template<typename T>
inline constexpr bool
float_is_same(T a, T b, T relative_tolerance = T(NAN)) noexcept
{
   return (std::isfinite(a) and std::isfinite(b)
           and is_close(a, b, relative_tolerance))
          or (std::isnan(a) and std::isnan(b))
          or (a == b); // covers +/- infinity
}

// ----------------------------------------------------------------------- Clamp

template<typename T> constexpr T clamp(T in, T min, T max) noexcept
{
   if(in < min) return min;
   if(in > max) return max;
   return in;
}

// ---------------------------------------------------------------------- Square

template<typename T> constexpr T square(T x) noexcept { return x * x; }

// ---------------------------------------------------------------------- Angles

template<std::floating_point T> inline constexpr T to_radians(T theta) noexcept
{
   return theta * (T(M_PI) / T(180.0));
}

template<std::floating_point T> inline constexpr T to_degrees(T theta) noexcept
{
   return theta * (T(180.0) / T(M_PI));
}

// ----------------------------------------------------------- sample statistics

// Upper median for even-sized ranges. Reorders the range.
template<typename InputItr>
auto calc_median(InputItr begin, InputItr end) noexcept
{
   const auto N = std::distance(begin, end);
   Expects(N > 0);
   auto mid = begin + N / 2;
   std::nth_element(begin, mid, end);
   return *mid;
}

} // namespace shotform
