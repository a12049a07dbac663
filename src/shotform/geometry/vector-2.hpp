
#pragma once

#include "shotform/foundation.hpp"
#include <cmath>

namespace shotform
{
// --------------------------------------------------------------------- Vector2
// Image-space position, pixels. `y` increases downwards.
template<typename T> class Vector2T
{
 public:
   using value_type = T;

   T x, y;

   Vector2T()
       : x(T(0.0))
       , y(T(0.0))
   {}
   Vector2T(T x_, T y_)
       : x(x_)
       , y(y_)
   {}

   Vector2T(const Vector2T&) = default;
   Vector2T& operator=(const Vector2T& v) = default;

   static Vector2T nan() { return Vector2T(T(NAN), T(NAN)); }

   unsigned size() const { return 2; }

   T quadrance() const { return x * x + y * y; }
   T norm() const { return T(std::sqrt(quadrance())); }
   T dot(const Vector2T& rhs) const { return x * rhs.x + y * rhs.y; }
   T distance(const Vector2T& rhs) const { return (*this - rhs).norm(); }

   T& operator[](int idx)
   {
#ifdef DEBUG_BUILD
      assert(idx >= 0 && idx < 2);
#endif
      return (idx == 0) ? x : y;
   }
   const T& operator[](int idx) const
   {
#ifdef DEBUG_BUILD
      assert(idx >= 0 && idx < 2);
#endif
      return (idx == 0) ? x : y;
   }

   Vector2T& operator*=(T scalar)
   {
      x *= scalar;
      y *= scalar;
      return *this;
   }

   Vector2T& operator/=(T scalar)
   {
      x /= scalar;
      y /= scalar;
      return *this;
   }
   Vector2T operator*(T scalar) const
   {
      Vector2T res(*this);
      res *= scalar;
      return res;
   }

   Vector2T operator/(T scalar) const
   {
      Vector2T res(*this);
      res /= scalar;
      return res;
   }

   Vector2T& operator+=(const Vector2T& rhs)
   {
      x += rhs.x;
      y += rhs.y;
      return *this;
   }

   Vector2T& operator-=(const Vector2T& rhs)
   {
      x -= rhs.x;
      y -= rhs.y;
      return *this;
   }

   Vector2T operator+(const Vector2T& rhs) const
   {
      Vector2T res(*this);
      res += rhs;
      return res;
   }
   Vector2T operator-(const Vector2T& rhs) const
   {
      Vector2T res(*this);
      res -= rhs;
      return res;
   }

   Vector2T operator-() const { return Vector2T<T>(-x, -y); }

   bool operator==(const Vector2T& rhs) const
   {
      return x == rhs.x && y == rhs.y;
   }
   bool operator!=(const Vector2T& rhs) const { return !(*this == rhs); }

   bool is_nan() const { return std::isnan(x) || std::isnan(y); }
   bool is_finite() const { return std::isfinite(x) && std::isfinite(y); }

   inline friend bool isfinite(const Vector2T& o) noexcept
   {
      return o.is_finite();
   }

   std::string to_string(const char* fmt = nullptr) const
   {
      if(fmt == nullptr) {
         if constexpr(std::is_floating_point<T>::value) {
            return format("[{:7.5f}, {:7.5f}]", x, y);
         } else {
            return format("[{}, {}]", x, y);
         }
      }
      return format(fmt::runtime(fmt), x, y);
   }

   friend std::string str(const Vector2T<T>& o) noexcept
   {
      return o.to_string();
   }
};

// Scalar multiplication
template<typename T> Vector2T<T> operator*(double a, const Vector2T<T>& v)
{
   return v * T(a);
}

template<typename T>
std::ostream& operator<<(std::ostream& out, const Vector2T<T>& v)
{
   out << v.to_string();
   return out;
}

using Vector2 = Vector2T<real>;

// Midpoint of two positions
template<typename T>
inline Vector2T<T> midpoint(const Vector2T<T>& a, const Vector2T<T>& b)
{
   return Vector2T<T>(T(0.5) * (a.x + b.x), T(0.5) * (a.y + b.y));
}

} // namespace shotform
