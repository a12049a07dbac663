
#define CATCH_CONFIG_PREFIX_ALL
#include <catch2/catch.hpp>

#include "shotform/filters/one-euro-filter.hpp"
#include "shotform/filters/pose-smoother.hpp"
#include "shotform/utils/math.hpp"

namespace shotform
{
CATCH_TEST_CASE("OneEuroFilter", "[one-euro-filter]")
{
   CATCH_SECTION("one-euro-constant-input")
   {
      OneEuroFilter f;
      for(int i = 0; i < 50; ++i) {
         const auto t = 0.033 * i;
         CATCH_REQUIRE(f.update(412.75, t) == 412.75);
      }
      CATCH_REQUIRE(f.derivative() == 0.0);
   }

   CATCH_SECTION("one-euro-first-update-seeds")
   {
      OneEuroFilter f;
      CATCH_REQUIRE(!f.has_state());
      CATCH_REQUIRE(f.update(3.0, 10.0) == 3.0);
      CATCH_REQUIRE(f.has_state());
      CATCH_REQUIRE(f.timestamp() == 10.0);
   }

   CATCH_SECTION("one-euro-lags-a-step")
   {
      OneEuroFilter f;
      f.update(0.0, 0.0);
      const auto y = f.update(100.0, 0.033);
      CATCH_REQUIRE(y > 0.0);
      CATCH_REQUIRE(y < 100.0);

      // And keeps closing the gap
      const auto z = f.update(100.0, 0.066);
      CATCH_REQUIRE(z > y);
      CATCH_REQUIRE(z < 100.0);
   }

   CATCH_SECTION("one-euro-non-increasing-timestamp")
   {
      OneEuroFilter f;
      f.update(1.0, 0.0);
      const auto y = f.update(5.0, 0.1);

      const auto v = f.value();
      const auto d = f.derivative();
      const auto t = f.timestamp();

      CATCH_REQUIRE(f.update(1000.0, 0.1) == y); // dt == 0
      CATCH_REQUIRE(f.update(1000.0, 0.05) == y); // dt < 0
      CATCH_REQUIRE(f.value() == v);
      CATCH_REQUIRE(f.derivative() == d);
      CATCH_REQUIRE(f.timestamp() == t);
   }

   CATCH_SECTION("one-euro-non-finite-input")
   {
      OneEuroFilter f;
      f.update(2.0, 0.0);
      CATCH_REQUIRE(f.update(dNAN, 0.1) == 2.0);
      CATCH_REQUIRE(f.timestamp() == 0.0);
   }

   CATCH_SECTION("one-euro-reset")
   {
      OneEuroFilter f;
      f.update(2.0, 0.0);
      f.update(4.0, 0.1);
      f.reset();
      CATCH_REQUIRE(!f.has_state());
      CATCH_REQUIRE(f.update(-7.0, 0.0) == -7.0);
   }

   CATCH_SECTION("one-euro-smoothing-factor")
   {
      // tau = 1/(2 pi fc) = 1 when fc = 1/(2 pi)
      const auto a = OneEuroFilter::smoothing_factor(1.0, 0.5 / M_PI);
      CATCH_REQUIRE(a == Approx(0.5));

      // A zero cutoff is floored, not divided by
      const auto b = OneEuroFilter::smoothing_factor(0.1, 0.0);
      CATCH_REQUIRE(std::isfinite(b));
      CATCH_REQUIRE(b >= 0.0);
   }

   CATCH_SECTION("one-euro-params-read")
   {
      OneEuroParams p;
      Json::Value o{Json::objectValue};
      o["beta"] = 0.5;
      p.read_with_defaults<OneEuroParams>(o, false);
      CATCH_REQUIRE(p.beta == 0.5);
      CATCH_REQUIRE(p.min_cutoff == 1.15);
      CATCH_REQUIRE(p.d_cutoff == 1.0);
   }
}

CATCH_TEST_CASE("PoseSmoother", "[pose-smoother]")
{
   CATCH_SECTION("pose-smoother-point-independence")
   {
      PoseSmoother s;
      s.update("right_knee", Vector2{10.0, 20.0}, 0.0);
      s.update("right_knee", Vector2{12.0, 21.0}, 0.1);

      const auto before = *s.find("right_knee");
      for(int i = 0; i < 10; ++i)
         s.update("left_knee", Vector2{100.0 + i, 200.0 - i}, 0.2 + 0.1 * i);
      const auto after = *s.find("right_knee");

      CATCH_REQUIRE(before.x.value() == after.x.value());
      CATCH_REQUIRE(before.y.value() == after.y.value());
      CATCH_REQUIRE(before.x.derivative() == after.x.derivative());
      CATCH_REQUIRE(before.x.timestamp() == after.x.timestamp());
      CATCH_REQUIRE(s.size() == 2);
   }

   CATCH_SECTION("pose-smoother-smooths-a-pose")
   {
      using namespace skeleton;
      PoseSmoother s;

      PersonPose p0(0.0,
                    {Keypoint{L_KNEE, Vector2{10.0, 10.0}, 0.9},
                     Keypoint{"racket_tip", Vector2{1.0, 1.0}, 0.5}});
      PersonPose p1(0.1,
                    {Keypoint{L_KNEE, Vector2{10.0, 10.0}, 0.9},
                     Keypoint{"racket_tip", Vector2{50.0, 1.0}, 0.5}});

      const auto s0 = s.smooth(p0);
      const auto s1 = s.smooth(p1);

      CATCH_REQUIRE(s0 == p0);
      CATCH_REQUIRE(s1.timestamp() == 0.1);
      CATCH_REQUIRE(s1.keypoint(L_KNEE)->pos == Vector2(10.0, 10.0));
      CATCH_REQUIRE(s.find("racket_tip") != nullptr);
      CATCH_REQUIRE(s.find("racket_tip")->x.value() < 50.0);
   }

   CATCH_SECTION("pose-smoother-reset")
   {
      PoseSmoother s;
      s.update("nose", Vector2{1.0, 1.0}, 0.0);
      s.reset();
      CATCH_REQUIRE(s.size() == 0);
      CATCH_REQUIRE(s.find("nose") == nullptr);

      const auto xy = s.update("nose", Vector2{9.0, 9.0}, 0.0);
      CATCH_REQUIRE(xy == Vector2(9.0, 9.0));
   }
}

} // namespace shotform
