
#define CATCH_CONFIG_PREFIX_ALL
#include <catch2/catch.hpp>

#include <random>

#include "shotform/kinematics/angles.hpp"
#include "shotform/kinematics/frame-angles.hpp"

#include "testcases/pose-builders.hpp"

namespace shotform
{
using namespace skeleton;
using testing::kp;
using testing::place;

CATCH_TEST_CASE("Angle3", "[angle3]")
{
   CATCH_SECTION("angle3-right-angle")
   {
      const auto x
          = angle3(Vector2{1.0, 0.0}, Vector2{0.0, 0.0}, Vector2{0.0, 1.0});
      CATCH_REQUIRE(x.has_value());
      CATCH_REQUIRE(*x == Approx(90.0));
   }

   CATCH_SECTION("angle3-symmetric")
   {
      std::mt19937 gen(42);
      std::uniform_real_distribution<real> distrib(-500.0, 500.0);
      auto rand_v = [&]() { return Vector2{distrib(gen), distrib(gen)}; };

      for(int i = 0; i < 100; ++i) {
         const auto a = rand_v(), b = rand_v(), c = rand_v();
         const auto abc = angle3(a, b, c);
         const auto cba = angle3(c, b, a);
         CATCH_REQUIRE(abc.has_value() == cba.has_value());
         if(abc.has_value()) CATCH_REQUIRE(*abc == *cba);
      }
   }

   CATCH_SECTION("angle3-degenerate")
   {
      const Vector2 p{3.0, 4.0};
      CATCH_REQUIRE(!angle3(p, p, p).has_value());
      CATCH_REQUIRE(!angle3(p, p, Vector2{5.0, 5.0}).has_value());
      CATCH_REQUIRE(!angle3(Vector2::nan(), p, Vector2{5.0, 5.0}).has_value());

      // Collinear points are well defined
      const auto straight
          = angle3(Vector2{0.0, 0.0}, Vector2{1.0, 1.0}, Vector2{2.0, 2.0});
      CATCH_REQUIRE(straight.has_value());
      CATCH_REQUIRE(*straight == Approx(180.0));

      const auto folded
          = angle3(Vector2{2.0, 2.0}, Vector2{0.0, 0.0}, Vector2{1.0, 1.0});
      CATCH_REQUIRE(folded.has_value());
      CATCH_REQUIRE(*folded == Approx(0.0).margin(1e-6));
   }

   CATCH_SECTION("angle3-confidence")
   {
      const Keypoint a = kp(L_HIP, 0.0, 0.0, 0.9);
      const Keypoint b = kp(L_KNEE, 0.0, 10.0, 0.9);
      const Keypoint c = kp(L_ANKLE, 10.0, 10.0, 0.1);
      const Keypoint d = kp(L_ANKLE, 10.0, 10.0, std::nullopt);

      CATCH_REQUIRE(!angle3(&a, &b, &c).has_value());
      CATCH_REQUIRE(angle3(&a, &b, &c, 0.05).has_value());
      CATCH_REQUIRE(angle3(&a, &b, &d).has_value()); // no score => confident
      CATCH_REQUIRE(!angle3(&a, &b, nullptr).has_value());
   }
}

CATCH_TEST_CASE("JointAngles", "[joint-angles]")
{
   CATCH_SECTION("joint-angle-side-preference")
   {
      // Left elbow at 120, right elbow at 160
      const Vector2 ls{100.0, 100.0}, le{100.0, 150.0};
      const Vector2 rs{200.0, 100.0}, re{200.0, 150.0};
      const auto lw = place(ls, le, 120.0, 40.0);
      const auto rw = place(rs, re, 160.0, 40.0);

      auto make = [&](real l_score, real r_score) {
         return PersonPose(0.0,
                           {kp(L_SHOULDER, ls.x, ls.y, 0.9),
                            kp(L_ELBOW, le.x, le.y, 0.9),
                            kp(L_WRIST, lw.x, lw.y, l_score),
                            kp(R_SHOULDER, rs.x, rs.y, 0.9),
                            kp(R_ELBOW, re.x, re.y, 0.9),
                            kp(R_WRIST, rw.x, rw.y, r_score)});
      };

      { // Left more confident
         const auto x = preferred_joint_angle(make(0.8, 0.5), Joint::ELBOW);
         CATCH_REQUIRE(x.has_value());
         CATCH_REQUIRE(x->side == Side::LEFT);
         CATCH_REQUIRE(x->degrees == Approx(120.0));
      }

      { // Tie goes right, never averaged
         const auto x = preferred_joint_angle(make(0.7, 0.7), Joint::ELBOW);
         CATCH_REQUIRE(x.has_value());
         CATCH_REQUIRE(x->side == Side::RIGHT);
         CATCH_REQUIRE(x->degrees == Approx(160.0));
      }

      { // Only the right side is usable
         const auto x = preferred_joint_angle(make(0.05, 0.5), Joint::ELBOW);
         CATCH_REQUIRE(x.has_value());
         CATCH_REQUIRE(x->side == Side::RIGHT);
      }

      CATCH_REQUIRE(!preferred_joint_angle(make(0.8, 0.5), Joint::KNEE));

      { // The per-frame record carries the same choice
         const auto fa = compute_frame_angles(make(0.8, 0.5));
         CATCH_REQUIRE(fa.elbow.has_value());
         CATCH_REQUIRE(fa.elbow->side == Side::LEFT);
         CATCH_REQUIRE(fa.elbow->degrees == Approx(120.0));
         CATCH_REQUIRE(fa.right.elbow.has_value());
         CATCH_REQUIRE(!fa.knee.has_value());

         const auto o = fa.to_json();
         CATCH_REQUIRE(o["elbow"]["side"].asString() == str(Side::LEFT));
         CATCH_REQUIRE(o["knee"].isNull());
      }
   }

   CATCH_SECTION("joint-angle-wrist-flexion")
   {
      const Vector2 e{0.0, 0.0}, w{0.0, -30.0};
      const auto pinky = place(e, w, 145.0, 8.0);

      PersonPose p(0.0,
                   {kp(R_ELBOW, e.x, e.y),
                    kp(R_WRIST, w.x, w.y),
                    kp(R_INDEX, 0.0, -40.0, 0.05), // not confident
                    kp(R_PINKY, pinky.x, pinky.y)});

      const auto flex = wrist_flexion(p, Side::RIGHT);
      CATCH_REQUIRE(flex.has_value());
      CATCH_REQUIRE(*flex == Approx(35.0));
      CATCH_REQUIRE(!wrist_flexion(p, Side::LEFT).has_value());
   }

   CATCH_SECTION("joint-angle-torso-foot-alignment")
   {
      const real y = 300.0 - 20.0 * std::tan(to_radians(10.0));
      PersonPose p(0.0,
                   {kp(L_HIP, 90.0, 200.0),
                    kp(R_HIP, 110.0, 200.0),
                    kp(L_ANKLE, 90.0, 300.0),
                    kp(R_ANKLE, 110.0, y)});
      const auto a = torso_foot_alignment(p);
      CATCH_REQUIRE(a.has_value());
      CATCH_REQUIRE(*a == Approx(10.0));

      // Undirected: swapping the ankles changes nothing
      PersonPose q(0.0,
                   {kp(L_HIP, 90.0, 200.0),
                    kp(R_HIP, 110.0, 200.0),
                    kp(R_ANKLE, 90.0, 300.0),
                    kp(L_ANKLE, 110.0, y)});
      CATCH_REQUIRE(*torso_foot_alignment(q) == Approx(10.0));
   }

   CATCH_SECTION("joint-angle-com-and-width")
   {
      PersonPose p(0.0,
                   {kp(L_SHOULDER, 60.0, 100.0),
                    kp(R_SHOULDER, 140.0, 100.0),
                    kp(L_HIP, 90.0, 200.0),
                    kp(R_HIP, 130.0, 200.0),
                    kp(L_ANKLE, 80.0, 280.0),
                    kp(R_ANKLE, 100.0, 280.0)});

      // hip-mid (110, 200), ankle-mid (90, 280)
      const auto com = lateral_com_offset(p);
      CATCH_REQUIRE(com.has_value());
      CATCH_REQUIRE(*com == Approx(20.0 / std::hypot(20.0, 80.0)));

      const auto bw = body_width(p);
      CATCH_REQUIRE(bw.has_value());
      CATCH_REQUIRE(*bw == Approx(80.0));

      const auto fa = compute_frame_angles(p, k_min_keypoint_score);
      CATCH_REQUIRE(fa.com_offset.has_value());
      CATCH_REQUIRE(!fa.left.elbow.has_value());
   }
}

} // namespace shotform
