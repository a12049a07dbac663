
#define CATCH_CONFIG_PREFIX_ALL
#include <catch2/catch.hpp>

#include "shotform/skeleton/person-pose.hpp"

#include "testcases/pose-builders.hpp"

namespace shotform
{
using namespace skeleton;
using testing::kp;

CATCH_TEST_CASE("KeypointName", "[keypoint-name]")
{
   CATCH_SECTION("keypoint-name-strings")
   {
      for(int i = 0; i < k_n_keypoints; ++i) {
         const auto x = int_to_keypoint_name(i);
         CATCH_REQUIRE(to_keypoint_name(str(x)) == x);
      }

      CATCH_REQUIRE(to_keypoint_name("left_knee") == L_KNEE);
      CATCH_REQUIRE(to_keypoint_name("right_foot_index") == R_FOOT_INDEX);
      CATCH_REQUIRE(to_keypoint_name("racket") == UNKNOWN);
      CATCH_REQUIRE(to_keypoint_name("") == UNKNOWN);

      CATCH_REQUIRE(to_side("left") == Side::LEFT);
      CATCH_REQUIRE_THROWS(to_side("middle"));
   }

   CATCH_SECTION("keypoint-name-sided")
   {
      CATCH_REQUIRE(sided(L_KNEE, Side::RIGHT) == R_KNEE);
      CATCH_REQUIRE(sided(R_KNEE, Side::RIGHT) == R_KNEE);
      CATCH_REQUIRE(sided(R_WRIST, Side::LEFT) == L_WRIST);
      CATCH_REQUIRE(sided(L_SHOULDER, Side::LEFT) == L_SHOULDER);
      CATCH_REQUIRE(sided(L_FOOT_INDEX, Side::RIGHT) == R_FOOT_INDEX);
      CATCH_REQUIRE(sided(NOSE, Side::RIGHT) == NOSE);
      CATCH_REQUIRE(sided(UNKNOWN, Side::LEFT) == UNKNOWN);
   }
}

CATCH_TEST_CASE("PersonPose", "[person-pose]")
{
   CATCH_SECTION("person-pose-sorted-and-unique")
   {
      PersonPose p(1.0,
                   {kp(R_ANKLE, 5.0, 5.0),
                    kp(NOSE, 1.0, 1.0),
                    Keypoint{"racket", Vector2{9.0, 9.0}, 0.5},
                    kp(R_ANKLE, 6.0, 6.0), // duplicate, dropped
                    kp(L_KNEE, 2.0, 2.0)});

      CATCH_REQUIRE(p.size() == 4);
      CATCH_REQUIRE(p.keypoints().front().name == NOSE);
      CATCH_REQUIRE(p.keypoints().back().name == UNKNOWN);
      CATCH_REQUIRE(p.keypoint(R_ANKLE)->pos == Vector2(5.0, 5.0));
      CATCH_REQUIRE(p.keypoint(L_ANKLE) == nullptr);
      CATCH_REQUIRE(p.keypoint(UNKNOWN) == nullptr);
   }

   CATCH_SECTION("person-pose-confident")
   {
      PersonPose p(0.0,
                   {kp(L_KNEE, 2.0, 2.0, 0.1),
                    kp(R_KNEE, 3.0, 3.0, std::nullopt),
                    kp(L_HIP, dNAN, 3.0, 0.9)});

      CATCH_REQUIRE(p.confident(L_KNEE, 0.15) == nullptr);
      CATCH_REQUIRE(p.confident(L_KNEE, 0.1) != nullptr);
      CATCH_REQUIRE(p.confident(R_KNEE, 0.99) != nullptr);
      CATCH_REQUIRE(p.confident(L_HIP, 0.0) == nullptr);
      CATCH_REQUIRE(p.keypoint(L_HIP) != nullptr);

      p.set_position(L_KNEE, Vector2{7.0, 8.0});
      CATCH_REQUIRE(p.keypoint(L_KNEE)->pos == Vector2(7.0, 8.0));
      CATCH_REQUIRE(p.keypoint(L_KNEE)->score == 0.1);
   }

   CATCH_SECTION("person-pose-json")
   {
      PersonPose p(0.5,
                   {kp(L_KNEE, 2.0, 2.5, 0.75),
                    kp(R_KNEE, 3.0, 3.0, std::nullopt),
                    Keypoint{"racket", Vector2{9.0, 9.0}, 0.5}});

      PersonPose q;
      q.read(p.to_json());
      CATCH_REQUIRE(p == q);
      CATCH_REQUIRE(!q.keypoint(R_KNEE)->score.has_value());
      CATCH_REQUIRE(q.keypoints().back().part == "racket"s);

      Json::Value o = p.to_json();
      o["keypoints"][0].removeMember("x");
      CATCH_REQUIRE_THROWS(q.read(o));
   }
}

} // namespace shotform
