
#define CATCH_CONFIG_PREFIX_ALL
#include <catch2/catch.hpp>

#include "shotform/release/release-detector.hpp"

#include "testcases/pose-builders.hpp"

namespace shotform
{
using namespace skeleton;
using testing::kp;
using testing::place;

// A right arm hanging from the wrist: the elbow sits 50px below the wrist,
// and the shoulder is placed to give the requested elbow angle.
static PoseSample
make_arm_sample(real t, real wrist_y, real elbow_deg, real score = 0.9)
{
   const Vector2 w{300.0, wrist_y};
   const Vector2 e{300.0, wrist_y + 50.0};
   const auto s = place(w, e, elbow_deg, 60.0);
   return PoseSample{t,
                     PersonPose(t,
                                {kp(R_WRIST, w.x, w.y, score),
                                 kp(R_ELBOW, e.x, e.y, score),
                                 kp(R_SHOULDER, s.x, s.y, score)})};
}

static vector<PoseSample> make_clip(const vector<real>& wrist_y,
                                    const vector<real>& elbow_deg)
{
   vector<PoseSample> o;
   for(size_t i = 0; i < wrist_y.size(); ++i)
      o.push_back(make_arm_sample(0.1 * real(i), wrist_y[i], elbow_deg[i]));
   return o;
}

CATCH_TEST_CASE("ReleaseDetector", "[release-detector]")
{
   const ReleaseParams p;
   const vector<real> elbows = {90.0, 100.0, 120.0, 155.0, 160.0};

   CATCH_SECTION("release-extension-and-lift")
   {
      // Wrist rises 10px from sample 1 to sample 3
      const auto clip = make_clip({300.0, 300.0, 295.0, 290.0, 285.0}, elbows);
      CATCH_REQUIRE(choose_shooting_side(clip) == Side::RIGHT);

      const auto idx = detect_release(clip, Side::RIGHT, p);
      CATCH_REQUIRE(idx.has_value());
      CATCH_REQUIRE(*idx == 3);

      CATCH_REQUIRE(detect_release(clip, p) == idx);
   }

   CATCH_SECTION("release-no-lift")
   {
      const auto clip = make_clip({300.0, 300.0, 300.0, 300.0, 300.0}, elbows);
      CATCH_REQUIRE(!detect_release(clip, Side::RIGHT, p).has_value());
   }

   CATCH_SECTION("release-lift-outside-lookback")
   {
      // The 10px rise happens 3 frames before the extended elbow
      const auto clip = make_clip({310.0, 300.0, 300.0, 300.0, 300.0},
                                  {90.0, 100.0, 120.0, 130.0, 155.0});
      CATCH_REQUIRE(!detect_release(clip, Side::RIGHT, p).has_value());

      ReleaseParams q = p;
      q.lookback      = 4;
      CATCH_REQUIRE(detect_release(clip, Side::RIGHT, q) == size_t(4));
   }

   CATCH_SECTION("release-too-few-samples")
   {
      auto clip = make_clip({300.0, 290.0}, {160.0, 160.0});
      CATCH_REQUIRE(!detect_release(clip, Side::RIGHT, p).has_value());

      // Three samples, but one is missing its wrist
      clip.push_back(make_arm_sample(0.2, 280.0, 160.0, 0.01));
      CATCH_REQUIRE(!detect_release(clip, Side::RIGHT, p).has_value());

      CATCH_REQUIRE(!detect_release({}, Side::RIGHT, p).has_value());
   }

   CATCH_SECTION("release-skips-unusable-frames")
   {
      auto clip = make_clip({300.0, 300.0, 295.0, 290.0, 285.0}, elbows);
      clip[3]   = make_arm_sample(0.3, 290.0, 155.0, 0.01); // lost the arm
      const auto idx = detect_release(clip, Side::RIGHT, p);
      CATCH_REQUIRE(idx.has_value());
      CATCH_REQUIRE(*idx == 4);
   }

   CATCH_SECTION("release-wrong-side")
   {
      const auto clip = make_clip({300.0, 300.0, 295.0, 290.0, 285.0}, elbows);
      CATCH_REQUIRE(!detect_release(clip, Side::LEFT, p).has_value());
   }

   CATCH_SECTION("release-params-json")
   {
      ReleaseParams q;
      q.read(parse_json(
          R"({"min_elbow_deg": 140, "min_wrist_lift": 6, "lookback": 3,
              "follow_hold_elbow_deg": 145})"));
      CATCH_REQUIRE(q.min_elbow_deg == 140.0);
      CATCH_REQUIRE(q.lookback == 3);
      CATCH_REQUIRE(q != ReleaseParams{});
   }
}

} // namespace shotform
