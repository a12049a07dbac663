
#define CATCH_CONFIG_PREFIX_ALL
#include <catch2/catch.hpp>

#include "shotform/release/clip-features.hpp"

#include "testcases/pose-builders.hpp"

namespace shotform
{
using namespace skeleton;
using testing::kp;
using testing::place;

struct FrameSpec
{
   real hip_dx    = 0.0;
   real knee_deg  = 0.0;
   real elbow_x   = 0.0;
   real elbow_deg = 0.0;
};

// Shoulders 40px apart (the body width), hips 20px apart, right leg and
// right arm posed per frame, and a straight right wrist.
static PoseSample make_sample(real t, const FrameSpec& f)
{
   const Vector2 rs{120.0, 100.0};
   const Vector2 rh{110.0 + f.hip_dx, 200.0};
   const Vector2 rk = rh + Vector2{0.0, 50.0};
   const Vector2 ra = place(rh, rk, f.knee_deg, 50.0);
   const Vector2 re{f.elbow_x, 150.0};
   const Vector2 rw = place(rs, re, f.elbow_deg, 40.0);
   const Vector2 ri = rw + (rw - re) / (rw - re).norm() * 10.0;

   return PoseSample{t,
                     PersonPose(t,
                                {kp(L_SHOULDER, 80.0, 100.0),
                                 kp(R_SHOULDER, rs.x, rs.y),
                                 kp(L_HIP, 90.0 + f.hip_dx, 200.0),
                                 kp(R_HIP, rh.x, rh.y),
                                 kp(R_KNEE, rk.x, rk.y),
                                 kp(L_ANKLE, 90.0 + f.hip_dx, 300.0),
                                 kp(R_ANKLE, ra.x, ra.y),
                                 kp(R_ELBOW, re.x, re.y),
                                 kp(R_WRIST, rw.x, rw.y),
                                 kp(R_INDEX, ri.x, ri.y)})};
}

static vector<PoseSample> make_clip(const vector<FrameSpec>& specs)
{
   vector<PoseSample> o;
   for(size_t i = 0; i < specs.size(); ++i)
      o.push_back(make_sample(0.1 * real(i), specs[i]));
   return o;
}

CATCH_TEST_CASE("ClipFeatures", "[clip-features]")
{
   const ReleaseParams p;
   const auto clip = make_clip({{0.0, 120.0, 150.0, 100.0},
                                {4.0, 90.0, 151.0, 120.0},
                                {0.0, 130.0, 152.0, 155.0},
                                {4.0, 170.0, 150.0, 160.0}});

   CATCH_SECTION("clip-body-width")
   {
      const auto bw = clip_body_width(clip);
      CATCH_REQUIRE(bw.has_value());
      CATCH_REQUIRE(*bw == Approx(40.0));
      CATCH_REQUIRE(!clip_body_width({}).has_value());
   }

   CATCH_SECTION("clip-features-with-release")
   {
      const auto f = compute_clip_features(clip, size_t(2), Side::RIGHT, p);

      CATCH_REQUIRE(f.squat_knee_angle.has_value());
      CATCH_REQUIRE(*f.squat_knee_angle == Approx(90.0));

      // (130 - 90) / 0.1s
      CATCH_REQUIRE(f.knee_ext_speed.has_value());
      CATCH_REQUIRE(*f.knee_ext_speed == Approx(400.0));

      CATCH_REQUIRE(f.release_angle.has_value());
      CATCH_REQUIRE(*f.release_angle == Approx(155.0));

      CATCH_REQUIRE(f.arm_power_angle.has_value());
      CATCH_REQUIRE(*f.arm_power_angle == Approx(0.0).margin(1e-3));

      // Elbow stays at 160 for one more frame
      CATCH_REQUIRE(f.follow_duration.has_value());
      CATCH_REQUIRE(*f.follow_duration == Approx(0.1));

      // Elbow x spans 2px, over a 40px body
      CATCH_REQUIRE(f.elbow_tightness.has_value());
      CATCH_REQUIRE(*f.elbow_tightness == Approx(0.05));

      // Hip midpoint x is {100, 104, 100, 104}: stddev 2px
      CATCH_REQUIRE(f.sway.has_value());
      CATCH_REQUIRE(*f.sway == Approx(0.05));

      CATCH_REQUIRE(f.align_angle.has_value());
      CATCH_REQUIRE(f.align_offset.has_value());
      CATCH_REQUIRE(*f.align_offset >= 0.0);
      CATCH_REQUIRE(f.com_offset.has_value());
      CATCH_REQUIRE(f.n_present() == size_t(k_n_feature_keys));
   }

   CATCH_SECTION("clip-features-follow-through-ends")
   {
      auto specs = vector<FrameSpec>{{0.0, 120.0, 150.0, 100.0},
                                     {0.0, 90.0, 150.0, 155.0},
                                     {0.0, 100.0, 150.0, 165.0},
                                     {0.0, 100.0, 150.0, 120.0},
                                     {0.0, 100.0, 150.0, 165.0}};
      const auto f
          = compute_clip_features(make_clip(specs), size_t(1), Side::RIGHT, p);
      CATCH_REQUIRE(f.follow_duration.has_value());
      CATCH_REQUIRE(*f.follow_duration == Approx(0.1));
   }

   CATCH_SECTION("clip-features-without-release")
   {
      const auto f = compute_clip_features(clip, {}, Side::RIGHT, p);

      // The whole clip
      CATCH_REQUIRE(*f.squat_knee_angle == Approx(90.0));
      CATCH_REQUIRE(*f.knee_ext_speed == Approx(400.0));

      // Unknown, not zero
      CATCH_REQUIRE(!f.release_angle.has_value());
      CATCH_REQUIRE(!f.arm_power_angle.has_value());
      CATCH_REQUIRE(!f.follow_duration.has_value());

      // Stability features still stand
      CATCH_REQUIRE(f.elbow_tightness.has_value());
      CATCH_REQUIRE(f.sway.has_value());
      CATCH_REQUIRE(f.align_angle.has_value());
      CATCH_REQUIRE(f.align_offset.has_value());
      CATCH_REQUIRE(f.com_offset.has_value());
   }

   CATCH_SECTION("clip-features-knee-never-extends")
   {
      const auto samples = make_clip({{0.0, 150.0, 150.0, 90.0},
                                      {0.0, 120.0, 150.0, 90.0},
                                      {0.0, 100.0, 150.0, 90.0}});
      const auto f = compute_clip_features(samples, {}, Side::RIGHT, p);
      CATCH_REQUIRE(f.knee_ext_speed.has_value());
      CATCH_REQUIRE(*f.knee_ext_speed == 0.0);
   }

   CATCH_SECTION("clip-features-without-body-width")
   {
      vector<PoseSample> samples;
      for(const auto& s : clip) {
         vector<Keypoint> kps;
         for(const auto& k : s.pose.keypoints())
            if(k.name != L_SHOULDER and k.name != L_HIP) kps.push_back(k);
         samples.push_back({s.timestamp, PersonPose(s.timestamp, kps)});
      }

      const auto f = compute_clip_features(samples, size_t(2), Side::RIGHT, p);
      CATCH_REQUIRE(!f.elbow_tightness.has_value());
      CATCH_REQUIRE(!f.sway.has_value());
      CATCH_REQUIRE(!f.align_offset.has_value());
      CATCH_REQUIRE(!f.align_angle.has_value());
      CATCH_REQUIRE(f.squat_knee_angle.has_value());
      CATCH_REQUIRE(f.release_angle.has_value());
   }

   CATCH_SECTION("clip-features-empty")
   {
      const auto f = compute_clip_features({}, {}, Side::RIGHT, p);
      CATCH_REQUIRE(f.n_present() == 0);
      CATCH_REQUIRE(f == FeatureVector{});
   }

   CATCH_SECTION("analyze-clip")
   {
      const auto a = analyze_clip(clip, p);
      CATCH_REQUIRE(a.n_samples == 4);
      CATCH_REQUIRE(a.side == Side::RIGHT);
      CATCH_REQUIRE(a.body_width.has_value());
      CATCH_REQUIRE(a.release_index.has_value() == a.release_time.has_value());
      CATCH_REQUIRE(a.release_index.has_value()
                    == a.release_angles.has_value());

      const auto o = a.to_json();
      CATCH_REQUIRE(o["side"].asString() == str(Side::RIGHT));
      CATCH_REQUIRE(o["features"].isObject());
   }
}

} // namespace shotform
