
#define CATCH_CONFIG_PREFIX_ALL
#include <catch2/catch.hpp>

#include "shotform/pipeline/analysis-session.hpp"
#include "shotform/pipeline/json-pose-source.hpp"

#include "testcases/pose-builders.hpp"

namespace shotform
{
using namespace skeleton;
using testing::kp;
using testing::place;

// A shooter in the middle of a 640x480 frame raising a right arm, with a
// small bystander in the corner.
static MultiPersonFrame make_frame(int i)
{
   const real t        = i / 30.0;
   const real wrist_y  = 200.0 - 6.0 * i;
   const real elbow    = std::min(90.0 + 10.0 * i, 175.0);
   const real knee_deg = (i < 5) ? 170.0 - 8.0 * i : 130.0 + 9.0 * (i - 5);

   const Vector2 w{340.0, wrist_y};
   const Vector2 e{340.0, wrist_y + 50.0};
   const Vector2 s = place(w, e, elbow, 60.0);
   const Vector2 rh{330.0, 320.0};
   const Vector2 rk{330.0, 380.0};
   const Vector2 ra = place(rh, rk, knee_deg, 60.0);

   PersonPose shooter(t,
                      {kp(NOSE, 320.0, 130.0),
                       kp(L_SHOULDER, 280.0, 200.0),
                       kp(R_SHOULDER, s.x, s.y),
                       kp(R_ELBOW, e.x, e.y),
                       kp(R_WRIST, w.x, w.y),
                       kp(L_HIP, 300.0, 320.0),
                       kp(R_HIP, rh.x, rh.y),
                       kp(L_KNEE, 300.0, 380.0),
                       kp(R_KNEE, rk.x, rk.y),
                       kp(L_ANKLE, 300.0, 440.0),
                       kp(R_ANKLE, ra.x, ra.y)});

   PersonPose bystander(t,
                        {kp(NOSE, 20.0, 20.0, 0.6),
                         kp(L_ANKLE, 30.0, 60.0, 0.6)});

   MultiPersonFrame f;
   f.timestamp = t;
   f.width     = 640.0;
   f.height    = 480.0;
   f.persons   = {bystander, shooter};
   return f;
}

static vector<MultiPersonFrame> make_frames(int n)
{
   vector<MultiPersonFrame> o;
   for(int i = 0; i < n; ++i) o.push_back(make_frame(i));
   return o;
}

CATCH_TEST_CASE("AnalysisSession", "[analysis-session]")
{
   CATCH_SECTION("session-process-frame")
   {
      AnalysisSession session;

      MultiPersonFrame empty;
      empty.timestamp = 0.0;
      CATCH_REQUIRE(!session.process_frame(empty).has_value());
      CATCH_REQUIRE(session.n_frames() == 1);
      CATCH_REQUIRE(session.samples().empty());

      const auto f0 = make_frame(0);
      const auto s0 = session.process_frame(f0);
      CATCH_REQUIRE(s0.has_value());
      CATCH_REQUIRE(*s0 == f0.persons[1]); // first observation passes through
      CATCH_REQUIRE(session.samples().size() == 1);

      // The static left knee stays exactly where it is
      const auto s1 = session.process_frame(make_frame(1));
      CATCH_REQUIRE(s1->keypoint(L_KNEE)->pos == Vector2(300.0, 380.0));
      CATCH_REQUIRE(s1->timestamp() == make_frame(1).timestamp);

      session.reset();
      CATCH_REQUIRE(session.n_frames() == 0);
      CATCH_REQUIRE(session.samples().empty());
   }

   CATCH_SECTION("session-analyze-and-rescore")
   {
      AnalysisSession session;
      for(const auto& f : make_frames(12)) session.process_frame(f);

      const auto clip = session.analyze();
      CATCH_REQUIRE(clip.n_samples == 12);
      CATCH_REQUIRE(clip.side == Side::RIGHT);
      CATCH_REQUIRE(clip.body_width.has_value());
      CATCH_REQUIRE(clip.features.squat_knee_angle.has_value());

      const auto a = session.score(clip);

      ScoringParams lenient;
      lenient.floor = 0.0;
      const auto b  = session.score(clip, lenient);
      CATCH_REQUIRE(b.total <= a.total);

      // Re-scoring leaves the session alone
      CATCH_REQUIRE(session.score(clip) == a);
      CATCH_REQUIRE(session.samples().size() == 12);
   }

   CATCH_SECTION("session-deterministic")
   {
      const auto frames = make_frames(15);

      JsonPoseSource src_a{frames};
      JsonPoseSource src_b{frames};
      const auto a = run_analysis(src_a, Params{});
      const auto b = run_analysis(src_b, Params{});

      CATCH_REQUIRE(a.n_frames == 15);
      CATCH_REQUIRE(a.clip.features == b.clip.features);
      CATCH_REQUIRE(a.clip.release_index == b.clip.release_index);
      CATCH_REQUIRE(a.score == b.score);
      CATCH_REQUIRE(a.to_json() == b.to_json());
   }

   CATCH_SECTION("session-report-json")
   {
      JsonPoseSource source{make_frames(10)};
      const auto report = run_analysis(source, Params{});
      const auto o      = report.to_json();

      CATCH_REQUIRE(o["n_frames"].asUInt64() == 10);
      CATCH_REQUIRE(o["n_subject"].asUInt64() == 10);
      CATCH_REQUIRE(o["clip"]["side"].asString() == "right"s);
      CATCH_REQUIRE(o["score"]["total"].isInt());
      CATCH_REQUIRE(o["score"]["lower"]["squat"]["value"].isString());
      CATCH_REQUIRE(o["score"]["balance"]["center"]["score"].isInt());
   }
}

CATCH_TEST_CASE("JsonPoseSource", "[json-pose-source]")
{
   CATCH_SECTION("json-pose-source-read")
   {
      const auto clip = parse_json(R"V0G0N(
{
   "frames": [
      {"timestamp": 0.0, "width": 640, "height": 480,
       "persons": [{"keypoints": [
          {"name": "left_knee", "x": 300.0, "y": 380.0, "score": 0.9},
          {"name": "left_hip", "x": 300.0, "y": 320.0},
          {"name": "racket", "x": 1.0, "y": 2.0, "score": 0.5}]}]},
      {"timestamp": 0.033, "width": 640, "height": 480, "persons": []}
   ]
}
)V0G0N");

      JsonPoseSource source{clip};
      CATCH_REQUIRE(source.size() == 2);

      const auto f0 = source.next_frame();
      CATCH_REQUIRE(f0.has_value());
      CATCH_REQUIRE(f0->persons.size() == 1);

      const auto& pose = f0->persons[0];
      CATCH_REQUIRE(pose.size() == 3);
      CATCH_REQUIRE(pose.keypoint(L_KNEE)->score == 0.9);
      CATCH_REQUIRE(!pose.keypoint(L_HIP)->score.has_value());
      CATCH_REQUIRE(pose.keypoint(L_HIP)->confidence() == 1.0);

      const auto f1 = source.next_frame();
      CATCH_REQUIRE(f1.has_value());
      CATCH_REQUIRE(f1->persons.empty());
      CATCH_REQUIRE(!source.next_frame().has_value());

      source.rewind();
      CATCH_REQUIRE(source.next_frame() == f0);
   }

   CATCH_SECTION("json-pose-source-malformed")
   {
      CATCH_REQUIRE_THROWS(JsonPoseSource{parse_json("[]")});
      CATCH_REQUIRE_THROWS(JsonPoseSource{parse_json(R"({"frames": {}})")});
      CATCH_REQUIRE_THROWS(JsonPoseSource{
          parse_json(R"({"frames": [{"timestamp": 0.0, "persons": []}]})")});
   }
}

CATCH_TEST_CASE("Params", "[params]")
{
   CATCH_SECTION("params-defaults")
   {
      const Params p;
      CATCH_REQUIRE(p.min_keypoint_score == 0.15);
      CATCH_REQUIRE(p.smoothing.min_cutoff == 1.15);
      CATCH_REQUIRE(p.subject.min_visibility == 0.2);
      CATCH_REQUIRE(p.release.min_elbow_deg == 150.0);
      CATCH_REQUIRE(p.scoring.floor == 20.0);
   }

   CATCH_SECTION("params-partial-json")
   {
      Params p;
      read(p, R"({"release": {"lookback": 4}, "smoothing": {"beta": 0.2}})"s);
      CATCH_REQUIRE(p.release.lookback == 4);
      CATCH_REQUIRE(p.release.min_wrist_lift == 4.0);
      CATCH_REQUIRE(p.smoothing.beta == 0.2);
      CATCH_REQUIRE(p.scoring == ScoringParams{});

      // Explicit defaults and implied defaults behave the same
      Params q;
      read(q, Params{}.to_json_string());
      CATCH_REQUIRE(q == Params{});
   }
}

} // namespace shotform
