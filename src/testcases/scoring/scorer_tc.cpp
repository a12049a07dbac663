
#define CATCH_CONFIG_PREFIX_ALL
#include <catch2/catch.hpp>

#include "shotform/scoring/scorer.hpp"
#include "shotform/utils/math.hpp"

namespace shotform
{
static ScoreRule make_rule(ScorePolicy policy, real target, real tolerance)
{
   ScoreRule r;
   r.policy    = policy;
   r.target    = target;
   r.tolerance = tolerance;
   return r;
}

static FeatureVector make_features()
{
   FeatureVector f;
   f.squat_knee_angle = 169.0;  // 50
   f.knee_ext_speed   = 130.0;  // 50
   f.release_angle    = 158.0;  // 100
   f.arm_power_angle  = 35.0;   // 100
   f.follow_duration  = 0.4;    // 100
   f.elbow_tightness  = 0.07;   // 50
   f.sway             = 0.08;   // 100
   f.align_angle      = 12.5;   // 50
   f.align_offset     = 0.3;    // not scored by default
   f.com_offset       = -0.1;   // not scored by default
   return f;
}

CATCH_TEST_CASE("ScoreRule", "[score-rule]")
{
   const real floor = 20.0;

   CATCH_SECTION("score-rule-closer")
   {
      const auto r = make_rule(ScorePolicy::CLOSER, 165.0, 8.0);
      CATCH_REQUIRE(score_rule(165.0, r, floor) == 100.0);
      CATCH_REQUIRE(score_rule(173.0, r, floor) == floor);
      CATCH_REQUIRE(score_rule(169.0, r, floor) == Approx(50.0));
      CATCH_REQUIRE(score_rule(161.0, r, floor) == Approx(50.0));

      // Never re-ascends outside the tolerance band
      for(real v = 173.0; v < 400.0; v += 7.5)
         CATCH_REQUIRE(score_rule(v, r, floor) == floor);
      for(real v = 157.0; v > -100.0; v -= 7.5)
         CATCH_REQUIRE(score_rule(v, r, floor) == floor);

      // With a zero floor, the ramp reaches zero
      CATCH_REQUIRE(score_rule(173.0, r, 0.0) == 0.0);
   }

   CATCH_SECTION("score-rule-closer-zero-tolerance")
   {
      const auto r = make_rule(ScorePolicy::CLOSER, 5.0, 0.0);
      CATCH_REQUIRE(score_rule(5.0, r, floor) == 100.0);
      CATCH_REQUIRE(score_rule(5.1, r, floor) == floor);

      const auto q = make_rule(ScorePolicy::CLOSER, 5.0, -3.0);
      CATCH_REQUIRE(std::isfinite(score_rule(6.0, q, floor)));
      CATCH_REQUIRE(score_rule(6.0, q, floor) == floor);
   }

   CATCH_SECTION("score-rule-bigger")
   {
      const auto r = make_rule(ScorePolicy::BIGGER, 260.0, 0.0);
      CATCH_REQUIRE(score_rule(130.0, r, 0.0) == Approx(50.0));
      CATCH_REQUIRE(score_rule(260.0, r, floor) == 100.0);
      CATCH_REQUIRE(score_rule(900.0, r, floor) == 100.0);
      CATCH_REQUIRE(score_rule(0.0, r, floor) == floor);
      CATCH_REQUIRE(score_rule(-50.0, r, floor) == floor);
      CATCH_REQUIRE(score_rule(-50.0, r, 0.0) == 0.0);

      const auto q = make_rule(ScorePolicy::BIGGER, 0.0, 0.0);
      CATCH_REQUIRE(score_rule(10.0, q, floor) == 100.0);
      CATCH_REQUIRE(score_rule(0.0, q, floor) == 100.0);
      CATCH_REQUIRE(score_rule(-1.0, q, floor) == floor);

      const auto n = make_rule(ScorePolicy::BIGGER, -5.0, 0.0);
      CATCH_REQUIRE(score_rule(0.0, n, floor) == 100.0);
      CATCH_REQUIRE(score_rule(-5.0, n, floor) == 100.0);
      CATCH_REQUIRE(score_rule(-6.0, n, 0.0) == 0.0);
   }

   CATCH_SECTION("score-rule-smaller")
   {
      auto r             = make_rule(ScorePolicy::SMALLER, 0.02, 0.0);
      r.worst_multiplier = 6.0;
      CATCH_REQUIRE(r.worst_bound() == Approx(0.12));
      CATCH_REQUIRE(score_rule(0.02, r, floor) == 100.0);
      CATCH_REQUIRE(score_rule(0.0, r, floor) == 100.0);
      CATCH_REQUIRE(score_rule(0.07, r, floor) == Approx(50.0));
      CATCH_REQUIRE(score_rule(0.12, r, 0.0) == Approx(0.0).margin(1e-9));
      CATCH_REQUIRE(score_rule(0.5, r, floor) == floor);

      r.worst  = 20.0; // explicit bound wins over the multiplier
      r.target = 5.0;
      CATCH_REQUIRE(r.worst_bound() == 20.0);
      CATCH_REQUIRE(score_rule(12.5, r, floor) == Approx(50.0));

      // A worst bound at or below the target cannot divide by zero
      r.worst = 5.0;
      CATCH_REQUIRE(r.worst_bound() > r.target);
      CATCH_REQUIRE(std::isfinite(score_rule(5.5, r, floor)));
   }

   CATCH_SECTION("score-rule-absent-is-floor")
   {
      for(const auto policy :
          {ScorePolicy::CLOSER, ScorePolicy::BIGGER, ScorePolicy::SMALLER}) {
         const auto r = make_rule(policy, 10.0, 2.0);
         CATCH_REQUIRE(score_rule(std::nullopt, r, floor) == floor);
         CATCH_REQUIRE(score_rule(dNAN, r, floor) == floor);
         CATCH_REQUIRE(score_rule(std::nullopt, r, 35.0) == 35.0);
      }
   }

   CATCH_SECTION("score-rule-clamped")
   {
      const auto r = make_rule(ScorePolicy::CLOSER, 10.0, 2.0);
      CATCH_REQUIRE(score_rule(10.0, r, 150.0) == 100.0);
      CATCH_REQUIRE(score_rule(50.0, r, -10.0) == 0.0);
   }

   CATCH_SECTION("score-rule-format-value")
   {
      auto r = make_rule(ScorePolicy::CLOSER, 165.0, 8.0);
      r.unit = "度";
      CATCH_REQUIRE(format_value(172.4849, r) == "172.48度"s);
      CATCH_REQUIRE(format_value(std::nullopt, r) == "未检测"s);

      r.unit     = "(度/秒)";
      r.decimals = 0;
      CATCH_REQUIRE(format_value(259.6, r) == "260(度/秒)"s);

      r.unit     = "%";
      r.decimals = 2;
      CATCH_REQUIRE(format_value(0.2868, r) == "28.68%"s);
   }

   CATCH_SECTION("score-rule-policy-strings")
   {
      CATCH_REQUIRE(to_score_policy("closer") == ScorePolicy::CLOSER);
      CATCH_REQUIRE(to_score_policy("Bigger") == ScorePolicy::BIGGER);
      CATCH_REQUIRE(to_score_policy("SMALLER") == ScorePolicy::SMALLER);
      CATCH_REQUIRE_THROWS(to_score_policy("nearer"));
   }
}

CATCH_TEST_CASE("ScoreFeatures", "[score-features]")
{
   const ScoringParams p;

   CATCH_SECTION("score-features-defaults")
   {
      const auto s = score_features(make_features(), p);
      CATCH_REQUIRE(s.buckets.size() == 3);
      CATCH_REQUIRE(s.find("lower")->score == 50);
      CATCH_REQUIRE(s.find("upper")->score == 88); // 87.5 rounds up
      CATCH_REQUIRE(s.find("balance")->score == 75);
      CATCH_REQUIRE(s.total == 71);

      CATCH_REQUIRE(s.find("upper")->find("elbowTight")->score == 50);
      CATCH_REQUIRE(s.find("balance")->find("center")->value_label
                    == "8.00%"s);
      CATCH_REQUIRE(s.find("missing") == nullptr);
   }

   CATCH_SECTION("score-features-json-shape")
   {
      const auto o = score_features(make_features(), p).to_json();
      CATCH_REQUIRE(o["total"].asInt() == 71);
      CATCH_REQUIRE(o["lower"]["score"].asInt() == 50);
      CATCH_REQUIRE(o["lower"]["squat"]["score"].asInt() == 50);
      CATCH_REQUIRE(o["lower"]["squat"]["value"].asString() == "169.00度");
      CATCH_REQUIRE(o["lower"]["kneeExt"]["value"].asString()
                    == "130(度/秒)");
      CATCH_REQUIRE(o["upper"]["armPower"]["value"].asString() == "35度");
      CATCH_REQUIRE(o["upper"]["follow"]["value"].asString() == "0.40秒");
      CATCH_REQUIRE(o["upper"]["elbowTight"]["value"].asString() == "7.00%");
      CATCH_REQUIRE(o["balance"]["align"]["value"].asString() == "12.50度");
      CATCH_REQUIRE(o["balance"]["align"]["score"].asInt() == 50);

      CATCH_REQUIRE(o.size() == 4);
      CATCH_REQUIRE(o["upper"].size() == 5);
   }

   CATCH_SECTION("score-features-nothing-measured")
   {
      const auto s = score_features(FeatureVector{}, p);
      CATCH_REQUIRE(s.total == 20);
      for(const auto& b : s.buckets) {
         CATCH_REQUIRE(b.score == 20);
         for(const auto& item : b.items)
            CATCH_REQUIRE(item.value_label == "未检测"s);
      }
   }

   CATCH_SECTION("score-features-zero-total-weight")
   {
      ScoringParams q = p;
      for(auto& b : q.buckets) b.weight = 0.0;
      const auto s = score_features(make_features(), q);
      CATCH_REQUIRE(s.total == 0);
      CATCH_REQUIRE(s.find("lower")->score == 50);
   }

   CATCH_SECTION("score-features-empty-bucket")
   {
      ScoringParams q = p;
      q.buckets.resize(1);
      q.buckets.push_back(ScoreBucketConfig{"empty", "empty", 1.0, {}});
      const auto s = score_features(make_features(), q);
      CATCH_REQUIRE(s.find("empty")->score == 0);
      CATCH_REQUIRE(s.total == 25); // (50 + 0) / 2
   }

   CATCH_SECTION("score-features-weighted")
   {
      ScoringParams q     = p;
      q.buckets[0].weight = 2.0; // lower, 50
      q.buckets[1].weight = 0.0; // upper, 88
      q.buckets[2].weight = 1.0; // balance, 75

      const auto s = score_features(make_features(), q);
      CATCH_REQUIRE(s.total == 58); // 175 / 3
   }

   CATCH_SECTION("score-features-rescoring-is-pure")
   {
      const auto f = make_features();
      const auto a = score_features(f, p);
      const auto b = score_features(f, p);
      CATCH_REQUIRE(a == b);

      ScoringParams q = p;
      q.floor         = 0.0;
      const auto c    = score_features(FeatureVector{}, q);
      CATCH_REQUIRE(c.total == 0);
      CATCH_REQUIRE(score_features(f, p) == a);
   }
}

} // namespace shotform
