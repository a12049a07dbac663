
#define CATCH_CONFIG_PREFIX_ALL
#include <catch2/catch.hpp>

#include "shotform/config.hpp"
#include "shotform/scoring/scoring-params.hpp"

namespace shotform
{
static const char* k_partly_broken = R"V0G0N(
{
   "floor": 10,
   "strict": false,
   "buckets": [
      {
         "key": "lower",
         "label": "下肢",
         "weight": 2,
         "items": [
            {"key": "squat", "feature": "squat_knee_angle",
             "rule": {"policy": "closer", "target": 165, "tolerance": 8,
                      "unit": "度"}},
            {"key": "kneeExt", "feature": "knee_ext_speed",
             "rule": {"target": 260}},
            {"key": "wobble", "feature": "wobble",
             "rule": {"policy": "smaller", "target": 1}}
         ]
      },
      {
         "key": "broken",
         "weight": -1,
         "items": []
      },
      {
         "key": "balance",
         "items": [
            {"key": "center", "label": "重心", "feature": "sway",
             "rule": {"policy": "smaller", "target": 0.08, "unit": "%",
                      "worst": null}}
         ]
      }
   ]
}
)V0G0N";

CATCH_TEST_CASE("ScoringParams", "[scoring-params]")
{
   CATCH_SECTION("scoring-params-defaults")
   {
      const ScoringParams p;
      CATCH_REQUIRE(p.floor == 20.0);
      CATCH_REQUIRE(!p.strict);
      CATCH_REQUIRE(p.buckets.size() == 3);
      CATCH_REQUIRE(p.total_weight() == 3.0);

      const auto& lower = p.buckets[0];
      CATCH_REQUIRE(lower.key == "lower"s);
      CATCH_REQUIRE(lower.items.size() == 2);
      CATCH_REQUIRE(lower.items[0].key == "squat"s);
      CATCH_REQUIRE(lower.items[0].feature == FeatureKey::SQUAT_KNEE_ANGLE);
      CATCH_REQUIRE(lower.items[0].rule.target == 165.0);
      CATCH_REQUIRE(lower.items[0].rule.tolerance == 8.0);
      CATCH_REQUIRE(lower.items[1].rule.policy == ScorePolicy::BIGGER);

      CATCH_REQUIRE(p.buckets[1].items.size() == 4);
      CATCH_REQUIRE(p.buckets[1].items[3].rule.worst_multiplier == 6.0);
      CATCH_REQUIRE(p.buckets[2].items[1].rule.worst == 20.0);
   }

   CATCH_SECTION("scoring-params-json-round-trip")
   {
      const ScoringParams p;
      ScoringParams q;
      q.buckets.clear();
      q.read(p.to_json());
      CATCH_REQUIRE(p == q);
      CATCH_REQUIRE(q.buckets == default_score_buckets());
   }

   CATCH_SECTION("scoring-params-lenient")
   {
      ScoringParams p;
      p.read(parse_json(k_partly_broken));

      CATCH_REQUIRE(p.floor == 10.0);
      CATCH_REQUIRE(p.buckets.size() == 2); // 'broken' skipped
      CATCH_REQUIRE(p.buckets[0].key == "lower"s);
      CATCH_REQUIRE(p.buckets[0].weight == 2.0);
      CATCH_REQUIRE(p.buckets[0].items.size() == 1); // no policy, bad feature
      CATCH_REQUIRE(p.buckets[0].items[0].rule.unit == "度"s);
      CATCH_REQUIRE(p.buckets[0].items[0].label == "squat"s);

      const auto& balance = p.buckets[1];
      CATCH_REQUIRE(balance.label == "balance"s);
      CATCH_REQUIRE(balance.weight == 1.0);
      CATCH_REQUIRE(balance.items[0].label == "重心"s);
      CATCH_REQUIRE(!balance.items[0].rule.worst.has_value());
      CATCH_REQUIRE(balance.items[0].rule.worst_bound() == Approx(0.4));
   }

   CATCH_SECTION("scoring-params-strict")
   {
      auto o      = parse_json(k_partly_broken);
      o["strict"] = true;

      ScoringParams p;
      CATCH_REQUIRE_THROWS_AS(p.read(o), std::runtime_error);

      // Only the missing policy left
      Json::Value removed;
      o["buckets"][0]["items"].removeIndex(2, &removed);
      o["buckets"].removeIndex(1, &removed);
      CATCH_REQUIRE_THROWS_AS(p.read(o), std::runtime_error);

      o["buckets"][0]["items"][1]["rule"]["policy"] = "bigger";
      p.read(o);
      CATCH_REQUIRE(p.buckets.size() == 2);
      CATCH_REQUIRE(p.buckets[0].items.size() == 2);
   }

   CATCH_SECTION("scoring-params-strict-from-environment")
   {
      Json::Value env{Json::objectValue};
      env["SHOTFORM_STRICT_CONFIG"] = true;
      set_environment_variables(env);

      ScoringParams p;
      CATCH_CHECK(p.is_strict());
      CATCH_CHECK_THROWS_AS(p.read(parse_json(k_partly_broken)),
                            std::runtime_error);

      load_environment_variables();
   }

   CATCH_SECTION("scoring-params-buckets-must-be-an-array")
   {
      auto o       = parse_json(k_partly_broken);
      o["buckets"] = "lower, upper";
      ScoringParams p;
      CATCH_REQUIRE_THROWS(p.read(o));
   }

   CATCH_SECTION("scoring-params-defaults-for-missing-keys")
   {
      ScoringParams p;
      p.read_with_defaults<ScoringParams>(parse_json(R"({"floor": 0})"),
                                          false);
      CATCH_REQUIRE(p.floor == 0.0);
      CATCH_REQUIRE(p.buckets == default_score_buckets());
   }
}

} // namespace shotform
