#include "scoring-params.hpp"

#include "shotform/config.hpp"
#include "shotform/io/json-io.hpp"

namespace shotform
{
// ------------------------------------------------------------- ScoreItemConfig
//
bool ScoreItemConfig::operator==(const ScoreItemConfig& o) const noexcept
{
   return key == o.key and label == o.label and feature == o.feature
          and rule == o.rule;
}

bool ScoreItemConfig::operator!=(const ScoreItemConfig& o) const noexcept
{
   return !(*this == o);
}

Json::Value ScoreItemConfig::to_json() const noexcept
{
   Json::Value o{Json::objectValue};
   o["key"]     = key;
   o["label"]   = label;
   o["feature"] = str(feature);
   o["rule"]    = rule.to_json();
   return o;
}

void ScoreItemConfig::read(const Json::Value& o) noexcept(false)
{
   const auto op = "reading score item"s;
   if(!o.isObject()) throw std::runtime_error("expected a JSON object");

   ScoreItemConfig x;
   x.key     = json_load_key<string>(o, "key", op);
   x.label   = has_key(o, "label") ? json_load_key<string>(o, "label", op)
                                   : x.key;
   x.feature = to_feature_key(json_load_key<string>(o, "feature", op));
   if(!has_key(o, "rule"))
      throw std::runtime_error(format("score item '{}' has no rule", x.key));
   try {
      x.rule.read(get_key(o, "rule"));
   } catch(std::runtime_error& e) {
      throw std::runtime_error(
          format("score item '{}': {}", x.key, e.what()));
   }
   *this = std::move(x);
}

// ----------------------------------------------------------- ScoreBucketConfig
//
bool ScoreBucketConfig::operator==(const ScoreBucketConfig& o) const noexcept
{
   return key == o.key and label == o.label and weight == o.weight
          and items == o.items;
}

bool ScoreBucketConfig::operator!=(const ScoreBucketConfig& o) const noexcept
{
   return !(*this == o);
}

Json::Value ScoreBucketConfig::to_json() const noexcept
{
   Json::Value o{Json::objectValue};
   o["key"]    = key;
   o["label"]  = label;
   o["weight"] = json_save(weight);

   Json::Value arr{Json::arrayValue};
   for(const auto& item : items) arr.append(item.to_json());
   o["items"] = arr;
   return o;
}

void ScoreBucketConfig::read(const Json::Value& o,
                             const bool strict) noexcept(false)
{
   const auto op = "reading score bucket"s;
   if(!o.isObject()) throw std::runtime_error("expected a JSON object");

   ScoreBucketConfig x;
   x.key   = json_load_key<string>(o, "key", op);
   x.label = has_key(o, "label") ? json_load_key<string>(o, "label", op)
                                 : x.key;
   if(has_key(o, "weight")) x.weight = json_load_key<real>(o, "weight", op);
   if(!std::isfinite(x.weight) or x.weight < 0.0)
      throw std::runtime_error(
          format("bucket '{}' has an invalid weight: {}", x.key, x.weight));

   const auto items = has_key(o, "items") ? get_key(o, "items")
                                          : Json::Value{Json::arrayValue};
   if(!items.isArray())
      throw std::runtime_error(
          format("bucket '{}': expected 'items' to be an array", x.key));

   for(const auto& node : items) {
      ScoreItemConfig item;
      try {
         item.read(node);
      } catch(std::runtime_error& e) {
         if(strict)
            throw std::runtime_error(
                format("bucket '{}': {}", x.key, e.what()));
         WARN(format("skipping malformed score item in bucket '{}': {}",
                     x.key,
                     e.what()));
         continue;
      }
      x.items.push_back(std::move(item));
   }

   *this = std::move(x);
}

// ------------------------------------------------------- default-score-buckets
//
vector<ScoreBucketConfig> default_score_buckets() noexcept
{
   auto rule = [](ScorePolicy policy,
                  real target,
                  real tolerance,
                  string unit,
                  int decimals) {
      ScoreRule r;
      r.policy    = policy;
      r.target    = target;
      r.tolerance = tolerance;
      r.unit      = std::move(unit);
      r.decimals  = decimals;
      return r;
   };
   auto closer = [&](real target, real tol, string unit, int decimals) {
      return rule(ScorePolicy::CLOSER, target, tol, std::move(unit), decimals);
   };
   auto smaller = [&](real target, string unit, int decimals) {
      return rule(ScorePolicy::SMALLER, target, 0.0, std::move(unit), decimals);
   };

   using F = FeatureKey;
   vector<ScoreBucketConfig> o(3);

   o[0].key   = "lower";
   o[0].label = "下肢";
   o[0].items = {
       {"squat", "下蹲深度(膝角)", F::SQUAT_KNEE_ANGLE, closer(165, 8, "度", 2)},
       {"kneeExt",
        "伸膝速度",
        F::KNEE_EXT_SPEED,
        rule(ScorePolicy::BIGGER, 260, 0.0, "(度/秒)", 0)}};

   auto elbow_tight             = smaller(0.02, "%", 2);
   elbow_tight.worst_multiplier = 6.0;

   o[1].key   = "upper";
   o[1].label = "上肢";
   o[1].items = {
       {"releaseAngle", "出手角", F::RELEASE_ANGLE, closer(158, 10, "度", 2)},
       {"armPower", "腕部发力", F::ARM_POWER_ANGLE, closer(35, 6, "度", 0)},
       {"follow", "随挥保持", F::FOLLOW_DURATION, closer(0.4, 0.12, "秒", 2)},
       {"elbowTight", "肘部路径紧凑", F::ELBOW_TIGHTNESS, elbow_tight}};

   auto align  = smaller(5.0, "度", 2);
   align.worst = 20.0;

   o[2].key   = "balance";
   o[2].label = "对齐与平衡";
   o[2].items = {{"center", "重心稳定(横摆)", F::SWAY, smaller(0.08, "%", 2)},
                 {"align", "对齐", F::ALIGN_ANGLE, align}};

   return o;
}

// ------------------------------------------------------------- buckets-to-json
//
Json::Value buckets_to_json(const vector<ScoreBucketConfig>& buckets) noexcept
{
   Json::Value o{Json::arrayValue};
   for(const auto& b : buckets) o.append(b.to_json());
   return o;
}

vector<ScoreBucketConfig> buckets_from_json(const Json::Value& o,
                                            const bool strict) noexcept(false)
{
   if(!o.isArray())
      throw std::runtime_error("expected 'buckets' to be a JSON array");

   vector<ScoreBucketConfig> buckets;
   buckets.reserve(o.size());
   for(const auto& node : o) {
      ScoreBucketConfig b;
      try {
         b.read(node, strict);
      } catch(std::runtime_error& e) {
         if(strict) throw;
         WARN(format("skipping malformed score bucket: {}", e.what()));
         continue;
      }
      buckets.push_back(std::move(b));
   }
   return buckets;
}

// ---------------------------------------------------- ScoringParams::meta-data
//
const vector<MemberMetaData>& ScoringParams::meta_data() const noexcept
{
#define ThisParams ScoringParams
   auto make_meta = []() {
      vector<MemberMetaData> m;
      m.push_back(MAKE_META(ThisParams, REAL, floor, true));
      m.push_back(MAKE_META(ThisParams, BOOL, strict, true));
      m.push_back({meta_type::JSON_VALUE,
                   "buckets"s,
                   true,
                   [](const void* ptr) -> std::any {
                      const auto& o = *static_cast<const ThisParams*>(ptr);
                      return std::any(buckets_to_json(o.buckets));
                   },
                   [](void* ptr, const std::any& x) {
                      auto& o         = *static_cast<ThisParams*>(ptr);
                      const auto& val = std::any_cast<const Json::Value&>(x);
                      o.buckets       = buckets_from_json(val, o.is_strict());
                   }});
      return m;
   };
   static vector<MemberMetaData> meta_ = make_meta();
   return meta_;
#undef ThisParams
}

bool ScoringParams::is_strict() const noexcept
{
   return strict or shotform_strict_config();
}

real ScoringParams::total_weight() const noexcept
{
   real sum = 0.0;
   for(const auto& b : buckets) sum += b.weight;
   return sum;
}

} // namespace shotform
