
#pragma once

#include "scoring-params.hpp"

namespace shotform
{
// ------------------------------------------------------------------- ScoreItem
//
struct ScoreItem final
{
   string key                = ""s;
   string label              = ""s;
   FeatureKey feature        = FeatureKey::SQUAT_KNEE_ANGLE;
   std::optional<real> value = {}; // raw measurement
   string value_label        = ""s; // ie "172.48度"
   int score                 = 0;
};

// ----------------------------------------------------------------- BucketScore
//
struct BucketScore final
{
   string key              = ""s;
   string label            = ""s;
   real weight             = 1.0;
   int score               = 0;
   vector<ScoreItem> items = {};

   const ScoreItem* find(const string_view key) const noexcept;
};

// ----------------------------------------------------------------- ScoreResult
//
struct ScoreResult final
{
   int total                   = 0;
   vector<BucketScore> buckets = {};

   const BucketScore* find(const string_view key) const noexcept;

   bool operator==(const ScoreResult&) const noexcept;
   bool operator!=(const ScoreResult&) const noexcept;

   // {total, <bucket>: {score, <item>: {score, value}, ...}, ...}
   Json::Value to_json() const noexcept;
   string to_string() const noexcept; // multi-line summary with labels

   friend string str(const ScoreResult& o) noexcept { return o.to_string(); }
};

// -------------------------------------------------------------- score-features
//
// Pure function of its inputs. Items score round(score_rule(...)), buckets
// are the rounded mean of their items (zero when empty), and the total is
// the rounded weighted mean of the buckets (zero when the weights sum to
// zero).
ScoreResult score_features(const FeatureVector& features,
                           const ScoringParams& p) noexcept;

} // namespace shotform
