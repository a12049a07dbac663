
#pragma once

#include "score-rule.hpp"

#include "shotform/io/struct-meta.hpp"
#include "shotform/kinematics/feature-vector.hpp"

namespace shotform
{
// ------------------------------------------------------------- ScoreItemConfig
//
struct ScoreItemConfig final
{
   string key         = ""s; // output key, ie "squat"
   string label       = ""s; // display label
   FeatureKey feature = FeatureKey::SQUAT_KNEE_ANGLE;
   ScoreRule rule     = {};

   bool operator==(const ScoreItemConfig&) const noexcept;
   bool operator!=(const ScoreItemConfig&) const noexcept;

   Json::Value to_json() const noexcept;
   void read(const Json::Value&) noexcept(false);
};

// ----------------------------------------------------------- ScoreBucketConfig
//
struct ScoreBucketConfig final
{
   string key                    = ""s; // output key, ie "lower"
   string label                  = ""s;
   real weight                   = 1.0;
   vector<ScoreItemConfig> items = {};

   bool operator==(const ScoreBucketConfig&) const noexcept;
   bool operator!=(const ScoreBucketConfig&) const noexcept;

   Json::Value to_json() const noexcept;

   // Items that fail to read throw in strict mode. Otherwise they are
   // skipped with a warning.
   void read(const Json::Value&, const bool strict) noexcept(false);
};

// The lower, upper, and balance buckets
vector<ScoreBucketConfig> default_score_buckets() noexcept;

Json::Value buckets_to_json(const vector<ScoreBucketConfig>&) noexcept;
vector<ScoreBucketConfig> buckets_from_json(const Json::Value&,
                                            const bool strict) noexcept(false);

// --------------------------------------------------------------- ScoringParams
//
struct ScoringParams final : public MetaCompatible
{
   virtual ~ScoringParams() {}
   const vector<MemberMetaData>& meta_data() const noexcept override;

   real floor = 20.0; // score for absent or hopeless values

   // Malformed buckets and items throw instead of being skipped.
   // `SHOTFORM_STRICT_CONFIG=1` forces this on.
   bool strict = false;

   vector<ScoreBucketConfig> buckets = default_score_buckets();

   bool is_strict() const noexcept;
   real total_weight() const noexcept;
};

META_READ_WRITE_LOAD_SAVE(ScoringParams)

} // namespace shotform
