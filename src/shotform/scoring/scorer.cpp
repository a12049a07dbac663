#include "scorer.hpp"

#include "shotform/utils/math.hpp"

namespace shotform
{
static int to_score(const real x) noexcept
{
   return int(std::lround(clamp(x, 0.0, 100.0)));
}

// ------------------------------------------------------------------------ find
//
const ScoreItem* BucketScore::find(const string_view key) const noexcept
{
   auto ii = std::find_if(
       cbegin(items), cend(items), [&](const auto& o) { return o.key == key; });
   return (ii == cend(items)) ? nullptr : &*ii;
}

const BucketScore* ScoreResult::find(const string_view key) const noexcept
{
   auto ii = std::find_if(cbegin(buckets), cend(buckets), [&](const auto& o) {
      return o.key == key;
   });
   return (ii == cend(buckets)) ? nullptr : &*ii;
}

// ------------------------------------------------------------------ operator==
//
bool ScoreResult::operator==(const ScoreResult& o) const noexcept
{
   if(total != o.total or buckets.size() != o.buckets.size()) return false;
   for(size_t i = 0; i < buckets.size(); ++i) {
      const auto& a = buckets[i];
      const auto& b = o.buckets[i];
      if(a.key != b.key or a.score != b.score) return false;
      if(a.items.size() != b.items.size()) return false;
      for(size_t j = 0; j < a.items.size(); ++j)
         if(a.items[j].key != b.items[j].key
            or a.items[j].score != b.items[j].score
            or a.items[j].value_label != b.items[j].value_label)
            return false;
   }
   return true;
}

bool ScoreResult::operator!=(const ScoreResult& o) const noexcept
{
   return !(*this == o);
}

// --------------------------------------------------------------------- to-json
//
Json::Value ScoreResult::to_json() const noexcept
{
   Json::Value o{Json::objectValue};
   o["total"] = total;
   for(const auto& b : buckets) {
      Json::Value node{Json::objectValue};
      node["score"] = b.score;
      for(const auto& item : b.items) {
         Json::Value leaf{Json::objectValue};
         leaf["score"]  = item.score;
         leaf["value"]  = item.value_label;
         node[item.key] = leaf;
      }
      o[b.key] = node;
   }
   return o;
}

string ScoreResult::to_string() const noexcept
{
   std::stringstream ss{""s};
   ss << format("total: {}", total) << endl;
   for(const auto& b : buckets) {
      ss << format("   {} ({}): {}", b.label, b.key, b.score) << endl;
      for(const auto& item : b.items)
         ss << format("      {:<3}  {}  {}",
                      item.score,
                      item.label,
                      item.value_label)
            << endl;
   }
   return ss.str();
}

// -------------------------------------------------------------- score-features
//
ScoreResult score_features(const FeatureVector& features,
                           const ScoringParams& p) noexcept
{
   ScoreResult o;
   o.buckets.reserve(p.buckets.size());

   real weighted_sum = 0.0;
   real weight_sum   = 0.0;

   for(const auto& config : p.buckets) {
      BucketScore b;
      b.key    = config.key;
      b.label  = config.label;
      b.weight = config.weight;
      b.items.reserve(config.items.size());

      int item_sum = 0;
      for(const auto& ic : config.items) {
         ScoreItem item;
         item.key         = ic.key;
         item.label       = ic.label;
         item.feature     = ic.feature;
         item.value       = features.get(ic.feature);
         item.value_label = format_value(item.value, ic.rule);
         item.score       = to_score(score_rule(item.value, ic.rule, p.floor));
         item_sum += item.score;
         b.items.push_back(std::move(item));
      }

      b.score = b.items.empty()
                    ? 0
                    : to_score(real(item_sum) / real(b.items.size()));

      weighted_sum += b.weight * b.score;
      weight_sum += b.weight;
      o.buckets.push_back(std::move(b));
   }

   o.total = (weight_sum > 0.0) ? to_score(weighted_sum / weight_sum) : 0;
   return o;
}

} // namespace shotform
