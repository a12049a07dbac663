
#pragma once

#include "one-euro-filter.hpp"

#include <map>

#include "shotform/skeleton/person-pose.hpp"

namespace shotform
{
// ---------------------------------------------------------------- PoseSmoother
//
// One pair of OneEuroFilters (x and y) per point-id, ie, per keypoint name,
// for the single subject tracked in one analysis session. A new clip needs
// a fresh (or `reset`) smoother.
class PoseSmoother final
{
 public:
   struct PointFilter final
   {
      OneEuroFilter x;
      OneEuroFilter y;
   };

 private:
   using filter_map = std::map<string, PointFilter, std::less<>>;

   OneEuroParams params_ = {};
   filter_map filters_   = {};

 public:
   PoseSmoother() = default;
   explicit PoseSmoother(const OneEuroParams& params);

   // Filters the position of `point_id`. The first observation of a
   // point-id is returned unchanged.
   Vector2
   update(const string_view point_id, const Vector2& xy, real timestamp);

   // Every keypoint with a finite position goes through its own filter,
   // keyed on the keypoint's name. Scores are passed through.
   SmoothedPose smooth(const PersonPose& pose);

   void reset() noexcept { filters_.clear(); }

   size_t size() const noexcept { return filters_.size(); }
   const OneEuroParams& params() const noexcept { return params_; }

   // nullptr if `point_id` has never been observed
   const PointFilter* find(const string_view point_id) const noexcept;
};

} // namespace shotform
