#include "pose-smoother.hpp"

#define This PoseSmoother

namespace shotform
{
This::This(const OneEuroParams& params)
    : params_(params)
{}

// ---------------------------------------------------------------------- update
//
Vector2
This::update(const string_view point_id, const Vector2& xy, real timestamp)
{
   auto ii = filters_.find(point_id);
   if(ii == cend(filters_)) {
      ii = filters_
               .emplace(string(point_id),
                        PointFilter{OneEuroFilter{params_},
                                    OneEuroFilter{params_}})
               .first;
   }
   auto& f = ii->second;
   return Vector2(f.x.update(xy.x, timestamp), f.y.update(xy.y, timestamp));
}

// ---------------------------------------------------------------------- smooth
//
SmoothedPose This::smooth(const PersonPose& pose)
{
   vector<Keypoint> kps = pose.keypoints();
   for(auto& k : kps)
      if(k.is_valid()) k.pos = update(k.part, k.pos, pose.timestamp());
   return SmoothedPose(pose.timestamp(), std::move(kps));
}

// ------------------------------------------------------------------------ find
//
const This::PointFilter* This::find(const string_view point_id) const noexcept
{
   auto ii = filters_.find(point_id);
   return (ii == cend(filters_)) ? nullptr : &ii->second;
}

} // namespace shotform
