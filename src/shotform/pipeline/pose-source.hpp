
#pragma once

#include "shotform/skeleton/person-pose.hpp"

namespace shotform
{
// ------------------------------------------------------------------ PoseSource
//
// Anything that produces detections frame by frame: a pose-estimation
// backend, or a recording of one. Frames come out in timestamp order.
class PoseSource
{
 public:
   virtual ~PoseSource() = default;

   // Empty once the source is exhausted
   virtual std::optional<MultiPersonFrame> next_frame() noexcept(false) = 0;
};

} // namespace shotform
