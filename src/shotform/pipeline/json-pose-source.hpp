
#pragma once

#include "pose-source.hpp"

namespace shotform
{
// -------------------------------------------------------------- JsonPoseSource
//
// Replays pre-computed detections:
//
//    {"frames": [{"timestamp": 0.0, "width": 1280, "height": 720,
//                 "persons": [{"keypoints": [{"name": "left_knee",
//                                             "x": 611.2, "y": 480.9,
//                                             "score": 0.93}, ...]}]},
//                ...]}
//
// The whole document is parsed up front, so a malformed file fails at
// construction rather than part way through a clip.
class JsonPoseSource final : public PoseSource
{
 private:
   vector<MultiPersonFrame> frames_ = {};
   size_t position_                 = 0;

 public:
   explicit JsonPoseSource(const Json::Value& clip) noexcept(false);
   explicit JsonPoseSource(vector<MultiPersonFrame> frames) noexcept;

   static JsonPoseSource load(const string& fname) noexcept(false);

   std::optional<MultiPersonFrame> next_frame() noexcept override;

   size_t size() const noexcept { return frames_.size(); }
   void rewind() noexcept { position_ = 0; }
};

} // namespace shotform
