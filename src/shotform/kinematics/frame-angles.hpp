
#pragma once

#include "angles.hpp"

namespace shotform
{
// ------------------------------------------------------------------ SideAngles
//
struct SideAngles final
{
   std::optional<real> knee     = {};
   std::optional<real> hip      = {};
   std::optional<real> elbow    = {};
   std::optional<real> shoulder = {};
   std::optional<real> ankle    = {};
   std::optional<real> wrist    = {};

   std::optional<real> get(const Joint) const noexcept;
};

// ----------------------------------------------------------------- FrameAngles
//
// Instantaneous measurements of one pose. Every field is empty when its
// keypoints are missing or below the confidence threshold.
struct FrameAngles final
{
   SideAngles left                 = {};
   SideAngles right                = {};
   std::optional<real> align_angle = {}; // degrees [0..90]
   std::optional<real> com_offset  = {}; // signed ratio

   // One reading per joint, from the more confident side
   std::optional<SidedAngle> knee  = {};
   std::optional<SidedAngle> elbow = {};

   const SideAngles& side(const skeleton::Side s) const noexcept
   {
      return (s == skeleton::Side::LEFT) ? left : right;
   }

   Json::Value to_json() const noexcept;
   string to_string() const noexcept;

   friend string str(const FrameAngles& o) noexcept { return o.to_string(); }
};

FrameAngles compute_frame_angles(const PersonPose& pose,
                                 const real min_score
                                 = k_min_keypoint_score) noexcept;

} // namespace shotform
