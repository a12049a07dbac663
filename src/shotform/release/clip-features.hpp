
#pragma once

#include "release-detector.hpp"

#include "shotform/kinematics/feature-vector.hpp"
#include "shotform/kinematics/frame-angles.hpp"

namespace shotform
{
// ---------------------------------------------------------------- ClipAnalysis
//
struct ClipAnalysis final
{
   size_t n_samples                          = 0;
   skeleton::Side side                       = skeleton::Side::RIGHT;
   std::optional<size_t> release_index       = {};
   std::optional<real> release_time          = {}; // seconds
   std::optional<FrameAngles> release_angles = {}; // the pose at release
   std::optional<real> body_width            = {}; // pixels, median
   FeatureVector features                    = {};

   Json::Value to_json() const noexcept;
   string to_string() const noexcept;

   friend string str(const ClipAnalysis& o) noexcept { return o.to_string(); }
};

// Median over the clip of `body_width(pose)`. Empty if no sample has one.
std::optional<real> clip_body_width(const vector<PoseSample>& samples,
                                    const real min_score
                                    = k_min_keypoint_score) noexcept;

// Turns a smoothed, time-ordered clip into its feature vector.
//  + squat-knee-angle: minimum knee angle up to the release (or whole clip)
//  + knee-ext-speed: maximum positive knee-angle rate up to the release
//  + release-angle: elbow angle at the release
//  + arm-power-angle: wrist flexion at the release
//  + follow-duration: time after the release while the elbow is held
//  + elbow-tightness: elbow x span over the clip / body width
//  + sway: stddev of the hip-midpoint x over the clip / body width
//  + align-angle: torso-foot alignment at the release (or last frame)
//  + align-offset: last-frame |hip-mid.x - ankle-mid.x| / body width
//  + com-offset: lateral com offset at the release (or last frame)
FeatureVector compute_clip_features(const vector<PoseSample>& samples,
                                    const std::optional<size_t> release_index,
                                    const skeleton::Side side,
                                    const ReleaseParams& p,
                                    const real min_score
                                    = k_min_keypoint_score) noexcept;

// Side selection, release detection, and clip features in one
ClipAnalysis analyze_clip(const vector<PoseSample>& samples,
                          const ReleaseParams& p,
                          const real min_score
                          = k_min_keypoint_score) noexcept;

} // namespace shotform
