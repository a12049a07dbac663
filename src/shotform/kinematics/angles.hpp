
#pragma once

#include "shotform/skeleton/person-pose.hpp"

namespace shotform
{
// Default minimum keypoint confidence for any angle measurement
constexpr real k_min_keypoint_score = 0.15;

// ---------------------------------------------------------------------- angle3
//
// The angle ABC at vertex B, in degrees [0..180]. Empty when any point is
// non-finite, or when BA or BC has zero length.
std::optional<real>
angle3(const Vector2& a, const Vector2& b, const Vector2& c) noexcept;

// As above, but also empty if any keypoint is missing (nullptr) or has a
// confidence below `min_score`.
std::optional<real> angle3(const Keypoint* a,
                           const Keypoint* b,
                           const Keypoint* c,
                           const real min_score
                           = k_min_keypoint_score) noexcept;

// ----------------------------------------------------------------------- Joint
//
enum class Joint : int8_t {
   KNEE = 0, // hip-knee-ankle
   HIP,      // shoulder-hip-knee
   ELBOW,    // shoulder-elbow-wrist
   SHOULDER, // elbow-shoulder-hip
   ANKLE,    // knee-ankle-(foot-index|heel)
   WRIST     // elbow-wrist-(index|pinky|thumb)
};

const char* str(const Joint) noexcept;

// The three keypoints (A, vertex B, C) that define `joint` on `side`.
// For ANKLE and WRIST, C is the first confident candidate in order of
// preference. Any element may be nullptr.
std::array<const Keypoint*, 3> joint_keypoints(const PersonPose& pose,
                                               const Joint joint,
                                               const skeleton::Side side,
                                               const real min_score) noexcept;

std::optional<real> joint_angle(const PersonPose& pose,
                                const Joint joint,
                                const skeleton::Side side,
                                const real min_score
                                = k_min_keypoint_score) noexcept;

// The weakest confidence of the joint's keypoints. Zero if any is missing.
real joint_confidence(const PersonPose& pose,
                      const Joint joint,
                      const skeleton::Side side,
                      const real min_score = k_min_keypoint_score) noexcept;

struct SidedAngle final
{
   skeleton::Side side = skeleton::Side::RIGHT;
   real degrees        = 0.0;
};

// When both sides give an angle, the side whose weakest keypoint is more
// confident wins, and the right side wins a tie. Never averaged.
std::optional<SidedAngle>
preferred_joint_angle(const PersonPose& pose,
                      const Joint joint,
                      const real min_score = k_min_keypoint_score) noexcept;

// --------------------------------------------------------------- wrist-flexion
//
// 180 - angle(elbow, wrist, hand-tip). Zero for a straight wrist.
std::optional<real>
wrist_flexion(const PersonPose& pose,
              const skeleton::Side side,
              const real min_score = k_min_keypoint_score) noexcept;

// ------------------------------------------------------------- torso alignment
//
// Undirected angle between the hip line (left-hip to right-hip) and the
// ankle line, in degrees [0..90].
std::optional<real>
torso_foot_alignment(const PersonPose& pose,
                     const real min_score = k_min_keypoint_score) noexcept;

// ------------------------------------------------------------------- midpoints
//
std::optional<Vector2>
hip_midpoint(const PersonPose& pose,
             const real min_score = k_min_keypoint_score) noexcept;

std::optional<Vector2>
ankle_midpoint(const PersonPose& pose,
               const real min_score = k_min_keypoint_score) noexcept;

// ---------------------------------------------------------- lateral com offset
//
// (hip-midpoint.x - ankle-midpoint.x) / |hip-midpoint - ankle-midpoint|
// Signed, resolution independent.
std::optional<real>
lateral_com_offset(const PersonPose& pose,
                   const real min_score = k_min_keypoint_score) noexcept;

// ------------------------------------------------------------------ body width
//
// max(shoulder width, hip width), whichever are available. Pixels.
std::optional<real>
body_width(const PersonPose& pose,
           const real min_score = k_min_keypoint_score) noexcept;

} // namespace shotform
