#pragma once

#include "shotform/foundation.hpp"

namespace shotform::skeleton
{
// ----------------------------------------------------------- body-33 keypoints
//
enum KeypointName : int8_t {
   NOSE = 0,
   L_EYE_INNER,  // 1
   L_EYE,        // 2
   L_EYE_OUTER,  // 3
   R_EYE_INNER,  // 4
   R_EYE,        // 5
   R_EYE_OUTER,  // 6
   L_EAR,        // 7
   R_EAR,        // 8
   MOUTH_LEFT,   // 9
   MOUTH_RIGHT,  // 10
   L_SHOULDER,   // 11
   R_SHOULDER,   // 12
   L_ELBOW,      // 13
   R_ELBOW,      // 14
   L_WRIST,      // 15
   R_WRIST,      // 16
   L_PINKY,      // 17
   R_PINKY,      // 18
   L_INDEX,      // 19
   R_INDEX,      // 20
   L_THUMB,      // 21
   R_THUMB,      // 22
   L_HIP,        // 23
   R_HIP,        // 24
   L_KNEE,       // 25
   R_KNEE,       // 26
   L_ANKLE,      // 27
   R_ANKLE,      // 28
   L_HEEL,       // 29
   R_HEEL,       // 30
   L_FOOT_INDEX, // 31
   R_FOOT_INDEX, // 32
   UNKNOWN       // 33, names outside the model are carried but never used
};

constexpr int k_n_keypoints = int(KeypointName::R_FOOT_INDEX) + 1;

// Body side, for the bilateral joints
enum class Side : int8_t { LEFT = 0, RIGHT };

KeypointName int_to_keypoint_name(int) noexcept;

// The detector's name, ie, "left_shoulder"
const char* str(const KeypointName) noexcept;

// Unrecognised names return UNKNOWN
KeypointName to_keypoint_name(const string_view val) noexcept;

const char* str(const Side) noexcept;
Side to_side(const string_view val) noexcept(false);

// The same joint on the given side, ie, sided(L_KNEE, Side::RIGHT) == R_KNEE.
// Midline and unknown names are returned unchanged.
KeypointName sided(const KeypointName, const Side) noexcept;

} // namespace shotform::skeleton
