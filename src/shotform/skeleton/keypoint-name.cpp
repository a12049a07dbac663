#include "keypoint-name.hpp"

namespace shotform::skeleton
{
// --------------------------------------------------------------- keypoint name
//
KeypointName int_to_keypoint_name(int val) noexcept
{
   if(val >= 0 and val < k_n_keypoints) return KeypointName(val);
   return UNKNOWN;
}

#define FOR_EACH_KEYPOINT(E)            \
   E(NOSE, "nose");                     \
   E(L_EYE_INNER, "left_eye_inner");    \
   E(L_EYE, "left_eye");                \
   E(L_EYE_OUTER, "left_eye_outer");    \
   E(R_EYE_INNER, "right_eye_inner");   \
   E(R_EYE, "right_eye");               \
   E(R_EYE_OUTER, "right_eye_outer");   \
   E(L_EAR, "left_ear");                \
   E(R_EAR, "right_ear");               \
   E(MOUTH_LEFT, "mouth_left");         \
   E(MOUTH_RIGHT, "mouth_right");       \
   E(L_SHOULDER, "left_shoulder");      \
   E(R_SHOULDER, "right_shoulder");     \
   E(L_ELBOW, "left_elbow");            \
   E(R_ELBOW, "right_elbow");           \
   E(L_WRIST, "left_wrist");            \
   E(R_WRIST, "right_wrist");           \
   E(L_PINKY, "left_pinky");            \
   E(R_PINKY, "right_pinky");           \
   E(L_INDEX, "left_index");            \
   E(R_INDEX, "right_index");           \
   E(L_THUMB, "left_thumb");            \
   E(R_THUMB, "right_thumb");           \
   E(L_HIP, "left_hip");                \
   E(R_HIP, "right_hip");               \
   E(L_KNEE, "left_knee");              \
   E(R_KNEE, "right_knee");             \
   E(L_ANKLE, "left_ankle");            \
   E(R_ANKLE, "right_ankle");           \
   E(L_HEEL, "left_heel");              \
   E(R_HEEL, "right_heel");             \
   E(L_FOOT_INDEX, "left_foot_index");  \
   E(R_FOOT_INDEX, "right_foot_index")

const char* str(const KeypointName x) noexcept
{
   switch(x) {
#define E(x, s) \
   case x: return s
      FOR_EACH_KEYPOINT(E);
#undef E
   case UNKNOWN: return "unknown";
   }
   return "unknown";
}

KeypointName to_keypoint_name(const string_view val) noexcept
{
#define E(x, s) \
   if(val == s) return x
   FOR_EACH_KEYPOINT(E);
#undef E
   return UNKNOWN;
}

#undef FOR_EACH_KEYPOINT

// ------------------------------------------------------------------------ side
//
const char* str(const Side x) noexcept
{
   switch(x) {
   case Side::LEFT: return "left";
   case Side::RIGHT: return "right";
   }
   return "right";
}

Side to_side(const string_view val) noexcept(false)
{
   if(val == "left") return Side::LEFT;
   if(val == "right") return Side::RIGHT;
   throw std::runtime_error(
       format("could not convert string '{}' to a Side", val));
}

// ----------------------------------------------------------------------- sided
//
KeypointName sided(const KeypointName x, const Side side) noexcept
{
   // Bilateral landmarks from L_SHOULDER onwards alternate left/right
   if(x < L_SHOULDER or x > R_FOOT_INDEX) return x;
   const bool is_left = ((int(x) - int(L_SHOULDER)) % 2) == 0;
   if(is_left and side == Side::RIGHT) return KeypointName(int(x) + 1);
   if(!is_left and side == Side::LEFT) return KeypointName(int(x) - 1);
   return x;
}

} // namespace shotform::skeleton
