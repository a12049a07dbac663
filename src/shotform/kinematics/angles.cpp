#include "angles.hpp"

#include "shotform/utils/math.hpp"

namespace shotform
{
using namespace skeleton;

// ---------------------------------------------------------------------- angle3
//
std::optional<real>
angle3(const Vector2& a, const Vector2& b, const Vector2& c) noexcept
{
   if(!a.is_finite() or !b.is_finite() or !c.is_finite()) return {};

   const auto ba    = a - b;
   const auto bc    = c - b;
   const auto denom = ba.norm() * bc.norm();
   if(!(denom > 0.0) or !std::isfinite(denom)) return {};

   const auto cos_t = clamp(ba.dot(bc) / denom, -1.0, 1.0);
   return to_degrees(std::acos(cos_t));
}

std::optional<real> angle3(const Keypoint* a,
                           const Keypoint* b,
                           const Keypoint* c,
                           const real min_score) noexcept
{
   if(a == nullptr or b == nullptr or c == nullptr) return {};
   if(!(a->confidence() >= min_score) or !(b->confidence() >= min_score)
      or !(c->confidence() >= min_score))
      return {};
   return angle3(a->pos, b->pos, c->pos);
}

// ----------------------------------------------------------------------- joint
//
const char* str(const Joint x) noexcept
{
   switch(x) {
#define E(x) \
   case Joint::x: return #x;
      E(KNEE);
      E(HIP);
      E(ELBOW);
      E(SHOULDER);
      E(ANKLE);
      E(WRIST);
#undef E
   }
   return "<unknown>";
}

static const Keypoint* first_confident(const PersonPose& pose,
                                       std::initializer_list<KeypointName> ls,
                                       const real min_score) noexcept
{
   for(const auto name : ls) {
      const auto ptr = pose.confident(name, min_score);
      if(ptr != nullptr) return ptr;
   }
   return nullptr;
}

std::array<const Keypoint*, 3> joint_keypoints(const PersonPose& pose,
                                               const Joint joint,
                                               const Side side,
                                               const real min_score) noexcept
{
   auto kp = [&](KeypointName x) { return pose.keypoint(sided(x, side)); };

   switch(joint) {
   case Joint::KNEE: return {kp(L_HIP), kp(L_KNEE), kp(L_ANKLE)};
   case Joint::HIP: return {kp(L_SHOULDER), kp(L_HIP), kp(L_KNEE)};
   case Joint::ELBOW: return {kp(L_SHOULDER), kp(L_ELBOW), kp(L_WRIST)};
   case Joint::SHOULDER: return {kp(L_ELBOW), kp(L_SHOULDER), kp(L_HIP)};
   case Joint::ANKLE:
      return {kp(L_KNEE),
              kp(L_ANKLE),
              first_confident(pose,
                              {sided(L_FOOT_INDEX, side), sided(L_HEEL, side)},
                              min_score)};
   case Joint::WRIST:
      return {kp(L_ELBOW),
              kp(L_WRIST),
              first_confident(pose,
                              {sided(L_INDEX, side),
                               sided(L_PINKY, side),
                               sided(L_THUMB, side)},
                              min_score)};
   }
   return {nullptr, nullptr, nullptr};
}

std::optional<real> joint_angle(const PersonPose& pose,
                                const Joint joint,
                                const Side side,
                                const real min_score) noexcept
{
   const auto [a, b, c] = joint_keypoints(pose, joint, side, min_score);
   return angle3(a, b, c, min_score);
}

real joint_confidence(const PersonPose& pose,
                      const Joint joint,
                      const Side side,
                      const real min_score) noexcept
{
   const auto kps = joint_keypoints(pose, joint, side, min_score);
   real ret       = 1.0;
   for(const auto ptr : kps) {
      if(ptr == nullptr) return 0.0;
      ret = std::min(ret, ptr->confidence());
   }
   return ret;
}

std::optional<SidedAngle> preferred_joint_angle(const PersonPose& pose,
                                                const Joint joint,
                                                const real min_score) noexcept
{
   const auto l = joint_angle(pose, joint, Side::LEFT, min_score);
   const auto r = joint_angle(pose, joint, Side::RIGHT, min_score);

   if(!l.has_value() and !r.has_value()) return {};
   if(!l.has_value()) return SidedAngle{Side::RIGHT, *r};
   if(!r.has_value()) return SidedAngle{Side::LEFT, *l};

   const auto lc = joint_confidence(pose, joint, Side::LEFT, min_score);
   const auto rc = joint_confidence(pose, joint, Side::RIGHT, min_score);
   return (lc > rc) ? SidedAngle{Side::LEFT, *l} : SidedAngle{Side::RIGHT, *r};
}

// --------------------------------------------------------------- wrist-flexion
//
std::optional<real> wrist_flexion(const PersonPose& pose,
                                  const Side side,
                                  const real min_score) noexcept
{
   const auto theta = joint_angle(pose, Joint::WRIST, side, min_score);
   if(!theta.has_value()) return {};
   return 180.0 - *theta;
}

// ----------------------------------------------------------------- torso-align
//
static std::optional<real> line_angle(const PersonPose& pose,
                                      const KeypointName l,
                                      const KeypointName r,
                                      const real min_score) noexcept
{
   const auto a = pose.confident(l, min_score);
   const auto b = pose.confident(r, min_score);
   if(a == nullptr or b == nullptr) return {};
   const auto d = b->pos - a->pos;
   if(!(d.quadrance() > 0.0)) return {};
   return to_degrees(std::atan2(d.y, d.x));
}

std::optional<real> torso_foot_alignment(const PersonPose& pose,
                                         const real min_score) noexcept
{
   const auto hip   = line_angle(pose, L_HIP, R_HIP, min_score);
   const auto ankle = line_angle(pose, L_ANKLE, R_ANKLE, min_score);
   if(!hip.has_value() or !ankle.has_value()) return {};

   // Lines are undirected, so fold the difference into [0..90]
   auto delta = std::fmod(std::fabs(*hip - *ankle), 180.0);
   if(delta > 90.0) delta = 180.0 - delta;
   return delta;
}

// ------------------------------------------------------------------- midpoints
//
static std::optional<Vector2> pair_midpoint(const PersonPose& pose,
                                            const KeypointName l,
                                            const KeypointName r,
                                            const real min_score) noexcept
{
   const auto a = pose.confident(l, min_score);
   const auto b = pose.confident(r, min_score);
   if(a == nullptr or b == nullptr) return {};
   return midpoint(a->pos, b->pos);
}

std::optional<Vector2> hip_midpoint(const PersonPose& pose,
                                    const real min_score) noexcept
{
   return pair_midpoint(pose, L_HIP, R_HIP, min_score);
}

std::optional<Vector2> ankle_midpoint(const PersonPose& pose,
                                      const real min_score) noexcept
{
   return pair_midpoint(pose, L_ANKLE, R_ANKLE, min_score);
}

// ---------------------------------------------------------- lateral-com-offset
//
std::optional<real> lateral_com_offset(const PersonPose& pose,
                                       const real min_score) noexcept
{
   const auto hip   = hip_midpoint(pose, min_score);
   const auto ankle = ankle_midpoint(pose, min_score);
   if(!hip.has_value() or !ankle.has_value()) return {};
   const auto span = hip->distance(*ankle);
   if(!(span > 0.0)) return {};
   return (hip->x - ankle->x) / span;
}

// ------------------------------------------------------------------ body-width
//
std::optional<real> body_width(const PersonPose& pose,
                               const real min_score) noexcept
{
   auto width = [&](KeypointName l, KeypointName r) -> std::optional<real> {
      const auto a = pose.confident(l, min_score);
      const auto b = pose.confident(r, min_score);
      if(a == nullptr or b == nullptr) return {};
      return a->pos.distance(b->pos);
   };

   const auto shoulders = width(L_SHOULDER, R_SHOULDER);
   const auto hips      = width(L_HIP, R_HIP);
   if(!shoulders.has_value() and !hips.has_value()) return {};
   const auto ret = std::max(shoulders.value_or(0.0), hips.value_or(0.0));
   if(!(ret > 0.0)) return {};
   return ret;
}

} // namespace shotform
