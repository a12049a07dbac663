#include "frame-angles.hpp"

#include "shotform/io/json-io.hpp"
#include "shotform/utils/string-utils.hpp"

namespace shotform
{
using skeleton::Side;

static constexpr std::array<Joint, 6> k_joints = {Joint::KNEE,
                                                  Joint::HIP,
                                                  Joint::ELBOW,
                                                  Joint::SHOULDER,
                                                  Joint::ANKLE,
                                                  Joint::WRIST};

std::optional<real> SideAngles::get(const Joint x) const noexcept
{
   switch(x) {
   case Joint::KNEE: return knee;
   case Joint::HIP: return hip;
   case Joint::ELBOW: return elbow;
   case Joint::SHOULDER: return shoulder;
   case Joint::ANKLE: return ankle;
   case Joint::WRIST: return wrist;
   }
   return {};
}

static SideAngles
compute_side(const PersonPose& pose, const Side side, const real min_score)
{
   SideAngles o;
   o.knee     = joint_angle(pose, Joint::KNEE, side, min_score);
   o.hip      = joint_angle(pose, Joint::HIP, side, min_score);
   o.elbow    = joint_angle(pose, Joint::ELBOW, side, min_score);
   o.shoulder = joint_angle(pose, Joint::SHOULDER, side, min_score);
   o.ankle    = joint_angle(pose, Joint::ANKLE, side, min_score);
   o.wrist    = joint_angle(pose, Joint::WRIST, side, min_score);
   return o;
}

// -------------------------------------------------------- compute-frame-angles
//
FrameAngles compute_frame_angles(const PersonPose& pose,
                                 const real min_score) noexcept
{
   FrameAngles o;
   o.left        = compute_side(pose, Side::LEFT, min_score);
   o.right       = compute_side(pose, Side::RIGHT, min_score);
   o.align_angle = torso_foot_alignment(pose, min_score);
   o.com_offset  = lateral_com_offset(pose, min_score);
   o.knee        = preferred_joint_angle(pose, Joint::KNEE, min_score);
   o.elbow       = preferred_joint_angle(pose, Joint::ELBOW, min_score);
   return o;
}

// --------------------------------------------------------------------- to-json
//
Json::Value FrameAngles::to_json() const noexcept
{
   auto side_json = [](const SideAngles& s) {
      Json::Value o{Json::objectValue};
      for(const auto j : k_joints)
         o[string_to_lowercase(str(j))] = json_save(s.get(j));
      return o;
   };

   auto sided_json = [](const std::optional<SidedAngle>& x) -> Json::Value {
      if(!x.has_value()) return Json::Value{Json::nullValue};
      Json::Value o{Json::objectValue};
      o["side"]    = str(x->side);
      o["degrees"] = x->degrees;
      return o;
   };

   Json::Value o{Json::objectValue};
   o["left"]        = side_json(left);
   o["right"]       = side_json(right);
   o["align_angle"] = json_save(align_angle);
   o["com_offset"]  = json_save(com_offset);
   o["knee"]        = sided_json(knee);
   o["elbow"]       = sided_json(elbow);
   return o;
}

string FrameAngles::to_string() const noexcept { return str(to_json()); }

} // namespace shotform
