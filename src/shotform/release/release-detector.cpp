#include "release-detector.hpp"

namespace shotform
{
using namespace skeleton;

// ---------------------------------------------------- ReleaseParams::meta-data
//
const vector<MemberMetaData>& ReleaseParams::meta_data() const noexcept
{
#define ThisParams ReleaseParams
   auto make_meta = []() {
      vector<MemberMetaData> m;
      m.push_back(MAKE_META(ThisParams, REAL, min_elbow_deg, true));
      m.push_back(MAKE_META(ThisParams, REAL, min_wrist_lift, true));
      m.push_back(MAKE_META(ThisParams, INT, lookback, true));
      m.push_back(MAKE_META(ThisParams, REAL, follow_hold_elbow_deg, true));
      return m;
   };
   static vector<MemberMetaData> meta_ = make_meta();
   return meta_;
#undef ThisParams
}

// -------------------------------------------------------- choose-shooting-side
//
Side choose_shooting_side(const vector<PoseSample>& samples,
                          const real min_score) noexcept
{
   auto arm_confidence = [&](const PersonPose& pose, Side side) {
      real sum = 0.0;
      for(const auto x : {L_SHOULDER, L_ELBOW, L_WRIST}) {
         const auto ptr = pose.confident(sided(x, side), min_score);
         if(ptr != nullptr) sum += ptr->confidence();
      }
      return sum;
   };

   real l = 0.0, r = 0.0;
   for(const auto& s : samples) {
      l += arm_confidence(s.pose, Side::LEFT);
      r += arm_confidence(s.pose, Side::RIGHT);
   }

   return (l > r) ? Side::LEFT : Side::RIGHT;
}

// -------------------------------------------------------------- detect-release
//
std::optional<size_t> detect_release(const vector<PoseSample>& samples,
                                     const Side side,
                                     const ReleaseParams& p,
                                     const real min_score) noexcept
{
   const auto shoulder_name = sided(L_SHOULDER, side);
   const auto elbow_name    = sided(L_ELBOW, side);
   const auto wrist_name    = sided(L_WRIST, side);

   auto wrist_of = [&](const PoseSample& s) {
      return s.pose.confident(wrist_name, min_score);
   };

   auto is_usable = [&](const PoseSample& s) {
      return s.pose.confident(shoulder_name, min_score) != nullptr
             and s.pose.confident(elbow_name, min_score) != nullptr
             and wrist_of(s) != nullptr;
   };

   const auto n_usable
       = std::count_if(cbegin(samples), cend(samples), is_usable);
   if(n_usable < 3) {
      TRACE(format("release: only {} usable sample(s)", n_usable));
      return {};
   }

   const size_t lookback = size_t(std::max(p.lookback, 1));

   for(size_t i = lookback; i < samples.size(); ++i) {
      const auto& cur = samples[i];
      if(!is_usable(cur)) continue;

      const auto elbow = joint_angle(cur.pose, Joint::ELBOW, side, min_score);
      if(!elbow.has_value() or *elbow < p.min_elbow_deg) continue;

      const auto cur_y = wrist_of(cur)->pos.y;
      bool lifted      = false;
      for(size_t b = 1; b <= lookback and !lifted; ++b) {
         const auto prev = wrist_of(samples[i - b]);
         if(prev == nullptr) continue;
         lifted = (prev->pos.y - cur_y >= p.min_wrist_lift);
      }

      if(lifted) {
         TRACE(format("release at sample {}, t={:.3f}s, elbow={:.1f}",
                      i,
                      cur.timestamp,
                      *elbow));
         return i;
      }
   }

   return {};
}

std::optional<size_t> detect_release(const vector<PoseSample>& samples,
                                     const ReleaseParams& p,
                                     const real min_score) noexcept
{
   return detect_release(
       samples, choose_shooting_side(samples, min_score), p, min_score);
}

} // namespace shotform
