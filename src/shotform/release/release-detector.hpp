
#pragma once

#include "shotform/io/struct-meta.hpp"
#include "shotform/kinematics/angles.hpp"
#include "shotform/skeleton/person-pose.hpp"

namespace shotform
{
// --------------------------------------------------------------- ReleaseParams
//
struct ReleaseParams final : public MetaCompatible
{
   virtual ~ReleaseParams() {}
   const vector<MemberMetaData>& meta_data() const noexcept override;

   // Empirical thresholds. They are defaults, not calibrated constants, and
   // should be validated against motion-capture ground truth.
   real min_elbow_deg  = 150.0; //!< "near fully extended" elbow
   real min_wrist_lift = 4.0;   //!< pixels the wrist must rise
   int lookback        = 2;     //!< frames compared against for the rise

   // The follow-through lasts while the elbow stays at least this straight
   real follow_hold_elbow_deg = 150.0;
};

META_READ_WRITE_LOAD_SAVE(ReleaseParams)

// --------------------------------------------------------------- shooting side
//
// The side with the larger summed shoulder, elbow, and wrist confidence
// over the clip. Ties go to the right.
skeleton::Side choose_shooting_side(const vector<PoseSample>& samples,
                                    const real min_score
                                    = k_min_keypoint_score) noexcept;

// -------------------------------------------------------------- detect release
//
// Index of the first sample where
//  (a) the elbow (shoulder-elbow-wrist) is at least `min_elbow_deg`, and
//  (b) the wrist has risen (y decreased) by at least `min_wrist_lift`
//      relative to one of the previous `lookback` samples.
// Samples without a confident shoulder, elbow and wrist are skipped.
// Empty if fewer than 3 usable samples exist, or nothing qualifies.
std::optional<size_t> detect_release(const vector<PoseSample>& samples,
                                     const skeleton::Side side,
                                     const ReleaseParams& p,
                                     const real min_score
                                     = k_min_keypoint_score) noexcept;

// As above, with the side chosen by `choose_shooting_side`
std::optional<size_t> detect_release(const vector<PoseSample>& samples,
                                     const ReleaseParams& p,
                                     const real min_score
                                     = k_min_keypoint_score) noexcept;

} // namespace shotform
