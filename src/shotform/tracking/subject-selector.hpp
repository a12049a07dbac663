
#pragma once

#include "shotform/io/struct-meta.hpp"
#include "shotform/skeleton/person-pose.hpp"

namespace shotform
{
// ------------------------------------------------------- SubjectSelectorParams
//
struct SubjectSelectorParams final : public MetaCompatible
{
   virtual ~SubjectSelectorParams() {}
   const vector<MemberMetaData>& meta_data() const noexcept override;

   // Keypoints must have confidence strictly above this to count
   real min_visibility = 0.2;
};

META_READ_WRITE_LOAD_SAVE(SubjectSelectorParams)

// Relative weights of the candidate score. Fixed, not tuned per clip.
constexpr real k_subject_area_weight       = 1.1;
constexpr real k_subject_lowest_y_weight   = 0.15;
constexpr real k_subject_centre_dx_weight  = -0.4;
constexpr real k_subject_confidence_weight = 25.0;

// The candidate score of one person. Empty if no keypoint qualifies.
//
//    score =  1.1  * bounding-box-area
//           + 0.15 * lowest-keypoint-y
//           - 0.4  * |bbox-centre-x - frame-width / 2|
//           + 25.0 * mean-confidence
//
std::optional<real> subject_score(const PersonPose& person,
                                  const real frame_width,
                                  const SubjectSelectorParams& p) noexcept;

// Picks the primary subject of a frame.
//  + nullptr when `persons` is empty
//  + the sole entry when there is exactly one
//  + otherwise the highest `subject_score`, first-in-order on a tie. If no
//    candidate has a qualifying keypoint, the first candidate.
const PersonPose* select_subject(const vector<PersonPose>& persons,
                                 const real frame_width,
                                 const real frame_height,
                                 const SubjectSelectorParams& p) noexcept;

} // namespace shotform
