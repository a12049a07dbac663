
#pragma once

#include "shotform/filters/one-euro-filter.hpp"
#include "shotform/io/struct-meta.hpp"
#include "shotform/release/release-detector.hpp"
#include "shotform/scoring/scoring-params.hpp"
#include "shotform/tracking/subject-selector.hpp"

namespace shotform
{
// ---------------------------------------------------------------------- Params
//
// Everything an analysis session can be configured with. `params.json`.
struct Params final : public MetaCompatible
{
   virtual ~Params() {}
   const vector<MemberMetaData>& meta_data() const noexcept override;

   real min_keypoint_score       = k_min_keypoint_score;
   OneEuroParams smoothing       = {};
   SubjectSelectorParams subject = {};
   ReleaseParams release         = {};
   ScoringParams scoring         = {};
};

META_READ_WRITE_LOAD_SAVE(Params)

} // namespace shotform
