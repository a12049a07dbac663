#include "subject-selector.hpp"

#include "shotform/utils/math.hpp"

namespace shotform
{
// -------------------------------------------- SubjectSelectorParams::meta-data
//
const vector<MemberMetaData>& SubjectSelectorParams::meta_data() const noexcept
{
#define ThisParams SubjectSelectorParams
   auto make_meta = []() {
      vector<MemberMetaData> m;
      m.push_back(MAKE_META(ThisParams, REAL, min_visibility, true));
      return m;
   };
   static vector<MemberMetaData> meta_ = make_meta();
   return meta_;
#undef ThisParams
}

// --------------------------------------------------------------- subject-score
//
std::optional<real> subject_score(const PersonPose& person,
                                  const real frame_width,
                                  const SubjectSelectorParams& p) noexcept
{
   real min_x  = std::numeric_limits<real>::max();
   real max_x  = std::numeric_limits<real>::lowest();
   real min_y  = std::numeric_limits<real>::max();
   real max_y  = std::numeric_limits<real>::lowest();
   real sum_c  = 0.0;
   int counter = 0;

   for(const auto& k : person.keypoints()) {
      if(!k.is_valid()) continue;
      const auto c = k.confidence();
      if(!(c > p.min_visibility)) continue;
      min_x = std::min(min_x, k.pos.x);
      max_x = std::max(max_x, k.pos.x);
      min_y = std::min(min_y, k.pos.y);
      max_y = std::max(max_y, k.pos.y);
      sum_c += c;
      ++counter;
   }

   if(counter == 0) return {};

   const auto area      = (max_x - min_x) * (max_y - min_y);
   const auto centre_dx = std::fabs(0.5 * (min_x + max_x) - 0.5 * frame_width);
   const auto mean_c    = sum_c / real(counter);

   return k_subject_area_weight * area + k_subject_lowest_y_weight * max_y
          + k_subject_centre_dx_weight * centre_dx
          + k_subject_confidence_weight * mean_c;
}

// -------------------------------------------------------------- select-subject
//
const PersonPose* select_subject(const vector<PersonPose>& persons,
                                 const real frame_width,
                                 const real frame_height,
                                 const SubjectSelectorParams& p) noexcept
{
   if(persons.empty()) return nullptr;
   if(persons.size() == 1) return &persons.front();

   const PersonPose* best = nullptr;
   real best_score        = std::numeric_limits<real>::lowest();
   for(const auto& person : persons) {
      const auto score = subject_score(person, frame_width, p);
      if(!score.has_value()) continue;
      if(best == nullptr or *score > best_score) {
         best       = &person;
         best_score = *score;
      }
   }

   if(best == nullptr) {
      TRACE(format("no candidate of {} in {}x{} frame has a visible keypoint",
                   persons.size(),
                   frame_width,
                   frame_height));
      return &persons.front();
   }

   return best;
}

} // namespace shotform
