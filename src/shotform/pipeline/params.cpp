#include "params.hpp"

namespace shotform
{
// ------------------------------------------------------------------- meta-data
//
const vector<MemberMetaData>& Params::meta_data() const noexcept
{
#define ThisParams Params
   auto make_meta = []() {
      vector<MemberMetaData> m;
      m.push_back(MAKE_META(ThisParams, REAL, min_keypoint_score, true));
      m.push_back(MAKE_META(ThisParams, COMPATIBLE_OBJECT, smoothing, true));
      m.push_back(MAKE_META(ThisParams, COMPATIBLE_OBJECT, subject, true));
      m.push_back(MAKE_META(ThisParams, COMPATIBLE_OBJECT, release, true));
      m.push_back(MAKE_META(ThisParams, COMPATIBLE_OBJECT, scoring, true));
      return m;
   };
   static vector<MemberMetaData> meta_ = make_meta();
   return meta_;
#undef ThisParams
}

} // namespace shotform
