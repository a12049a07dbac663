#include "feature-vector.hpp"

#include "shotform/io/json-io.hpp"
#include "shotform/utils/math.hpp"

#define This FeatureVector

namespace shotform
{
// ------------------------------------------------------------------ FeatureKey
//
#define FOR_EACH_FEATURE(E)                      \
   E(SQUAT_KNEE_ANGLE, "squat_knee_angle");      \
   E(KNEE_EXT_SPEED, "knee_ext_speed");          \
   E(RELEASE_ANGLE, "release_angle");            \
   E(ARM_POWER_ANGLE, "arm_power_angle");        \
   E(FOLLOW_DURATION, "follow_duration");        \
   E(ELBOW_TIGHTNESS, "elbow_tightness");        \
   E(SWAY, "sway");                              \
   E(ALIGN_ANGLE, "align_angle");                \
   E(ALIGN_OFFSET, "align_offset");              \
   E(COM_OFFSET, "com_offset")

const char* str(const FeatureKey x) noexcept
{
   switch(x) {
#define E(x, s) \
   case FeatureKey::x: return s
      FOR_EACH_FEATURE(E);
#undef E
   }
   return "<unknown>";
}

FeatureKey to_feature_key(const string_view val) noexcept(false)
{
#define E(x, s) \
   if(val == s) return FeatureKey::x
   FOR_EACH_FEATURE(E);
#undef E
   throw std::runtime_error(
       format("could not convert string '{}' to a FeatureKey", val));
}

bool is_feature_key(const string_view val) noexcept
{
#define E(x, s) \
   if(val == s) return true
   FOR_EACH_FEATURE(E);
#undef E
   return false;
}

// ------------------------------------------------------------------------- get
//
const std::optional<real>& This::get(const FeatureKey x) const noexcept
{
   return const_cast<This*>(this)->get(x);
}

std::optional<real>& This::get(const FeatureKey x) noexcept
{
   switch(x) {
#define E(x, s) \
   case FeatureKey::x: return this->s
      E(SQUAT_KNEE_ANGLE, squat_knee_angle);
      E(KNEE_EXT_SPEED, knee_ext_speed);
      E(RELEASE_ANGLE, release_angle);
      E(ARM_POWER_ANGLE, arm_power_angle);
      E(FOLLOW_DURATION, follow_duration);
      E(ELBOW_TIGHTNESS, elbow_tightness);
      E(SWAY, sway);
      E(ALIGN_ANGLE, align_angle);
      E(ALIGN_OFFSET, align_offset);
      E(COM_OFFSET, com_offset);
#undef E
   }
   return com_offset;
}

size_t This::n_present() const noexcept
{
   size_t counter = 0;
   for(int i = 0; i < k_n_feature_keys; ++i)
      if(get(FeatureKey(i)).has_value()) ++counter;
   return counter;
}

// ------------------------------------------------------------------ operator==
//
bool This::operator==(const FeatureVector& o) const noexcept
{
   for(int i = 0; i < k_n_feature_keys; ++i) {
      const auto& a = get(FeatureKey(i));
      const auto& b = o.get(FeatureKey(i));
      if(a.has_value() != b.has_value()) return false;
      if(a.has_value() and !float_is_same(*a, *b)) return false;
   }
   return true;
}

bool This::operator!=(const FeatureVector& o) const noexcept
{
   return !(*this == o);
}

// --------------------------------------------------------------------- to-json
//
Json::Value This::to_json() const noexcept
{
   Json::Value o{Json::objectValue};
   for(int i = 0; i < k_n_feature_keys; ++i)
      o[str(FeatureKey(i))] = json_save(get(FeatureKey(i)));
   return o;
}

void This::read(const Json::Value& o) noexcept(false)
{
   if(!o.isObject()) throw std::runtime_error("expected a JSON object");
   *this = FeatureVector{};
   for(int i = 0; i < k_n_feature_keys; ++i) {
      const auto key = str(FeatureKey(i));
      if(has_key(o, key)) json_load(o[key], get(FeatureKey(i)));
   }
}

string This::to_string() const noexcept { return str(to_json()); }

} // namespace shotform
