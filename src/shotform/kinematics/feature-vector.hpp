
#pragma once

#include "shotform/foundation.hpp"

#include "json/json.h"

namespace shotform
{
// ------------------------------------------------------------------ FeatureKey
//
enum class FeatureKey : int8_t {
   SQUAT_KNEE_ANGLE = 0, // degrees
   KNEE_EXT_SPEED,       // degrees per second
   RELEASE_ANGLE,        // degrees
   ARM_POWER_ANGLE,      // degrees
   FOLLOW_DURATION,      // seconds
   ELBOW_TIGHTNESS,      // ratio of body width
   SWAY,                 // ratio of body width
   ALIGN_ANGLE,          // degrees
   ALIGN_OFFSET,         // ratio of body width
   COM_OFFSET            // signed ratio
};

constexpr int k_n_feature_keys = int(FeatureKey::COM_OFFSET) + 1;

// ie, "squat_knee_angle"
const char* str(const FeatureKey) noexcept;
FeatureKey to_feature_key(const string_view val) noexcept(false);
bool is_feature_key(const string_view val) noexcept;

// --------------------------------------------------------------- FeatureVector
//
// Clip-level measurements. An empty field means "could not be measured",
// never "bad".
struct FeatureVector final
{
   std::optional<real> squat_knee_angle = {};
   std::optional<real> knee_ext_speed   = {};
   std::optional<real> release_angle    = {};
   std::optional<real> arm_power_angle  = {};
   std::optional<real> follow_duration  = {};
   std::optional<real> elbow_tightness  = {};
   std::optional<real> sway             = {};
   std::optional<real> align_angle      = {};
   std::optional<real> align_offset     = {};
   std::optional<real> com_offset       = {};

   const std::optional<real>& get(const FeatureKey) const noexcept;
   std::optional<real>& get(const FeatureKey) noexcept;

   size_t n_present() const noexcept;

   bool operator==(const FeatureVector&) const noexcept;
   bool operator!=(const FeatureVector&) const noexcept;

   Json::Value to_json() const noexcept;
   void read(const Json::Value&) noexcept(false);
   string to_string() const noexcept;

   friend string str(const FeatureVector& o) noexcept { return o.to_string(); }
};

} // namespace shotform
