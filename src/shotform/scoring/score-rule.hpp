
#pragma once

#include "shotform/foundation.hpp"

#include "json/json.h"

namespace shotform
{
// ----------------------------------------------------------------- ScorePolicy
//
enum class ScorePolicy : int8_t {
   CLOSER = 0, // 100 at the target, floor once |v - target| >= tolerance
   BIGGER,     // 100 at or above the target, linear from zero below it
   SMALLER     // 100 at or below the target, floor at the worst bound
};

const char* str(const ScorePolicy) noexcept;
ScorePolicy to_score_policy(const string_view val) noexcept(false);

// The smallest tolerance (or target-to-worst gap) a rule may have
constexpr real k_min_tolerance = 1e-6;

// Shown in place of a value that could not be measured
constexpr const char* k_not_detected_label = "未检测";

// ------------------------------------------------------------------- ScoreRule
//
struct ScoreRule final
{
   real target               = 0.0;
   real tolerance            = 0.0; // CLOSER only
   ScorePolicy policy        = ScorePolicy::CLOSER;
   string unit               = ""s; // "%" renders `v * 100`
   int decimals              = 2;
   std::optional<real> worst = {};  // SMALLER only
   real worst_multiplier     = 5.0; // SMALLER, when `worst` is not set

   // The SMALLER policy's zero-credit bound, always above the target
   real worst_bound() const noexcept;

   bool operator==(const ScoreRule&) const noexcept;
   bool operator!=(const ScoreRule&) const noexcept;

   Json::Value to_json() const noexcept;

   // `policy` and `target` are required. Everything else has a default.
   void read(const Json::Value&) noexcept(false);
   string to_string() const noexcept;

   friend string str(const ScoreRule& o) noexcept { return o.to_string(); }
};

// ------------------------------------------------------------------ score-rule
//
// The unrounded policy score for `value`, never below `floor`, never above
// 100. An absent value earns the floor.
real score_rule(const std::optional<real>& value,
                const ScoreRule& rule,
                const real floor) noexcept;

// ie, "172.48度", "28.68%", or "未检测" for an absent value
string format_value(const std::optional<real>& value,
                    const ScoreRule& rule) noexcept;

} // namespace shotform
