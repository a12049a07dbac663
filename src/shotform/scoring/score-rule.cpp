#include "score-rule.hpp"

#include "shotform/io/json-io.hpp"
#include "shotform/utils/math.hpp"
#include "shotform/utils/string-utils.hpp"

#define This ScoreRule

namespace shotform
{
// ----------------------------------------------------------------- ScorePolicy
//
const char* str(const ScorePolicy x) noexcept
{
   switch(x) {
#define E(x) \
   case ScorePolicy::x: return #x
      E(CLOSER);
      E(BIGGER);
      E(SMALLER);
#undef E
   }
   return "<unknown>";
}

ScorePolicy to_score_policy(const string_view val) noexcept(false)
{
   const auto s = string_to_lowercase(val);
   if(s == "closer") return ScorePolicy::CLOSER;
   if(s == "bigger") return ScorePolicy::BIGGER;
   if(s == "smaller") return ScorePolicy::SMALLER;
   throw std::runtime_error(
       format("could not convert string '{}' to a ScorePolicy", val));
}

// ----------------------------------------------------------------- worst-bound
//
real This::worst_bound() const noexcept
{
   const auto w = worst.has_value() ? *worst : target * worst_multiplier;
   if(!(w > target)) return target + std::max(tolerance, k_min_tolerance);
   return w;
}

// ------------------------------------------------------------------ operator==
//
bool This::operator==(const ScoreRule& o) const noexcept
{
   auto opt_same = [](const auto& a, const auto& b) {
      if(a.has_value() != b.has_value()) return false;
      return !a.has_value() or float_is_same(*a, *b);
   };
   return float_is_same(target, o.target)
          and float_is_same(tolerance, o.tolerance) and policy == o.policy
          and unit == o.unit and decimals == o.decimals
          and opt_same(worst, o.worst)
          and float_is_same(worst_multiplier, o.worst_multiplier);
}

bool This::operator!=(const ScoreRule& o) const noexcept
{
   return !(*this == o);
}

// --------------------------------------------------------------------- to-json
//
Json::Value This::to_json() const noexcept
{
   Json::Value o{Json::objectValue};
   o["target"]           = json_save(target);
   o["tolerance"]        = json_save(tolerance);
   o["policy"]           = string_to_lowercase(str(policy));
   o["unit"]             = json_save(unit);
   o["decimals"]         = json_save(decimals);
   o["worst"]            = json_save(worst);
   o["worst_multiplier"] = json_save(worst_multiplier);
   return o;
}

void This::read(const Json::Value& o) noexcept(false)
{
   const auto op = "reading score rule"s;
   if(!o.isObject()) throw std::runtime_error("expected a JSON object");

   ScoreRule x;
   x.policy = to_score_policy(json_load_key<string>(o, "policy", op));
   x.target = json_load_key<real>(o, "target", op);
   if(has_key(o, "tolerance"))
      x.tolerance = json_load_key<real>(o, "tolerance", op);
   if(has_key(o, "unit")) x.unit = json_load_key<string>(o, "unit", op);
   if(has_key(o, "decimals"))
      x.decimals = json_load_key<int>(o, "decimals", op);
   if(has_key(o, "worst")) json_load(get_key(o, "worst"), x.worst);
   if(has_key(o, "worst_multiplier"))
      x.worst_multiplier = json_load_key<real>(o, "worst_multiplier", op);

   if(!std::isfinite(x.target))
      throw std::runtime_error("score rule target must be finite");
   if(x.decimals < 0 or x.decimals > 10)
      throw std::runtime_error(
          format("score rule decimals out of range: {}", x.decimals));

   *this = std::move(x);
}

string This::to_string() const noexcept { return str(to_json()); }

// ------------------------------------------------------------------ score-rule
//
static real policy_score(const real v, const ScoreRule& rule) noexcept
{
   switch(rule.policy) {
   case ScorePolicy::CLOSER: {
      const auto tol  = std::max(rule.tolerance, k_min_tolerance);
      const auto diff = std::fabs(v - rule.target);
      return (diff >= tol) ? 0.0 : 100.0 * (1.0 - diff / tol);
   }
   case ScorePolicy::BIGGER:
      if(v >= rule.target) return 100.0;
      if(!(rule.target > 0.0)) return 0.0; // nothing to ramp from
      return 100.0 * v / rule.target;
   case ScorePolicy::SMALLER: {
      if(v <= rule.target) return 100.0;
      const auto worst = rule.worst_bound();
      return 100.0 * (1.0 - (v - rule.target) / (worst - rule.target));
   }
   }
   return 0.0;
}

real score_rule(const std::optional<real>& value,
                const ScoreRule& rule,
                const real floor) noexcept
{
   const auto lo = clamp(floor, 0.0, 100.0);
   if(!value.has_value() or !std::isfinite(*value)) return lo;
   return clamp(std::max(lo, policy_score(*value, rule)), 0.0, 100.0);
}

// ---------------------------------------------------------------- format-value
//
string format_value(const std::optional<real>& value,
                    const ScoreRule& rule) noexcept
{
   if(!value.has_value() or !std::isfinite(*value)) return k_not_detected_label;
   if(rule.unit == "%")
      return percent_str(*value, rule.decimals);
   return format("{}{}", fixed_decimals_str(*value, rule.decimals), rule.unit);
}

} // namespace shotform
