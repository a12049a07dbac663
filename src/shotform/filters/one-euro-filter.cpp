#include "one-euro-filter.hpp"

#include "shotform/utils/math.hpp"

#define This OneEuroFilter

namespace shotform
{
// ---------------------------------------------------- OneEuroParams::meta-data
//
const vector<MemberMetaData>& OneEuroParams::meta_data() const noexcept
{
#define ThisParams OneEuroParams
   auto make_meta = []() {
      vector<MemberMetaData> m;
      m.push_back(MAKE_META(ThisParams, REAL, min_cutoff, true));
      m.push_back(MAKE_META(ThisParams, REAL, beta, true));
      m.push_back(MAKE_META(ThisParams, REAL, d_cutoff, true));
      m.push_back(MAKE_META(ThisParams, REAL, min_dt, true));
      return m;
   };
   static vector<MemberMetaData> meta_ = make_meta();
   return meta_;
#undef ThisParams
}

// ---------------------------------------------------------------- construction
//
This::This(const OneEuroParams& params)
    : params_(params)
{}

// ------------------------------------------------------------ smoothing-factor
//
real This::smoothing_factor(real dt, real cutoff) noexcept
{
   const auto fc  = std::max(cutoff, k_min_cutoff_floor);
   const auto tau = 1.0 / (2.0 * M_PI * fc);
   return dt / (dt + tau);
}

// ---------------------------------------------------------------------- update
//
real This::update(real x, real timestamp) noexcept
{
   if(!std::isfinite(x) or !std::isfinite(timestamp))
      return has_state_ ? value_ : x;

   if(!has_state_) {
      value_      = x;
      derivative_ = 0.0;
      timestamp_  = timestamp;
      has_state_  = true;
      return value_;
   }

   if(timestamp <= timestamp_) return value_; // degenerate interval

   const auto dt = std::max(timestamp - timestamp_, params_.min_dt);

   // Smoothed derivative
   const auto dx     = (x - value_) / dt;
   const auto a_d    = smoothing_factor(dt, params_.d_cutoff);
   const auto dx_hat = derivative_ + a_d * (dx - derivative_);

   // Speed-adaptive cutoff
   const auto cutoff = params_.min_cutoff + params_.beta * std::fabs(dx_hat);
   const auto a      = smoothing_factor(dt, cutoff);

   value_      = value_ + a * (x - value_);
   derivative_ = dx_hat;
   timestamp_  = timestamp;
   return value_;
}

// ----------------------------------------------------------------------- reset
//
void This::reset() noexcept
{
   has_state_  = false;
   value_      = 0.0;
   derivative_ = 0.0;
   timestamp_  = 0.0;
}

} // namespace shotform
