
#pragma once

#include "shotform/foundation.hpp"
#include "shotform/io/struct-meta.hpp"

namespace shotform
{
// --------------------------------------------------------------- OneEuroParams
//
struct OneEuroParams final : public MetaCompatible
{
   virtual ~OneEuroParams() {}
   const vector<MemberMetaData>& meta_data() const noexcept override;

   real min_cutoff = 1.15; //!< Hz. Baseline smoothing. Higher means less lag
   real beta       = 0.05; //!< Speed coefficient. Higher tracks motion faster
   real d_cutoff   = 1.0;  //!< Hz. Smoothing of the derivative estimate
   real min_dt     = 1e-3; //!< seconds. Floor on the update interval
};

META_READ_WRITE_LOAD_SAVE(OneEuroParams)

// --------------------------------------------------------------- OneEuroFilter
//
// Adaptive first-order low-pass filter for a single scalar signal. The
// cutoff frequency rises with the (smoothed) speed of the signal.
//
// Timestamps must be non-decreasing. An update whose timestamp is not
// strictly later than the last one returns the last value and leaves the
// state untouched.
class OneEuroFilter final
{
 private:
   OneEuroParams params_ = {};
   bool has_state_       = false;
   real value_           = 0.0; // last filtered value
   real derivative_      = 0.0; // last filtered derivative
   real timestamp_       = 0.0; // seconds

 public:
   static constexpr real k_min_cutoff_floor = 1e-6;

   OneEuroFilter() = default;
   explicit OneEuroFilter(const OneEuroParams& params);

   real update(real x, real timestamp) noexcept;
   void reset() noexcept;

   bool has_state() const noexcept { return has_state_; }
   real value() const noexcept { return value_; }
   real derivative() const noexcept { return derivative_; }
   real timestamp() const noexcept { return timestamp_; }
   const OneEuroParams& params() const noexcept { return params_; }

   // The exponential smoothing factor for interval `dt` and `cutoff` Hz.
   static real smoothing_factor(real dt, real cutoff) noexcept;
};

} // namespace shotform
