#include "clip-features.hpp"

#include "shotform/utils/math.hpp"

#include <Eigen/Core>

namespace shotform
{
using namespace skeleton;

// Collects a per-sample measurement into an Eigen array, skipping samples
// where the measurement is empty.
template<typename F>
static Eigen::ArrayXd collect(const vector<PoseSample>& samples,
                              const size_t first,
                              const size_t last, // exclusive
                              F f) noexcept
{
   vector<real> values;
   values.reserve(last - first);
   for(size_t i = first; i < last and i < samples.size(); ++i) {
      const std::optional<real> x = f(samples[i]);
      if(x.has_value() and std::isfinite(*x)) values.push_back(*x);
   }
   return Eigen::Map<const Eigen::ArrayXd>(values.data(),
                                           Eigen::Index(values.size()));
}

static real population_stddev(const Eigen::ArrayXd& xs) noexcept
{
   Expects(xs.size() > 0);
   return std::sqrt((xs - xs.mean()).square().mean());
}

// ------------------------------------------------------------- clip-body-width
//
std::optional<real> clip_body_width(const vector<PoseSample>& samples,
                                    const real min_score) noexcept
{
   vector<real> widths;
   widths.reserve(samples.size());
   for(const auto& s : samples) {
      const auto w = body_width(s.pose, min_score);
      if(w.has_value()) widths.push_back(*w);
   }
   if(widths.empty()) return {};
   return calc_median(begin(widths), end(widths));
}

// ------------------------------------------------------- compute-clip-features
//
FeatureVector compute_clip_features(const vector<PoseSample>& samples,
                                    const std::optional<size_t> release_index,
                                    const Side side,
                                    const ReleaseParams& p,
                                    const real min_score) noexcept
{
   FeatureVector o;
   if(samples.empty()) return o;

   const auto N          = samples.size();
   const bool has_release = release_index.has_value() and *release_index < N;
   const size_t release   = has_release ? *release_index : N - 1;
   const auto bw          = clip_body_width(samples, min_score);

   auto knee_of = [&](const PoseSample& s) {
      return joint_angle(s.pose, Joint::KNEE, side, min_score);
   };
   auto elbow_of = [&](const PoseSample& s) {
      return joint_angle(s.pose, Joint::ELBOW, side, min_score);
   };

   { // Squat depth, up to and including the release
      const auto knees = collect(samples, 0, release + 1, knee_of);
      if(knees.size() > 0) o.squat_knee_angle = knees.minCoeff();
   }

   { // Knee extension speed, between consecutive usable frames
      std::optional<real> best;
      std::optional<std::pair<real, real>> last; // timestamp, knee angle
      for(size_t i = 0; i <= release; ++i) {
         const auto knee = knee_of(samples[i]);
         if(!knee.has_value()) continue;
         const auto t = samples[i].timestamp;
         if(last.has_value() and t > last->first) {
            const auto rate = (*knee - last->second) / (t - last->first);
            best            = std::max(best.value_or(0.0), rate);
         }
         last = std::make_pair(t, *knee);
      }
      o.knee_ext_speed = best;
   }

   if(has_release) {
      const auto& s     = samples[release];
      o.release_angle   = elbow_of(s);
      o.arm_power_angle = wrist_flexion(s.pose, side, min_score);

      // Follow-through: time the elbow stays straight after the release
      real held_until = s.timestamp;
      for(size_t i = release + 1; i < N; ++i) {
         const auto elbow = elbow_of(samples[i]);
         if(!elbow.has_value()) continue;
         if(*elbow < p.follow_hold_elbow_deg) break;
         held_until = samples[i].timestamp;
      }
      o.follow_duration = std::max(0.0, held_until - s.timestamp);
   }

   if(bw.has_value()) {
      const auto elbow_xs = collect(samples, 0, N, [&](const PoseSample& s) {
         const auto ptr = s.pose.confident(sided(L_ELBOW, side), min_score);
         return (ptr == nullptr) ? std::optional<real>{}
                                 : std::optional<real>{ptr->pos.x};
      });
      if(elbow_xs.size() > 0)
         o.elbow_tightness
             = (elbow_xs.maxCoeff() - elbow_xs.minCoeff()) / *bw;

      const auto hip_xs = collect(samples, 0, N, [&](const PoseSample& s) {
         const auto hip = hip_midpoint(s.pose, min_score);
         return hip.has_value() ? std::optional<real>{hip->x}
                                : std::optional<real>{};
      });
      if(hip_xs.size() > 0) o.sway = population_stddev(hip_xs) / *bw;
   }

   // Searches backwards from `from` for the first sample with a value
   auto last_usable = [&](size_t from, auto f) -> std::optional<real> {
      for(size_t i = from + 1; i-- > 0;) {
         const auto x = f(samples[i]);
         if(x.has_value()) return x;
      }
      return {};
   };

   auto align_of = [&](const PoseSample& s) {
      return torso_foot_alignment(s.pose, min_score);
   };
   auto com_of = [&](const PoseSample& s) {
      return lateral_com_offset(s.pose, min_score);
   };

   o.align_angle = has_release ? align_of(samples[release])
                               : last_usable(N - 1, align_of);
   o.com_offset  = has_release ? com_of(samples[release])
                               : last_usable(N - 1, com_of);

   if(bw.has_value()) {
      o.align_offset = last_usable(N - 1, [&](const PoseSample& s) {
         const auto hip   = hip_midpoint(s.pose, min_score);
         const auto ankle = ankle_midpoint(s.pose, min_score);
         if(!hip.has_value() or !ankle.has_value())
            return std::optional<real>{};
         return std::optional<real>{std::fabs(hip->x - ankle->x) / *bw};
      });
   }

   return o;
}

// ---------------------------------------------------------------- analyze-clip
//
ClipAnalysis analyze_clip(const vector<PoseSample>& samples,
                          const ReleaseParams& p,
                          const real min_score) noexcept
{
   ClipAnalysis o;
   o.n_samples     = samples.size();
   o.side          = choose_shooting_side(samples, min_score);
   o.release_index = detect_release(samples, o.side, p, min_score);
   if(o.release_index.has_value()) {
      const auto& s    = samples[*o.release_index];
      o.release_time   = s.timestamp;
      o.release_angles = compute_frame_angles(s.pose, min_score);
   }
   o.body_width = clip_body_width(samples, min_score);
   o.features
       = compute_clip_features(samples, o.release_index, o.side, p, min_score);
   return o;
}

// --------------------------------------------------------------------- to-json
//
Json::Value ClipAnalysis::to_json() const noexcept
{
   Json::Value o{Json::objectValue};
   o["n_samples"]      = Json::Value(Json::UInt64(n_samples));
   o["side"]           = str(side);
   o["release_index"]  = release_index.has_value()
                             ? Json::Value(Json::UInt64(*release_index))
                             : Json::Value(Json::nullValue);
   o["release_time"]   = json_save(release_time);
   o["release_angles"] = release_angles.has_value()
                             ? release_angles->to_json()
                             : Json::Value(Json::nullValue);
   o["body_width"]     = json_save(body_width);
   o["features"]       = features.to_json();
   return o;
}

string ClipAnalysis::to_string() const noexcept { return str(to_json()); }

} // namespace shotform
