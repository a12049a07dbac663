#include "analysis-session.hpp"

#define This AnalysisSession

namespace shotform
{
// ---------------------------------------------------------------- construction
//
This::This()
    : This(Params{})
{}

This::This(const Params& params)
    : params_(params)
    , smoother_(params.smoothing)
{}

// --------------------------------------------------------------- process-frame
//
std::optional<SmoothedPose> This::process_frame(const MultiPersonFrame& frame)
{
   ++n_frames_;

   if(!samples_.empty() and frame.timestamp < samples_.back().timestamp)
      WARN(format("frame at {}s arrived after {}s; smoothing will hold the "
                  "previous value",
                  frame.timestamp,
                  samples_.back().timestamp));

   const PersonPose* subject = select_subject(
       frame.persons, frame.width, frame.height, params_.subject);
   if(subject == nullptr) {
      TRACE(format("frame {}s: no subject among {} detection(s)",
                   frame.timestamp,
                   frame.persons.size()));
      return {};
   }

   PersonPose pose = *subject;
   pose.set_timestamp(frame.timestamp);
   SmoothedPose smoothed = smoother_.smooth(pose);
   samples_.push_back({frame.timestamp, smoothed});

   TRACE(format("frame {}s: subject with {} keypoint(s), {} sample(s)",
                frame.timestamp,
                smoothed.size(),
                samples_.size()));
   return smoothed;
}

// --------------------------------------------------------------------- analyze
//
ClipAnalysis This::analyze() const noexcept
{
   return analyze_clip(samples_, params_.release, params_.min_keypoint_score);
}

// ----------------------------------------------------------------------- score
//
ScoreResult This::score(const ClipAnalysis& clip) const noexcept
{
   return score(clip, params_.scoring);
}

ScoreResult This::score(const ClipAnalysis& clip,
                        const ScoringParams& scoring) const noexcept
{
   return score_features(clip.features, scoring);
}

// ---------------------------------------------------------------------- report
//
ShotReport This::report() const noexcept
{
   ShotReport o;
   o.n_frames  = n_frames_;
   o.n_subject = samples_.size();
   o.clip      = analyze();
   o.score     = score(o.clip);
   return o;
}

// ----------------------------------------------------------------------- reset
//
void This::reset() noexcept
{
   smoother_.reset();
   samples_.clear();
   n_frames_ = 0;
}

// ---------------------------------------------------------------- run-analysis
//
ShotReport run_analysis(PoseSource& source,
                        const Params& params) noexcept(false)
{
   AnalysisSession session{params};

   INFO(format("analysis session started"));
   while(true) {
      auto frame = source.next_frame();
      if(!frame.has_value()) break;
      session.process_frame(*frame);
   }

   ShotReport report = session.report();
   INFO(format("analysed {} frame(s), {} with a subject; release {}, "
               "{}/{} features measured, total score {}",
               report.n_frames,
               report.n_subject,
               report.clip.release_index.has_value()
                   ? format("at #{}", *report.clip.release_index)
                   : "not found"s,
               report.clip.features.n_present(),
               k_n_feature_keys,
               report.score.total));
   return report;
}

} // namespace shotform
