
#pragma once

#include "params.hpp"
#include "pose-source.hpp"
#include "shot-report.hpp"

#include "shotform/filters/pose-smoother.hpp"

namespace shotform
{
// ------------------------------------------------------------- AnalysisSession
//
// One shot, one subject. Owns the smoothing state for that subject, so a new
// clip needs a new session (or a `reset()`).
//
// Frames must be fed in timestamp order. Not thread safe; independent
// sessions share nothing.
class AnalysisSession final
{
 private:
   Params params_              = {};
   PoseSmoother smoother_      = {};
   vector<PoseSample> samples_ = {};
   size_t n_frames_            = 0;

 public:
   AnalysisSession();
   explicit AnalysisSession(const Params& params);
   AnalysisSession(const AnalysisSession&) = delete;
   AnalysisSession(AnalysisSession&&)      = default;
   ~AnalysisSession()                      = default;
   AnalysisSession& operator=(const AnalysisSession&) = delete;
   AnalysisSession& operator=(AnalysisSession&&) = default;

   const Params& params() const noexcept { return params_; }
   const vector<PoseSample>& samples() const noexcept { return samples_; }
   size_t n_frames() const noexcept { return n_frames_; }

   // Selects the subject, smooths it, and keeps the sample. Empty when the
   // frame has nobody in it.
   std::optional<SmoothedPose> process_frame(const MultiPersonFrame& frame);

   // Release detection and clip features over the samples so far
   ClipAnalysis analyze() const noexcept;

   // Scores `clip` without touching the session. Re-scoring with new
   // parameters is just another call.
   ScoreResult score(const ClipAnalysis& clip) const noexcept;
   ScoreResult score(const ClipAnalysis& clip,
                     const ScoringParams& scoring) const noexcept;

   ShotReport report() const noexcept;

   // Forgets every sample and all smoothing state
   void reset() noexcept;
};

// Feeds every frame of `source` through a fresh session
ShotReport run_analysis(PoseSource& source,
                        const Params& params) noexcept(false);

} // namespace shotform
