
#pragma once

#include "shotform/release/clip-features.hpp"
#include "shotform/scoring/scorer.hpp"

namespace shotform
{
// ------------------------------------------------------------------ ShotReport
//
// Everything known about one analysed shot. Exported as `report.json`.
struct ShotReport final
{
   size_t n_frames   = 0; // frames seen
   size_t n_subject  = 0; // frames where a subject was selected
   ClipAnalysis clip = {};
   ScoreResult score = {};

   Json::Value to_json() const noexcept;
   string to_string() const noexcept;

   friend string str(const ShotReport& o) noexcept { return o.to_string(); }
};

void save(const ShotReport& report, const string& fname) noexcept(false);

} // namespace shotform
