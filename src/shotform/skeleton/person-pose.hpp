#pragma once

#include "keypoint-name.hpp"

#include "shotform/geometry/vector-2.hpp"
#include "shotform/io/json-io.hpp"

namespace shotform
{
// -------------------------------------------------------------------- Keypoint
//
struct Keypoint final
{
   skeleton::KeypointName name = skeleton::UNKNOWN;
   string part                 = ""s; // detector's label, kept for UNKNOWN
   Vector2 pos                 = Vector2::nan();
   std::optional<real> score   = {}; // confidence in [0, 1], if reported

   Keypoint() = default;
   Keypoint(skeleton::KeypointName name_,
            Vector2 pos_,
            std::optional<real> score_ = {});
   Keypoint(string part_, Vector2 pos_, std::optional<real> score_ = {});

   bool operator==(const Keypoint&) const noexcept;
   bool operator!=(const Keypoint&) const noexcept;

   // A keypoint without a reported score is taken as fully confident
   real confidence() const noexcept { return score.value_or(1.0); }
   bool is_valid() const noexcept { return pos.is_finite(); }

   Json::Value to_json() const noexcept;
   void read(const Json::Value&) noexcept(false);
   string to_string() const noexcept;

   friend string str(const Keypoint& o) noexcept { return o.to_string(); }
};

// ------------------------------------------------------------------ PersonPose
//
// One detected person in one frame. Keypoints are kept sorted by name, and
// names from the body model are unique.
struct PersonPose final
{
 private:
   using index_type = std::array<int16_t, skeleton::k_n_keypoints>;

   real timestamp_             = 0.0; // seconds
   vector<Keypoint> keypoints_ = {};
   index_type index_           = make_empty_index_();

   static index_type make_empty_index_() noexcept;
   void rebuild_index_() noexcept;

 public:
   PersonPose() = default;
   PersonPose(real timestamp, vector<Keypoint> keypoints);

   bool operator==(const PersonPose&) const noexcept;
   bool operator!=(const PersonPose&) const noexcept;

   real timestamp() const noexcept { return timestamp_; }
   void set_timestamp(real t) noexcept { timestamp_ = t; }

   // Sorts by name. On duplicate names, the first occurrence wins.
   void set_keypoints(vector<Keypoint> keypoints) noexcept;
   const vector<Keypoint>& keypoints() const noexcept { return keypoints_; }

   size_t size() const noexcept { return keypoints_.size(); }
   bool empty() const noexcept { return keypoints_.empty(); }

   // nullptr if absent
   const Keypoint* keypoint(skeleton::KeypointName) const noexcept;

   // Absent, or below `min_score`, or non-finite, all give nullptr
   const Keypoint* confident(skeleton::KeypointName,
                             real min_score) const noexcept;

   // Replaces the position of an existing keypoint
   void set_position(skeleton::KeypointName, const Vector2& pos) noexcept;

   Json::Value to_json() const noexcept;
   void read(const Json::Value&) noexcept(false);
   string to_string() const noexcept;

   friend string str(const PersonPose& o) noexcept { return o.to_string(); }
};

// The smoothed rendition of a PersonPose. Same shape.
using SmoothedPose = PersonPose;

// ------------------------------------------------------------ MultiPersonFrame
//
struct MultiPersonFrame final
{
   real timestamp             = 0.0; // seconds
   real width                 = 0.0; // pixels
   real height                = 0.0; // pixels
   vector<PersonPose> persons = {};

   bool operator==(const MultiPersonFrame&) const noexcept;
   bool operator!=(const MultiPersonFrame&) const noexcept;

   Json::Value to_json() const noexcept;
   void read(const Json::Value&) noexcept(false);
};

// ------------------------------------------------------------------ PoseSample
//
struct PoseSample final
{
   real timestamp  = 0.0; // seconds
   PersonPose pose = {};
};

} // namespace shotform
