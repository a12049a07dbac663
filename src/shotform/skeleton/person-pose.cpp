#include "person-pose.hpp"

#include "shotform/utils/math.hpp"

namespace shotform
{
// -------------------------------------------------------------------- Keypoint
//
Keypoint::Keypoint(skeleton::KeypointName name_,
                   Vector2 pos_,
                   std::optional<real> score_)
    : name(name_)
    , part(skeleton::str(name_))
    , pos(pos_)
    , score(score_)
{}

Keypoint::Keypoint(string part_, Vector2 pos_, std::optional<real> score_)
    : name(skeleton::to_keypoint_name(part_))
    , part(std::move(part_))
    , pos(pos_)
    , score(score_)
{}

bool Keypoint::operator==(const Keypoint& o) const noexcept
{
#define TEST(x) (this->x == o.x)
#define TEST_REAL(x) (float_is_same(this->x, o.x))
   return TEST(name) and TEST(part) and TEST_REAL(pos.x) and TEST_REAL(pos.y)
          and TEST(score.has_value())
          and (!score.has_value() or float_is_same(*score, *o.score));
#undef TEST
#undef TEST_REAL
}

bool Keypoint::operator!=(const Keypoint& o) const noexcept
{
   return !(*this == o);
}

Json::Value Keypoint::to_json() const noexcept
{
   Json::Value o{Json::objectValue};
   o["name"] = part;
   o["x"]    = json_save(pos.x);
   o["y"]    = json_save(pos.y);
   if(score.has_value()) o["score"] = json_save(*score);
   return o;
}

void Keypoint::read(const Json::Value& o) noexcept(false)
{
   const string op = "reading keypoint"s;
   part            = json_load_key<string>(o, "name", op);
   name            = skeleton::to_keypoint_name(part);
   pos.x           = json_load_key<real>(o, "x", op);
   pos.y           = json_load_key<real>(o, "y", op);
   score           = {};
   if(has_key(o, "score")) json_load(o["score"], score);
}

string Keypoint::to_string() const noexcept
{
   return format("{}: {} ({})",
                 part,
                 str(pos),
                 (score.has_value() ? format("{:4.2f}", *score) : "-"s));
}

// ------------------------------------------------------------------ PersonPose
//
PersonPose::PersonPose(real timestamp, vector<Keypoint> keypoints)
    : timestamp_(timestamp)
{
   set_keypoints(std::move(keypoints));
}

PersonPose::index_type PersonPose::make_empty_index_() noexcept
{
   index_type index;
   index.fill(-1);
   return index;
}

void PersonPose::rebuild_index_() noexcept
{
   index_ = make_empty_index_();
   for(size_t i = 0; i < keypoints_.size(); ++i) {
      const auto name = keypoints_[i].name;
      if(name != skeleton::UNKNOWN) index_[size_t(name)] = int16_t(i);
   }
}

void PersonPose::set_keypoints(vector<Keypoint> keypoints) noexcept
{
   std::stable_sort(
       begin(keypoints), end(keypoints), [](const auto& a, const auto& b) {
          return (a.name == b.name) ? (a.part < b.part) : (a.name < b.name);
       });

   auto ii = std::unique(
       begin(keypoints), end(keypoints), [](const auto& a, const auto& b) {
          return a.name == b.name and a.part == b.part;
       });
   if(ii != end(keypoints)) {
      TRACE(format("dropping {} duplicate keypoint(s)",
                   std::distance(ii, end(keypoints))));
      keypoints.erase(ii, end(keypoints));
   }

   keypoints_ = std::move(keypoints);
   rebuild_index_();
}

const Keypoint* PersonPose::keypoint(skeleton::KeypointName x) const noexcept
{
   if(int(x) < 0 or int(x) >= skeleton::k_n_keypoints) return nullptr;
   const auto ind = index_[size_t(x)];
   return (ind < 0) ? nullptr : &keypoints_[size_t(ind)];
}

const Keypoint* PersonPose::confident(skeleton::KeypointName x,
                                      real min_score) const noexcept
{
   const auto ptr = keypoint(x);
   if(ptr == nullptr or !ptr->is_valid()) return nullptr;
   if(!(ptr->confidence() >= min_score)) return nullptr;
   return ptr;
}

void PersonPose::set_position(skeleton::KeypointName x,
                              const Vector2& pos) noexcept
{
   if(x == skeleton::UNKNOWN) return;
   const auto ind = index_[size_t(x)];
   if(ind >= 0) keypoints_[size_t(ind)].pos = pos;
}

bool PersonPose::operator==(const PersonPose& o) const noexcept
{
   return float_is_same(timestamp_, o.timestamp_)
          and keypoints_ == o.keypoints_;
}

bool PersonPose::operator!=(const PersonPose& o) const noexcept
{
   return !(*this == o);
}

Json::Value PersonPose::to_json() const noexcept
{
   Json::Value o{Json::objectValue};
   o["timestamp"] = json_save(timestamp_);
   o["keypoints"] = json_save_t(
       cbegin(keypoints_), cend(keypoints_), [](const auto& k) {
          return k.to_json();
       });
   return o;
}

void PersonPose::read(const Json::Value& o) noexcept(false)
{
   const string op = "reading person pose"s;
   vector<Keypoint> kps;
   json_load_t<Keypoint>(
       get_key(o, "keypoints"),
       kps,
       [](const Json::Value& node, Keypoint& k) { k.read(node); });
   timestamp_ = 0.0;
   if(has_key(o, "timestamp"))
      timestamp_ = json_load_key<real>(o, "timestamp", op);
   set_keypoints(std::move(kps));
}

string PersonPose::to_string() const noexcept
{
   return format("PersonPose t={:.3f}s\n{}",
                 timestamp_,
                 indent(rng::implode(keypoints_, "\n"), 3));
}

// ------------------------------------------------------------ MultiPersonFrame
//
bool MultiPersonFrame::operator==(const MultiPersonFrame& o) const noexcept
{
   return float_is_same(timestamp, o.timestamp)
          and float_is_same(width, o.width)
          and float_is_same(height, o.height) and persons == o.persons;
}

bool MultiPersonFrame::operator!=(const MultiPersonFrame& o) const noexcept
{
   return !(*this == o);
}

Json::Value MultiPersonFrame::to_json() const noexcept
{
   Json::Value o{Json::objectValue};
   o["timestamp"] = json_save(timestamp);
   o["width"]     = json_save(width);
   o["height"]    = json_save(height);
   o["persons"]
       = json_save_t(cbegin(persons), cend(persons), [](const auto& p) {
            return p.to_json();
         });
   return o;
}

void MultiPersonFrame::read(const Json::Value& o) noexcept(false)
{
   const string op = "reading frame"s;
   timestamp       = json_load_key<real>(o, "timestamp", op);
   width           = json_load_key<real>(o, "width", op);
   height          = json_load_key<real>(o, "height", op);
   persons.clear();
   json_load_t<PersonPose>(
       get_key(o, "persons"),
       persons,
       [](const Json::Value& node, PersonPose& p) { p.read(node); });

   // Persons inherit the frame's timestamp
   for(auto& p : persons) p.set_timestamp(timestamp);
}

} // namespace shotform
