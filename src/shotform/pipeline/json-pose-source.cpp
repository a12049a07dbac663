#include "json-pose-source.hpp"

#include "shotform/utils/file-system.hpp"

#define This JsonPoseSource

namespace shotform
{
// ---------------------------------------------------------------- construction
//
This::This(const Json::Value& clip) noexcept(false)
{
   if(!clip.isObject() or !has_key(clip, "frames"))
      throw std::runtime_error("expected a JSON object with a 'frames' key");

   const auto frames = get_key(clip, "frames");
   if(!frames.isArray())
      throw std::runtime_error("expected 'frames' to be a JSON array");

   frames_.resize(frames.size());
   for(auto i = 0u; i < frames.size(); ++i) {
      try {
         frames_[i].read(frames[i]);
      } catch(std::runtime_error& e) {
         throw std::runtime_error(format("frame #{}: {}", i, e.what()));
      }
   }

   for(size_t i = 1; i < frames_.size(); ++i)
      if(frames_[i].timestamp < frames_[i - 1].timestamp)
         WARN(format("frame #{} goes back in time ({} < {})",
                     i,
                     frames_[i].timestamp,
                     frames_[i - 1].timestamp));
}

This::This(vector<MultiPersonFrame> frames) noexcept
    : frames_(std::move(frames))
{}

JsonPoseSource This::load(const string& fname) noexcept(false)
{
   const auto clip = parse_json(file_get_contents(fname));
   try {
      return JsonPoseSource{clip};
   } catch(std::runtime_error& e) {
      throw std::runtime_error(format("reading '{}': {}", fname, e.what()));
   }
}

// ------------------------------------------------------------------ next-frame
//
std::optional<MultiPersonFrame> This::next_frame() noexcept
{
   if(position_ >= frames_.size()) return {};
   return frames_[position_++];
}

} // namespace shotform
