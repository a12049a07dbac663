#include "shot-report.hpp"

#include "shotform/utils/file-system.hpp"

namespace shotform
{
// --------------------------------------------------------------------- to-json
//
Json::Value ShotReport::to_json() const noexcept
{
   Json::Value o{Json::objectValue};
   o["version"]   = k_version;
   o["n_frames"]  = Json::Value(Json::UInt64(n_frames));
   o["n_subject"] = Json::Value(Json::UInt64(n_subject));
   o["clip"]      = clip.to_json();
   o["score"]     = score.to_json();
   return o;
}

string ShotReport::to_string() const noexcept
{
   auto opt_str = [](const auto& x, auto f) {
      return x.has_value() ? f(*x) : "none"s;
   };

   std::stringstream ss{""s};
   ss << format("frames:        {} ({} with a subject)", n_frames, n_subject)
      << endl;
   ss << format("shooting side: {}", str(clip.side)) << endl;
   ss << format("release:       {}",
                opt_str(clip.release_index,
                        [&](size_t i) {
                           return format("#{} at {}s",
                                         i,
                                         fixed_decimals_str(*clip.release_time,
                                                            3));
                        }))
      << endl;
   ss << format("body width:    {}",
                opt_str(clip.body_width,
                        [](real w) { return fixed_decimals_str(w, 1); }))
      << endl;
   ss << score.to_string();
   return ss.str();
}

// ------------------------------------------------------------------------ save
//
void save(const ShotReport& report, const string& fname) noexcept(false)
{
   const auto ec
       = file_put_contents(fname, json_encode_pretty(report.to_json()));
   if(ec)
      throw std::runtime_error(
          format("failed to write '{}': {}", fname, ec.message()));
}

} // namespace shotform
