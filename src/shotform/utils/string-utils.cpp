#include "string-utils.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>

#include "fmt/format.h"

namespace shotform
{
// --------------------------------------------------------- string-to-lowercase

string string_to_lowercase(const std::string_view s) noexcept
{
   string ret(s);
   std::transform(cbegin(s), cend(s), begin(ret), [](char c) {
      return char(std::tolower(static_cast<unsigned char>(c)));
   });
   return ret;
}

// ---------------------------------------------------------- fixed-decimals-str

string fixed_decimals_str(double v, int decimals) noexcept
{
   if(!std::isfinite(v)) return "-";
   const int d = std::clamp(decimals, 0, 12);
   return fmt::format("{:.{}f}", v, d);
}

// ----------------------------------------------------------------- percent-str

string percent_str(double v, int decimals) noexcept
{
   if(!std::isfinite(v)) return "-";
   return fixed_decimals_str(v * 100.0, decimals) + "%";
}

} // namespace shotform
