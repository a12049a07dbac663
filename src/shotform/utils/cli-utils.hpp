#pragma once

#include "shotform/foundation.hpp"

namespace shotform::cli
{
inline string safe_arg_str(int argc, char** argv, int& i) noexcept(false)
{
   auto arg = argv[i];
   ++i;
   if(i >= argc) {
      auto msg = format("expected string after argument '{}'", arg);
      throw std::runtime_error(msg);
   }
   return string(argv[i]);
}

} // namespace shotform::cli
