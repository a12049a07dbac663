#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <string>
#include <unordered_map>

#include <unistd.h>

#include "shotform/foundation.hpp"
#include "shotform/utils/file-system.hpp"
#include "shotform/utils/string-utils.hpp"

#include "analyze-clip/analyze-clip-inc.hpp"
#include "dump-default-params/dump-default-params-inc.hpp"

using namespace shotform;
using namespace std::string_literals;

// ------------------------------------------------------------------------ Runs

static auto make_runs()
{
   std::unordered_map<std::string, std::function<int(int, char**)>> r;
   std::unordered_map<std::string, std::function<std::string()>> b;

#define REGISTER_AS(name, z)            \
   {                                    \
      r[#name] = shotform::z ::run_main; \
      b[#name] = shotform::z ::brief;    \
   }
#define REGISTER(z) REGISTER_AS(z, z)

   // -- register -- "main" functions
   REGISTER_AS(analyze_clip, analyze_clip_main);
   REGISTER(dump_default_params);

#undef REGISTER
#undef REGISTER_AS

   return make_pair(r, b);
}

// Runs are registered with underscores, and may be invoked with dashes
static std::string to_run_name(std::string s)
{
   std::replace(s.begin(), s.end(), '-', '_');
   return s;
}

// ------------------------------------------------------------------- show-help

static void show_help(const char* arg0)
{
   auto [runs, briefs] = make_runs();

   std::vector<std::string> names;
   for(const auto& ii : runs) names.push_back(ii.first);
   std::sort(names.begin(), names.end());

   auto f = [&](const string& s) {
      auto ii        = briefs.find(s);
      std::string bb = ""s;
      if(ii == cend(briefs)) {
         WARN(format("failed to find brief of '{:s}'", s));
      } else {
         bb = ii->second();
      }
      const int sz = 25 - int(s.size());
      std::string spaces(size_t(std::max(sz, 1)), ' ');

      return format("{:s}{:s}    {:s}", s, spaces, bb);
   };

   cout << format(R"V0G0N(

   Usage: {:s} [-h] [--version] <run> [run options...]

      Run can be one of:

      {:s}

)V0G0N",
                  basename(arg0),
                  implode(names.begin(), names.end(), "\n      ", f));
}

// ------------------------------------------------------------------------ main

int main(int argc, char** argv)
{
   if(argc < 2) {
      cout << "Type -h for help" << endl;
      return EXIT_FAILURE;
   }

   const std::string arg = argv[1];
   if(arg == "--help"s || arg == "-h") {
      show_help(argv[0]);
      return EXIT_SUCCESS;
   }

   if(arg == "--version"s) {
      cout << shotform::environment_info() << endl;
      return EXIT_SUCCESS;
   }

   auto [runs, briefs] = make_runs();

   auto ii = runs.find(to_run_name(arg));
   if(ii == runs.end()) {
      WARN(shotform::format("Failed to find run '{:s}'", arg));
      return EXIT_FAILURE;
   }

   // Init environment variables
   shotform::load_environment_variables();
   shotform::logger_enable_colours(isatty(fileno(stderr)) != 0);

   // Now "shift" argv[0] to argv[1]
   return ii->second(argc - 1, &argv[1]);
}
