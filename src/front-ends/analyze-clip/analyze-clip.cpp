
#include "stdinc.hpp"

#include "analyze-clip-inc.hpp"

#include "shotform/pipeline/analysis-session.hpp"
#include "shotform/pipeline/json-pose-source.hpp"
#include "shotform/utils/cli-utils.hpp"
#include "shotform/utils/file-system.hpp"

namespace shotform::analyze_clip_main
{
// ----------------------------------------------------------------------- brief

string brief() noexcept
{
   return "Scores a shot from a clip of pre-computed pose detections.";
}

// ---------------------------------------------------------------------- config

struct Config
{
   bool has_error      = false;
   bool show_help      = false;
   bool print_json     = false;
   string params_fname = ""s;
   string report_fname = ""s;
   string clip_fname   = ""s;
};

// ------------------------------------------------------------------- show-help

void show_help(string argv0)
{
   cout << format(R"V0G0N(

   Usage: {:s} [OPTIONS...] <clip.json>

      -p <filename>      Parameters file. Missing keys take their defaults.
                         See 'dump-default-params'.
      -o <filename>      Save the full report (json) to this file.
      --json             Print the score as json instead of a summary.

   Example:

      # Score a clip with the default parameters, and keep the report
      > {:s} -o /tmp/report.json /path/to/clip.json

)V0G0N",
                  basename(argv0),
                  basename(argv0));
}

// ---------------------------------------------------------- parse-command-line

static Config parse_command_line(int argc, char** argv) noexcept
{
   Config config;

   for(int i = 1; i < argc; ++i) {
      const string_view arg = argv[i];
      if(arg == "-h" || arg == "--help") config.show_help = true;
   }
   if(config.show_help) return config;

   for(int i = 1; i < argc - 1; ++i) {
      const string_view arg = argv[i];
      try {
         if(arg == "-p") {
            config.params_fname = cli::safe_arg_str(argc - 1, argv, i);
         } else if(arg == "-o") {
            config.report_fname = cli::safe_arg_str(argc - 1, argv, i);
         } else if(arg == "--json") {
            config.print_json = true;
         } else {
            cout << format("Unknown argument: '{:s}'", arg) << endl;
            config.has_error = true;
         }
      } catch(std::runtime_error& e) {
         cout << format("Error on command-line: {:s}", e.what()) << endl;
         config.has_error = true;
      }
   }

   if(argc < 2) {
      cout << format("Must specify a clip filename!") << endl;
      config.has_error = true;
      return config;
   }

   config.clip_fname = argv[argc - 1];
   if(!is_regular_file(config.clip_fname)) {
      cout << format("Failed to find clip file: '{:s}'", config.clip_fname)
           << endl;
      config.has_error = true;
   }

   if(!config.params_fname.empty() and !is_regular_file(config.params_fname)) {
      cout << format("Failed to find parameters file: '{:s}'",
                     config.params_fname)
           << endl;
      config.has_error = true;
   }

   return config;
}

// -------------------------------------------------------------------- run main

int run_main(int argc, char** argv)
{
   const Config config = parse_command_line(argc, argv);

   if(config.show_help) {
      show_help(argv[0]);
      return EXIT_SUCCESS;
   }

   if(config.has_error) {
      cout << format("aborting...") << endl;
      return EXIT_FAILURE;
   }

   bool success = false;
   try {
      Params params;
      if(!config.params_fname.empty()) {
         load(params, config.params_fname);
         INFO(format("loaded parameters from '{:s}'", config.params_fname));
      }

      auto source       = JsonPoseSource::load(config.clip_fname);
      const auto report = run_analysis(source, params);

      if(config.print_json)
         cout << json_encode_pretty(report.score.to_json()) << endl;
      else
         cout << report.to_string();

      if(!config.report_fname.empty()) {
         save(report, config.report_fname);
         INFO(format("report saved to '{:s}'", config.report_fname));
      }
      success = true;
   } catch(std::exception& e) {
      LOG_ERR(format("failed: {:s}", e.what()));
   }

   return success ? EXIT_SUCCESS : EXIT_FAILURE;
}

} // namespace shotform::analyze_clip_main
