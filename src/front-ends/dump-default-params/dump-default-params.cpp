
#include "stdinc.hpp"

#include "dump-default-params-inc.hpp"

#include "shotform/pipeline/params.hpp"
#include "shotform/utils/cli-utils.hpp"
#include "shotform/utils/file-system.hpp"

namespace shotform::dump_default_params
{
// ----------------------------------------------------------------------- brief

string brief() noexcept { return "Dumps the default 'params.json' to file."; }

// ---------------------------------------------------------------------- config

struct Config
{
   bool has_error = false;
   bool show_help = false;
   string outdir  = "/tmp"s;
};

// ------------------------------------------------------------------- show-help

void show_help(string argv0)
{
   Config default_config;

   cout << format(R"V0G0N(

   Usage: {:s} [OPTIONS...]

      -d <dirname>       Directory to save 'default-params.json' to.
                         Default is '{:s}'.

   Example:

      > {:s} -d /tmp/params

)V0G0N",
                  basename(argv0),
                  default_config.outdir,
                  basename(argv0));
}

// -------------------------------------------------------------------- run main

int run_main(int argc, char** argv)
{
   Config config;

   // ---- Parse command line
   for(int i = 1; i < argc; ++i) {
      const string_view arg = argv[i];
      try {
         if(arg == "-h" || arg == "--help") {
            config.show_help = true;
         } else if(arg == "-d"s) {
            config.outdir = cli::safe_arg_str(argc, argv, i);
         } else {
            cout << format("Unknown argument: '{:s}'", arg) << endl;
            config.has_error = true;
         }
      } catch(std::runtime_error& e) {
         cout << format("Error on command-line: {:s}", e.what()) << endl;
         config.has_error = true;
      }
   }

   if(config.show_help) {
      show_help(argv[0]);
      return EXIT_SUCCESS;
   }

   if(!config.has_error and !mkdir_p(config.outdir)) {
      cout << format("Failed to create output directory '{:s}'",
                     config.outdir)
           << endl;
      config.has_error = true;
   }

   if(config.has_error) {
      cout << format("aborting...") << endl;
      return EXIT_FAILURE;
   }

   // ---- Action
   bool success = false;
   try {
      const string fname = format("{:s}/default-params.json", config.outdir);
      save(Params{}, fname);
      INFO(format("default parameters saved to '{:s}'", fname));
      success = true;
   } catch(std::exception& e) {
      LOG_ERR(format("failed: {:s}", e.what()));
   }

   return success ? EXIT_SUCCESS : EXIT_FAILURE;
}

} // namespace shotform::dump_default_params
