#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <string>

#include "stdinc.hpp"

// ---- Compile in catch
#define CATCH_CONFIG_PREFIX_ALL
#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>

// ------------------------------------------------------------------------ main

int main(int argc, char** argv)
{
   Catch::Session session; // There must be exactly one instance

   // Let Catch (using Clara) parse the command line
   auto return_code = session.applyCommandLine(argc, argv);
   if(return_code != EXIT_SUCCESS) return return_code; // Command line error

   shotform::load_environment_variables();

   INFO(shotform::format("Shotform Configuration:"));
   std::cout << shotform::environment_info() << std::endl;

   return session.run();
}
