
#define CATCH_CONFIG_PREFIX_ALL
#include <catch2/catch.hpp>

#include "shotform/config.hpp"
#include "shotform/foundation.hpp"

namespace shotform
{
CATCH_TEST_CASE("EnvironmentInfo", "[environment-info]")
{
   CATCH_SECTION("environment-info-build-configuration")
   {
      const auto s = environment_info();
      CATCH_REQUIRE(s.find(k_version) != string::npos);
      CATCH_REQUIRE(s.find("cli") == string::npos);
      CATCH_REQUIRE(s.find("testcases") == string::npos);

      const char* kind = k_is_debug_build     ? "=  debug"
                         : k_is_release_build ? "=  release"
                                              : "=  unspecified";
      CATCH_REQUIRE(s.find(kind) != string::npos);
   }
}

} // namespace shotform
