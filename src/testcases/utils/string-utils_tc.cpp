
#define CATCH_CONFIG_PREFIX_ALL
#include <catch2/catch.hpp>

#include "shotform/io/json-io.hpp"
#include "shotform/utils/math.hpp"
#include "shotform/utils/string-utils.hpp"

namespace shotform
{
CATCH_TEST_CASE("FixedDecimals", "[fixed-decimals]")
{
   CATCH_SECTION("fixed-decimals")
   {
      CATCH_REQUIRE(fixed_decimals_str(172.4849, 2) == "172.48"s);
      CATCH_REQUIRE(fixed_decimals_str(259.6, 0) == "260"s);
      CATCH_REQUIRE(fixed_decimals_str(0.4, 2) == "0.40"s);
      CATCH_REQUIRE(fixed_decimals_str(dNAN, 2) == "-"s);
      CATCH_REQUIRE(percent_str(0.2868, 2) == "28.68%"s);
   }

   CATCH_SECTION("string-utils")
   {
      CATCH_REQUIRE(string_to_lowercase("CLOSER") == "closer"s);
      CATCH_REQUIRE(str(42) == "42"s);
      CATCH_REQUIRE(str(size_t(7)) == "7"s);
      CATCH_REQUIRE(str(-3L) == "-3"s);
      CATCH_REQUIRE(str(1.5) == "1.500000"s);
      CATCH_REQUIRE(str(true) == "true"s);
      CATCH_REQUIRE(str("knee") == "knee"s);

      vector<int> xs = {1, 2, 3};
      CATCH_REQUIRE(implode(cbegin(xs), cend(xs), ", ") == "1, 2, 3"s);
   }
}

CATCH_TEST_CASE("JsonIO", "[json-io]")
{
   CATCH_SECTION("json-optional")
   {
      std::optional<real> x = 1.5;
      CATCH_REQUIRE(json_save(x).asDouble() == 1.5);
      CATCH_REQUIRE(json_save(std::optional<real>{}).isNull());

      std::optional<real> y = 3.0;
      json_load(Json::Value{Json::nullValue}, y);
      CATCH_REQUIRE(!y.has_value());
      json_load(Json::Value{2.0}, y);
      CATCH_REQUIRE(y.has_value());
      CATCH_REQUIRE(*y == 2.0);
   }

   CATCH_SECTION("json-parse")
   {
      CATCH_REQUIRE_THROWS(parse_json("{\"a\": "));

      Json::Value o;
      CATCH_REQUIRE(!parse_json("[1, 2", o));
      CATCH_REQUIRE(parse_json("{\"a\": [1, 2]}", o));
      CATCH_REQUIRE(o["a"].size() == 2);
   }

   CATCH_SECTION("json-missing-key")
   {
      const auto o = parse_json("{\"a\": 1}");
      CATCH_REQUIRE_THROWS(json_load_key<real>(o, "b", "test"));

      real x = 0.0;
      CATCH_REQUIRE(!json_try_load_key(x, o, "b", "test", false));
      CATCH_REQUIRE(json_try_load_key(x, o, "a", "test", false));
      CATCH_REQUIRE(x == 1.0);
   }

   CATCH_SECTION("json-pretty-keeps-utf8")
   {
      Json::Value o{Json::objectValue};
      o["value"] = "未检测";
      CATCH_REQUIRE(json_encode_pretty(o).find("未检测") != string::npos);
   }
}

} // namespace shotform
