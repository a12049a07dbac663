
#define CATCH_CONFIG_PREFIX_ALL
#include <catch2/catch.hpp>

#include "shotform/io/struct-meta.hpp"

namespace shotform
{
struct TypeB final : public MetaCompatible
{
   virtual ~TypeB() {}

   int x    = -1;
   bool y   = false;
   real z   = 1.0;
   string s = "hello"s;

   const vector<MemberMetaData>& meta_data() const noexcept override
   {
      auto make_it = []() {
         vector<MemberMetaData> M;
         M.emplace_back(meta_type::INT, "x", true, &TypeB::x);
         M.emplace_back(meta_type::BOOL, "y", true, &TypeB::y);
         M.emplace_back(meta_type::REAL, "z", true, &TypeB::z);
         M.push_back(MAKE_META(TypeB, STRING, s, false));
         return M;
      };
      static vector<MemberMetaData> meta = make_it();
      return meta;
   }
};

struct TypeC final : public MetaCompatible
{
   virtual ~TypeC() {}

   unsigned n = 3;
   TypeB blah;

   const vector<MemberMetaData>& meta_data() const noexcept override
   {
      auto make_it = []() {
         vector<MemberMetaData> M;
         M.push_back(MAKE_META(TypeC, UNSIGNED, n, true));
         M.push_back(MAKE_META(TypeC, COMPATIBLE_OBJECT, blah, true));
         return M;
      };
      static vector<MemberMetaData> meta = make_it();
      return meta;
   }
};

CATCH_TEST_CASE("StructMeta", "[struct_meta]")
{
   CATCH_SECTION("struct-meta")
   {
      TypeB a, b;
      CATCH_REQUIRE(a == b);

      b.s = "world"s; // not important in eq
      CATCH_REQUIRE(a == b);

      auto json = a.to_json();
      json["x"] = 10;
      b.read(json);
      CATCH_REQUIRE(b.x == 10);
      CATCH_REQUIRE(b.s == "hello"s);
      CATCH_REQUIRE(a != b);
   }

   CATCH_SECTION("struct-meta-read-requires-every-key")
   {
      TypeB a;
      auto json = a.to_json();
      json.removeMember("z");
      CATCH_REQUIRE_THROWS(a.read(json));
   }

   CATCH_SECTION("struct-meta-nested-defaults")
   {
      TypeC a;
      a.n      = 7;
      a.blah.z = 2.5;

      Json::Value o{Json::objectValue};
      o["blah"]      = Json::Value{Json::objectValue};
      o["blah"]["x"] = 42;

      TypeC b;
      b.read_with_defaults(o, &a, false);
      CATCH_REQUIRE(b.n == 7);
      CATCH_REQUIRE(b.blah.x == 42);
      CATCH_REQUIRE(b.blah.z == 2.5);
      CATCH_REQUIRE(b.blah.y == false);
   }

   CATCH_SECTION("struct-meta-malformed-values-throw")
   {
      TypeC a;
      Json::Value o{Json::objectValue};
      o["n"] = "three";
      CATCH_REQUIRE_THROWS_AS(a.read_with_defaults<TypeC>(o, false),
                              std::runtime_error);
   }

   CATCH_SECTION("struct-meta-json-string-round-trip")
   {
      TypeC a;
      a.blah.x = 5;
      a.blah.s = "x y z"s;
      TypeC b;
      b.read(parse_json(a.to_json_string()));
      CATCH_REQUIRE(a == b);
      CATCH_REQUIRE(b.blah.s == "x y z"s);
   }
}

} // namespace shotform
