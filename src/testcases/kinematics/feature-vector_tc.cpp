
#define CATCH_CONFIG_PREFIX_ALL
#include <catch2/catch.hpp>

#include "shotform/kinematics/feature-vector.hpp"

namespace shotform
{
CATCH_TEST_CASE("FeatureVector", "[feature-vector]")
{
   CATCH_SECTION("feature-keys")
   {
      for(int i = 0; i < k_n_feature_keys; ++i) {
         const auto x = FeatureKey(i);
         CATCH_REQUIRE(is_feature_key(str(x)));
         CATCH_REQUIRE(to_feature_key(str(x)) == x);
      }
      CATCH_REQUIRE(!is_feature_key("wobble"));
      CATCH_REQUIRE_THROWS(to_feature_key("wobble"));
   }

   CATCH_SECTION("feature-vector-get")
   {
      FeatureVector f;
      CATCH_REQUIRE(f.n_present() == 0);

      f.get(FeatureKey::SWAY) = 0.25;
      CATCH_REQUIRE(f.sway.has_value());
      CATCH_REQUIRE(*f.sway == 0.25);
      CATCH_REQUIRE(f.n_present() == 1);

      const FeatureVector& g = f;
      CATCH_REQUIRE(g.get(FeatureKey::SWAY) == 0.25);
      CATCH_REQUIRE(!g.get(FeatureKey::COM_OFFSET).has_value());
   }

   CATCH_SECTION("feature-vector-json")
   {
      FeatureVector f;
      f.squat_knee_angle = 168.25;
      f.com_offset       = -0.125;

      const auto o = f.to_json();
      CATCH_REQUIRE(o.size() == unsigned(k_n_feature_keys));
      CATCH_REQUIRE(o["release_angle"].isNull());
      CATCH_REQUIRE(o["squat_knee_angle"].asDouble() == 168.25);

      FeatureVector g;
      g.sway = 1.0;
      g.read(o);
      CATCH_REQUIRE(f == g);

      CATCH_REQUIRE_THROWS(g.read(Json::Value{"nope"}));
   }
}

} // namespace shotform
