
#define CATCH_CONFIG_PREFIX_ALL
#include <catch2/catch.hpp>

#include "shotform/tracking/subject-selector.hpp"

#include "testcases/pose-builders.hpp"

namespace shotform
{
using namespace skeleton;
using testing::kp;

// A box-ish person: shoulders at the top, ankles at the bottom
static PersonPose make_person(real cx, real top, real h, real score = 0.9)
{
   const real w = 0.3 * h;
   return PersonPose(0.0,
                     {kp(L_SHOULDER, cx - 0.5 * w, top, score),
                      kp(R_SHOULDER, cx + 0.5 * w, top, score),
                      kp(L_HIP, cx - 0.3 * w, top + 0.5 * h, score),
                      kp(R_HIP, cx + 0.3 * w, top + 0.5 * h, score),
                      kp(L_ANKLE, cx - 0.3 * w, top + h, score),
                      kp(R_ANKLE, cx + 0.3 * w, top + h, score)});
}

CATCH_TEST_CASE("SubjectSelector", "[subject-selector]")
{
   const SubjectSelectorParams p;

   CATCH_SECTION("subject-empty-frame")
   {
      vector<PersonPose> persons;
      CATCH_REQUIRE(select_subject(persons, 1280, 720, p) == nullptr);
   }

   CATCH_SECTION("subject-single-candidate")
   {
      // Whatever the frame size, and however bad the candidate
      vector<PersonPose> persons = {make_person(10.0, 10.0, 20.0, 0.01)};
      for(const auto wh : {0.0, 1.0, 720.0, 1e6}) {
         const auto ptr = select_subject(persons, wh, wh, p);
         CATCH_REQUIRE(ptr == &persons[0]);
         CATCH_REQUIRE(*ptr == make_person(10.0, 10.0, 20.0, 0.01));
      }
   }

   CATCH_SECTION("subject-bigger-and-central-wins")
   {
      vector<PersonPose> persons = {make_person(100.0, 300.0, 150.0),
                                    make_person(640.0, 100.0, 500.0),
                                    make_person(1200.0, 350.0, 100.0)};
      CATCH_REQUIRE(select_subject(persons, 1280, 720, p) == &persons[1]);
   }

   CATCH_SECTION("subject-tie-goes-to-first")
   {
      vector<PersonPose> persons = {make_person(640.0, 100.0, 400.0),
                                    make_person(640.0, 100.0, 400.0)};
      CATCH_REQUIRE(select_subject(persons, 1280, 720, p) == &persons[0]);
   }

   CATCH_SECTION("subject-none-qualify")
   {
      vector<PersonPose> persons = {make_person(100.0, 100.0, 400.0, 0.1),
                                    make_person(640.0, 100.0, 400.0, 0.1)};
      CATCH_REQUIRE(!subject_score(persons[1], 1280, p).has_value());
      CATCH_REQUIRE(select_subject(persons, 1280, 720, p) == &persons[0]);
   }

   CATCH_SECTION("subject-missing-score-counts-as-confident")
   {
      PersonPose a(0.0,
                   {kp(NOSE, 10.0, 10.0, std::nullopt),
                    kp(L_ANKLE, 20.0, 40.0, std::nullopt)});
      const auto s = subject_score(a, 100.0, p);
      CATCH_REQUIRE(s.has_value());

      // area 300, lowest y 40, centre dx 35, mean confidence 1
      const auto expected = k_subject_area_weight * 300.0
                            + k_subject_lowest_y_weight * 40.0
                            + k_subject_centre_dx_weight * 35.0
                            + k_subject_confidence_weight * 1.0;
      CATCH_REQUIRE(*s == Approx(expected));
   }
}

} // namespace shotform
