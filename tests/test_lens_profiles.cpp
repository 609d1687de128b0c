#include "tile_develop/core/errors.hpp"
#include "tile_develop/edit/edit_state.hpp"
#include "tile_develop/io/lens_profiles.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace tile_develop;
using tile_develop::io::LensProfileDatabase;

namespace {

const char* kProfiles = R"(
profiles:
  - lens: "RF 24-105mm F4 L IS USM"
    calibrations:
      - {focal: 105, k1: 0.04, k2: -0.01, k3: 0.0, vig_k1: -0.1, tca_red: 1.0002}
      - {focal: 24, k1: -0.08, k2: 0.02, k3: 0.0, vig_k1: -0.3, tca_red: 1.0006, tca_blue: 0.9996}
  - camera: "Canon EOS R5"
    lens: "RF 24-105mm F4 L IS USM"
    calibrations:
      - {focal: 24, k1: -0.06, k2: 0.0, k3: 0.0, vig_k1: -0.25}
  - camera: "Sony A7 IV"
    lens: "FE 50mm F1.8"
    calibrations:
      - {focal: 50, k1: 0.01}
)";

} // namespace

TEST_CASE("lens_lookup_prefers_exact_camera_match") {
    const auto db = LensProfileDatabase::from_yaml(YAML::Load(kProfiles));
    REQUIRE(db.size() == 3);

    auto exact = db.lookup("canon eos r5", "rf 24-105mm f4 l is usm");
    REQUIRE(exact);
    REQUIRE(exact->k1 == Catch::Approx(-0.06f));

    auto generic = db.lookup("Canon EOS R6", "RF 24-105mm F4 L IS USM");
    REQUIRE(generic);
    REQUIRE(generic->k1 == Catch::Approx(-0.08f)); // calibrations sorted by focal length
}

TEST_CASE("lens_lookup_interpolates_between_focal_lengths") {
    const auto db = LensProfileDatabase::from_yaml(YAML::Load(kProfiles));
    auto mid = db.lookup("Nikon Z6", "RF 24-105mm F4 L IS USM", 64.5f);
    REQUIRE(mid);
    REQUIRE(mid->k1 == Catch::Approx(-0.02f));
    REQUIRE(mid->k2 == Catch::Approx(0.005f));
    REQUIRE(mid->vig_k1 == Catch::Approx(-0.2f));
    REQUIRE(mid->tca_red == Catch::Approx(1.0004f));
    // A key missing at one focal length interpolates against its default.
    REQUIRE(mid->tca_blue == Catch::Approx(0.9998f));
    REQUIRE(mid->vignette_amount == 1.0f);

    auto below = db.lookup("Nikon Z6", "RF 24-105mm F4 L IS USM", 10.0f);
    REQUIRE(below->k1 == Catch::Approx(-0.08f));
    auto above = db.lookup("Nikon Z6", "RF 24-105mm F4 L IS USM", 300.0f);
    REQUIRE(above->k1 == Catch::Approx(0.04f));
}

TEST_CASE("lens_lookup_misses_unknown_lens") {
    const auto db = LensProfileDatabase::from_yaml(YAML::Load(kProfiles));
    REQUIRE_FALSE(db.lookup("Sony A7 IV", "FE 85mm F1.8"));
    REQUIRE_FALSE(db.lookup("Canon EOS R5", "FE 50mm F1.8"));
}

TEST_CASE("lens_profiles_reject_invalid_entries") {
    REQUIRE_THROWS_AS(LensProfileDatabase::from_yaml(YAML::Load(
                          "profiles:\n  - lens: x\n    calibrations:\n      - {focal: 10, k1: 5}\n")),
                      ConfigError);
    REQUIRE_THROWS_AS(LensProfileDatabase::from_yaml(YAML::Load(
                          "profiles:\n  - lens: x\n    calibrations:\n      - {focal: 10, tca_red: 1.5}\n")),
                      ConfigError);
    REQUIRE_THROWS_AS(LensProfileDatabase::from_yaml(YAML::Load("profiles:\n  - camera: x\n")),
                      ConfigError);
    REQUIRE(LensProfileDatabase::from_yaml(YAML::Load("{}")).size() == 0);
}

TEST_CASE("looked_up_correction_is_legal_only_first_in_first_global_group") {
    const auto db = LensProfileDatabase::from_yaml(YAML::Load(kProfiles));
    const edit::LensCorrection lens = *db.lookup("Canon EOS R5", "RF 24-105mm F4 L IS USM");

    edit::EditState s;
    edit::AdjustmentGroup first;
    first.adjustments.push_back(lens);
    first.adjustments.push_back(edit::Exposure{0.5f});
    REQUIRE_NOTHROW(s.add_group(first));

    edit::AdjustmentGroup second;
    second.adjustments.push_back(lens);
    REQUIRE_THROWS_AS(s.add_group(second), ValidationError);

    const edit::GroupId id = s.groups()[0].id;
    REQUIRE_THROWS_AS(s.add_adjustment(id, lens), ValidationError);
}

TEST_CASE("transform_may_only_follow_lens_correction_in_first_group") {
    edit::LensCorrection lens;
    lens.k1 = -0.05f;
    edit::Transform transform;
    transform.rotate = 3.0f;

    edit::EditState s;
    edit::AdjustmentGroup first;
    first.adjustments = {lens, transform, edit::Exposure{0.2f}};
    REQUIRE_NOTHROW(s.add_group(first));

    edit::AdjustmentGroup swapped;
    swapped.adjustments = {transform, lens};
    REQUIRE_THROWS_AS(edit::EditState{}.add_group(swapped), ValidationError);

    edit::AdjustmentGroup late;
    late.adjustments = {edit::Exposure{0.2f}, transform};
    REQUIRE_THROWS_AS(edit::EditState{}.add_group(late), ValidationError);

    edit::AdjustmentGroup twice;
    twice.adjustments = {transform, transform};
    REQUIRE_THROWS_AS(edit::EditState{}.add_group(twice), ValidationError);
}
