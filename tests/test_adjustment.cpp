#include "tile_develop/core/errors.hpp"
#include "tile_develop/edit/adjustment.hpp"
#include "tile_develop/pipeline/kernels.hpp"

#include <cmath>
#include <set>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace tile_develop;
using namespace tile_develop::edit;
using namespace tile_develop::pipeline;

namespace {

RgbPlanes gray_ramp(int rows, int cols) {
    RgbPlanes p;
    p.R.resize(rows, cols);
    for (int y = 0; y < rows; ++y) {
        for (int x = 0; x < cols; ++x) {
            p.R(y, x) = static_cast<float>(x + y * cols) / static_cast<float>(rows * cols);
        }
    }
    p.G = p.R;
    p.B = p.R;
    return p;
}

KernelContext context_for(const RgbPlanes& p) {
    KernelContext ctx;
    ctx.region = Rect{0, 0, p.cols(), p.rows()};
    ctx.image_width = p.cols();
    ctx.image_height = p.rows();
    return ctx;
}

} // namespace

TEST_CASE("kind_names_are_unique_and_round_trip") {
    const auto names = all_kind_names();
    REQUIRE(names.size() == std::variant_size_v<Adjustment>);
    REQUIRE(std::set<std::string>(names.begin(), names.end()).size() == names.size());
    for (const auto& n : names) {
        auto adj = default_adjustment(n);
        REQUIRE(adj.has_value());
        REQUIRE(std::string(kind_name(*adj)) == n);
        REQUIRE(is_identity(*adj));
        REQUIRE(is_known_kernel(n));
    }
    REQUIRE_FALSE(default_adjustment("dehaze").has_value());
    REQUIRE_FALSE(is_known_kernel("dehaze"));
}

TEST_CASE("validate_adjustment_rejects_out_of_range") {
    REQUIRE_NOTHROW(validate_adjustment(Exposure{2.0f}));
    REQUIRE_THROWS_AS(validate_adjustment(Exposure{7.0f}), ValidationError);
    REQUIRE_THROWS_AS(validate_adjustment(Exposure{NAN}), ValidationError);

    Clarity c;
    c.amount = 0.5f;
    c.radius = 0;
    REQUIRE_THROWS_AS(validate_adjustment(c), ValidationError);
}

TEST_CASE("curve_points_must_increase_strictly") {
    REQUIRE_NOTHROW(validate_curve_points({{0.0f, 0.0f}, {0.5f, 0.6f}, {1.0f, 1.0f}}));
    REQUIRE_THROWS_AS(validate_curve_points({{0.0f, 0.0f}}), ValidationError);
    REQUIRE_THROWS_AS(validate_curve_points({{0.0f, 0.0f}, {0.5f, 0.5f}, {0.5f, 0.7f}}),
                      ValidationError);
    REQUIRE_THROWS_AS(validate_curve_points({{0.0f, 0.0f}, {1.2f, 1.0f}}), ValidationError);
}

TEST_CASE("adjustment_radius_reports_spatial_footprint") {
    Clarity c;
    c.amount = 0.3f;
    c.radius = 25;
    REQUIRE(adjustment_radius(c) == 25);
    REQUIRE(adjustment_radius(Exposure{1.0f}) == 0);
    Sharpen s;
    s.amount = 1.0f;
    s.radius = 3;
    REQUIRE(adjustment_radius(s) == 3);
}

TEST_CASE("adjustments_equal_compares_parameters") {
    REQUIRE(adjustments_equal(Exposure{1.0f}, Exposure{1.0f}));
    REQUIRE_FALSE(adjustments_equal(Exposure{1.0f}, Exposure{1.5f}));
    REQUIRE_FALSE(adjustments_equal(Exposure{0.0f}, Contrast{0.0f}));

    HslBand a;
    a.band = HslBandId::BLUES;
    a.hue = 10.0f;
    HslBand b = a;
    b.band = HslBandId::GREENS;
    REQUIRE_FALSE(adjustments_equal(a, b));
}

TEST_CASE("exposure_kernel_scales_by_power_of_two") {
    RgbPlanes p = gray_ramp(4, 4);
    const RgbPlanes before = p;
    apply_adjustment(Exposure{1.0f}, p, context_for(p));
    REQUIRE(p.R(2, 3) == Catch::Approx(2.0f * before.R(2, 3)));
    REQUIRE(p.B(3, 1) == Catch::Approx(2.0f * before.B(3, 1)));
}

TEST_CASE("saturation_kernel_leaves_gray_untouched") {
    RgbPlanes p = gray_ramp(3, 5);
    const RgbPlanes before = p;
    Saturation s;
    s.saturation = 0.8f;
    apply_adjustment(s, p, context_for(p));
    REQUIRE((p.R - before.R).cwiseAbs().maxCoeff() < 1e-5f);
    REQUIRE((p.G - p.B).cwiseAbs().maxCoeff() < 1e-5f);
}

TEST_CASE("tone_curve_passes_through_control_points_and_is_monotone") {
    const std::vector<CurvePoint> pts{{0.0f, 0.0f}, {0.25f, 0.15f}, {0.75f, 0.9f}, {1.0f, 1.0f}};
    ToneCurve curve(pts);
    for (const auto& p : pts) {
        REQUIRE(curve(p.x) == Catch::Approx(p.y).margin(1e-6));
    }
    float prev = curve(0.0f);
    for (int i = 1; i <= 100; ++i) {
        const float v = curve(static_cast<float>(i) / 100.0f);
        REQUIRE(v >= prev - 1e-6f);
        prev = v;
    }
}

TEST_CASE("grain_noise_is_deterministic_and_bounded") {
    for (int i = 0; i < 50; ++i) {
        const float n = grain_noise(i, 3 * i + 1, 42);
        REQUIRE(n >= -1.0f);
        REQUIRE(n <= 1.0f);
        REQUIRE(n == grain_noise(i, 3 * i + 1, 42));
    }
    REQUIRE(grain_noise(5, 5, 1) != grain_noise(5, 5, 2));
}

TEST_CASE("color_only_classification") {
    REQUIRE(is_color_only(Exposure{1.0f}));
    REQUIRE(is_color_only(Curve{}));
    REQUIRE_FALSE(is_color_only(Clarity{}));
    REQUIRE_FALSE(is_color_only(Vignette{}));
    REQUIRE_FALSE(is_color_only(LensCorrection{}));
    REQUIRE_FALSE(is_color_only(Transform{}));
}

TEST_CASE("geometry_placement_rules") {
    const Adjustment lens = LensCorrection{};
    const Adjustment transform = Transform{};
    const std::vector<Adjustment> none;

    REQUIRE_NOTHROW(check_geometry_placement(0, true, none, lens));
    REQUIRE_NOTHROW(check_geometry_placement(0, true, {lens}, transform));
    REQUIRE_NOTHROW(check_geometry_placement(3, false, {Exposure{}}, Exposure{1.0f}));

    REQUIRE_THROWS_AS(check_geometry_placement(1, true, none, transform), ValidationError);
    REQUIRE_THROWS_AS(check_geometry_placement(0, false, none, lens), ValidationError);
    REQUIRE_THROWS_AS(check_geometry_placement(0, true, {Exposure{}}, transform), ValidationError);
    REQUIRE_THROWS_AS(check_geometry_placement(0, true, {transform}, transform), ValidationError);
    REQUIRE_THROWS_AS(check_geometry_placement(0, true, {transform}, lens), ValidationError);
}

TEST_CASE("transform_range_and_identity") {
    Transform t;
    REQUIRE(t.is_identity());
    t.scale = 120.0f;
    REQUIRE_FALSE(t.is_identity());
    REQUIRE_NOTHROW(validate_adjustment(t));
    t.rotate = 60.0f;
    REQUIRE_THROWS_AS(validate_adjustment(t), ValidationError);

    LensCorrection lens;
    lens.tca_red = 1.05f;
    REQUIRE_THROWS_AS(validate_adjustment(lens), ValidationError);
}
