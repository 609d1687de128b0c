#include "tile_develop/edit/edit_state.hpp"
#include "tile_develop/edit/mask.hpp"
#include "tile_develop/pipeline/mask_compositor.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace tile_develop;
using namespace tile_develop::edit;
using namespace tile_develop::pipeline;

namespace {

MaskRaster full_raster(int w, int h, double scale = 1.0, int full_w = 0, int full_h = 0) {
    MaskRaster r;
    r.region = Rect{0, 0, w, h};
    r.image_width = w;
    r.image_height = h;
    r.full_width = full_w > 0 ? full_w : w;
    r.full_height = full_h > 0 ? full_h : h;
    r.scale = scale;
    return r;
}

Mask circle(float radius, int feather_radius) {
    MaskBuilder b;
    b.radial_gradient({0.5f, 0.5f}, radius, radius, 0.0f, 0.0f);
    return b.build(1.0f, feather_radius);
}

} // namespace

TEST_CASE("feather_radius_zero_is_bit_identical_to_raw_mask") {
    MaskBuilder b;
    b.radial_gradient({0.4f, 0.6f}, 0.3f, 0.2f, 30.0f, 0.4f);
    const Mask mask = b.build(1.0f, 0);

    MaskCompositor compositor;
    const MaskRaster raster = full_raster(48, 32);
    const Matrix2Df raw = compositor.rasterize_node(mask, mask.root(), raster);
    const Matrix2Df evaluated = compositor.evaluate_mask(mask, raster);
    REQUIRE(evaluated == raw);
}

TEST_CASE("circle_with_feather_5_has_soft_edge_and_hard_far_field") {
    const Mask mask = circle(0.25f, 5); // 16 px radius on a 64x64 image
    MaskCompositor compositor;
    const Matrix2Df m = compositor.evaluate_mask(mask, full_raster(64, 64));

    // Boundary lies between columns 47 and 48 on the center row.
    REQUIRE(m(32, 47) > 0.25f);
    REQUIRE(m(32, 47) < 0.75f);
    REQUIRE(m(32, 48) > 0.25f);
    REQUIRE(m(32, 48) < 0.75f);
    REQUIRE((m(32, 47) + m(32, 48)) / 2.0f == Catch::Approx(0.5f).margin(0.1f));

    // More than twice the feather radius away from the edge.
    REQUIRE(m(32, 58) == 0.0f);
    REQUIRE(m(0, 0) == 0.0f);
    REQUIRE(m(32, 37) == Catch::Approx(1.0f).margin(1e-6));
    REQUIRE(m(32, 32) == Catch::Approx(1.0f).margin(1e-6));
}

TEST_CASE("mask_regions_match_full_raster") {
    MaskBuilder b;
    const int lin = b.linear_gradient({0.0f, 0.0f}, {1.0f, 1.0f});
    BrushStroke stroke;
    stroke.points = {{0.2f, 0.3f}, {0.7f, 0.6f}};
    stroke.radius = 6.0f;
    stroke.hardness = 0.3f;
    const int brush = b.brush_strokes({stroke});
    b.combine(MaskOp::ADD, lin, brush);
    const Mask mask = b.build();

    MaskCompositor compositor;
    const Matrix2Df full = compositor.rasterize_node(mask, mask.root(), full_raster(60, 40));

    MaskRaster part = full_raster(60, 40);
    part.region = Rect{13, 7, 25, 21};
    const Matrix2Df sub = compositor.rasterize_node(mask, mask.root(), part);
    REQUIRE(sub == full.block(7, 13, 21, 25));
}

TEST_CASE("combine_ops_follow_clamped_arithmetic") {
    Matrix2Df a(1, 3);
    Matrix2Df b(1, 3);
    a << 0.25f, 0.75f, 1.0f;
    b << 0.5f, 0.5f, 0.5f;

    const Matrix2Df add = combine_masks(MaskOp::ADD, a, b);
    REQUIRE(add(0, 0) == Catch::Approx(0.75f));
    REQUIRE(add(0, 1) == 1.0f);

    const Matrix2Df sub = combine_masks(MaskOp::SUBTRACT, a, b);
    REQUIRE(sub(0, 0) == 0.0f);
    REQUIRE(sub(0, 2) == Catch::Approx(0.5f));

    const Matrix2Df isect = combine_masks(MaskOp::INTERSECT, a, b);
    REQUIRE(isect(0, 1) == Catch::Approx(0.375f));
}

TEST_CASE("invert_node_complements_its_input") {
    MaskBuilder b;
    const int lin = b.linear_gradient({0.0f, 0.5f}, {1.0f, 0.5f});
    b.invert(lin);
    const Mask inverted = b.build();

    MaskCompositor compositor;
    const MaskRaster raster = full_raster(20, 4);
    const Matrix2Df base = compositor.rasterize_node(inverted, lin, raster);
    const Matrix2Df inv = compositor.evaluate_mask(inverted, raster);
    REQUIRE(((base + inv).array() - 1.0f).abs().maxCoeff() < 1e-6f);
    REQUIRE(inv(0, 0) < inv(0, 19));
}

TEST_CASE("eraser_stroke_removes_brush_coverage") {
    BrushStroke paint;
    paint.points = {{0.5f, 0.5f}};
    paint.radius = 8.0f;
    paint.hardness = 1.0f;
    BrushStroke erase = paint;
    erase.radius = 3.0f;
    erase.erase = true;

    MaskBuilder b;
    b.brush_strokes({paint, erase});
    const Mask mask = b.build();

    MaskCompositor compositor;
    const Matrix2Df m = compositor.evaluate_mask(mask, full_raster(32, 32));
    REQUIRE(m(16, 16) == 0.0f);
    REQUIRE(m(16, 21) == 1.0f);
    REQUIRE(m(16, 30) == 0.0f);
}

TEST_CASE("group_weight_folds_layers_and_applies_opacities") {
    AdjustmentGroup g;
    g.opacity = 0.5f;

    MaskLayer everything;
    everything.mask = [] {
        MaskBuilder b;
        b.linear_gradient({0.0f, -1.0f}, {0.0f, -0.5f}); // 0 everywhere on the image
        b.invert(0);
        return b.build(0.8f);
    }();
    MaskLayer hole;
    hole.op = MaskOp::SUBTRACT;
    hole.mask = circle(0.25f, 0);
    g.masks = {everything, hole};

    MaskCompositor compositor;
    const Matrix2Df w = compositor.evaluate_group(g, full_raster(64, 64));
    REQUIRE(w(0, 0) == Catch::Approx(0.4f));
    REQUIRE(w(32, 32) == 0.0f);
}

TEST_CASE("global_group_weight_is_its_opacity") {
    AdjustmentGroup g;
    g.opacity = 0.3f;
    MaskCompositor compositor;
    const Matrix2Df w = compositor.evaluate_group(g, full_raster(5, 4));
    REQUIRE(w.rows() == 4);
    REQUIRE(w.cols() == 5);
    REQUIRE(w.minCoeff() == 0.3f);
    REQUIRE(w.maxCoeff() == 0.3f);
}

TEST_CASE("bitmap_leaf_is_resampled_to_render_scale_once") {
    Matrix2Df values = Matrix2Df::Zero(8, 8);
    values.leftCols(4).setOnes();
    MaskBuilder b;
    b.bitmap(make_mask_bitmap(values, "test"));
    const Mask mask = b.build();

    MaskCompositor compositor;
    const MaskRaster raster = full_raster(4, 4, 0.5, 8, 8);
    const Matrix2Df m = compositor.evaluate_mask(mask, raster);
    REQUIRE(m.leftCols(2).minCoeff() == Catch::Approx(1.0f));
    REQUIRE(m.rightCols(2).maxCoeff() == Catch::Approx(0.0f));

    compositor.evaluate_mask(mask, raster);
    REQUIRE(compositor.cached_bitmaps() == 1);
}
