#include "tile_develop/core/errors.hpp"
#include "tile_develop/edit/edit_state.hpp"
#include "tile_develop/pipeline/compiler.hpp"

#include <catch2/catch_test_macros.hpp>

using namespace tile_develop;
using namespace tile_develop::edit;
using namespace tile_develop::pipeline;

namespace {

AdjustmentGroup exposure_group(float ev, const std::string& name = "") {
    AdjustmentGroup g;
    g.name = name;
    g.adjustments.push_back(Exposure{ev});
    return g;
}

MaskLayer circle_layer(int feather_radius) {
    MaskBuilder b;
    b.radial_gradient({0.5f, 0.5f}, 0.2f, 0.2f);
    MaskLayer layer;
    layer.mask = b.build(1.0f, feather_radius);
    return layer;
}

EditState three_groups() {
    EditState s;
    s.add_group(exposure_group(0.5f, "base"));
    s.add_group(exposure_group(-0.25f, "sky"));
    AdjustmentGroup g = exposure_group(0.1f, "face");
    g.masks.push_back(circle_layer(0));
    s.add_group(g);
    return s;
}

} // namespace

TEST_CASE("compile_is_deterministic") {
    const EditState s = three_groups();
    const CompiledPipeline a = compile(s, "img", 400, 300, 1.0);
    const CompiledPipeline b = compile(s, "img", 400, 300, 1.0);
    REQUIRE(a.passes.size() == 3);
    REQUIRE(a.root_key == b.root_key);
    for (size_t i = 0; i < a.passes.size(); ++i) {
        REQUIRE(a.passes[i].cache_key == b.passes[i].cache_key);
    }
    REQUIRE(a.content_hash() == a.passes.back().cache_key);
}

TEST_CASE("compile_binds_passes_in_order") {
    const CompiledPipeline p = compile(three_groups(), "img", 400, 300, 1.0);
    REQUIRE(p.passes[0].input == "source");
    REQUIRE(p.passes[0].output == "pass:0");
    REQUIRE(p.passes[2].input == "pass:1");
    REQUIRE(p.passes[2].kernels == std::vector<std::string>{"exposure"});
}

TEST_CASE("edit_to_one_group_invalidates_only_later_passes") {
    EditState s = three_groups();
    const CompiledPipeline before = compile(s, "img", 400, 300, 1.0);

    const GroupId middle = s.groups()[1].id;
    s.set_adjustment(middle, 0, Exposure{0.75f});
    const CompiledPipeline after = compile(s, "img", 400, 300, 1.0);

    REQUIRE(first_affected_pass(before, after) == 1);
    REQUIRE(before.passes[0].cache_key == after.passes[0].cache_key);
    REQUIRE(before.passes[1].cache_key != after.passes[1].cache_key);
    REQUIRE(before.passes[2].cache_key != after.passes[2].cache_key);
    REQUIRE(first_affected_pass(before, before) == before.passes.size());
}

TEST_CASE("group_name_does_not_affect_cache_keys") {
    EditState s = three_groups();
    const CompiledPipeline before = compile(s, "img", 400, 300, 1.0);
    s.set_group_name(s.groups()[0].id, "renamed");
    const CompiledPipeline after = compile(s, "img", 400, 300, 1.0);
    REQUIRE(before.content_hash() == after.content_hash());
}

TEST_CASE("image_identity_and_scale_enter_the_root_key") {
    const EditState s = three_groups();
    const auto a = compile(s, "img", 400, 300, 1.0);
    REQUIRE(a.root_key != compile(s, "other", 400, 300, 1.0).root_key);
    REQUIRE(a.root_key != compile(s, "img", 400, 300, 0.5).root_key);
    REQUIRE(a.root_key != compile(s, "img", 401, 300, 1.0).root_key);
}

TEST_CASE("identity_adjustments_and_disabled_groups_are_dropped") {
    EditState s;
    s.add_group(exposure_group(0.0f));
    AdjustmentGroup off = exposure_group(1.0f);
    off.enabled = false;
    s.add_group(off);

    const CompiledPipeline p = compile(s, "img", 64, 64, 1.0);
    REQUIRE(p.passes.size() == 1);
    REQUIRE(p.passes[0].is_noop());
    REQUIRE(p.halo == 0);
}

TEST_CASE("halo_covers_footprints_and_largest_radius") {
    EditState s;
    AdjustmentGroup detail;
    Clarity c;
    c.amount = 0.4f;
    c.radius = 20;
    Sharpen sh;
    sh.amount = 1.0f;
    sh.radius = 2;
    detail.adjustments = {c, sh};
    s.add_group(detail);

    AdjustmentGroup local = exposure_group(0.3f);
    local.masks.push_back(circle_layer(30));
    s.add_group(local);

    AdjustmentGroup finish;
    NoiseReduction nr;
    nr.luminance = 0.5f;
    nr.radius = 8;
    finish.adjustments = {nr};
    s.add_group(finish);

    const CompiledPipeline full = compile(s, "img", 2000, 1000, 1.0);
    REQUIRE(full.passes[0].footprint == 22);
    REQUIRE(full.passes[0].radius == 20);
    // The feather is applied on the mask's own margin and reads no input.
    REQUIRE(full.passes[1].footprint == 0);
    REQUIRE(full.passes[1].radius == 30);
    REQUIRE(full.passes[2].footprint == 8);
    REQUIRE(full.halo == 30);
    REQUIRE(full.max_radius() == 30);

    const CompiledPipeline half = compile(s, "img", 2000, 1000, 0.5);
    REQUIRE(half.width == 1000);
    REQUIRE(half.height == 500);
    REQUIRE(half.passes[0].footprint == 11);
    REQUIRE(half.passes[1].footprint == 0);
    REQUIRE(half.passes[2].footprint == 4);
    REQUIRE(half.halo == 15);
}

TEST_CASE("halo_is_the_footprint_sum_when_it_exceeds_every_radius") {
    EditState s;
    for (int i = 0; i < 3; ++i) {
        AdjustmentGroup g;
        Sharpen sh;
        sh.amount = 0.5f;
        sh.radius = 6;
        g.adjustments = {sh};
        s.add_group(g);
    }
    const CompiledPipeline p = compile(s, "img", 200, 100, 1.0);
    REQUIRE(p.max_radius() == 6);
    REQUIRE(p.halo == 18);
}

TEST_CASE("feather_of_a_kernel_less_group_adds_no_halo") {
    EditState s;
    AdjustmentGroup g = exposure_group(0.0f);
    g.masks.push_back(circle_layer(40));
    s.add_group(g);
    REQUIRE(compile(s, "img", 100, 100, 1.0).halo == 0);
}

TEST_CASE("scaled_radius_never_collapses_to_zero") {
    REQUIRE(scaled_radius(0, 0.5) == 0);
    REQUIRE(scaled_radius(1, 0.1) == 1);
    REQUIRE(scaled_radius(20, 0.25) == 5);
    REQUIRE(scaled_radius(20, 2.0) == 20);
}

TEST_CASE("compile_rejects_empty_image") {
    REQUIRE_THROWS_AS(compile(EditState{}, "img", 0, 10, 1.0), PipelineError);
    REQUIRE_THROWS_AS(compile(EditState{}, "img", 10, 10, 0.0), PipelineError);
}
