#include "tile_develop/core/errors.hpp"
#include "tile_develop/pipeline/tile_scheduler.hpp"

#include <set>

#include <catch2/catch_test_macros.hpp>

using namespace tile_develop;
using namespace tile_develop::pipeline;

TEST_CASE("tile_grid_cores_cover_image_exactly_once") {
    const int w = 100;
    const int h = 70;
    const auto tiles = build_tile_grid(w, h, 32, 5);
    REQUIRE(tiles.size() == 4 * 3);

    Eigen::MatrixXi hits = Eigen::MatrixXi::Zero(h, w);
    for (const auto& t : tiles) {
        hits.block(t.core.y, t.core.x, t.core.height, t.core.width).array() += 1;
    }
    REQUIRE(hits.minCoeff() == 1);
    REQUIRE(hits.maxCoeff() == 1);
}

TEST_CASE("tile_grid_regions_grow_by_halo_and_clamp") {
    const auto tiles = build_tile_grid(100, 70, 32, 5);
    const TileRegion& first = tiles.front();
    REQUIRE(first.core == Rect{0, 0, 32, 32});
    REQUIRE(first.region == Rect{0, 0, 37, 37});

    const TileRegion& inner = tiles[5]; // row 1, col 1
    REQUIRE(inner.row == 1);
    REQUIRE(inner.col == 1);
    REQUIRE(inner.region == Rect{27, 27, 42, 42});

    const TileRegion& last = tiles.back();
    REQUIRE(last.core == Rect{96, 64, 4, 6});
    REQUIRE(last.region == Rect{91, 59, 9, 11});
}

TEST_CASE("tile_ids_are_unique_and_independent_of_halo") {
    const auto a = build_tile_grid(64, 64, 16, 2);
    const auto b = build_tile_grid(64, 64, 16, 3);
    std::set<std::string> ids;
    for (const auto& t : a) {
        ids.insert(t.tile_id);
    }
    REQUIRE(ids.size() == a.size());
    REQUIRE(a[5].region != b[5].region);
    REQUIRE(a[5].tile_id == b[5].tile_id);
    // Another tile size moves the cores, so ids change.
    REQUIRE(a[5].tile_id != build_tile_grid(64, 64, 32, 2)[5].tile_id);
}

TEST_CASE("shrink_region_keeps_image_border_sides") {
    // Interior rect loses the footprint on every side.
    REQUIRE(shrink_region(Rect{10, 10, 40, 30}, 4, 100, 100) == Rect{14, 14, 32, 22});
    // Sides on the image border stay put.
    REQUIRE(shrink_region(Rect{0, 0, 40, 30}, 4, 100, 100) == Rect{0, 0, 36, 26});
    REQUIRE(shrink_region(Rect{60, 70, 40, 30}, 4, 100, 100) == Rect{64, 74, 36, 26});
    REQUIRE(shrink_region(Rect{0, 0, 100, 100}, 9, 100, 100) == Rect{0, 0, 100, 100});
    REQUIRE(shrink_region(Rect{10, 10, 6, 6}, 4, 100, 100).empty());
}

TEST_CASE("grow_and_intersect_regions_clamp_to_image") {
    REQUIRE(grow_region(Rect{5, 5, 10, 10}, 8, 20, 30) == Rect{0, 0, 20, 23});
    REQUIRE(intersect_regions(Rect{0, 0, 10, 10}, Rect{5, 6, 10, 10}) == Rect{5, 6, 5, 4});
    REQUIRE(intersect_regions(Rect{0, 0, 4, 4}, Rect{8, 8, 2, 2}).empty());
}

TEST_CASE("paste_core_rejects_buffer_not_covering_core") {
    RgbPlanes buf;
    buf.R = Matrix2Df::Zero(8, 8);
    buf.G = Matrix2Df::Zero(8, 8);
    buf.B = Matrix2Df::Zero(8, 8);
    RgbPlanes out;
    out.R = Matrix2Df::Zero(32, 32);
    out.G = Matrix2Df::Zero(32, 32);
    out.B = Matrix2Df::Zero(32, 32);
    REQUIRE_THROWS_AS(paste_core(Rect{4, 4, 8, 8}, Rect{6, 4, 8, 8}, buf, out), PipelineError);
}

TEST_CASE("reassemble_of_extracted_regions_restores_image") {
    RgbPlanes img;
    img.R = Matrix2Df::Random(41, 29);
    img.G = Matrix2Df::Random(41, 29);
    img.B = Matrix2Df::Random(41, 29);

    const auto tiles = build_tile_grid(29, 41, 10, 4);
    std::vector<RgbPlanes> buffers;
    for (const auto& t : tiles) {
        buffers.push_back(extract_region(img, t.region));
    }
    const RgbPlanes out = reassemble(tiles, buffers, 29, 41);
    REQUIRE(out.R == img.R);
    REQUIRE(out.G == img.G);
    REQUIRE(out.B == img.B);
}

TEST_CASE("tile_grid_rejects_non_positive_tile_size") {
    REQUIRE_THROWS_AS(build_tile_grid(10, 10, 0, 0), PipelineError);
    REQUIRE(build_tile_grid(0, 10, 16, 0).empty());
}
