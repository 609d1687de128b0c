#include "tile_develop/core/errors.hpp"
#include "tile_develop/image/analysis.hpp"

#include <sstream>
#include <string>
#include <vector>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace tile_develop;
using namespace tile_develop::image;

namespace {

std::vector<std::string> lines_of(const std::string& text) {
    std::vector<std::string> out;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        out.push_back(line);
    }
    return out;
}

} // namespace

TEST_CASE("histogram_counts_every_pixel_per_channel") {
    const Image img = make_image("h", 2, 2, 3,
                                 {0.0f, 0.0f, 0.0f,
                                  1.0f, 0.0f, 0.0f,
                                  1.0f, 1.0f, 1.0f,
                                  2.0f, -1.0f, 0.5f});
    const Histogram h = compute_histogram(img, 256);
    REQUIRE(h.red.size() == 256);
    REQUIRE(h.red[0] == 1);
    REQUIRE(h.red[255] == 3);
    REQUIRE(h.green[0] == 3);
    REQUIRE(h.blue[128] == 1);
    REQUIRE(h.luma[0] == 1);
    REQUIRE(h.luma[255] == 1);

    uint32_t total = 0;
    for (uint32_t c : h.luma) total += c;
    REQUIRE(total == 4);
}

TEST_CASE("histogram_of_gray_image_fills_all_channels") {
    const Image img = make_image("g", 3, 1, 1, {0.0f, 0.5f, 1.0f});
    const Histogram h = compute_histogram(img, 16);
    REQUIRE(h.red == h.green);
    REQUIRE(h.green == h.blue);
    REQUIRE(h.red[15] == 1);
    REQUIRE_THROWS_AS(compute_histogram(img, 1), ValidationError);
}

TEST_CASE("identity_group_exports_identity_lut") {
    edit::AdjustmentGroup g;
    const auto lines = lines_of(export_cube_lut(g, 17, "identity"));
    REQUIRE(lines[0] == "TITLE \"identity\"");
    REQUIRE(lines[1] == "LUT_3D_SIZE 17");
    REQUIRE(lines.size() == 5 + 17 * 17 * 17);
    REQUIRE(lines[5] == "0.000000 0.000000 0.000000");
    REQUIRE(lines[6] == "0.062500 0.000000 0.000000");     // red varies fastest
    REQUIRE(lines[5 + 17] == "0.000000 0.062500 0.000000");
    REQUIRE(lines.back() == "1.000000 1.000000 1.000000");
}

TEST_CASE("lut_bakes_color_adjustments_and_skips_spatial_ones") {
    edit::AdjustmentGroup g;
    g.adjustments.push_back(edit::Exposure{1.0f});
    edit::Clarity c;
    c.amount = 1.0f;
    g.adjustments.push_back(c);

    const auto lines = lines_of(export_cube_lut(g, 17, "plus one"));
    REQUIRE(lines[6] == "0.125000 0.000000 0.000000");
}

TEST_CASE("lut_rejects_unsupported_resolution") {
    REQUIRE_THROWS_AS(export_cube_lut(edit::AdjustmentGroup{}, 20, "x"), ValidationError);
}
