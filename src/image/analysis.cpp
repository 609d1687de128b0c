#include "tile_develop/image/analysis.hpp"
#include "tile_develop/core/errors.hpp"
#include "tile_develop/pipeline/kernels.hpp"

#include <algorithm>
#include <cstdio>
#include <iostream>
#include <sstream>

namespace tile_develop::image {

namespace {

inline int bin_of(float v, int bins) {
    if (!(v > 0.0f)) {
        return 0;
    }
    const int b = static_cast<int>(std::min(1.0f, v) * static_cast<float>(bins - 1) + 0.5f);
    return std::min(bins - 1, b);
}

} // namespace

Histogram compute_histogram(const PixelBuffer& buffer, int bins) {
    if (bins < 2) {
        throw ValidationError("histogram needs at least 2 bins");
    }
    Histogram h;
    h.red.assign(static_cast<size_t>(bins), 0);
    h.green.assign(static_cast<size_t>(bins), 0);
    h.blue.assign(static_cast<size_t>(bins), 0);
    h.luma.assign(static_cast<size_t>(bins), 0);

    const bool gray = buffer.channels < 3;
    for (int y = 0; y < buffer.height; ++y) {
        for (int x = 0; x < buffer.width; ++x) {
            const float r = buffer.at(x, y, 0);
            const float g = gray ? r : buffer.at(x, y, 1);
            const float b = gray ? r : buffer.at(x, y, 2);
            ++h.red[static_cast<size_t>(bin_of(r, bins))];
            ++h.green[static_cast<size_t>(bin_of(g, bins))];
            ++h.blue[static_cast<size_t>(bin_of(b, bins))];
            const float cr = std::min(1.0f, std::max(0.0f, r));
            const float cg = std::min(1.0f, std::max(0.0f, g));
            const float cb = std::min(1.0f, std::max(0.0f, b));
            ++h.luma[static_cast<size_t>(bin_of(0.299f * cr + 0.587f * cg + 0.114f * cb, bins))];
        }
    }
    return h;
}

std::string export_cube_lut(const edit::AdjustmentGroup& group, int resolution,
                            const std::string& title) {
    if (resolution != 17 && resolution != 33 && resolution != 65) {
        throw ValidationError("LUT resolution must be 17, 33 or 65, got " +
                              std::to_string(resolution));
    }

    const int n = resolution;
    const int count = n * n * n;
    RgbPlanes lattice;
    lattice.R.resize(1, count);
    lattice.G.resize(1, count);
    lattice.B.resize(1, count);
    const float step = 1.0f / static_cast<float>(n - 1);
    int i = 0;
    for (int b = 0; b < n; ++b) {
        for (int g = 0; g < n; ++g) {
            for (int r = 0; r < n; ++r, ++i) {
                lattice.R(0, i) = static_cast<float>(r) * step;
                lattice.G(0, i) = static_cast<float>(g) * step;
                lattice.B(0, i) = static_cast<float>(b) * step;
            }
        }
    }

    pipeline::KernelContext ctx;
    ctx.region = Rect{0, 0, count, 1};
    ctx.image_width = count;
    ctx.image_height = 1;

    int skipped = 0;
    for (const auto& adj : group.adjustments) {
        if (!pipeline::is_color_only(adj)) {
            ++skipped;
            continue;
        }
        pipeline::apply_adjustment(adj, lattice, ctx);
    }
    if (skipped > 0) {
        std::cerr << "[EDIT] LUT export ignores " << skipped << " spatial adjustment(s)"
                  << std::endl;
    }

    std::ostringstream out;
    out << "TITLE \"" << title << "\"\n";
    out << "LUT_3D_SIZE " << n << "\n";
    out << "DOMAIN_MIN 0.0 0.0 0.0\n";
    out << "DOMAIN_MAX 1.0 1.0 1.0\n\n";
    char line[96];
    for (int k = 0; k < count; ++k) {
        std::snprintf(line, sizeof(line), "%.6f %.6f %.6f\n", lattice.R(0, k), lattice.G(0, k),
                      lattice.B(0, k));
        out << line;
    }
    return out.str();
}

} // namespace tile_develop::image
