#include "tile_develop/pipeline/tile_scheduler.hpp"
#include "tile_develop/core/errors.hpp"

#include <algorithm>

namespace tile_develop::pipeline {

std::string make_tile_id(int row, int col, const Rect& core) {
    return "r" + std::to_string(row) + "c" + std::to_string(col) + ":" +
           std::to_string(core.x) + "," + std::to_string(core.y) + "," +
           std::to_string(core.width) + "x" + std::to_string(core.height);
}

Rect grow_region(const Rect& rect, int margin, int image_width, int image_height) {
    margin = std::max(0, margin);
    const int x0 = std::max(0, rect.x - margin);
    const int y0 = std::max(0, rect.y - margin);
    const int x1 = std::min(image_width, rect.right() + margin);
    const int y1 = std::min(image_height, rect.bottom() + margin);
    return Rect{x0, y0, std::max(0, x1 - x0), std::max(0, y1 - y0)};
}

Rect shrink_region(const Rect& rect, int footprint, int image_width, int image_height) {
    if (footprint <= 0) {
        return rect;
    }
    const int x0 = rect.x > 0 ? rect.x + footprint : rect.x;
    const int y0 = rect.y > 0 ? rect.y + footprint : rect.y;
    const int x1 = rect.right() < image_width ? rect.right() - footprint : rect.right();
    const int y1 = rect.bottom() < image_height ? rect.bottom() - footprint : rect.bottom();
    return Rect{x0, y0, std::max(0, x1 - x0), std::max(0, y1 - y0)};
}

Rect intersect_regions(const Rect& a, const Rect& b) {
    const int x0 = std::max(a.x, b.x);
    const int y0 = std::max(a.y, b.y);
    const int x1 = std::min(a.right(), b.right());
    const int y1 = std::min(a.bottom(), b.bottom());
    return Rect{x0, y0, std::max(0, x1 - x0), std::max(0, y1 - y0)};
}

std::vector<TileRegion> build_tile_grid(int image_width, int image_height, int tile_size,
                                        int halo) {
    std::vector<TileRegion> tiles;
    if (image_width <= 0 || image_height <= 0) return tiles;
    if (tile_size <= 0) {
        throw PipelineError("tile size must be positive");
    }
    halo = std::max(0, halo);

    int row = 0;
    for (int y0 = 0; y0 < image_height; y0 += tile_size) {
        int col = 0;
        for (int x0 = 0; x0 < image_width; x0 += tile_size) {
            TileRegion t;
            t.row = row;
            t.col = col;
            t.halo = halo;
            t.core = Rect{x0, y0, std::min(tile_size, image_width - x0),
                          std::min(tile_size, image_height - y0)};
            t.region = grow_region(t.core, halo, image_width, image_height);
            t.tile_id = make_tile_id(row, col, t.core);
            tiles.push_back(std::move(t));
            ++col;
        }
        ++row;
    }
    return tiles;
}

Matrix2Df extract_region(const Matrix2Df& plane, const Rect& rect) {
    return plane.block(rect.y, rect.x, rect.height, rect.width);
}

RgbPlanes extract_region(const RgbPlanes& planes, const Rect& rect) {
    RgbPlanes out;
    out.R = extract_region(planes.R, rect);
    out.G = extract_region(planes.G, rect);
    out.B = extract_region(planes.B, rect);
    return out;
}

void paste_core(const Rect& core, const Rect& buffer_region, const RgbPlanes& buffer,
                RgbPlanes& out) {
    if (!buffer_region.contains(core)) {
        throw PipelineError("buffer does not cover tile core at " + std::to_string(core.x) +
                            "," + std::to_string(core.y));
    }
    const int ox = core.x - buffer_region.x;
    const int oy = core.y - buffer_region.y;
    const int w = core.width;
    const int h = core.height;
    out.R.block(core.y, core.x, h, w) = buffer.R.block(oy, ox, h, w);
    out.G.block(core.y, core.x, h, w) = buffer.G.block(oy, ox, h, w);
    out.B.block(core.y, core.x, h, w) = buffer.B.block(oy, ox, h, w);
}

void paste_core(const TileRegion& tile, const RgbPlanes& region_buffer, RgbPlanes& out) {
    paste_core(tile.core, tile.region, region_buffer, out);
}

RgbPlanes reassemble(const std::vector<TileRegion>& tiles,
                     const std::vector<RgbPlanes>& region_buffers,
                     int image_width, int image_height) {
    if (tiles.size() != region_buffers.size()) {
        throw PipelineError("reassemble: " + std::to_string(tiles.size()) + " tiles but " +
                            std::to_string(region_buffers.size()) + " buffers");
    }
    RgbPlanes out;
    out.R = Matrix2Df::Zero(image_height, image_width);
    out.G = Matrix2Df::Zero(image_height, image_width);
    out.B = Matrix2Df::Zero(image_height, image_width);
    for (size_t i = 0; i < tiles.size(); ++i) {
        paste_core(tiles[i], region_buffers[i], out);
    }
    return out;
}

} // namespace tile_develop::pipeline
