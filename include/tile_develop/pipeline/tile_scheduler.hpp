#pragma once

#include "tile_develop/core/types.hpp"

#include <string>
#include <vector>

namespace tile_develop::pipeline {

/**
 * Row-major grid of non-overlapping cores of at most tile_size pixels.
 * Each processing region is the core grown by `halo` on every side and
 * clamped to the image; the last row/column may be narrower.
 */
std::vector<TileRegion> build_tile_grid(int image_width, int image_height, int tile_size,
                                        int halo);

// Derived from the core only, so a tile keeps its id when the halo changes.
std::string make_tile_id(int row, int col, const Rect& core);

// `rect` grown by `margin` on every side, clamped to the image.
Rect grow_region(const Rect& rect, int margin, int image_width, int image_height);

// Pixels of `rect` that stay exact after an operation reading `footprint`
// pixels around each output pixel. Sides on the image border do not shrink.
Rect shrink_region(const Rect& rect, int footprint, int image_width, int image_height);

Rect intersect_regions(const Rect& a, const Rect& b);

Matrix2Df extract_region(const Matrix2Df& plane, const Rect& rect);
RgbPlanes extract_region(const RgbPlanes& planes, const Rect& rect);

// Copies `core` out of a buffer holding `buffer_region` into the full-size output.
void paste_core(const Rect& core, const Rect& buffer_region, const RgbPlanes& buffer,
                RgbPlanes& out);
void paste_core(const TileRegion& tile, const RgbPlanes& region_buffer, RgbPlanes& out);

RgbPlanes reassemble(const std::vector<TileRegion>& tiles,
                     const std::vector<RgbPlanes>& region_buffers,
                     int image_width, int image_height);

} // namespace tile_develop::pipeline
