#pragma once

#include "tile_develop/edit/edit_state.hpp"
#include "tile_develop/image/image.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace tile_develop::image {

struct Histogram {
    std::vector<uint32_t> red;
    std::vector<uint32_t> green;
    std::vector<uint32_t> blue;
    std::vector<uint32_t> luma;
};

// Per-channel and luma (0.299/0.587/0.114) counts of values clamped to [0,1].
// Gray buffers count into all three channels.
Histogram compute_histogram(const PixelBuffer& buffer, int bins = 256);

/**
 * Bakes the per-pixel adjustments of a group into a .cube 3D LUT
 * (red fastest). Spatial adjustments and masks are ignored. resolution must
 * be 17, 33 or 65.
 */
std::string export_cube_lut(const edit::AdjustmentGroup& group, int resolution,
                            const std::string& title);

} // namespace tile_develop::image
