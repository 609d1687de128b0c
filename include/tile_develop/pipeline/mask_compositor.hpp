#pragma once

#include "tile_develop/core/types.hpp"
#include "tile_develop/edit/edit_state.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace tile_develop::pipeline {

class ComputeBackend;

// Geometry a mask is rasterized for.
struct MaskRaster {
    Rect region;          // render-scale pixels to produce
    int image_width = 0;  // render-scale image size
    int image_height = 0;
    int full_width = 0;   // full-resolution image size
    int full_height = 0;
    double scale = 1.0;
};

/**
 * Evaluates masks into per-pixel weights in [0,1].
 *
 * Leaves are rasterized in global coordinates so any region of the image
 * yields the same values as the whole image. The combined mask is feathered
 * with the separable kernel when its scaled radius is positive, over the
 * region grown by that radius; radius 0 leaves it untouched. Bitmap leaves are resampled to the render scale once
 * and reused.
 */
class MaskCompositor {
public:
    explicit MaskCompositor(ComputeBackend* backend = nullptr);

    // Single mask, feathered and multiplied by its opacity.
    Matrix2Df evaluate_mask(const edit::Mask& mask, const MaskRaster& raster) const;

    // Layers folded left to right from an all-zero accumulator, times the
    // group opacity. A global group yields a constant plane.
    Matrix2Df evaluate_group(const edit::AdjustmentGroup& group, const MaskRaster& raster) const;

    // Unfeathered value of one arena node.
    Matrix2Df rasterize_node(const edit::Mask& mask, int node, const MaskRaster& raster) const;

    size_t cached_bitmaps() const;

private:
    Matrix2Df rasterize_leaf(const edit::MaskNode& node, const MaskRaster& raster) const;
    std::shared_ptr<const Matrix2Df> bitmap_at_scale(const edit::MaskBitmap& bitmap,
                                                     int width, int height) const;

    ComputeBackend* backend_;
    mutable std::mutex mutex_;
    mutable std::map<std::string, std::shared_ptr<const Matrix2Df>> resampled_;
};

Matrix2Df combine_masks(edit::MaskOp op, const Matrix2Df& a, const Matrix2Df& b);

} // namespace tile_develop::pipeline
