#pragma once

#include "tile_develop/core/types.hpp"
#include "tile_develop/edit/adjustment.hpp"
#include "tile_develop/image/convolution.hpp"

#include <string>
#include <vector>

namespace tile_develop::pipeline {

class ComputeBackend;

// Where a buffer sits in the render-scale image, plus shared inputs.
struct KernelContext {
    Rect region;               // buffer extent in render-scale image coordinates
    int image_width = 0;       // render-scale image size
    int image_height = 0;
    double scale = 1.0;        // render scale relative to full resolution
    float hdr_sample_max = image::kDefaultHdrSampleMax;
    const RgbPlanes* source = nullptr; // whole render-scale source (geometry)
    ComputeBackend* backend = nullptr; // blur provider; in-tree kernel when null
};

bool is_known_kernel(const std::string& name);

// True for adjustments that only look at the pixel itself.
bool is_color_only(const edit::Adjustment& adj);

// Applies one adjustment in place. Spatial kernels read only inside the
// buffer, so the caller supplies enough halo.
void apply_adjustment(const edit::Adjustment& adj, RgbPlanes& planes, const KernelContext& ctx);

// Resamples the source once through the leading lens correction and
// transform of `adjustments`. Returns how many leading adjustments it used.
size_t apply_geometry(const std::vector<edit::Adjustment>& adjustments, RgbPlanes& planes,
                      const KernelContext& ctx);

// Monotone cubic (Fritsch-Carlson) through the control points, continued
// linearly outside the first and last point.
class ToneCurve {
public:
    explicit ToneCurve(const std::vector<edit::CurvePoint>& points);
    float operator()(float x) const;

private:
    std::vector<float> xs_;
    std::vector<float> ys_;
    std::vector<float> slopes_;
};

// Deterministic grain noise in [-1, 1] for a full-resolution cell.
float grain_noise(int cell_x, int cell_y, int seed);

} // namespace tile_develop::pipeline
