#pragma once

#include "tile_develop/core/types.hpp"

#include <vector>

namespace tile_develop::image {

// fp16 maximum; default clamp for extended-range intermediates.
constexpr float kDefaultHdrSampleMax = 65504.0f;

enum class SampleRange {
    NORMALIZED, // 0..1 mask / color data
    EXTENDED    // HDR intermediates, samples clamped before accumulation
};

// exp(-(x*x) / (2*sigma*sigma)); 0 for a degenerate sigma.
float gaussian_weight(float x, float sigma);

// Unnormalized weights for offsets [-radius, radius], sigma = radius / 2.
std::vector<float> make_gaussian_kernel(int radius);

// Clamp one sample into [-max, max]; NaN becomes 0.
float clamp_hdr_sample(float v, float hdr_sample_max);

/**
 * Two-pass separable Gaussian blur.
 *
 * The horizontal pass reads the input plane, the vertical pass reads the
 * horizontal output. Sample coordinates are clamped to the plane bounds and
 * every output is the weighted sum divided by the weights actually used.
 * For SampleRange::NORMALIZED a zero weight sum yields the center sample.
 */
Matrix2Df separable_blur(const Matrix2Df& plane, int radius,
                         SampleRange range = SampleRange::NORMALIZED,
                         float hdr_sample_max = kDefaultHdrSampleMax);

// Direct (non-separable) 2-D convolution with the same weights and clamping.
Matrix2Df gaussian_blur_direct(const Matrix2Df& plane, int radius,
                               SampleRange range = SampleRange::NORMALIZED,
                               float hdr_sample_max = kDefaultHdrSampleMax);

} // namespace tile_develop::image
