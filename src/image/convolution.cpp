#include "tile_develop/image/convolution.hpp"

#include <algorithm>
#include <cmath>

namespace tile_develop::image {

float gaussian_weight(float x, float sigma) {
    if (!(sigma > 0.0f)) {
        return 0.0f;
    }
    return std::exp(-(x * x) / (2.0f * sigma * sigma));
}

std::vector<float> make_gaussian_kernel(int radius) {
    const int r = std::max(0, radius);
    const float sigma = static_cast<float>(r) / 2.0f;
    std::vector<float> k(static_cast<size_t>(2 * r + 1));
    for (int i = -r; i <= r; ++i) {
        k[static_cast<size_t>(i + r)] = gaussian_weight(static_cast<float>(i), sigma);
    }
    return k;
}

float clamp_hdr_sample(float v, float hdr_sample_max) {
    if (std::isnan(v)) {
        return 0.0f;
    }
    return std::min(std::max(v, -hdr_sample_max), hdr_sample_max);
}

namespace {

inline float load_sample(const Matrix2Df& src, int y, int x, SampleRange range, float hdr_max) {
    const float v = src(y, x);
    return (range == SampleRange::EXTENDED) ? clamp_hdr_sample(v, hdr_max) : v;
}

// One 1-D pass. horizontal=true walks columns, otherwise rows.
Matrix2Df blur_1d(const Matrix2Df& src, const std::vector<float>& kernel, bool horizontal,
                  SampleRange range, float hdr_max) {
    const int h = static_cast<int>(src.rows());
    const int w = static_cast<int>(src.cols());
    const int r = static_cast<int>(kernel.size() / 2);
    Matrix2Df dst(h, w);

    for (int y = 0; y < h; ++y) {
        for (int x = 0; x < w; ++x) {
            double acc = 0.0;
            double total = 0.0;
            for (int i = -r; i <= r; ++i) {
                const float wt = kernel[static_cast<size_t>(i + r)];
                const int sx = horizontal ? std::clamp(x + i, 0, w - 1) : x;
                const int sy = horizontal ? y : std::clamp(y + i, 0, h - 1);
                acc += static_cast<double>(wt) * load_sample(src, sy, sx, range, hdr_max);
                total += wt;
            }
            if (total > 0.0) {
                dst(y, x) = static_cast<float>(acc / total);
            } else {
                dst(y, x) = load_sample(src, y, x, range, hdr_max);
            }
        }
    }
    return dst;
}

} // namespace

Matrix2Df separable_blur(const Matrix2Df& plane, int radius, SampleRange range,
                         float hdr_sample_max) {
    if (plane.size() == 0) {
        return plane;
    }
    const std::vector<float> kernel = make_gaussian_kernel(radius);
    Matrix2Df horizontal = blur_1d(plane, kernel, true, range, hdr_sample_max);
    return blur_1d(horizontal, kernel, false, range, hdr_sample_max);
}

Matrix2Df gaussian_blur_direct(const Matrix2Df& plane, int radius, SampleRange range,
                               float hdr_sample_max) {
    if (plane.size() == 0) {
        return plane;
    }
    const std::vector<float> kernel = make_gaussian_kernel(radius);
    const int r = static_cast<int>(kernel.size() / 2);
    const int h = static_cast<int>(plane.rows());
    const int w = static_cast<int>(plane.cols());
    Matrix2Df dst(h, w);

    for (int y = 0; y < h; ++y) {
        for (int x = 0; x < w; ++x) {
            double acc = 0.0;
            double total = 0.0;
            for (int j = -r; j <= r; ++j) {
                const int sy = std::clamp(y + j, 0, h - 1);
                const double wy = kernel[static_cast<size_t>(j + r)];
                for (int i = -r; i <= r; ++i) {
                    const int sx = std::clamp(x + i, 0, w - 1);
                    const double wt = wy * kernel[static_cast<size_t>(i + r)];
                    acc += wt * load_sample(plane, sy, sx, range, hdr_sample_max);
                    total += wt;
                }
            }
            dst(y, x) = (total > 0.0) ? static_cast<float>(acc / total)
                                      : load_sample(plane, y, x, range, hdr_sample_max);
        }
    }
    return dst;
}

} // namespace tile_develop::image
