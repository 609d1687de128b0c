#pragma once

#include "tile_develop/core/types.hpp"

#include <vector>

namespace tile_develop::image {

/**
 * Decoded pixel buffer. Samples are interleaved, normalized floats
 * (0..1 for integer sources, unbounded for F32 sources). The pipeline only
 * ever reads an Image; it never mutates one.
 */
struct Image {
    ImageId id;
    int width = 0;
    int height = 0;
    int channels = 0;           // 1, 3 or 4 (RGBA)
    PixelFormat format = PixelFormat::F32;
    ColorSpace color_space = ColorSpace::SRGB;
    std::vector<float> data;

    float at(int x, int y, int c) const {
        return data[(static_cast<size_t>(y) * width + x) * channels + c];
    }
    bool has_alpha() const { return channels == 4; }
};

// Render output: same layout and metadata as the source image.
using PixelBuffer = Image;

// Validates dimensions/channel count against the data size.
Image make_image(ImageId id, int width, int height, int channels, std::vector<float> data,
                 PixelFormat format = PixelFormat::F32,
                 ColorSpace color_space = ColorSpace::SRGB);

// Interleaved -> planar RGB. Gray sources are replicated into all planes.
RgbPlanes to_planes(const Image& img);

// Alpha plane of an RGBA image; empty matrix otherwise.
Matrix2Df alpha_plane(const Image& img);

// Planar RGB -> interleaved buffer with the metadata and channel layout of
// `like`. Gray output is folded back from the replicated planes exactly.
PixelBuffer from_planes(const RgbPlanes& planes, const Matrix2Df& alpha, const Image& like);

// Area-averaged downscale (OpenCV INTER_AREA). scale >= 1 returns a copy.
Image downscale(const Image& img, double scale);

// Resample a single plane to the given size (OpenCV INTER_AREA).
Matrix2Df resample_plane(const Matrix2Df& plane, int width, int height);

// Extent of one image axis at a render scale (at least 1).
int scaled_extent(int extent, double scale);

// Scale factor that fits the longest edge into target_edge (0 = native).
double scale_for_target(int width, int height, int target_edge);

} // namespace tile_develop::image
