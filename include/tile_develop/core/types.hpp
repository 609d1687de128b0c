#pragma once

#include <Eigen/Dense>
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <string>
#include <vector>

namespace tile_develop {

// Pixel plane types
using Matrix2Df = Eigen::Matrix<float, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using VectorXf = Eigen::VectorXf;

using ImageId = std::string;

// Source sample format of a decoded image
enum class PixelFormat {
    U8,
    U16,
    F32
};

inline std::string pixel_format_to_string(PixelFormat format) {
    switch (format) {
        case PixelFormat::U8: return "U8";
        case PixelFormat::U16: return "U16";
        case PixelFormat::F32: return "F32";
        default: return "UNKNOWN";
    }
}

// Color space tag carried through the pipeline untouched
enum class ColorSpace {
    UNKNOWN,
    SRGB,
    LINEAR_SRGB,
    DISPLAY_P3,
    ADOBE_RGB
};

inline std::string color_space_to_string(ColorSpace cs) {
    switch (cs) {
        case ColorSpace::SRGB: return "sRGB";
        case ColorSpace::LINEAR_SRGB: return "linear_sRGB";
        case ColorSpace::DISPLAY_P3: return "Display_P3";
        case ColorSpace::ADOBE_RGB: return "Adobe_RGB";
        default: return "UNKNOWN";
    }
}

inline ColorSpace string_to_color_space(const std::string& s) {
    std::string norm = s;
    std::transform(norm.begin(), norm.end(), norm.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (norm == "srgb") return ColorSpace::SRGB;
    if (norm == "linear_srgb") return ColorSpace::LINEAR_SRGB;
    if (norm == "display_p3") return ColorSpace::DISPLAY_P3;
    if (norm == "adobe_rgb") return ColorSpace::ADOBE_RGB;
    return ColorSpace::UNKNOWN;
}

// Axis-aligned pixel rectangle
struct Rect {
    int x = 0;
    int y = 0;
    int width = 0;
    int height = 0;

    int right() const { return x + width; }
    int bottom() const { return y + height; }
    bool empty() const { return width <= 0 || height <= 0; }
    bool contains(const Rect& o) const {
        return o.x >= x && o.y >= y && o.right() <= right() && o.bottom() <= bottom();
    }

    bool operator==(const Rect& o) const {
        return x == o.x && y == o.y && width == o.width && height == o.height;
    }
    bool operator!=(const Rect& o) const { return !(*this == o); }
};

// Tile descriptor: core region plus halo-grown processing region
struct TileRegion {
    int row = 0;         // Grid row index
    int col = 0;         // Grid column index
    Rect core;           // Pixels this tile contributes to the output
    Rect region;         // core + halo, clamped to the image
    int halo = 0;        // Requested halo (before clamping)
    std::string tile_id; // Core-derived identity used in cache keys
};

// Working representation of a tile or image inside the pipeline
struct RgbPlanes {
    Matrix2Df R;
    Matrix2Df G;
    Matrix2Df B;

    int rows() const { return static_cast<int>(R.rows()); }
    int cols() const { return static_cast<int>(R.cols()); }
    size_t byte_size() const {
        return static_cast<size_t>(R.size() + G.size() + B.size()) * sizeof(float);
    }
};

} // namespace tile_develop
