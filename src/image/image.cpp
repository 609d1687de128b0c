#include "tile_develop/image/image.hpp"
#include "tile_develop/core/errors.hpp"

#include <opencv2/opencv.hpp>

#include <algorithm>
#include <cmath>

namespace tile_develop::image {

Image make_image(ImageId id, int width, int height, int channels, std::vector<float> data,
                 PixelFormat format, ColorSpace color_space) {
    if (width <= 0 || height <= 0) {
        throw ValidationError("image dimensions must be positive");
    }
    if (channels != 1 && channels != 3 && channels != 4) {
        throw ValidationError("image channel count must be 1, 3 or 4, got " +
                              std::to_string(channels));
    }
    const size_t expected = static_cast<size_t>(width) * height * channels;
    if (data.size() != expected) {
        throw ValidationError("image data size " + std::to_string(data.size()) +
                              " does not match " + std::to_string(width) + "x" +
                              std::to_string(height) + "x" + std::to_string(channels));
    }

    Image img;
    img.id = std::move(id);
    img.width = width;
    img.height = height;
    img.channels = channels;
    img.format = format;
    img.color_space = color_space;
    img.data = std::move(data);
    return img;
}

RgbPlanes to_planes(const Image& img) {
    RgbPlanes p;
    p.R.resize(img.height, img.width);
    p.G.resize(img.height, img.width);
    p.B.resize(img.height, img.width);

    const int ch = img.channels;
    for (int y = 0; y < img.height; ++y) {
        const float* row = img.data.data() + static_cast<size_t>(y) * img.width * ch;
        for (int x = 0; x < img.width; ++x) {
            const float* px = row + static_cast<size_t>(x) * ch;
            if (ch == 1) {
                p.R(y, x) = px[0];
                p.G(y, x) = px[0];
                p.B(y, x) = px[0];
            } else {
                p.R(y, x) = px[0];
                p.G(y, x) = px[1];
                p.B(y, x) = px[2];
            }
        }
    }
    return p;
}

Matrix2Df alpha_plane(const Image& img) {
    if (!img.has_alpha()) {
        return Matrix2Df();
    }
    Matrix2Df a(img.height, img.width);
    for (int y = 0; y < img.height; ++y) {
        for (int x = 0; x < img.width; ++x) {
            a(y, x) = img.at(x, y, 3);
        }
    }
    return a;
}

PixelBuffer from_planes(const RgbPlanes& planes, const Matrix2Df& alpha, const Image& like) {
    PixelBuffer out;
    out.id = like.id;
    out.width = planes.cols();
    out.height = planes.rows();
    out.channels = like.channels;
    out.format = like.format;
    out.color_space = like.color_space;
    out.data.resize(static_cast<size_t>(out.width) * out.height * out.channels);

    const bool copy_alpha = like.channels == 4 && alpha.rows() == out.height &&
                            alpha.cols() == out.width;

    for (int y = 0; y < out.height; ++y) {
        for (int x = 0; x < out.width; ++x) {
            float* px = out.data.data() +
                        (static_cast<size_t>(y) * out.width + x) * out.channels;
            if (out.channels == 1) {
                // 3x is exact in double for any float x, so r=g=b=x folds back to x.
                const double sum = static_cast<double>(planes.R(y, x)) +
                                   static_cast<double>(planes.G(y, x)) +
                                   static_cast<double>(planes.B(y, x));
                px[0] = static_cast<float>(sum / 3.0);
            } else {
                px[0] = planes.R(y, x);
                px[1] = planes.G(y, x);
                px[2] = planes.B(y, x);
                if (out.channels == 4) {
                    px[3] = copy_alpha ? alpha(y, x) : 1.0f;
                }
            }
        }
    }
    return out;
}

Image downscale(const Image& img, double scale) {
    if (scale >= 1.0) {
        return img;
    }
    const int w = scaled_extent(img.width, scale);
    const int h = scaled_extent(img.height, scale);

    cv::Mat src(img.height, img.width, CV_32FC(img.channels),
                const_cast<float*>(img.data.data()));
    cv::Mat dst;
    cv::resize(src, dst, cv::Size(w, h), 0.0, 0.0, cv::INTER_AREA);
    if (!dst.isContinuous()) {
        dst = dst.clone();
    }

    Image out = img;
    out.width = w;
    out.height = h;
    out.data.assign(dst.ptr<float>(), dst.ptr<float>() + static_cast<size_t>(w) * h * img.channels);
    return out;
}

Matrix2Df resample_plane(const Matrix2Df& plane, int width, int height) {
    if (plane.cols() == width && plane.rows() == height) {
        return plane;
    }
    cv::Mat src(static_cast<int>(plane.rows()), static_cast<int>(plane.cols()), CV_32F,
                const_cast<float*>(plane.data()));
    cv::Mat dst;
    const int interp = (width < plane.cols()) ? cv::INTER_AREA : cv::INTER_LINEAR;
    cv::resize(src, dst, cv::Size(width, height), 0.0, 0.0, interp);

    Matrix2Df out(height, width);
    for (int y = 0; y < height; ++y) {
        const float* row = dst.ptr<float>(y);
        std::copy(row, row + width, out.data() + static_cast<size_t>(y) * width);
    }
    return out;
}

int scaled_extent(int extent, double scale) {
    if (scale >= 1.0) {
        return extent;
    }
    return std::max(1, static_cast<int>(std::lround(extent * scale)));
}

double scale_for_target(int width, int height, int target_edge) {
    const int longest = std::max(width, height);
    if (target_edge <= 0 || longest <= target_edge) {
        return 1.0;
    }
    return static_cast<double>(target_edge) / static_cast<double>(longest);
}

} // namespace tile_develop::image
