#include "tile_develop/io/opencv_codec.hpp"
#include "tile_develop/core/errors.hpp"
#include "tile_develop/core/utils.hpp"

#include <opencv2/opencv.hpp>

#include <algorithm>
#include <iostream>

namespace tile_develop::io {

image::Image OpenCvDecoder::decode(const std::vector<uint8_t>& bytes, const ImageId& id) const {
    if (bytes.empty()) {
        throw DecodeError(id + ": empty input");
    }

    cv::Mat raw;
    try {
        raw = cv::imdecode(cv::Mat(1, static_cast<int>(bytes.size()), CV_8U,
                                   const_cast<uint8_t*>(bytes.data())),
                           cv::IMREAD_UNCHANGED);
    } catch (const cv::Exception& e) {
        throw DecodeError(id + ": " + e.what());
    }
    if (raw.empty()) {
        throw DecodeError(id + ": unsupported or corrupt image data");
    }

    PixelFormat format;
    double norm;
    switch (raw.depth()) {
        case CV_8U:
            format = PixelFormat::U8;
            norm = 1.0 / 255.0;
            break;
        case CV_16U:
            format = PixelFormat::U16;
            norm = 1.0 / 65535.0;
            break;
        case CV_32F:
            format = PixelFormat::F32;
            norm = 1.0;
            break;
        default:
            throw DecodeError(id + ": unsupported sample depth");
    }

    const int ch = raw.channels();
    cv::Mat rgb;
    int channels = ch;
    if (ch == 1) {
        rgb = raw;
    } else if (ch == 3) {
        cv::cvtColor(raw, rgb, cv::COLOR_BGR2RGB);
    } else if (ch == 4) {
        cv::cvtColor(raw, rgb, cv::COLOR_BGRA2RGBA);
    } else if (ch == 2) {
        // Gray + alpha: expand to RGBA.
        std::vector<cv::Mat> parts;
        cv::split(raw, parts);
        cv::merge(std::vector<cv::Mat>{parts[0], parts[0], parts[0], parts[1]}, rgb);
        channels = 4;
    } else {
        throw DecodeError(id + ": unsupported channel count " + std::to_string(ch));
    }

    cv::Mat f;
    rgb.convertTo(f, CV_32F, norm);
    if (!f.isContinuous()) {
        f = f.clone();
    }
    const float* p = f.ptr<float>(0);
    std::vector<float> data(p, p + static_cast<size_t>(f.rows) * f.cols * channels);
    return image::make_image(id, f.cols, f.rows, channels, std::move(data), format);
}

image::Image decode_file(const fs::path& path, const Decoder& decoder) {
    const std::vector<uint8_t> bytes = core::read_bytes(path);
    return decoder.decode(bytes, path.filename().string());
}

void write_image(const fs::path& path, const image::PixelBuffer& buffer) {
    if (buffer.width <= 0 || buffer.height <= 0 || buffer.data.empty()) {
        throw IOError("nothing to write to " + path.string());
    }

    const std::string ext = core::to_lower(path.extension().string());
    const bool eight_bit = ext == ".jpg" || ext == ".jpeg";
    const int depth = eight_bit ? CV_8U : CV_16U;
    const double max_value = eight_bit ? 255.0 : 65535.0;

    cv::Mat f(buffer.height, buffer.width, CV_MAKETYPE(CV_32F, buffer.channels),
              const_cast<float*>(buffer.data.data()));
    cv::Mat clipped;
    cv::min(f, 1.0, clipped);
    cv::max(clipped, 0.0, clipped);

    cv::Mat out;
    clipped.convertTo(out, depth, max_value);
    if (buffer.channels == 3) {
        cv::cvtColor(out, out, cv::COLOR_RGB2BGR);
    } else if (buffer.channels == 4) {
        if (eight_bit) {
            cv::cvtColor(out, out, cv::COLOR_RGBA2BGR);
        } else {
            cv::cvtColor(out, out, cv::COLOR_RGBA2BGRA);
        }
    }

    bool ok = false;
    try {
        ok = cv::imwrite(path.string(), out);
    } catch (const cv::Exception& e) {
        throw IOError("cannot write " + path.string() + ": " + e.what());
    }
    if (!ok) {
        throw IOError("cannot write " + path.string());
    }
    std::cerr << "[RENDER] Wrote " << path.string() << " (" << buffer.width << "x"
              << buffer.height << ")" << std::endl;
}

} // namespace tile_develop::io
