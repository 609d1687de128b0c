#pragma once

#include "tile_develop/io/collaborators.hpp"

#include <filesystem>

namespace tile_develop::io {

namespace fs = std::filesystem;

// cv::imdecode based decoder for 8/16-bit gray, RGB and RGBA files.
class OpenCvDecoder : public Decoder {
public:
    image::Image decode(const std::vector<uint8_t>& bytes, const ImageId& id) const override;
};

// Reads and decodes a file; the image id is the file name.
image::Image decode_file(const fs::path& path, const Decoder& decoder);

// 8-bit for .jpg/.jpeg, 16-bit otherwise (png, tif).
void write_image(const fs::path& path, const image::PixelBuffer& buffer);

} // namespace tile_develop::io
