#pragma once

#include "tile_develop/edit/adjustment.hpp"
#include "tile_develop/edit/mask.hpp"
#include "tile_develop/image/image.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tile_develop::io {

// Turns encoded file contents into an Image. Throws DecodeError.
class Decoder {
public:
    virtual ~Decoder() = default;
    virtual image::Image decode(const std::vector<uint8_t>& bytes, const ImageId& id) const = 0;
};

// Produces a bitmap mask (subject, sky, ...) for an image. The result is
// used as a bitmap leaf.
class Segmenter {
public:
    virtual ~Segmenter() = default;
    virtual edit::MaskBitmap segment(const image::Image& img, const std::string& hint) const = 0;
};

class LensProfileLookup {
public:
    virtual ~LensProfileLookup() = default;
    virtual std::optional<edit::LensCorrection> lookup(const std::string& camera,
                                                       const std::string& lens) const = 0;
};

} // namespace tile_develop::io
