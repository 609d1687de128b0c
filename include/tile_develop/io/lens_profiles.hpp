#pragma once

#include "tile_develop/io/collaborators.hpp"

#include <filesystem>
#include <yaml-cpp/yaml.h>

namespace tile_develop::io {

namespace fs = std::filesystem;

struct LensCalibration {
    float focal_mm = 0.0f;
    edit::LensCorrection correction;
};

struct LensProfile {
    std::string camera; // empty matches any camera
    std::string lens;
    std::vector<LensCalibration> calibrations; // sorted by focal length
};

/**
 * Lens correction profiles from a YAML file:
 *
 *   profiles:
 *     - camera: "Canon EOS R5"
 *       lens: "RF 24-105mm F4 L IS USM"
 *       calibrations:
 *         - {focal: 24, k1: -0.08, k2: 0.02, k3: 0.0, tca_red: 1.0004,
 *            tca_blue: 0.9997, vig_k1: -0.3, vig_k2: 0.05, vig_k3: 0.0}
 *
 * Keys are the lens_correction parameter names; missing ones keep their
 * defaults. Lookups interpolate linearly between calibrated focal lengths.
 *
 * Names match case-insensitively; a profile for the exact camera wins over
 * a camera-agnostic one.
 */
class LensProfileDatabase : public LensProfileLookup {
public:
    LensProfileDatabase() = default;
    explicit LensProfileDatabase(std::vector<LensProfile> profiles);

    static LensProfileDatabase load(const fs::path& path);
    static LensProfileDatabase from_yaml(const YAML::Node& node);

    // First calibration of the matching profile.
    std::optional<edit::LensCorrection> lookup(const std::string& camera,
                                               const std::string& lens) const override;

    // Linear interpolation between calibrated focal lengths, clamped to the
    // calibrated range.
    std::optional<edit::LensCorrection> lookup(const std::string& camera, const std::string& lens,
                                               float focal_mm) const;

    size_t size() const { return profiles_.size(); }

private:
    const LensProfile* find(const std::string& camera, const std::string& lens) const;

    std::vector<LensProfile> profiles_;
};

} // namespace tile_develop::io
