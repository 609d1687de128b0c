#include "tile_develop/io/lens_profiles.hpp"
#include "tile_develop/core/errors.hpp"
#include "tile_develop/core/utils.hpp"

#include <algorithm>
#include <iostream>
#include <type_traits>

namespace tile_develop::io {

namespace {

float lerp(float a, float b, float t) {
    return a + (b - a) * t;
}

edit::LensCorrection interpolate(const edit::LensCorrection& a, const edit::LensCorrection& b,
                                 float t) {
    edit::LensCorrection out;
    out.k1 = lerp(a.k1, b.k1, t);
    out.k2 = lerp(a.k2, b.k2, t);
    out.k3 = lerp(a.k3, b.k3, t);
    out.tca_red = lerp(a.tca_red, b.tca_red, t);
    out.tca_blue = lerp(a.tca_blue, b.tca_blue, t);
    out.vig_k1 = lerp(a.vig_k1, b.vig_k1, t);
    out.vig_k2 = lerp(a.vig_k2, b.vig_k2, t);
    out.vig_k3 = lerp(a.vig_k3, b.vig_k3, t);
    out.distortion_amount = lerp(a.distortion_amount, b.distortion_amount, t);
    out.tca_amount = lerp(a.tca_amount, b.tca_amount, t);
    out.vignette_amount = lerp(a.vignette_amount, b.vignette_amount, t);
    return out;
}

} // namespace

LensProfileDatabase::LensProfileDatabase(std::vector<LensProfile> profiles)
    : profiles_(std::move(profiles)) {
    for (auto& p : profiles_) {
        std::sort(p.calibrations.begin(), p.calibrations.end(),
                  [](const LensCalibration& a, const LensCalibration& b) {
                      return a.focal_mm < b.focal_mm;
                  });
    }
}

LensProfileDatabase LensProfileDatabase::load(const fs::path& path) {
    if (!fs::exists(path)) {
        throw IOError("Lens profile file not found: " + path.string());
    }
    YAML::Node node;
    try {
        node = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw ConfigError("Cannot parse " + path.string() + ": " + e.what());
    }
    LensProfileDatabase db = from_yaml(node);
    std::cerr << "[LENS] Loaded " << db.size() << " profiles from " << path.string()
              << std::endl;
    return db;
}

LensProfileDatabase LensProfileDatabase::from_yaml(const YAML::Node& node) {
    std::vector<LensProfile> profiles;
    const YAML::Node list = node["profiles"];
    if (!list) {
        return LensProfileDatabase();
    }
    if (!list.IsSequence()) {
        throw ConfigError("lens profiles: 'profiles' must be a list");
    }

    try {
        for (const auto& p : list) {
            LensProfile profile;
            if (p["camera"]) profile.camera = p["camera"].as<std::string>();
            if (!p["lens"]) {
                throw ConfigError("lens profiles: entry without 'lens'");
            }
            profile.lens = p["lens"].as<std::string>();

            for (const auto& c : p["calibrations"]) {
                LensCalibration cal;
                if (c["focal"]) cal.focal_mm = c["focal"].as<float>();
                edit::Adjustment correction{edit::LensCorrection{}};
                edit::for_each_param(correction, [&](const edit::ParamSpec& spec, auto& value) {
                    if (c[spec.name]) {
                        value = c[spec.name].as<std::decay_t<decltype(value)>>();
                    }
                });
                edit::validate_adjustment(correction);
                cal.correction = std::get<edit::LensCorrection>(correction);
                profile.calibrations.push_back(cal);
            }
            if (profile.calibrations.empty()) {
                throw ConfigError("lens profiles: '" + profile.lens + "' has no calibrations");
            }
            profiles.push_back(std::move(profile));
        }
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("lens profiles: ") + e.what());
    } catch (const ValidationError& e) {
        throw ConfigError(std::string("lens profiles: ") + e.what());
    }
    return LensProfileDatabase(std::move(profiles));
}

const LensProfile* LensProfileDatabase::find(const std::string& camera,
                                             const std::string& lens) const {
    const std::string cam = core::to_lower(camera);
    const std::string len = core::to_lower(lens);
    const LensProfile* any_camera = nullptr;
    for (const auto& p : profiles_) {
        if (core::to_lower(p.lens) != len) {
            continue;
        }
        if (p.camera.empty()) {
            if (!any_camera) any_camera = &p;
        } else if (core::to_lower(p.camera) == cam) {
            return &p;
        }
    }
    return any_camera;
}

std::optional<edit::LensCorrection> LensProfileDatabase::lookup(const std::string& camera,
                                                                const std::string& lens) const {
    const LensProfile* p = find(camera, lens);
    if (!p) {
        std::cerr << "[LENS] No profile for '" << lens << "' on '" << camera << "'" << std::endl;
        return std::nullopt;
    }
    return p->calibrations.front().correction;
}

std::optional<edit::LensCorrection> LensProfileDatabase::lookup(const std::string& camera,
                                                                const std::string& lens,
                                                                float focal_mm) const {
    const LensProfile* p = find(camera, lens);
    if (!p) {
        std::cerr << "[LENS] No profile for '" << lens << "' on '" << camera << "'" << std::endl;
        return std::nullopt;
    }
    const auto& cals = p->calibrations;
    if (focal_mm <= cals.front().focal_mm) {
        return cals.front().correction;
    }
    if (focal_mm >= cals.back().focal_mm) {
        return cals.back().correction;
    }
    for (size_t i = 1; i < cals.size(); ++i) {
        if (focal_mm <= cals[i].focal_mm) {
            const float span = cals[i].focal_mm - cals[i - 1].focal_mm;
            const float t = span > 0.0f ? (focal_mm - cals[i - 1].focal_mm) / span : 0.0f;
            return interpolate(cals[i - 1].correction, cals[i].correction, t);
        }
    }
    return cals.back().correction;
}

} // namespace tile_develop::io
