#include "tile_develop/edit/adjustment.hpp"
#include "tile_develop/core/errors.hpp"

#include <cmath>
#include <type_traits>

namespace tile_develop::edit {

namespace {

template <typename T>
struct KindName;

template <> struct KindName<Exposure> { static constexpr const char* value = "exposure"; };
template <> struct KindName<Contrast> { static constexpr const char* value = "contrast"; };
template <> struct KindName<Tone> { static constexpr const char* value = "tone"; };
template <> struct KindName<WhiteBalance> { static constexpr const char* value = "white_balance"; };
template <> struct KindName<Saturation> { static constexpr const char* value = "saturation"; };
template <> struct KindName<Curve> { static constexpr const char* value = "curve"; };
template <> struct KindName<HslBand> { static constexpr const char* value = "hsl_band"; };
template <> struct KindName<ColorGrade> { static constexpr const char* value = "color_grade"; };
template <> struct KindName<Clarity> { static constexpr const char* value = "clarity"; };
template <> struct KindName<Sharpen> { static constexpr const char* value = "sharpen"; };
template <> struct KindName<NoiseReduction> { static constexpr const char* value = "noise_reduction"; };
template <> struct KindName<Vignette> { static constexpr const char* value = "vignette"; };
template <> struct KindName<Grain> { static constexpr const char* value = "grain"; };
template <> struct KindName<LensCorrection> { static constexpr const char* value = "lens_correction"; };
template <> struct KindName<Transform> { static constexpr const char* value = "transform"; };

template <size_t I = 0>
std::optional<Adjustment> default_by_name(const std::string& kind) {
    if constexpr (I < std::variant_size_v<Adjustment>) {
        using T = std::variant_alternative_t<I, Adjustment>;
        if (kind == KindName<T>::value) {
            return Adjustment{T{}};
        }
        return default_by_name<I + 1>(kind);
    } else {
        return std::nullopt;
    }
}

template <size_t I = 0>
void collect_names(std::vector<std::string>& out) {
    if constexpr (I < std::variant_size_v<Adjustment>) {
        out.emplace_back(KindName<std::variant_alternative_t<I, Adjustment>>::value);
        collect_names<I + 1>(out);
    }
}

} // namespace

const char* kind_name(const Adjustment& adj) {
    return std::visit([](const auto& a) {
        return KindName<std::decay_t<decltype(a)>>::value;
    }, adj);
}

std::optional<Adjustment> default_adjustment(const std::string& kind) {
    return default_by_name(kind);
}

std::vector<std::string> all_kind_names() {
    std::vector<std::string> names;
    collect_names(names);
    return names;
}

const char* curve_channel_name(CurveChannel c) {
    switch (c) {
        case CurveChannel::RGB: return "rgb";
        case CurveChannel::RED: return "red";
        case CurveChannel::GREEN: return "green";
        case CurveChannel::BLUE: return "blue";
        default: return "rgb";
    }
}

std::optional<CurveChannel> curve_channel_from_name(const std::string& s) {
    if (s == "rgb") return CurveChannel::RGB;
    if (s == "red") return CurveChannel::RED;
    if (s == "green") return CurveChannel::GREEN;
    if (s == "blue") return CurveChannel::BLUE;
    return std::nullopt;
}

const char* hsl_band_name(HslBandId b) {
    switch (b) {
        case HslBandId::REDS: return "reds";
        case HslBandId::ORANGES: return "oranges";
        case HslBandId::YELLOWS: return "yellows";
        case HslBandId::GREENS: return "greens";
        case HslBandId::CYANS: return "cyans";
        case HslBandId::BLUES: return "blues";
        case HslBandId::PURPLES: return "purples";
        case HslBandId::MAGENTAS: return "magentas";
        default: return "reds";
    }
}

std::optional<HslBandId> hsl_band_from_name(const std::string& s) {
    static const HslBandId kBands[] = {
        HslBandId::REDS, HslBandId::ORANGES, HslBandId::YELLOWS, HslBandId::GREENS,
        HslBandId::CYANS, HslBandId::BLUES, HslBandId::PURPLES, HslBandId::MAGENTAS};
    for (HslBandId b : kBands) {
        if (s == hsl_band_name(b)) return b;
    }
    return std::nullopt;
}

bool Curve::is_identity() const {
    for (const auto& p : points) {
        if (p.x != p.y) return false;
    }
    return true;
}

void validate_curve_points(const std::vector<CurvePoint>& points) {
    if (points.size() < 2 || points.size() > Curve::kMaxPoints) {
        throw ValidationError("curve.points must contain 2.." +
                              std::to_string(Curve::kMaxPoints) + " points");
    }
    for (size_t i = 0; i < points.size(); ++i) {
        const auto& p = points[i];
        if (!std::isfinite(p.x) || !std::isfinite(p.y) || p.x < 0.0f || p.x > 1.0f ||
            p.y < 0.0f || p.y > 1.0f) {
            throw ValidationError("curve.points[" + std::to_string(i) + "] outside [0,1]");
        }
        if (i > 0 && !(p.x > points[i - 1].x)) {
            throw ValidationError("curve.points x must be strictly increasing");
        }
    }
}

void validate_adjustment(const Adjustment& adj) {
    const std::string kind = kind_name(adj);
    for_each_param(adj, [&](const ParamSpec& spec, const auto& value) {
        const float v = static_cast<float>(value);
        if (!std::isfinite(v) || v < spec.min || v > spec.max) {
            throw ValidationError(kind + "." + spec.name + " = " + std::to_string(v) +
                                  " outside [" + std::to_string(spec.min) + ", " +
                                  std::to_string(spec.max) + "]");
        }
    });
    if (const auto* curve = std::get_if<Curve>(&adj)) {
        validate_curve_points(curve->points);
    }
}

bool is_identity(const Adjustment& adj) {
    return std::visit([](const auto& a) { return a.is_identity(); }, adj);
}

int adjustment_radius(const Adjustment& adj) {
    if (const auto* a = std::get_if<Clarity>(&adj)) return a->radius;
    if (const auto* a = std::get_if<Sharpen>(&adj)) return a->radius;
    if (const auto* a = std::get_if<NoiseReduction>(&adj)) return a->radius;
    return 0;
}

bool is_lens_correction(const Adjustment& adj) {
    return std::holds_alternative<LensCorrection>(adj);
}

bool is_geometry(const Adjustment& adj) {
    return std::holds_alternative<LensCorrection>(adj) || std::holds_alternative<Transform>(adj);
}

void check_geometry_placement(size_t group_index, bool group_is_global,
                              const std::vector<Adjustment>& preceding, const Adjustment& adj) {
    if (!is_geometry(adj)) {
        return;
    }
    const std::string kind = kind_name(adj);
    if (group_index != 0) {
        throw ValidationError(kind + " is only allowed in the first group");
    }
    if (!group_is_global) {
        throw ValidationError(kind + " requires a global group");
    }
    for (const auto& prev : preceding) {
        if (!is_geometry(prev)) {
            throw ValidationError(kind + " must precede every other adjustment");
        }
        if (prev.index() == adj.index()) {
            throw ValidationError(kind + " appears twice");
        }
        if (std::holds_alternative<Transform>(prev) && is_lens_correction(adj)) {
            throw ValidationError("lens_correction must come before transform");
        }
    }
}

bool adjustments_equal(const Adjustment& a, const Adjustment& b) {
    if (a.index() != b.index()) {
        return false;
    }

    std::vector<double> va;
    std::vector<double> vb;
    for_each_param(a, [&](const ParamSpec&, const auto& v) { va.push_back(v); });
    for_each_param(b, [&](const ParamSpec&, const auto& v) { vb.push_back(v); });
    if (va != vb) {
        return false;
    }

    if (const auto* ca = std::get_if<Curve>(&a)) {
        const auto& cb = std::get<Curve>(b);
        if (ca->channel != cb.channel || ca->points.size() != cb.points.size()) {
            return false;
        }
        for (size_t i = 0; i < ca->points.size(); ++i) {
            if (ca->points[i].x != cb.points[i].x || ca->points[i].y != cb.points[i].y) {
                return false;
            }
        }
    }
    if (const auto* ha = std::get_if<HslBand>(&a)) {
        if (ha->band != std::get<HslBand>(b).band) {
            return false;
        }
    }
    return true;
}

} // namespace tile_develop::edit
