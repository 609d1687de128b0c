#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace tile_develop::edit {

// Declared range and identity value of one numeric parameter.
struct ParamSpec {
    const char* name;
    float min;
    float max;
    float identity;
};

// Each adjustment exposes its scalar parameters through a static visit()
// so validation, hashing, equality and serialization share one table.

struct Exposure {
    float ev = 0.0f;

    template <typename Self, typename F>
    static void visit(Self& a, F&& f) {
        f(ParamSpec{"ev", -5.0f, 5.0f, 0.0f}, a.ev);
    }
    bool is_identity() const { return ev == 0.0f; }
};

struct Contrast {
    float amount = 0.0f;

    template <typename Self, typename F>
    static void visit(Self& a, F&& f) {
        f(ParamSpec{"amount", -1.0f, 1.0f, 0.0f}, a.amount);
    }
    bool is_identity() const { return amount == 0.0f; }
};

struct Tone {
    float highlights = 0.0f;
    float shadows = 0.0f;
    float whites = 0.0f;
    float blacks = 0.0f;

    template <typename Self, typename F>
    static void visit(Self& a, F&& f) {
        f(ParamSpec{"highlights", -1.0f, 1.0f, 0.0f}, a.highlights);
        f(ParamSpec{"shadows", -1.0f, 1.0f, 0.0f}, a.shadows);
        f(ParamSpec{"whites", -1.0f, 1.0f, 0.0f}, a.whites);
        f(ParamSpec{"blacks", -1.0f, 1.0f, 0.0f}, a.blacks);
    }
    bool is_identity() const {
        return highlights == 0.0f && shadows == 0.0f && whites == 0.0f && blacks == 0.0f;
    }
};

struct WhiteBalance {
    float temperature = 0.0f;
    float tint = 0.0f;

    template <typename Self, typename F>
    static void visit(Self& a, F&& f) {
        f(ParamSpec{"temperature", -1.0f, 1.0f, 0.0f}, a.temperature);
        f(ParamSpec{"tint", -1.0f, 1.0f, 0.0f}, a.tint);
    }
    bool is_identity() const { return temperature == 0.0f && tint == 0.0f; }
};

struct Saturation {
    float saturation = 0.0f;
    float vibrance = 0.0f;

    template <typename Self, typename F>
    static void visit(Self& a, F&& f) {
        f(ParamSpec{"saturation", -1.0f, 1.0f, 0.0f}, a.saturation);
        f(ParamSpec{"vibrance", -1.0f, 1.0f, 0.0f}, a.vibrance);
    }
    bool is_identity() const { return saturation == 0.0f && vibrance == 0.0f; }
};

enum class CurveChannel { RGB, RED, GREEN, BLUE };

struct CurvePoint {
    float x = 0.0f;
    float y = 0.0f;
};

// Tone curve through 2..16 control points with strictly increasing x.
struct Curve {
    static constexpr size_t kMaxPoints = 16;

    CurveChannel channel = CurveChannel::RGB;
    std::vector<CurvePoint> points{{0.0f, 0.0f}, {1.0f, 1.0f}};

    template <typename Self, typename F>
    static void visit(Self&, F&&) {}
    bool is_identity() const;
};

enum class HslBandId { REDS, ORANGES, YELLOWS, GREENS, CYANS, BLUES, PURPLES, MAGENTAS };

struct HslBand {
    HslBandId band = HslBandId::REDS;
    float hue = 0.0f;
    float saturation = 0.0f;
    float lightness = 0.0f;

    template <typename Self, typename F>
    static void visit(Self& a, F&& f) {
        f(ParamSpec{"hue", -180.0f, 180.0f, 0.0f}, a.hue);
        f(ParamSpec{"saturation", -100.0f, 100.0f, 0.0f}, a.saturation);
        f(ParamSpec{"lightness", -100.0f, 100.0f, 0.0f}, a.lightness);
    }
    bool is_identity() const { return hue == 0.0f && saturation == 0.0f && lightness == 0.0f; }
};

struct ColorWheel {
    float x = 0.0f;
    float y = 0.0f;
    float intensity = 0.0f;
};

// Shadows / midtones / highlights color wheels.
struct ColorGrade {
    ColorWheel shadows;
    ColorWheel midtones;
    ColorWheel highlights;

    template <typename Self, typename F>
    static void visit(Self& a, F&& f) {
        f(ParamSpec{"shadows.x", -1.0f, 1.0f, 0.0f}, a.shadows.x);
        f(ParamSpec{"shadows.y", -1.0f, 1.0f, 0.0f}, a.shadows.y);
        f(ParamSpec{"shadows.intensity", 0.0f, 1.0f, 0.0f}, a.shadows.intensity);
        f(ParamSpec{"midtones.x", -1.0f, 1.0f, 0.0f}, a.midtones.x);
        f(ParamSpec{"midtones.y", -1.0f, 1.0f, 0.0f}, a.midtones.y);
        f(ParamSpec{"midtones.intensity", 0.0f, 1.0f, 0.0f}, a.midtones.intensity);
        f(ParamSpec{"highlights.x", -1.0f, 1.0f, 0.0f}, a.highlights.x);
        f(ParamSpec{"highlights.y", -1.0f, 1.0f, 0.0f}, a.highlights.y);
        f(ParamSpec{"highlights.intensity", 0.0f, 1.0f, 0.0f}, a.highlights.intensity);
    }
    bool is_identity() const {
        return shadows.intensity == 0.0f && midtones.intensity == 0.0f &&
               highlights.intensity == 0.0f;
    }
};

// Local contrast: luma detail against a Gaussian-blurred base.
struct Clarity {
    float amount = 0.0f;
    int radius = 20;

    template <typename Self, typename F>
    static void visit(Self& a, F&& f) {
        f(ParamSpec{"amount", -1.0f, 1.0f, 0.0f}, a.amount);
        f(ParamSpec{"radius", 1.0f, 100.0f, 20.0f}, a.radius);
    }
    bool is_identity() const { return amount == 0.0f; }
};

// Unsharp mask.
struct Sharpen {
    float amount = 0.0f;
    int radius = 2;

    template <typename Self, typename F>
    static void visit(Self& a, F&& f) {
        f(ParamSpec{"amount", 0.0f, 2.0f, 0.0f}, a.amount);
        f(ParamSpec{"radius", 1.0f, 10.0f, 2.0f}, a.radius);
    }
    bool is_identity() const { return amount == 0.0f; }
};

struct NoiseReduction {
    float luminance = 0.0f;
    int radius = 3;

    template <typename Self, typename F>
    static void visit(Self& a, F&& f) {
        f(ParamSpec{"luminance", 0.0f, 1.0f, 0.0f}, a.luminance);
        f(ParamSpec{"radius", 1.0f, 16.0f, 3.0f}, a.radius);
    }
    bool is_identity() const { return luminance == 0.0f; }
};

struct Vignette {
    float amount = 0.0f;
    float midpoint = 0.5f;

    template <typename Self, typename F>
    static void visit(Self& a, F&& f) {
        f(ParamSpec{"amount", -1.0f, 1.0f, 0.0f}, a.amount);
        f(ParamSpec{"midpoint", 0.0f, 1.0f, 0.5f}, a.midpoint);
    }
    bool is_identity() const { return amount == 0.0f; }
};

// Film grain, deterministic in full-resolution image coordinates.
struct Grain {
    float amount = 0.0f;
    float size = 1.0f;
    int seed = 0;

    template <typename Self, typename F>
    static void visit(Self& a, F&& f) {
        f(ParamSpec{"amount", 0.0f, 1.0f, 0.0f}, a.amount);
        f(ParamSpec{"size", 1.0f, 8.0f, 1.0f}, a.size);
        f(ParamSpec{"seed", 0.0f, 2147483647.0f, 0.0f}, a.seed);
    }
    bool is_identity() const { return amount == 0.0f; }
};

// Lens profile correction: radial distortion (k1, k2, k3), lateral
// chromatic aberration as red/blue radius scales, and optical vignetting
// 1 + v1 r^2 + v2 r^4 + v3 r^6 divided out. Each part has an amount.
struct LensCorrection {
    float k1 = 0.0f;
    float k2 = 0.0f;
    float k3 = 0.0f;
    float tca_red = 1.0f;
    float tca_blue = 1.0f;
    float vig_k1 = 0.0f;
    float vig_k2 = 0.0f;
    float vig_k3 = 0.0f;
    float distortion_amount = 1.0f;
    float tca_amount = 1.0f;
    float vignette_amount = 1.0f;

    template <typename Self, typename F>
    static void visit(Self& a, F&& f) {
        f(ParamSpec{"k1", -1.0f, 1.0f, 0.0f}, a.k1);
        f(ParamSpec{"k2", -1.0f, 1.0f, 0.0f}, a.k2);
        f(ParamSpec{"k3", -1.0f, 1.0f, 0.0f}, a.k3);
        f(ParamSpec{"tca_red", 0.98f, 1.02f, 1.0f}, a.tca_red);
        f(ParamSpec{"tca_blue", 0.98f, 1.02f, 1.0f}, a.tca_blue);
        f(ParamSpec{"vig_k1", -1.0f, 1.0f, 0.0f}, a.vig_k1);
        f(ParamSpec{"vig_k2", -1.0f, 1.0f, 0.0f}, a.vig_k2);
        f(ParamSpec{"vig_k3", -1.0f, 1.0f, 0.0f}, a.vig_k3);
        f(ParamSpec{"distortion_amount", 0.0f, 2.0f, 1.0f}, a.distortion_amount);
        f(ParamSpec{"tca_amount", 0.0f, 2.0f, 1.0f}, a.tca_amount);
        f(ParamSpec{"vignette_amount", 0.0f, 2.0f, 1.0f}, a.vignette_amount);
    }
    bool distorts() const {
        return distortion_amount != 0.0f && (k1 != 0.0f || k2 != 0.0f || k3 != 0.0f);
    }
    bool shifts_channels() const {
        return tca_amount != 0.0f && (tca_red != 1.0f || tca_blue != 1.0f);
    }
    bool corrects_vignetting() const {
        return vignette_amount != 0.0f && (vig_k1 != 0.0f || vig_k2 != 0.0f || vig_k3 != 0.0f);
    }
    bool is_identity() const { return !distorts() && !shifts_channels() && !corrects_vignetting(); }
};

// Manual geometry: keystone (vertical, horizontal), rotation in degrees,
// aspect, scale in percent, offsets in percent of the half extent, and a
// manual barrel/pincushion term.
struct Transform {
    float distortion = 0.0f;
    float vertical = 0.0f;
    float horizontal = 0.0f;
    float rotate = 0.0f;
    float aspect = 0.0f;
    float scale = 100.0f;
    float x_offset = 0.0f;
    float y_offset = 0.0f;

    template <typename Self, typename F>
    static void visit(Self& a, F&& f) {
        f(ParamSpec{"distortion", -100.0f, 100.0f, 0.0f}, a.distortion);
        f(ParamSpec{"vertical", -100.0f, 100.0f, 0.0f}, a.vertical);
        f(ParamSpec{"horizontal", -100.0f, 100.0f, 0.0f}, a.horizontal);
        f(ParamSpec{"rotate", -45.0f, 45.0f, 0.0f}, a.rotate);
        f(ParamSpec{"aspect", -100.0f, 100.0f, 0.0f}, a.aspect);
        f(ParamSpec{"scale", 50.0f, 150.0f, 100.0f}, a.scale);
        f(ParamSpec{"x_offset", -100.0f, 100.0f, 0.0f}, a.x_offset);
        f(ParamSpec{"y_offset", -100.0f, 100.0f, 0.0f}, a.y_offset);
    }
    bool is_identity() const {
        return distortion == 0.0f && vertical == 0.0f && horizontal == 0.0f && rotate == 0.0f &&
               aspect == 0.0f && scale == 100.0f && x_offset == 0.0f && y_offset == 0.0f;
    }
};

using Adjustment = std::variant<Exposure, Contrast, Tone, WhiteBalance, Saturation, Curve,
                                HslBand, ColorGrade, Clarity, Sharpen, NoiseReduction,
                                Vignette, Grain, LensCorrection, Transform>;

// Stable names used by serialization and kernel lists, in variant order.
const char* kind_name(const Adjustment& adj);
std::optional<Adjustment> default_adjustment(const std::string& kind);
std::vector<std::string> all_kind_names();

const char* curve_channel_name(CurveChannel c);
std::optional<CurveChannel> curve_channel_from_name(const std::string& s);
const char* hsl_band_name(HslBandId b);
std::optional<HslBandId> hsl_band_from_name(const std::string& s);

// Calls f(const ParamSpec&, float&|int&) for every scalar parameter.
template <typename A, typename F>
void for_each_param(A& adj, F&& f) {
    std::visit([&](auto& a) { std::decay_t<decltype(a)>::visit(a, f); }, adj);
}

// Throws ValidationError naming the offending field.
void validate_adjustment(const Adjustment& adj);
void validate_curve_points(const std::vector<CurvePoint>& points);

bool is_identity(const Adjustment& adj);

// Spatial footprint in full-resolution pixels (0 for per-pixel operations).
int adjustment_radius(const Adjustment& adj);

bool is_lens_correction(const Adjustment& adj);

// Lens correction and transform resample the source image.
bool is_geometry(const Adjustment& adj);

// Geometry may only open the first group, which must be global, with lens
// correction before transform and at most one of each. Throws
// ValidationError naming the rule `adj` breaks when appended to `preceding`.
void check_geometry_placement(size_t group_index, bool group_is_global,
                              const std::vector<Adjustment>& preceding, const Adjustment& adj);

// Exact (bitwise for floats) parameter equality.
bool adjustments_equal(const Adjustment& a, const Adjustment& b);

} // namespace tile_develop::edit
