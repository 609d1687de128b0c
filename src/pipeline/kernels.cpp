#include "tile_develop/pipeline/kernels.hpp"
#include "tile_develop/pipeline/backend.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>

namespace tile_develop::pipeline {

using namespace tile_develop::edit;

namespace {

constexpr float kLumaR = 0.2126f;
constexpr float kLumaG = 0.7152f;
constexpr float kLumaB = 0.0722f;
constexpr float kClarityGain = 0.6f;
constexpr float kGrainGain = 0.1f;
constexpr double kPi = 3.14159265358979323846;

inline float luma(float r, float g, float b) {
    return kLumaR * r + kLumaG * g + kLumaB * b;
}

inline float clamp01(float v) {
    return std::min(1.0f, std::max(0.0f, v));
}

Matrix2Df blur(const KernelContext& ctx, const Matrix2Df& plane, int radius) {
    if (ctx.backend) {
        return ctx.backend->blur(plane, radius, image::SampleRange::EXTENDED, ctx.hdr_sample_max);
    }
    return image::separable_blur(plane, radius, image::SampleRange::EXTENDED, ctx.hdr_sample_max);
}

Matrix2Df luma_plane(const RgbPlanes& p) {
    Matrix2Df y(p.R.rows(), p.R.cols());
    const Eigen::Index n = y.size();
    for (Eigen::Index i = 0; i < n; ++i) {
        y.data()[i] = luma(p.R.data()[i], p.G.data()[i], p.B.data()[i]);
    }
    return y;
}

// h in degrees [0, 360), s and l in [0, 1].
void rgb_to_hsl(float r, float g, float b, float& h, float& s, float& l) {
    const float maxc = std::max({r, g, b});
    const float minc = std::min({r, g, b});
    l = 0.5f * (maxc + minc);
    const float d = maxc - minc;
    if (d <= 1e-6f) {
        h = 0.0f;
        s = 0.0f;
        return;
    }
    s = l > 0.5f ? d / (2.0f - maxc - minc) : d / (maxc + minc);
    if (maxc == r) {
        h = (g - b) / d + (g < b ? 6.0f : 0.0f);
    } else if (maxc == g) {
        h = (b - r) / d + 2.0f;
    } else {
        h = (r - g) / d + 4.0f;
    }
    h *= 60.0f;
}

float hue_to_channel(float p, float q, float t) {
    if (t < 0.0f) t += 1.0f;
    if (t > 1.0f) t -= 1.0f;
    if (t < 1.0f / 6.0f) return p + (q - p) * 6.0f * t;
    if (t < 0.5f) return q;
    if (t < 2.0f / 3.0f) return p + (q - p) * (2.0f / 3.0f - t) * 6.0f;
    return p;
}

void hsl_to_rgb(float h, float s, float l, float& r, float& g, float& b) {
    if (s <= 0.0f) {
        r = g = b = l;
        return;
    }
    const float q = l < 0.5f ? l * (1.0f + s) : l + s - l * s;
    const float p = 2.0f * l - q;
    const float hn = h / 360.0f;
    r = hue_to_channel(p, q, hn + 1.0f / 3.0f);
    g = hue_to_channel(p, q, hn);
    b = hue_to_channel(p, q, hn - 1.0f / 3.0f);
}

HslBandId band_of_hue(float h) {
    if (h >= 345.0f || h < 15.0f) return HslBandId::REDS;
    if (h < 45.0f) return HslBandId::ORANGES;
    if (h < 75.0f) return HslBandId::YELLOWS;
    if (h < 165.0f) return HslBandId::GREENS;
    if (h < 195.0f) return HslBandId::CYANS;
    if (h < 255.0f) return HslBandId::BLUES;
    if (h < 285.0f) return HslBandId::PURPLES;
    return HslBandId::MAGENTAS;
}

float sample_bilinear(const Matrix2Df& plane, float x, float y) {
    const int w = static_cast<int>(plane.cols());
    const int h = static_cast<int>(plane.rows());
    x = std::min(std::max(x, 0.0f), static_cast<float>(w - 1));
    y = std::min(std::max(y, 0.0f), static_cast<float>(h - 1));
    const int x0 = static_cast<int>(std::floor(x));
    const int y0 = static_cast<int>(std::floor(y));
    const int x1 = std::min(x0 + 1, w - 1);
    const int y1 = std::min(y0 + 1, h - 1);
    const float fx = x - static_cast<float>(x0);
    const float fy = y - static_cast<float>(y0);
    const float top = plane(y0, x0) * (1.0f - fx) + plane(y0, x1) * fx;
    const float bot = plane(y1, x0) * (1.0f - fx) + plane(y1, x1) * fx;
    return top * (1.0f - fy) + bot * fy;
}

// Output position -> position in the lens-corrected image, both relative
// to the image center and normalized by the longer half extent.
void invert_transform(const Transform& t, double half_w, double half_h, double& x, double& y) {
    const double n = std::max(half_w, half_h);
    x -= t.x_offset / 100.0 * half_w / n;
    y -= t.y_offset / 100.0 * half_h / n;

    const double s = t.scale / 100.0;
    x /= s;
    y /= s;

    const double a = t.aspect / 100.0;
    if (a > 0.0) {
        x /= 1.0 + 0.5 * a;
    } else {
        y /= 1.0 - 0.5 * a;
    }

    const double theta = -t.rotate * kPi / 180.0;
    const double c = std::cos(theta);
    const double sn = std::sin(theta);
    const double rx = x * c - y * sn;
    const double ry = x * sn + y * c;
    x = rx;
    y = ry;

    // Keystone as a projective divide.
    const double w = std::max(0.05, 1.0 + 0.5 * (t.horizontal / 100.0) * x +
                                        0.5 * (t.vertical / 100.0) * y);
    x /= w;
    y /= w;

    const double k = 1.0 + 0.25 * (t.distortion / 100.0) * (x * x + y * y);
    x *= k;
    y *= k;
}

// One bilinear resample of the source through the lens model and then the
// transform; either may be null. Reads only ctx.source, never the buffer.
void resample_geometry(const LensCorrection* lens, const Transform* transform, RgbPlanes& p,
                       const KernelContext& ctx) {
    if (!ctx.source) {
        return;
    }
    const double cx = 0.5 * ctx.image_width;
    const double cy = 0.5 * ctx.image_height;
    const double n = std::max(cx, cy);
    const double diag = std::sqrt(cx * cx + cy * cy);

    double red_scale = 1.0;
    double blue_scale = 1.0;
    if (lens && lens->shifts_channels()) {
        red_scale = 1.0 + lens->tca_amount * (lens->tca_red - 1.0);
        blue_scale = 1.0 + lens->tca_amount * (lens->tca_blue - 1.0);
    }

    const int w = static_cast<int>(p.R.cols());
    const Eigen::Index count = p.R.size();
    for (Eigen::Index i = 0; i < count; ++i) {
        const int gx = ctx.region.x + static_cast<int>(i % w);
        const int gy = ctx.region.y + static_cast<int>(i / w);
        double x = gx + 0.5 - cx;
        double y = gy + 0.5 - cy;
        if (transform) {
            x /= n;
            y /= n;
            invert_transform(*transform, cx, cy, x, y);
            x *= n;
            y *= n;
        }

        double k = 1.0;
        double gain = 1.0;
        if (lens) {
            const double r2 = (x * x + y * y) / (diag * diag);
            if (lens->distorts()) {
                k += lens->distortion_amount *
                     (lens->k1 * r2 + lens->k2 * r2 * r2 + lens->k3 * r2 * r2 * r2);
            }
            if (lens->corrects_vignetting()) {
                const double s2 = r2 * k * k;
                const double v = 1.0 + lens->vig_k1 * s2 + lens->vig_k2 * s2 * s2 +
                                 lens->vig_k3 * s2 * s2 * s2;
                gain = 1.0 + lens->vignette_amount * (1.0 / std::max(0.05, v) - 1.0);
            }
        }

        const auto at = [&](const Matrix2Df& plane, double channel_scale) {
            const double f = k * channel_scale;
            return sample_bilinear(plane, static_cast<float>(cx + x * f - 0.5),
                                   static_cast<float>(cy + y * f - 0.5));
        };
        const float g = static_cast<float>(gain);
        p.R.data()[i] = at(ctx.source->R, red_scale) * g;
        p.G.data()[i] = at(ctx.source->G, 1.0) * g;
        p.B.data()[i] = at(ctx.source->B, blue_scale) * g;
    }
}

struct KernelVisitor {
    RgbPlanes& p;
    const KernelContext& ctx;

    Eigen::Index size() const { return p.R.size(); }
    int cols() const { return static_cast<int>(p.R.cols()); }

    template <typename F>
    void per_pixel(F&& fn) {
        float* r = p.R.data();
        float* g = p.G.data();
        float* b = p.B.data();
        for (Eigen::Index i = 0; i < size(); ++i) {
            fn(r[i], g[i], b[i], i);
        }
    }

    void operator()(const Exposure& a) {
        const float m = std::exp2(a.ev);
        p.R *= m;
        p.G *= m;
        p.B *= m;
    }

    void operator()(const Contrast& a) {
        const float f = std::max(0.0f, 1.0f + a.amount * 1.4f);
        per_pixel([&](float& r, float& g, float& b, Eigen::Index) {
            r = (r - 0.5f) * f + 0.5f;
            g = (g - 0.5f) * f + 0.5f;
            b = (b - 0.5f) * f + 0.5f;
        });
    }

    void operator()(const Tone& a) {
        per_pixel([&](float& r, float& g, float& b, Eigen::Index) {
            const float l = luma(r, g, b);
            float nl = l;
            if (a.highlights != 0.0f && l > 0.5f) {
                const float t = std::min(1.0f, (l - 0.5f) * 2.0f);
                nl += a.highlights * t * (1.0f - l);
            }
            if (a.shadows != 0.0f && l < 0.5f) {
                const float t = std::min(1.0f, (0.5f - l) * 2.0f);
                nl += a.shadows * t * (0.5f - l);
            }
            const float shift = nl - l;
            r += shift;
            g += shift;
            b += shift;

            if (a.whites != 0.0f || a.blacks != 0.0f) {
                const float l2 = clamp01(luma(r, g, b));
                const float f = (1.0f + a.whites * l2) * (1.0f + a.blacks * (1.0f - l2));
                r *= f;
                g *= f;
                b *= f;
            }
        });
    }

    void operator()(const WhiteBalance& a) {
        const float temp = a.temperature * 0.1f;
        const float tint = a.tint * 0.1f;
        const float rb = temp - tint * 0.05f;
        const float gs = tint * 0.1f;
        p.R.array() += rb;
        p.B.array() -= rb;
        p.G.array() += gs;
    }

    void operator()(const Saturation& a) {
        per_pixel([&](float& r, float& g, float& b, Eigen::Index) {
            const float l = luma(r, g, b);
            float scale = 1.0f + a.saturation;
            if (a.vibrance != 0.0f) {
                const float maxc = std::max({r, g, b});
                const float minc = std::min({r, g, b});
                const float sat = maxc > 1e-6f ? clamp01((maxc - minc) / maxc) : 0.0f;
                scale *= 1.0f + a.vibrance * (1.0f - sat);
            }
            r = l + (r - l) * scale;
            g = l + (g - l) * scale;
            b = l + (b - l) * scale;
        });
    }

    void operator()(const Curve& a) {
        const ToneCurve curve(a.points);
        switch (a.channel) {
            case CurveChannel::RGB:
                per_pixel([&](float& r, float& g, float& b, Eigen::Index) {
                    r = curve(r);
                    g = curve(g);
                    b = curve(b);
                });
                break;
            case CurveChannel::RED:
                p.R = p.R.unaryExpr([&](float v) { return curve(v); });
                break;
            case CurveChannel::GREEN:
                p.G = p.G.unaryExpr([&](float v) { return curve(v); });
                break;
            case CurveChannel::BLUE:
                p.B = p.B.unaryExpr([&](float v) { return curve(v); });
                break;
        }
    }

    void operator()(const HslBand& a) {
        per_pixel([&](float& r, float& g, float& b, Eigen::Index) {
            float h = 0.0f, s = 0.0f, l = 0.0f;
            rgb_to_hsl(clamp01(r), clamp01(g), clamp01(b), h, s, l);
            if (s <= 0.0f || band_of_hue(h) != a.band) {
                return;
            }
            h = std::fmod(h + a.hue + 360.0f, 360.0f);
            s = clamp01(s * (1.0f + a.saturation / 100.0f));
            l = clamp01(l * (1.0f + a.lightness / 100.0f));
            hsl_to_rgb(h, s, l, r, g, b);
        });
    }

    void operator()(const ColorGrade& a) {
        per_pixel([&](float& r, float& g, float& b, Eigen::Index) {
            const float l = 0.299f * r + 0.587f * g + 0.114f * b;
            const ColorWheel& w = l < 0.33f ? a.shadows : (l <= 0.67f ? a.midtones : a.highlights);
            if (w.intensity == 0.0f) {
                return;
            }
            const float dx = w.x * w.intensity * 0.1f;
            const float dy = w.y * w.intensity * 0.1f;
            r += dx;
            g += dy;
            b -= dx;
        });
    }

    void operator()(const Clarity& a) {
        const int radius = scaled_radius(a.radius, ctx.scale);
        const Matrix2Df y = luma_plane(p);
        const Matrix2Df base = blur(ctx, y, radius);
        per_pixel([&](float& r, float& g, float& b, Eigen::Index i) {
            const float yi = y.data()[i];
            const float mid = 1.0f - std::min(1.0f, std::abs(yi - 0.5f) * 2.0f);
            const float delta = a.amount * kClarityGain * mid * (yi - base.data()[i]);
            r += delta;
            g += delta;
            b += delta;
        });
    }

    void operator()(const Sharpen& a) {
        const int radius = scaled_radius(a.radius, ctx.scale);
        for (Matrix2Df* plane : {&p.R, &p.G, &p.B}) {
            const Matrix2Df blurred = blur(ctx, *plane, radius);
            *plane = *plane + a.amount * (*plane - blurred);
        }
    }

    void operator()(const NoiseReduction& a) {
        const int radius = scaled_radius(a.radius, ctx.scale);
        const Matrix2Df y = luma_plane(p);
        const Matrix2Df smooth = blur(ctx, y, radius);
        per_pixel([&](float& r, float& g, float& b, Eigen::Index i) {
            const float shift = a.luminance * (smooth.data()[i] - y.data()[i]);
            r += shift;
            g += shift;
            b += shift;
        });
    }

    void operator()(const Vignette& a) {
        const float exponent = 2.0f * (0.5f + a.midpoint);
        const int w = cols();
        per_pixel([&](float& r, float& g, float& b, Eigen::Index i) {
            const int gx = ctx.region.x + static_cast<int>(i % w);
            const int gy = ctx.region.y + static_cast<int>(i / w);
            const float xn = ((gx + 0.5f) / ctx.image_width - 0.5f) * 2.0f;
            const float yn = ((gy + 0.5f) / ctx.image_height - 0.5f) * 2.0f;
            const float dist = std::min(1.0f, std::sqrt(xn * xn + yn * yn) * 0.7071f);
            const float f = 1.0f - a.amount * std::pow(dist, exponent);
            r *= f;
            g *= f;
            b *= f;
        });
    }

    void operator()(const Grain& a) {
        const int w = cols();
        const double inv_scale = 1.0 / ctx.scale;
        per_pixel([&](float& r, float& g, float& b, Eigen::Index i) {
            const int gx = ctx.region.x + static_cast<int>(i % w);
            const int gy = ctx.region.y + static_cast<int>(i / w);
            const int cx = static_cast<int>(std::floor((gx + 0.5) * inv_scale / a.size));
            const int cy = static_cast<int>(std::floor((gy + 0.5) * inv_scale / a.size));
            const float n = a.amount * kGrainGain * grain_noise(cx, cy, a.seed);
            r += n;
            g += n;
            b += n;
        });
    }

    // Resample the whole source, so the result does not depend on the halo.
    void operator()(const LensCorrection& a) { resample_geometry(&a, nullptr, p, ctx); }
    void operator()(const Transform& a) { resample_geometry(nullptr, &a, p, ctx); }
};

} // namespace

bool is_known_kernel(const std::string& name) {
    const auto names = all_kind_names();
    return std::find(names.begin(), names.end(), name) != names.end();
}

bool is_color_only(const Adjustment& adj) {
    return !(std::holds_alternative<Clarity>(adj) || std::holds_alternative<Sharpen>(adj) ||
             std::holds_alternative<NoiseReduction>(adj) || std::holds_alternative<Vignette>(adj) ||
             std::holds_alternative<Grain>(adj) || is_geometry(adj));
}

void apply_adjustment(const Adjustment& adj, RgbPlanes& planes, const KernelContext& ctx) {
    std::visit(KernelVisitor{planes, ctx}, adj);
}

size_t apply_geometry(const std::vector<Adjustment>& adjustments, RgbPlanes& planes,
                      const KernelContext& ctx) {
    const LensCorrection* lens = nullptr;
    const Transform* transform = nullptr;
    size_t n = 0;
    for (; n < adjustments.size() && is_geometry(adjustments[n]); ++n) {
        if (const auto* l = std::get_if<LensCorrection>(&adjustments[n])) {
            lens = l;
        } else {
            transform = std::get_if<Transform>(&adjustments[n]);
        }
    }
    if (n > 0) {
        resample_geometry(lens, transform, planes, ctx);
    }
    return n;
}

ToneCurve::ToneCurve(const std::vector<CurvePoint>& points) {
    for (const auto& pt : points) {
        xs_.push_back(pt.x);
        ys_.push_back(pt.y);
    }
    const size_t n = xs_.size();
    slopes_.assign(n, 0.0f);
    if (n < 2) {
        return;
    }

    std::vector<float> d(n - 1);
    for (size_t k = 0; k + 1 < n; ++k) {
        d[k] = (ys_[k + 1] - ys_[k]) / (xs_[k + 1] - xs_[k]);
    }
    slopes_[0] = d[0];
    slopes_[n - 1] = d[n - 2];
    for (size_t k = 1; k + 1 < n; ++k) {
        slopes_[k] = (d[k - 1] * d[k] <= 0.0f) ? 0.0f : 0.5f * (d[k - 1] + d[k]);
    }
    for (size_t k = 0; k + 1 < n; ++k) {
        if (d[k] == 0.0f) {
            slopes_[k] = 0.0f;
            slopes_[k + 1] = 0.0f;
            continue;
        }
        const float a = slopes_[k] / d[k];
        const float b = slopes_[k + 1] / d[k];
        const float s = a * a + b * b;
        if (s > 9.0f) {
            const float t = 3.0f / std::sqrt(s);
            slopes_[k] = t * a * d[k];
            slopes_[k + 1] = t * b * d[k];
        }
    }
}

float ToneCurve::operator()(float x) const {
    const size_t n = xs_.size();
    if (n == 0) return x;
    if (n == 1) return ys_[0];
    if (x <= xs_.front()) {
        return ys_.front() + slopes_.front() * (x - xs_.front());
    }
    if (x >= xs_.back()) {
        return ys_.back() + slopes_.back() * (x - xs_.back());
    }

    const size_t k = static_cast<size_t>(std::upper_bound(xs_.begin(), xs_.end(), x) - xs_.begin()) - 1;
    const float h = xs_[k + 1] - xs_[k];
    const float t = (x - xs_[k]) / h;
    const float t2 = t * t;
    const float t3 = t2 * t;
    return (2.0f * t3 - 3.0f * t2 + 1.0f) * ys_[k] + (t3 - 2.0f * t2 + t) * h * slopes_[k] +
           (-2.0f * t3 + 3.0f * t2) * ys_[k + 1] + (t3 - t2) * h * slopes_[k + 1];
}

float grain_noise(int cell_x, int cell_y, int seed) {
    uint32_t h = static_cast<uint32_t>(seed) * 0x9E3779B1u;
    h ^= static_cast<uint32_t>(cell_x) * 0x85EBCA6Bu;
    h = (h << 13) | (h >> 19);
    h ^= static_cast<uint32_t>(cell_y) * 0xC2B2AE35u;
    h ^= h >> 16;
    h *= 0x85EBCA6Bu;
    h ^= h >> 13;
    h *= 0xC2B2AE35u;
    h ^= h >> 16;
    return static_cast<float>(h & 0xFFFFFFu) / static_cast<float>(0xFFFFFFu) * 2.0f - 1.0f;
}

} // namespace tile_develop::pipeline
