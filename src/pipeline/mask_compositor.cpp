#include "tile_develop/pipeline/mask_compositor.hpp"
#include "tile_develop/core/errors.hpp"
#include "tile_develop/image/convolution.hpp"
#include "tile_develop/image/image.hpp"
#include "tile_develop/pipeline/backend.hpp"
#include "tile_develop/pipeline/compiler.hpp"
#include "tile_develop/pipeline/tile_scheduler.hpp"

#include <algorithm>
#include <cmath>

namespace tile_develop::pipeline {

using namespace tile_develop::edit;

namespace {

constexpr size_t kMaxResampledBitmaps = 16;
constexpr double kPi = 3.14159265358979323846;

inline float smoothstep01(float t) {
    t = std::min(1.0f, std::max(0.0f, t));
    return t * t * (3.0f - 2.0f * t);
}

// Full-resolution pixel-center coordinates of render-scale pixel (gx, gy).
struct PixelMapper {
    double sx;
    double sy;

    explicit PixelMapper(const MaskRaster& r)
        : sx(static_cast<double>(r.full_width) / r.image_width),
          sy(static_cast<double>(r.full_height) / r.image_height) {}

    double fx(int gx) const { return (gx + 0.5) * sx; }
    double fy(int gy) const { return (gy + 0.5) * sy; }
};

Matrix2Df linear_gradient(const LinearGradientLeaf& n, const MaskRaster& r) {
    const PixelMapper map(r);
    const double W = r.full_width;
    const double H = r.full_height;
    const double sx = n.start.x * W;
    const double sy = n.start.y * H;
    const double ex = n.end.x * W - sx;
    const double ey = n.end.y * H - sy;
    const double len2 = ex * ex + ey * ey;

    Matrix2Df out(r.region.height, r.region.width);
    for (int y = 0; y < r.region.height; ++y) {
        const double py = map.fy(r.region.y + y) - sy;
        for (int x = 0; x < r.region.width; ++x) {
            const double px = map.fx(r.region.x + x) - sx;
            const double t = (px * ex + py * ey) / len2;
            out(y, x) = static_cast<float>(1.0 - std::min(1.0, std::max(0.0, t)));
        }
    }
    return out;
}

Matrix2Df radial_gradient(const RadialGradientLeaf& n, const MaskRaster& r) {
    const PixelMapper map(r);
    const double W = r.full_width;
    const double H = r.full_height;
    const double cx = n.center.x * W;
    const double cy = n.center.y * H;
    const double rx = n.radius_x * W;
    const double ry = n.radius_y * H;
    const double theta = n.rotation_deg * kPi / 180.0;
    const double c = std::cos(theta);
    const double s = std::sin(theta);
    const float inner = 1.0f - n.feather;

    Matrix2Df out(r.region.height, r.region.width);
    for (int y = 0; y < r.region.height; ++y) {
        const double dy = map.fy(r.region.y + y) - cy;
        for (int x = 0; x < r.region.width; ++x) {
            const double dx = map.fx(r.region.x + x) - cx;
            const double u = (dx * c + dy * s) / rx;
            const double v = (-dx * s + dy * c) / ry;
            const float d = static_cast<float>(std::sqrt(u * u + v * v));
            float value;
            if (d <= inner) {
                value = 1.0f;
            } else if (d >= 1.0f) {
                value = 0.0f;
            } else {
                value = 1.0f - smoothstep01((d - inner) / (1.0f - inner));
            }
            out(y, x) = value;
        }
    }
    return out;
}

double segment_distance(double px, double py, double ax, double ay, double bx, double by) {
    const double vx = bx - ax;
    const double vy = by - ay;
    const double len2 = vx * vx + vy * vy;
    double t = 0.0;
    if (len2 > 0.0) {
        t = std::min(1.0, std::max(0.0, ((px - ax) * vx + (py - ay) * vy) / len2));
    }
    const double dx = px - (ax + t * vx);
    const double dy = py - (ay + t * vy);
    return std::sqrt(dx * dx + dy * dy);
}

Matrix2Df brush_strokes(const BrushStrokesLeaf& n, const MaskRaster& r) {
    const PixelMapper map(r);
    const double W = r.full_width;
    const double H = r.full_height;
    Matrix2Df out = Matrix2Df::Zero(r.region.height, r.region.width);

    for (const auto& stroke : n.strokes) {
        std::vector<double> xs;
        std::vector<double> ys;
        double minx = 1e300, miny = 1e300, maxx = -1e300, maxy = -1e300;
        for (const auto& p : stroke.points) {
            xs.push_back(p.x * W);
            ys.push_back(p.y * H);
            minx = std::min(minx, xs.back());
            maxx = std::max(maxx, xs.back());
            miny = std::min(miny, ys.back());
            maxy = std::max(maxy, ys.back());
        }
        const double R = stroke.radius;
        const double hard = stroke.hardness * R;

        // Render-scale bounding box of the stroke inside this region.
        const int x0 = std::max(0, static_cast<int>(std::floor((minx - R) / map.sx)) - r.region.x);
        const int x1 = std::min(r.region.width - 1,
                                static_cast<int>(std::ceil((maxx + R) / map.sx)) - r.region.x);
        const int y0 = std::max(0, static_cast<int>(std::floor((miny - R) / map.sy)) - r.region.y);
        const int y1 = std::min(r.region.height - 1,
                                static_cast<int>(std::ceil((maxy + R) / map.sy)) - r.region.y);

        for (int y = y0; y <= y1; ++y) {
            const double py = map.fy(r.region.y + y);
            for (int x = x0; x <= x1; ++x) {
                const double px = map.fx(r.region.x + x);
                double d = segment_distance(px, py, xs[0], ys[0], xs[0], ys[0]);
                for (size_t k = 1; k < xs.size(); ++k) {
                    d = std::min(d, segment_distance(px, py, xs[k - 1], ys[k - 1], xs[k], ys[k]));
                }
                float coverage;
                if (d <= hard) {
                    coverage = 1.0f;
                } else if (d >= R) {
                    coverage = 0.0f;
                } else {
                    coverage = 1.0f - smoothstep01(static_cast<float>((d - hard) / (R - hard)));
                }
                if (coverage <= 0.0f) {
                    continue;
                }
                float& v = out(y, x);
                v = stroke.erase ? v * (1.0f - coverage) : std::max(v, coverage);
            }
        }
    }
    return out;
}

} // namespace

Matrix2Df combine_masks(MaskOp op, const Matrix2Df& a, const Matrix2Df& b) {
    switch (op) {
        case MaskOp::ADD:
            return (a + b).cwiseMax(0.0f).cwiseMin(1.0f);
        case MaskOp::SUBTRACT:
            return (a - b).cwiseMax(0.0f).cwiseMin(1.0f);
        case MaskOp::INTERSECT:
            return a.cwiseProduct(b);
    }
    throw ValidationError("unknown mask op");
}

MaskCompositor::MaskCompositor(ComputeBackend* backend)
    : backend_(backend) {}

size_t MaskCompositor::cached_bitmaps() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return resampled_.size();
}

std::shared_ptr<const Matrix2Df> MaskCompositor::bitmap_at_scale(const MaskBitmap& bitmap,
                                                                 int width, int height) const {
    const std::string key = bitmap.digest + "@" + std::to_string(width) + "x" +
                            std::to_string(height);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = resampled_.find(key);
        if (it != resampled_.end()) {
            return it->second;
        }
    }

    auto plane = std::make_shared<const Matrix2Df>(
        image::resample_plane(*bitmap.values, width, height));

    std::lock_guard<std::mutex> lock(mutex_);
    if (resampled_.size() >= kMaxResampledBitmaps) {
        resampled_.erase(resampled_.begin());
    }
    resampled_.emplace(key, plane);
    return plane;
}

Matrix2Df MaskCompositor::rasterize_leaf(const MaskNode& node, const MaskRaster& r) const {
    if (const auto* n = std::get_if<BitmapLeaf>(&node)) {
        auto plane = bitmap_at_scale(n->bitmap, r.image_width, r.image_height);
        return plane->block(r.region.y, r.region.x, r.region.height, r.region.width);
    }
    if (const auto* n = std::get_if<LinearGradientLeaf>(&node)) {
        return linear_gradient(*n, r);
    }
    if (const auto* n = std::get_if<RadialGradientLeaf>(&node)) {
        return radial_gradient(*n, r);
    }
    if (const auto* n = std::get_if<BrushStrokesLeaf>(&node)) {
        return brush_strokes(*n, r);
    }
    throw ValidationError(std::string("mask node '") + mask_node_type(node) + "' is not a leaf");
}

Matrix2Df MaskCompositor::rasterize_node(const Mask& mask, int node, const MaskRaster& r) const {
    if (node < 0 || node >= static_cast<int>(mask.nodes.size())) {
        throw ValidationError("mask node " + std::to_string(node) + " out of range");
    }

    std::vector<Matrix2Df> values(static_cast<size_t>(node) + 1);
    for (int i = 0; i <= node; ++i) {
        const MaskNode& n = mask.nodes[static_cast<size_t>(i)];
        if (const auto* c = std::get_if<CombineNode>(&n)) {
            values[i] = combine_masks(c->op, values[c->lhs], values[c->rhs]);
        } else if (const auto* inv = std::get_if<InvertNode>(&n)) {
            values[i] = (1.0f - values[inv->input].array()).matrix();
        } else {
            values[i] = rasterize_leaf(n, r);
        }
    }
    return std::move(values[static_cast<size_t>(node)]);
}

Matrix2Df MaskCompositor::evaluate_mask(const Mask& mask, const MaskRaster& r) const {
    const int radius = scaled_radius(mask.feather_radius, r.scale);
    Matrix2Df m;
    if (radius > 0) {
        // Feather on a raster grown by the radius so every region pixel sees
        // the same neighbourhood as in the whole image.
        MaskRaster grown = r;
        grown.region = grow_region(r.region, radius, r.image_width, r.image_height);
        Matrix2Df raw = rasterize_node(mask, mask.root(), grown);
        raw = backend_ ? backend_->blur(raw, radius, image::SampleRange::NORMALIZED,
                                        image::kDefaultHdrSampleMax)
                       : image::separable_blur(raw, radius, image::SampleRange::NORMALIZED);
        m = raw.block(r.region.y - grown.region.y, r.region.x - grown.region.x,
                      r.region.height, r.region.width);
    } else {
        m = rasterize_node(mask, mask.root(), r);
    }
    if (mask.opacity != 1.0f) {
        m *= mask.opacity;
    }
    return m;
}

Matrix2Df MaskCompositor::evaluate_group(const AdjustmentGroup& group, const MaskRaster& r) const {
    if (group.is_global()) {
        return Matrix2Df::Constant(r.region.height, r.region.width, group.opacity);
    }

    Matrix2Df acc = Matrix2Df::Zero(r.region.height, r.region.width);
    for (const auto& layer : group.masks) {
        acc = combine_masks(layer.op, acc, evaluate_mask(layer.mask, r));
    }
    if (group.opacity != 1.0f) {
        acc *= group.opacity;
    }
    return acc;
}

} // namespace tile_develop::pipeline
