#include "tile_develop/edit/mask.hpp"
#include "tile_develop/core/errors.hpp"
#include "tile_develop/core/utils.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>

namespace tile_develop::edit {

const char* mask_op_name(MaskOp op) {
    switch (op) {
        case MaskOp::ADD: return "add";
        case MaskOp::SUBTRACT: return "subtract";
        case MaskOp::INTERSECT: return "intersect";
        default: return "add";
    }
}

std::optional<MaskOp> mask_op_from_name(const std::string& s) {
    if (s == "add") return MaskOp::ADD;
    if (s == "subtract") return MaskOp::SUBTRACT;
    if (s == "intersect") return MaskOp::INTERSECT;
    return std::nullopt;
}

MaskBitmap make_mask_bitmap(const Matrix2Df& values, std::string source) {
    if (values.size() == 0) {
        throw ValidationError("mask bitmap is empty");
    }

    auto clamped = std::make_shared<Matrix2Df>(values.rows(), values.cols());
    for (Eigen::Index i = 0; i < values.size(); ++i) {
        const float v = values.data()[i];
        clamped->data()[i] = std::isnan(v) ? 0.0f : std::min(1.0f, std::max(0.0f, v));
    }

    MaskBitmap bmp;
    bmp.width = static_cast<int>(values.cols());
    bmp.height = static_cast<int>(values.rows());
    bmp.source = std::move(source);

    const std::string header = std::to_string(bmp.width) + "x" + std::to_string(bmp.height) + ":";
    std::vector<uint8_t> bytes(header.begin(), header.end());
    const size_t payload = static_cast<size_t>(clamped->size()) * sizeof(float);
    bytes.resize(header.size() + payload);
    std::memcpy(bytes.data() + header.size(), clamped->data(), payload);
    bmp.digest = core::sha256_bytes(bytes);

    bmp.values = std::move(clamped);
    return bmp;
}

int MaskBuilder::push(MaskNode node) {
    nodes_.push_back(std::move(node));
    return static_cast<int>(nodes_.size()) - 1;
}

int MaskBuilder::bitmap(MaskBitmap bitmap) {
    return push(BitmapLeaf{std::move(bitmap)});
}

int MaskBuilder::linear_gradient(NormPoint start, NormPoint end) {
    return push(LinearGradientLeaf{start, end});
}

int MaskBuilder::radial_gradient(NormPoint center, float radius_x, float radius_y,
                                 float rotation_deg, float feather) {
    return push(RadialGradientLeaf{center, radius_x, radius_y, rotation_deg, feather});
}

int MaskBuilder::brush_strokes(std::vector<BrushStroke> strokes) {
    return push(BrushStrokesLeaf{std::move(strokes)});
}

int MaskBuilder::combine(MaskOp op, int lhs, int rhs) {
    return push(CombineNode{op, lhs, rhs});
}

int MaskBuilder::invert(int input) {
    return push(InvertNode{input});
}

Mask MaskBuilder::build(float opacity, int feather_radius) const {
    Mask m;
    m.nodes = nodes_;
    m.opacity = opacity;
    m.feather_radius = feather_radius;
    validate_mask(m);
    return m;
}

const char* mask_node_type(const MaskNode& node) {
    struct Namer {
        const char* operator()(const BitmapLeaf&) const { return "bitmap"; }
        const char* operator()(const LinearGradientLeaf&) const { return "linear_gradient"; }
        const char* operator()(const RadialGradientLeaf&) const { return "radial_gradient"; }
        const char* operator()(const BrushStrokesLeaf&) const { return "brush_strokes"; }
        const char* operator()(const CombineNode&) const { return "combine"; }
        const char* operator()(const InvertNode&) const { return "invert"; }
    };
    return std::visit(Namer{}, node);
}

namespace {

bool finite(float v) { return std::isfinite(v); }
bool finite(const NormPoint& p) { return std::isfinite(p.x) && std::isfinite(p.y); }

void fail(size_t idx, const std::string& msg) {
    throw ValidationError("mask node " + std::to_string(idx) + ": " + msg);
}

void check_ref(size_t idx, int ref) {
    if (ref < 0 || static_cast<size_t>(ref) >= idx) {
        fail(idx, "reference " + std::to_string(ref) + " does not point to an earlier node");
    }
}

void validate_node(size_t idx, const MaskNode& node) {
    if (const auto* n = std::get_if<BitmapLeaf>(&node)) {
        const auto& b = n->bitmap;
        if (!b.values || b.width <= 0 || b.height <= 0 || b.values->rows() != b.height ||
            b.values->cols() != b.width) {
            fail(idx, "bitmap dimensions do not match its data");
        }
    } else if (const auto* n = std::get_if<LinearGradientLeaf>(&node)) {
        if (!finite(n->start) || !finite(n->end)) {
            fail(idx, "linear gradient end points must be finite");
        }
        if (n->start.x == n->end.x && n->start.y == n->end.y) {
            fail(idx, "linear gradient start and end coincide");
        }
    } else if (const auto* n = std::get_if<RadialGradientLeaf>(&node)) {
        if (!finite(n->center) || !finite(n->rotation_deg)) {
            fail(idx, "radial gradient center and rotation must be finite");
        }
        if (!(n->radius_x > 0.0f) || !(n->radius_y > 0.0f) || !finite(n->radius_x) ||
            !finite(n->radius_y)) {
            fail(idx, "radial gradient radii must be positive");
        }
        if (!(n->feather >= 0.0f && n->feather <= 1.0f)) {
            fail(idx, "radial gradient feather outside [0, 1]");
        }
    } else if (const auto* n = std::get_if<BrushStrokesLeaf>(&node)) {
        for (size_t s = 0; s < n->strokes.size(); ++s) {
            const auto& st = n->strokes[s];
            if (st.points.empty()) {
                fail(idx, "brush stroke " + std::to_string(s) + " has no points");
            }
            if (!(st.radius > 0.0f) || !finite(st.radius)) {
                fail(idx, "brush stroke " + std::to_string(s) + " radius must be positive");
            }
            if (!(st.hardness >= 0.0f && st.hardness <= 1.0f)) {
                fail(idx, "brush stroke " + std::to_string(s) + " hardness outside [0, 1]");
            }
            for (const auto& p : st.points) {
                if (!finite(p)) {
                    fail(idx, "brush stroke " + std::to_string(s) + " has a non-finite point");
                }
            }
        }
    } else if (const auto* n = std::get_if<CombineNode>(&node)) {
        check_ref(idx, n->lhs);
        check_ref(idx, n->rhs);
    } else if (const auto* n = std::get_if<InvertNode>(&node)) {
        check_ref(idx, n->input);
    }
}

bool points_equal(const NormPoint& a, const NormPoint& b) {
    return a.x == b.x && a.y == b.y;
}

bool nodes_equal(const MaskNode& a, const MaskNode& b) {
    if (a.index() != b.index()) {
        return false;
    }
    if (const auto* x = std::get_if<BitmapLeaf>(&a)) {
        const auto& y = std::get<BitmapLeaf>(b);
        return x->bitmap.width == y.bitmap.width && x->bitmap.height == y.bitmap.height &&
               x->bitmap.source == y.bitmap.source && x->bitmap.digest == y.bitmap.digest;
    }
    if (const auto* x = std::get_if<LinearGradientLeaf>(&a)) {
        const auto& y = std::get<LinearGradientLeaf>(b);
        return points_equal(x->start, y.start) && points_equal(x->end, y.end);
    }
    if (const auto* x = std::get_if<RadialGradientLeaf>(&a)) {
        const auto& y = std::get<RadialGradientLeaf>(b);
        return points_equal(x->center, y.center) && x->radius_x == y.radius_x &&
               x->radius_y == y.radius_y && x->rotation_deg == y.rotation_deg &&
               x->feather == y.feather;
    }
    if (const auto* x = std::get_if<BrushStrokesLeaf>(&a)) {
        const auto& y = std::get<BrushStrokesLeaf>(b);
        if (x->strokes.size() != y.strokes.size()) return false;
        for (size_t i = 0; i < x->strokes.size(); ++i) {
            const auto& sa = x->strokes[i];
            const auto& sb = y.strokes[i];
            if (sa.radius != sb.radius || sa.hardness != sb.hardness || sa.erase != sb.erase ||
                sa.points.size() != sb.points.size()) {
                return false;
            }
            for (size_t p = 0; p < sa.points.size(); ++p) {
                if (!points_equal(sa.points[p], sb.points[p])) return false;
            }
        }
        return true;
    }
    if (const auto* x = std::get_if<CombineNode>(&a)) {
        const auto& y = std::get<CombineNode>(b);
        return x->op == y.op && x->lhs == y.lhs && x->rhs == y.rhs;
    }
    return std::get<InvertNode>(a).input == std::get<InvertNode>(b).input;
}

} // namespace

void validate_mask(const Mask& mask) {
    if (mask.nodes.empty()) {
        throw ValidationError("mask has no nodes");
    }
    if (!(mask.opacity >= 0.0f && mask.opacity <= 1.0f)) {
        throw ValidationError("mask opacity " + std::to_string(mask.opacity) +
                              " outside [0, 1]");
    }
    if (mask.feather_radius < 0 || mask.feather_radius > kMaxFeatherRadius) {
        throw ValidationError("mask feather radius " + std::to_string(mask.feather_radius) +
                              " outside [0, " + std::to_string(kMaxFeatherRadius) + "]");
    }
    for (size_t i = 0; i < mask.nodes.size(); ++i) {
        validate_node(i, mask.nodes[i]);
    }
}

bool masks_equal(const Mask& a, const Mask& b) {
    if (a.opacity != b.opacity || a.feather_radius != b.feather_radius ||
        a.nodes.size() != b.nodes.size()) {
        return false;
    }
    for (size_t i = 0; i < a.nodes.size(); ++i) {
        if (!nodes_equal(a.nodes[i], b.nodes[i])) {
            return false;
        }
    }
    return true;
}

bool mask_layers_equal(const std::vector<MaskLayer>& a, const std::vector<MaskLayer>& b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        if (a[i].op != b[i].op || !masks_equal(a[i].mask, b[i].mask)) {
            return false;
        }
    }
    return true;
}

} // namespace tile_develop::edit
