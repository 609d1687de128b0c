#pragma once

#include "tile_develop/core/types.hpp"

#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace tile_develop::edit {

enum class MaskOp {
    ADD,       // clamp(a + b, 0, 1)
    SUBTRACT,  // clamp(a - b, 0, 1)
    INTERSECT  // a * b
};

const char* mask_op_name(MaskOp op);
std::optional<MaskOp> mask_op_from_name(const std::string& s);

/**
 * Dense full-resolution mask (brush results, external segmentation).
 * Values are clamped to [0,1] on construction and shared immutably, so
 * copying an EditState never duplicates bitmap storage.
 */
struct MaskBitmap {
    int width = 0;
    int height = 0;
    std::shared_ptr<const Matrix2Df> values;
    std::string source; // e.g. "brush", "segmentation:sky"
    std::string digest; // SHA-256 over dimensions and sample bytes
};

MaskBitmap make_mask_bitmap(const Matrix2Df& values, std::string source = "bitmap");

struct NormPoint {
    float x = 0.0f;
    float y = 0.0f;
};

struct BitmapLeaf {
    MaskBitmap bitmap;
};

// 1 on the start side, linear falloff to 0 at the end point.
struct LinearGradientLeaf {
    NormPoint start{0.5f, 0.0f};
    NormPoint end{0.5f, 1.0f};
};

// Ellipse in normalized coordinates (radius_x relative to the width,
// radius_y relative to the height), rotated in pixel space. `feather` is
// the fraction of the radius over which the value falls from 1 to 0.
struct RadialGradientLeaf {
    NormPoint center{0.5f, 0.5f};
    float radius_x = 0.25f;
    float radius_y = 0.25f;
    float rotation_deg = 0.0f;
    float feather = 0.5f;
};

struct BrushStroke {
    std::vector<NormPoint> points;
    float radius = 20.0f;   // full-resolution pixels
    float hardness = 0.5f;  // fraction of the radius at full coverage
    bool erase = false;
};

// Vector brush strokes replayed in order: brush takes the max coverage,
// eraser multiplies by (1 - coverage).
struct BrushStrokesLeaf {
    std::vector<BrushStroke> strokes;
};

struct CombineNode {
    MaskOp op = MaskOp::ADD;
    int lhs = 0;
    int rhs = 0;
};

struct InvertNode {
    int input = 0;
};

using MaskNode = std::variant<BitmapLeaf, LinearGradientLeaf, RadialGradientLeaf,
                              BrushStrokesLeaf, CombineNode, InvertNode>;

/**
 * Mask expression stored as a flat arena in bottom-up order: every node
 * refers only to earlier nodes and the last node is the root.
 */
struct Mask {
    std::vector<MaskNode> nodes;
    float opacity = 1.0f;
    int feather_radius = 0; // full-resolution pixels

    int root() const { return static_cast<int>(nodes.size()) - 1; }
};

// One mask of a group, folded into the group weight with `op`.
struct MaskLayer {
    MaskOp op = MaskOp::ADD;
    Mask mask;
};

constexpr int kMaxFeatherRadius = 500;

class MaskBuilder {
public:
    int bitmap(MaskBitmap bitmap);
    int linear_gradient(NormPoint start, NormPoint end);
    int radial_gradient(NormPoint center, float radius_x, float radius_y,
                        float rotation_deg = 0.0f, float feather = 0.5f);
    int brush_strokes(std::vector<BrushStroke> strokes);
    int combine(MaskOp op, int lhs, int rhs);
    int invert(int input);

    // Validates and returns the mask rooted at the last added node.
    Mask build(float opacity = 1.0f, int feather_radius = 0) const;

private:
    int push(MaskNode node);

    std::vector<MaskNode> nodes_;
};

const char* mask_node_type(const MaskNode& node);

// Throws ValidationError describing the first problem found.
void validate_mask(const Mask& mask);

bool masks_equal(const Mask& a, const Mask& b);
bool mask_layers_equal(const std::vector<MaskLayer>& a, const std::vector<MaskLayer>& b);

} // namespace tile_develop::edit
