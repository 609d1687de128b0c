#include "tile_develop/pipeline/compiler.hpp"
#include "tile_develop/core/errors.hpp"
#include "tile_develop/core/utils.hpp"
#include "tile_develop/edit/serialization.hpp"
#include "tile_develop/image/image.hpp"

#include <algorithm>
#include <cmath>

namespace tile_develop::pipeline {

const std::string& CompiledPipeline::content_hash() const {
    return passes.empty() ? root_key : passes.back().cache_key;
}

int CompiledPipeline::max_radius() const {
    int r = 0;
    for (const auto& p : passes) {
        r = std::max(r, p.radius);
    }
    return r;
}

int scaled_radius(int radius, double scale) {
    if (radius <= 0) {
        return 0;
    }
    const double s = std::min(1.0, std::max(0.0, scale));
    return std::max(1, static_cast<int>(std::lround(radius * s)));
}

CompiledPipeline compile(const edit::EditState& state, const ImageId& image_id,
                         int full_width, int full_height, double scale) {
    if (full_width <= 0 || full_height <= 0) {
        throw PipelineError("cannot compile for an empty image");
    }
    if (!(scale > 0.0)) {
        throw PipelineError("render scale must be positive");
    }

    CompiledPipeline out;
    out.image_id = image_id;
    out.full_width = full_width;
    out.full_height = full_height;
    out.scale = std::min(1.0, scale);
    out.width = image::scaled_extent(full_width, out.scale);
    out.height = image::scaled_extent(full_height, out.scale);

    // json keeps the shortest round-trip form of the double.
    const std::string scale_repr = edit::json(out.scale).dump();
    out.root_key = core::sha256_string(image_id + "|" + std::to_string(full_width) + "x" +
                                       std::to_string(full_height) + "|" +
                                       std::to_string(out.width) + "x" +
                                       std::to_string(out.height) + "|" + scale_repr);

    std::string prev_key = out.root_key;
    int footprint_sum = 0;
    for (const auto& group : state.groups()) {
        if (!group.enabled) {
            continue;
        }

        Pass pass;
        pass.id = static_cast<int>(out.passes.size());
        pass.group_id = group.id;
        pass.group = group;
        pass.group.adjustments.clear();
        pass.input = pass.id == 0 ? "source" : "pass:" + std::to_string(pass.id - 1);
        pass.output = "pass:" + std::to_string(pass.id);

        int blur_chain = 0;
        for (const auto& adj : group.adjustments) {
            if (edit::is_identity(adj)) {
                continue;
            }
            pass.kernels.emplace_back(edit::kind_name(adj));
            pass.group.adjustments.push_back(adj);
            const int r = scaled_radius(edit::adjustment_radius(adj), out.scale);
            pass.radius = std::max(pass.radius, r);
            blur_chain += r;
        }

        int feather = 0;
        if (!pass.kernels.empty()) {
            for (const auto& layer : group.masks) {
                feather = std::max(feather, scaled_radius(layer.mask.feather_radius, out.scale));
            }
        }
        pass.radius = std::max(pass.radius, feather);
        // Blurs inside a pass run back to back. Masks are rasterized in image
        // coordinates and feathered on their own margin, so they read no input.
        pass.footprint = blur_chain;
        footprint_sum += pass.footprint;

        const std::string group_hash = core::sha256_string(edit::group_content_json(pass.group).dump());
        pass.cache_key = core::sha256_string(prev_key + "|" + group_hash + "|" + scale_repr);
        prev_key = pass.cache_key;

        out.passes.push_back(std::move(pass));
    }
    // Never below the largest active radius, feathers included.
    out.halo = std::max(footprint_sum, out.max_radius());
    return out;
}

size_t first_affected_pass(const CompiledPipeline& before, const CompiledPipeline& after) {
    const size_t n = std::min(before.passes.size(), after.passes.size());
    for (size_t i = 0; i < n; ++i) {
        if (before.passes[i].cache_key != after.passes[i].cache_key) {
            return i;
        }
    }
    return n;
}

} // namespace tile_develop::pipeline
