#pragma once

#include "tile_develop/core/types.hpp"
#include "tile_develop/edit/edit_state.hpp"

#include <string>
#include <vector>

namespace tile_develop::pipeline {

// One compiled adjustment group.
struct Pass {
    int id = 0;                       // position in the pass list
    edit::GroupId group_id = 0;
    std::vector<std::string> kernels; // adjustment kinds, identities dropped
    edit::AdjustmentGroup group;      // snapshot; adjustments match `kernels`
    std::string input;                // "source" or "pass:<id-1>"
    std::string output;               // "pass:<id>"
    int radius = 0;                   // largest kernel or feather radius at render scale
    int footprint = 0;                // margin this pass reads around each output pixel
    std::string cache_key;

    bool is_noop() const { return kernels.empty(); }
};

struct CompiledPipeline {
    ImageId image_id;
    int full_width = 0;
    int full_height = 0;
    int width = 0;  // render scale
    int height = 0;
    double scale = 1.0;
    std::vector<Pass> passes;
    int halo = 0;   // max(sum of footprints, max_radius())
    std::string root_key;

    // Key of the last pass (root key for an empty pipeline).
    const std::string& content_hash() const;
    int max_radius() const;
};

// Radius in full-resolution pixels -> render-scale pixels. Non-zero radii
// never collapse to zero.
int scaled_radius(int radius, double scale);

/**
 * Compiles an EditState into an ordered pass list. Pure: the same inputs
 * always produce the same passes and cache keys. Each key chains the
 * previous key with the group content, so an edit to group k changes the
 * keys of passes >= k only.
 */
CompiledPipeline compile(const edit::EditState& state, const ImageId& image_id,
                         int full_width, int full_height, double scale);

// Index of the first pass whose key differs; the shorter pass count when
// one list is a prefix of the other.
size_t first_affected_pass(const CompiledPipeline& before, const CompiledPipeline& after);

} // namespace tile_develop::pipeline
