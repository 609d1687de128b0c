#pragma once

#include "tile_develop/edit/edit_state.hpp"

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace tile_develop::edit {

using json = nlohmann::json;

// Sidecar edit document.
using Document = json;

constexpr const char* kDocumentFormat = "tile_develop.edit";
constexpr int kDocumentVersion = 1;

// Problems found while loading; the load itself never aborts on them.
struct DeserializeReport {
    std::vector<std::string> warnings;

    bool clean() const { return warnings.empty(); }
};

Document serialize(const EditState& state);

/**
 * Rebuilds an EditState from a document with per-field fallback:
 * unknown adjustment kinds are skipped, out-of-range or mistyped fields
 * take their identity default, a malformed mask layer is dropped (a
 * group left without layers is disabled, never made global), and missing
 * or duplicate group ids are reassigned. Every
 * fallback is recorded in `report` when given.
 */
EditState deserialize(const Document& doc, DeserializeReport* report = nullptr);

std::string to_string(const EditState& state, int indent = 2);

// Throws ValidationError if the text is not JSON at all.
EditState from_string(const std::string& text, DeserializeReport* report = nullptr);

json adjustment_to_json(const Adjustment& adj);
json mask_to_json(const Mask& mask, bool embed_bitmaps = true);

// Output-relevant content of a group (no id, no name, bitmaps by digest).
// Used for cache keys.
json group_content_json(const AdjustmentGroup& group);

} // namespace tile_develop::edit
