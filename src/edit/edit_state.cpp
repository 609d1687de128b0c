#include "tile_develop/edit/edit_state.hpp"
#include "tile_develop/edit/serialization.hpp"
#include "tile_develop/core/errors.hpp"
#include "tile_develop/core/utils.hpp"

#include <algorithm>
#include <unordered_set>

namespace tile_develop::edit {

template <typename F>
void EditState::mutate(F&& fn) {
    std::vector<AdjustmentGroup> next = groups_;
    fn(next);
    validate_groups(next);
    groups_.swap(next);
}

EditState EditState::from_groups(std::vector<AdjustmentGroup> groups) {
    EditState state;
    for (auto& g : groups) {
        if (g.id == 0) {
            g.id = state.next_id(groups);
        }
    }
    validate_groups(groups);
    state.groups_ = std::move(groups);
    return state;
}

GroupId EditState::next_id(const std::vector<AdjustmentGroup>& groups) const {
    GroupId max_id = 0;
    for (const auto& g : groups) {
        max_id = std::max(max_id, g.id);
    }
    return max_id + 1;
}

int EditState::index_of(GroupId id) const {
    for (size_t i = 0; i < groups_.size(); ++i) {
        if (groups_[i].id == id) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

size_t EditState::require_index(GroupId id) const {
    const int idx = index_of(id);
    if (idx < 0) {
        throw ValidationError("unknown group id " + std::to_string(id));
    }
    return static_cast<size_t>(idx);
}

const AdjustmentGroup& EditState::group(GroupId id) const {
    return groups_[require_index(id)];
}

GroupId EditState::add_group(AdjustmentGroup group) {
    return insert_group(groups_.size(), std::move(group));
}

GroupId EditState::insert_group(size_t index, AdjustmentGroup group) {
    if (index > groups_.size()) {
        throw ValidationError("group insert index " + std::to_string(index) +
                              " past end (" + std::to_string(groups_.size()) + ")");
    }
    if (group.id == 0) {
        group.id = next_id(groups_);
    }
    const GroupId id = group.id;
    mutate([&](std::vector<AdjustmentGroup>& gs) {
        gs.insert(gs.begin() + static_cast<std::ptrdiff_t>(index), std::move(group));
    });
    return id;
}

void EditState::remove_group(GroupId id) {
    const size_t idx = require_index(id);
    mutate([&](std::vector<AdjustmentGroup>& gs) {
        gs.erase(gs.begin() + static_cast<std::ptrdiff_t>(idx));
    });
}

void EditState::move_group(GroupId id, size_t new_index) {
    const size_t idx = require_index(id);
    if (new_index >= groups_.size()) {
        throw ValidationError("group move index " + std::to_string(new_index) + " out of range");
    }
    mutate([&](std::vector<AdjustmentGroup>& gs) {
        AdjustmentGroup moved = std::move(gs[idx]);
        gs.erase(gs.begin() + static_cast<std::ptrdiff_t>(idx));
        gs.insert(gs.begin() + static_cast<std::ptrdiff_t>(new_index), std::move(moved));
    });
}

void EditState::set_group_name(GroupId id, std::string name) {
    const size_t idx = require_index(id);
    mutate([&](std::vector<AdjustmentGroup>& gs) { gs[idx].name = std::move(name); });
}

void EditState::set_group_opacity(GroupId id, float opacity) {
    const size_t idx = require_index(id);
    mutate([&](std::vector<AdjustmentGroup>& gs) { gs[idx].opacity = opacity; });
}

void EditState::set_group_enabled(GroupId id, bool enabled) {
    const size_t idx = require_index(id);
    mutate([&](std::vector<AdjustmentGroup>& gs) { gs[idx].enabled = enabled; });
}

void EditState::add_adjustment(GroupId id, Adjustment adj) {
    const size_t idx = require_index(id);
    mutate([&](std::vector<AdjustmentGroup>& gs) {
        gs[idx].adjustments.push_back(std::move(adj));
    });
}

void EditState::set_adjustment(GroupId id, size_t index, Adjustment adj) {
    const size_t idx = require_index(id);
    if (index >= groups_[idx].adjustments.size()) {
        throw ValidationError("adjustment index " + std::to_string(index) + " out of range");
    }
    mutate([&](std::vector<AdjustmentGroup>& gs) {
        gs[idx].adjustments[index] = std::move(adj);
    });
}

void EditState::remove_adjustment(GroupId id, size_t index) {
    const size_t idx = require_index(id);
    if (index >= groups_[idx].adjustments.size()) {
        throw ValidationError("adjustment index " + std::to_string(index) + " out of range");
    }
    mutate([&](std::vector<AdjustmentGroup>& gs) {
        auto& adjs = gs[idx].adjustments;
        adjs.erase(adjs.begin() + static_cast<std::ptrdiff_t>(index));
    });
}

void EditState::add_mask_layer(GroupId id, MaskLayer layer) {
    const size_t idx = require_index(id);
    mutate([&](std::vector<AdjustmentGroup>& gs) {
        gs[idx].masks.push_back(std::move(layer));
    });
}

void EditState::set_mask_layer(GroupId id, size_t index, MaskLayer layer) {
    const size_t idx = require_index(id);
    if (index >= groups_[idx].masks.size()) {
        throw ValidationError("mask layer index " + std::to_string(index) + " out of range");
    }
    mutate([&](std::vector<AdjustmentGroup>& gs) {
        gs[idx].masks[index] = std::move(layer);
    });
}

void EditState::remove_mask_layer(GroupId id, size_t index) {
    const size_t idx = require_index(id);
    if (index >= groups_[idx].masks.size()) {
        throw ValidationError("mask layer index " + std::to_string(index) + " out of range");
    }
    mutate([&](std::vector<AdjustmentGroup>& gs) {
        auto& masks = gs[idx].masks;
        masks.erase(masks.begin() + static_cast<std::ptrdiff_t>(index));
    });
}

void EditState::validate_group(const AdjustmentGroup& group) {
    const std::string where = "group " + std::to_string(group.id);
    if (!(group.opacity >= 0.0f && group.opacity <= 1.0f)) {
        throw ValidationError(where + ": opacity " + std::to_string(group.opacity) +
                              " outside [0, 1]");
    }
    for (const auto& adj : group.adjustments) {
        validate_adjustment(adj);
    }
    for (const auto& layer : group.masks) {
        validate_mask(layer.mask);
    }
}

void EditState::validate_groups(const std::vector<AdjustmentGroup>& groups) {
    std::unordered_set<GroupId> ids;
    for (size_t g = 0; g < groups.size(); ++g) {
        const auto& group = groups[g];
        if (group.id == 0 || !ids.insert(group.id).second) {
            throw ValidationError("group id " + std::to_string(group.id) +
                                  " is missing or duplicated");
        }
        validate_group(group);

        // Geometry resamples the source, so it must run first and globally.
        std::vector<Adjustment> preceding;
        for (const auto& adj : group.adjustments) {
            check_geometry_placement(g, group.is_global(), preceding, adj);
            preceding.push_back(adj);
        }
    }
}

std::string EditState::content_hash() const {
    std::string canonical;
    for (const auto& g : groups_) {
        nlohmann::json j = group_content_json(g);
        j["id"] = g.id;
        j["name"] = g.name;
        canonical += j.dump();
        canonical += '\n';
    }
    return core::sha256_string(canonical);
}

bool groups_equal(const AdjustmentGroup& a, const AdjustmentGroup& b) {
    if (a.id != b.id || a.name != b.name || a.enabled != b.enabled ||
        a.opacity != b.opacity || a.adjustments.size() != b.adjustments.size()) {
        return false;
    }
    for (size_t i = 0; i < a.adjustments.size(); ++i) {
        if (!adjustments_equal(a.adjustments[i], b.adjustments[i])) {
            return false;
        }
    }
    return mask_layers_equal(a.masks, b.masks);
}

bool EditState::operator==(const EditState& other) const {
    if (groups_.size() != other.groups_.size()) {
        return false;
    }
    for (size_t i = 0; i < groups_.size(); ++i) {
        if (!groups_equal(groups_[i], other.groups_[i])) {
            return false;
        }
    }
    return true;
}

} // namespace tile_develop::edit
