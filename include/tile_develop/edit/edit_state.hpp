#pragma once

#include "tile_develop/edit/adjustment.hpp"
#include "tile_develop/edit/mask.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace tile_develop::edit {

using GroupId = uint64_t;

/**
 * One unit of the edit stack. An empty mask list makes the group global;
 * otherwise its layers are folded left to right into a per-pixel weight.
 */
struct AdjustmentGroup {
    GroupId id = 0; // 0 = assign on insertion
    std::string name;
    bool enabled = true;
    float opacity = 1.0f;
    std::vector<Adjustment> adjustments;
    std::vector<MaskLayer> masks;

    bool is_global() const { return masks.empty(); }
};

/**
 * Ordered list of adjustment groups.
 *
 * Every mutation validates the resulting state before it becomes visible
 * and throws ValidationError on an illegal edit, leaving the state
 * untouched. Groups are never reordered implicitly; move_group() is the
 * only splice.
 */
class EditState {
public:
    EditState() = default;

    // Builds a state from existing groups, assigning ids where missing.
    static EditState from_groups(std::vector<AdjustmentGroup> groups);

    const std::vector<AdjustmentGroup>& groups() const { return groups_; }
    size_t size() const { return groups_.size(); }
    bool empty() const { return groups_.empty(); }

    const AdjustmentGroup& group(GroupId id) const;
    int index_of(GroupId id) const; // -1 if absent

    GroupId add_group(AdjustmentGroup group);
    GroupId insert_group(size_t index, AdjustmentGroup group);
    void remove_group(GroupId id);
    void move_group(GroupId id, size_t new_index);

    void set_group_name(GroupId id, std::string name);
    void set_group_opacity(GroupId id, float opacity);
    void set_group_enabled(GroupId id, bool enabled);

    void add_adjustment(GroupId id, Adjustment adj);
    void set_adjustment(GroupId id, size_t index, Adjustment adj);
    void remove_adjustment(GroupId id, size_t index);

    void add_mask_layer(GroupId id, MaskLayer layer);
    void set_mask_layer(GroupId id, size_t index, MaskLayer layer);
    void remove_mask_layer(GroupId id, size_t index);

    // SHA-256 over the canonical document form; bitmaps enter by digest.
    std::string content_hash() const;

    bool operator==(const EditState& other) const;
    bool operator!=(const EditState& other) const { return !(*this == other); }

    static void validate_group(const AdjustmentGroup& group);

private:
    template <typename F>
    void mutate(F&& fn);

    static void validate_groups(const std::vector<AdjustmentGroup>& groups);
    GroupId next_id(const std::vector<AdjustmentGroup>& groups) const;
    size_t require_index(GroupId id) const;

    std::vector<AdjustmentGroup> groups_;
};

bool groups_equal(const AdjustmentGroup& a, const AdjustmentGroup& b);

} // namespace tile_develop::edit
