#pragma once

#include "tile_develop/edit/edit_state.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tile_develop::edit {

using Clock = std::chrono::steady_clock;

// Where a committed edit came from; drives coalescing of slider drags.
struct EditOrigin {
    std::string parameter_path; // e.g. "group:3/adjustment:0/ev"
    Clock::time_point timestamp = Clock::now();
};

struct HistoryEntry {
    std::shared_ptr<const EditState> state;
    uint64_t sequence = 0;
};

/**
 * Linear undo/redo history of immutable EditState snapshots.
 *
 * commit() truncates the redo tail. A commit whose origin names the same
 * parameter as the previous commit, arrives within the coalescing window and
 * follows no undo replaces the top entry instead of adding one. undo() and
 * redo() only move the active index.
 */
class HistoryStack {
public:
    explicit HistoryStack(EditState initial,
                          std::chrono::milliseconds coalesce_window = std::chrono::milliseconds(400),
                          size_t max_entries = 0);

    void commit(EditState state, std::optional<EditOrigin> origin = std::nullopt);

    bool undo();
    bool redo();

    bool can_undo() const { return index_ > 0; }
    bool can_redo() const { return index_ + 1 < entries_.size(); }

    const EditState& current() const { return *entries_[index_].state; }
    std::shared_ptr<const EditState> current_ptr() const { return entries_[index_].state; }
    const HistoryEntry& entry(size_t i) const { return entries_.at(i); }

    size_t size() const { return entries_.size(); }
    size_t index() const { return index_; }
    uint64_t sequence() const { return entries_[index_].sequence; }

private:
    std::vector<HistoryEntry> entries_;
    size_t index_ = 0;
    uint64_t next_sequence_ = 0;

    std::chrono::milliseconds coalesce_window_;
    size_t max_entries_;

    std::optional<EditOrigin> last_origin_;
};

} // namespace tile_develop::edit
