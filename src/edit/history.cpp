#include "tile_develop/edit/history.hpp"

#include <iostream>

namespace tile_develop::edit {

HistoryStack::HistoryStack(EditState initial, std::chrono::milliseconds coalesce_window,
                           size_t max_entries)
    : coalesce_window_(coalesce_window), max_entries_(max_entries) {
    entries_.push_back({std::make_shared<const EditState>(std::move(initial)), next_sequence_++});
}

void HistoryStack::commit(EditState state, std::optional<EditOrigin> origin) {
    auto snapshot = std::make_shared<const EditState>(std::move(state));

    // last_origin_ is reset by undo/redo, so a coalesce only happens on top.
    const bool coalesce = origin && last_origin_ && index_ > 0 &&
                          index_ + 1 == entries_.size() &&
                          origin->parameter_path == last_origin_->parameter_path &&
                          origin->timestamp >= last_origin_->timestamp &&
                          origin->timestamp - last_origin_->timestamp <= coalesce_window_;

    if (coalesce) {
        entries_[index_] = {std::move(snapshot), next_sequence_++};
        last_origin_ = origin;
        return;
    }

    entries_.resize(index_ + 1);
    entries_.push_back({std::move(snapshot), next_sequence_++});
    index_ = entries_.size() - 1;
    last_origin_ = origin;

    if (max_entries_ > 0 && entries_.size() > max_entries_) {
        const size_t drop = entries_.size() - max_entries_;
        entries_.erase(entries_.begin(), entries_.begin() + static_cast<std::ptrdiff_t>(drop));
        index_ -= drop;
        std::cerr << "[HISTORY] dropped " << drop << " oldest entr"
                  << (drop == 1 ? "y" : "ies") << std::endl;
    }
}

bool HistoryStack::undo() {
    if (!can_undo()) {
        return false;
    }
    --index_;
    last_origin_.reset();
    return true;
}

bool HistoryStack::redo() {
    if (!can_redo()) {
        return false;
    }
    ++index_;
    last_origin_.reset();
    return true;
}

} // namespace tile_develop::edit
