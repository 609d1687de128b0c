#include "tile_develop/core/events.hpp"
#include "tile_develop/core/utils.hpp"

namespace tile_develop::core {

EventEmitter::EventEmitter(std::ostream* out)
    : out_(out) {}

json EventEmitter::base_event(const std::string& type, const std::string& run_id) const {
    return {
        {"type", type},
        {"run_id", run_id},
        {"ts", get_iso_timestamp()}
    };
}

void EventEmitter::emit(const json& event) {
    if (!out_) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    (*out_) << event.dump() << "\n";
    out_->flush();
}

void EventEmitter::run_start(const std::string& run_id, const json& extra) {
    if (!out_) return;
    json event = base_event("render_start", run_id);
    for (auto& [key, value] : extra.items()) {
        event[key] = value;
    }
    emit(event);
}

void EventEmitter::run_end(const std::string& run_id, bool success,
                           const std::string& status, const json& extra) {
    if (!out_) return;
    json event = base_event("render_end", run_id);
    event["success"] = success;
    event["status"] = status;
    for (auto& [key, value] : extra.items()) {
        event[key] = value;
    }
    emit(event);
}

void EventEmitter::pass_start(const std::string& run_id, int pass_id,
                              const std::string& kernels) {
    if (!out_) return;
    json event = base_event("pass_start", run_id);
    event["pass"] = pass_id;
    event["kernels"] = kernels;
    emit(event);
}

void EventEmitter::tile_done(const std::string& run_id, int tile_idx, int total_tiles,
                             int passes_from_cache, int passes_computed) {
    if (!out_) return;
    json event = base_event("tile_done", run_id);
    event["tile"] = tile_idx;
    event["total_tiles"] = total_tiles;
    event["from_cache"] = passes_from_cache;
    event["computed"] = passes_computed;
    emit(event);
}

void EventEmitter::cache_flush(const std::string& image_id, size_t entries_removed) {
    if (!out_) return;
    json event = base_event("cache_flush", "");
    event["image_id"] = image_id;
    event["entries_removed"] = entries_removed;
    emit(event);
}

void EventEmitter::warning(const std::string& run_id, const std::string& message) {
    if (!out_) return;
    json event = base_event("warning", run_id);
    event["message"] = message;
    emit(event);
}

void EventEmitter::error(const std::string& run_id, const std::string& message) {
    if (!out_) return;
    json event = base_event("error", run_id);
    event["message"] = message;
    emit(event);
}

} // namespace tile_develop::core
