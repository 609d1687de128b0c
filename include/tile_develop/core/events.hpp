#pragma once

#include <nlohmann/json.hpp>
#include <mutex>
#include <ostream>
#include <string>

namespace tile_develop::core {

using json = nlohmann::json;

/**
 * JSON-lines event emission for render runs.
 * Every event carries type, run_id and an ISO-8601 timestamp. A null stream
 * turns the emitter into a no-op.
 */
class EventEmitter {
public:
    explicit EventEmitter(std::ostream* out = nullptr);

    bool enabled() const { return out_ != nullptr; }

    void run_start(const std::string& run_id, const json& extra);
    void run_end(const std::string& run_id, bool success, const std::string& status,
                 const json& extra = json::object());

    void pass_start(const std::string& run_id, int pass_id, const std::string& kernels);
    void tile_done(const std::string& run_id, int tile_idx, int total_tiles,
                   int passes_from_cache, int passes_computed);

    void cache_flush(const std::string& image_id, size_t entries_removed);

    void warning(const std::string& run_id, const std::string& message);
    void error(const std::string& run_id, const std::string& message);

private:
    void emit(const json& event);
    json base_event(const std::string& type, const std::string& run_id) const;

    std::ostream* out_;
    std::mutex mutex_;
};

} // namespace tile_develop::core
