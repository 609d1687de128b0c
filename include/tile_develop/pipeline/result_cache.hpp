#pragma once

#include "tile_develop/core/types.hpp"
#include "tile_develop/pipeline/device_memory.hpp"

#include <cstdint>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace tile_develop::pipeline {

struct CacheKey {
    ImageId image_id;
    int pass_id = 0;
    std::string pass_key; // chained pipeline key of the pass
    std::string tile_id;

    std::string digest() const;
};

// A cached pass output and the image pixels it holds. Every pixel of
// `region` is final for its pass.
struct CachedTile {
    std::shared_ptr<const RgbPlanes> buffer;
    Rect region;
};

struct CacheStats {
    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t evictions = 0;
    uint64_t corrupt = 0; // entries that failed validation on read
    size_t bytes = 0;
    size_t entries = 0;
};

/**
 * LRU cache of pass outputs per tile, bounded by a byte budget. When a
 * DeviceMemory is given each entry also holds a reservation against it, so
 * cache contents and working buffers compete for the same device budget.
 * All methods are thread-safe.
 */
class ResultCache {
public:
    explicit ResultCache(size_t budget_bytes, DeviceMemory* device = nullptr);

    ResultCache(const ResultCache&) = delete;
    ResultCache& operator=(const ResultCache&) = delete;

    // Hit only on the exact key when the stored region contains `needed`.
    // An entry whose buffer disagrees with its region or stored length is
    // evicted and counted as corrupt.
    std::optional<CachedTile> get(const CacheKey& key, const Rect& needed);

    // Returns false when the buffer could not be stored. The buffer must be
    // region-sized.
    bool put(const CacheKey& key, std::shared_ptr<const RgbPlanes> buffer, const Rect& region);

    bool contains(const CacheKey& key) const;

    // Evicts least-recently-used entries until `bytes` were freed or the
    // cache is empty. Returns the bytes freed.
    size_t reclaim(size_t bytes);

    // Drops every entry of one image. Returns the number removed.
    size_t flush(const ImageId& image_id);
    void clear();

    CacheStats stats() const;
    size_t budget() const { return budget_; }

private:
    struct Entry {
        ImageId image_id;
        std::shared_ptr<const RgbPlanes> buffer;
        Rect region;
        size_t stored_bytes = 0;
        uint64_t last_access = 0;
        DeviceMemory::Reservation reservation;
        std::list<std::string>::iterator lru_pos;
    };

    void evict_locked(const std::string& digest);
    bool evict_oldest_locked();

    const size_t budget_;
    DeviceMemory* device_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
    std::list<std::string> lru_; // front = most recent
    uint64_t tick_ = 0;
    CacheStats stats_;
};

} // namespace tile_develop::pipeline
