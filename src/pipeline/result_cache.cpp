#include "tile_develop/pipeline/result_cache.hpp"
#include "tile_develop/core/utils.hpp"

#include <iostream>

namespace tile_develop::pipeline {

std::string CacheKey::digest() const {
    return core::sha256_string(image_id + "|" + std::to_string(pass_id) + "|" + pass_key + "|" +
                               tile_id);
}

ResultCache::ResultCache(size_t budget_bytes, DeviceMemory* device)
    : budget_(budget_bytes), device_(device) {}

std::optional<CachedTile> ResultCache::get(const CacheKey& key, const Rect& needed) {
    const std::string digest = key.digest();
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = entries_.find(digest);
    if (it == entries_.end()) {
        ++stats_.misses;
        return std::nullopt;
    }

    Entry& e = it->second;
    const RgbPlanes& buf = *e.buffer;
    const bool planes_ok = buf.G.rows() == buf.R.rows() && buf.G.cols() == buf.R.cols() &&
                           buf.B.rows() == buf.R.rows() && buf.B.cols() == buf.R.cols();
    if (!planes_ok || buf.rows() != e.region.height || buf.cols() != e.region.width ||
        buf.byte_size() != e.stored_bytes) {
        std::cerr << "[CACHE] Invalid entry for pass " << key.pass_id << " tile " << key.tile_id
                  << " (region " << e.region.width << "x" << e.region.height << ", buffer "
                  << buf.cols() << "x" << buf.rows() << "), evicting" << std::endl;
        ++stats_.corrupt;
        ++stats_.misses;
        evict_locked(digest);
        return std::nullopt;
    }
    if (!e.region.contains(needed)) {
        ++stats_.misses;
        return std::nullopt;
    }

    e.last_access = ++tick_;
    lru_.splice(lru_.begin(), lru_, e.lru_pos);
    ++stats_.hits;
    return CachedTile{e.buffer, e.region};
}

bool ResultCache::put(const CacheKey& key, std::shared_ptr<const RgbPlanes> buffer,
                      const Rect& region) {
    if (!buffer || buffer->rows() != region.height || buffer->cols() != region.width) {
        return false;
    }
    const size_t bytes = buffer->byte_size();
    if (bytes > budget_) {
        return false;
    }

    const std::string digest = key.digest();
    std::lock_guard<std::mutex> lock(mutex_);

    if (entries_.count(digest) != 0) {
        evict_locked(digest);
    }
    while (stats_.bytes + bytes > budget_) {
        if (!evict_oldest_locked()) {
            return false;
        }
    }

    DeviceMemory::Reservation reservation;
    if (device_ != nullptr) {
        auto r = device_->try_reserve(bytes);
        while (!r) {
            if (!evict_oldest_locked()) {
                return false;
            }
            r = device_->try_reserve(bytes);
        }
        reservation = std::move(*r);
    }

    lru_.push_front(digest);
    Entry e;
    e.image_id = key.image_id;
    e.region = region;
    e.stored_bytes = bytes;
    e.buffer = std::move(buffer);
    e.last_access = ++tick_;
    e.reservation = std::move(reservation);
    e.lru_pos = lru_.begin();
    entries_.emplace(digest, std::move(e));

    stats_.bytes += bytes;
    stats_.entries = entries_.size();
    return true;
}

bool ResultCache::contains(const CacheKey& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.count(key.digest()) != 0;
}

size_t ResultCache::reclaim(size_t bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    const size_t before = stats_.bytes;
    while (before - stats_.bytes < bytes) {
        if (!evict_oldest_locked()) {
            break;
        }
    }
    const size_t freed = before - stats_.bytes;
    if (freed > 0) {
        std::cerr << "[CACHE] Reclaimed " << core::format_bytes(freed) << std::endl;
    }
    return freed;
}

size_t ResultCache::flush(const ImageId& image_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (it->second.image_id == image_id) {
            stats_.bytes -= it->second.stored_bytes;
            lru_.erase(it->second.lru_pos);
            it = entries_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    stats_.entries = entries_.size();
    if (removed > 0) {
        std::cerr << "[CACHE] Flushed " << removed << " entries of image " << image_id
                  << std::endl;
    }
    return removed;
}

void ResultCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    lru_.clear();
    stats_.bytes = 0;
    stats_.entries = 0;
}

CacheStats ResultCache::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

void ResultCache::evict_locked(const std::string& digest) {
    auto it = entries_.find(digest);
    if (it == entries_.end()) {
        return;
    }
    stats_.bytes -= it->second.stored_bytes;
    lru_.erase(it->second.lru_pos);
    entries_.erase(it);
    ++stats_.evictions;
    stats_.entries = entries_.size();
}

bool ResultCache::evict_oldest_locked() {
    if (lru_.empty()) {
        return false;
    }
    const std::string oldest = lru_.back();
    evict_locked(oldest);
    return true;
}

} // namespace tile_develop::pipeline
