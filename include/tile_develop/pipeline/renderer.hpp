#pragma once

#include "tile_develop/config/configuration.hpp"
#include "tile_develop/core/events.hpp"
#include "tile_develop/edit/edit_state.hpp"
#include "tile_develop/image/image.hpp"
#include "tile_develop/pipeline/backend.hpp"
#include "tile_develop/pipeline/device_memory.hpp"
#include "tile_develop/pipeline/executor.hpp"
#include "tile_develop/pipeline/result_cache.hpp"

#include <cstdint>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace tile_develop::pipeline {

enum class RenderLane {
    FULL,
    PREVIEW
};

// Result of an asynchronous render. get() rethrows the run's error,
// RenderCancelled included.
class RenderHandle {
public:
    RenderHandle() = default;
    RenderHandle(std::shared_future<image::PixelBuffer> future,
                 std::shared_ptr<CancellationToken> token, uint64_t version);

    image::PixelBuffer get() const;
    bool valid() const { return future_.valid(); }
    bool ready() const;
    void wait() const;
    void cancel();
    bool cancelled() const;
    uint64_t version() const { return version_; }

private:
    std::shared_future<image::PixelBuffer> future_;
    std::shared_ptr<CancellationToken> token_;
    uint64_t version_ = 0;
};

/**
 * Editing session front end. Owns the compute backend, the device memory
 * budget and the result cache; cache entries are keyed by image id so one
 * renderer can serve several images.
 *
 * At most one run per image and lane is in flight: a newer submission
 * cancels the older run, which then finishes with RenderCancelled and leaves
 * the cache untouched. Full and preview lanes run concurrently.
 */
class Renderer {
public:
    explicit Renderer(config::Config cfg, std::ostream* events = nullptr);
    Renderer(config::Config cfg, std::unique_ptr<ComputeBackend> backend,
             std::ostream* events = nullptr);
    ~Renderer();

    Renderer(const Renderer&) = delete;
    Renderer& operator=(const Renderer&) = delete;

    // target_resolution: longest output edge, 0 for native size. Runs share
    // the image; the overloads taking a reference copy it once per call.
    image::PixelBuffer render(const edit::EditState& state,
                              std::shared_ptr<const image::Image> image,
                              int target_resolution = 0);
    image::PixelBuffer render(const edit::EditState& state, const image::Image& image,
                              int target_resolution = 0);

    RenderHandle submit(const edit::EditState& state, std::shared_ptr<const image::Image> image,
                        int target_resolution = 0);
    RenderHandle submit(const edit::EditState& state, const image::Image& image,
                        int target_resolution = 0);

    // Fast path at preview.max_edge.
    RenderHandle submit_preview(const edit::EditState& state,
                                std::shared_ptr<const image::Image> image);
    RenderHandle submit_preview(const edit::EditState& state, const image::Image& image);

    size_t flush_cache(const ImageId& image_id);

    // Null when caching is disabled.
    ResultCache* cache() { return cache_.get(); }
    DeviceMemory& device_memory() { return device_; }
    ComputeBackend& backend() { return *backend_; }
    const config::Config& config() const { return cfg_; }

    RunStats last_stats() const;

private:
    RenderHandle launch(RenderLane lane, const edit::EditState& state,
                        std::shared_ptr<const image::Image> image, int target_resolution);

    image::PixelBuffer execute(const edit::EditState& state, const image::Image& image,
                               int target_resolution, const CancellationToken& token);

    config::Config cfg_;
    std::unique_ptr<ComputeBackend> backend_;
    DeviceMemory device_;
    std::unique_ptr<ResultCache> cache_;
    core::EventEmitter events_;

    mutable std::mutex mutex_;
    std::map<std::pair<ImageId, RenderLane>, std::shared_ptr<CancellationToken>> in_flight_;
    std::map<std::pair<ImageId, RenderLane>, uint64_t> versions_;
    std::vector<std::pair<std::shared_ptr<CancellationToken>,
                          std::shared_future<image::PixelBuffer>>> runs_;
    RunStats last_stats_;
};

} // namespace tile_develop::pipeline
