#pragma once

#include "tile_develop/core/events.hpp"
#include "tile_develop/core/types.hpp"
#include "tile_develop/image/convolution.hpp"
#include "tile_develop/pipeline/compiler.hpp"
#include "tile_develop/pipeline/kernels.hpp"
#include "tile_develop/pipeline/mask_compositor.hpp"

#include <atomic>
#include <string>
#include <vector>

namespace tile_develop::pipeline {

class ComputeBackend;
class DeviceMemory;
class ResultCache;

// Cooperative cancellation flag shared between a run and its submitter.
class CancellationToken {
public:
    void cancel() { cancelled_.store(true, std::memory_order_relaxed); }
    bool cancelled() const { return cancelled_.load(std::memory_order_relaxed); }
    void throw_if_cancelled() const;

private:
    std::atomic<bool> cancelled_{false};
};

struct RunStats {
    size_t tiles = 0;
    size_t passes_computed = 0;   // passes that ran kernels
    size_t passes_from_cache = 0; // passes covered by a cache hit
    size_t cache_writes = 0;
    size_t staged_dropped = 0;    // outputs not cached for lack of device memory
};

struct ExecutorOptions {
    int worker_threads = 4;
    float hdr_sample_max = image::kDefaultHdrSampleMax;
    std::string run_id;
    core::EventEmitter* events = nullptr;
};

/**
 * Runs a compiled pipeline tile by tile.
 *
 * For every tile the latest pass whose cached output still covers the
 * margin the later passes read is located by walking back from the last
 * pass; the remaining passes are computed in order. A fresh tile starts from
 * its halo-grown region, and each pass shrinks the region to the pixels it
 * computed exactly, which is what gets cached. New outputs are staged with
 * their own device reservation and only written to the cache once the whole
 * run finished without cancellation. Staged outputs are dropped first when a
 * tile cannot get working memory.
 */
class PassExecutor {
public:
    PassExecutor(ComputeBackend& backend, DeviceMemory* device, ResultCache* cache,
                 ExecutorOptions options = {});

    RgbPlanes run(const CompiledPipeline& pipeline, const RgbPlanes& source,
                  const std::vector<TileRegion>& tiles, const CancellationToken& token,
                  RunStats* stats = nullptr);

    // Working memory one tile of the given region needs on the device.
    static size_t working_bytes(const Rect& region);

private:
    ComputeBackend& backend_;
    DeviceMemory* device_;
    ResultCache* cache_;
    ExecutorOptions options_;
    MaskCompositor compositor_;
};

// Applies a pass to one region buffer: kernels in order, then the group
// weight blend out = in + w * (adjusted - in).
RgbPlanes apply_pass(const Pass& pass, const RgbPlanes& input, const KernelContext& ctx,
                     const MaskCompositor& compositor, const MaskRaster& raster);

} // namespace tile_develop::pipeline
