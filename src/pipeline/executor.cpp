#include "tile_develop/pipeline/executor.hpp"
#include "tile_develop/core/errors.hpp"
#include "tile_develop/core/utils.hpp"
#include "tile_develop/pipeline/backend.hpp"
#include "tile_develop/pipeline/device_memory.hpp"
#include "tile_develop/pipeline/result_cache.hpp"
#include "tile_develop/pipeline/tile_scheduler.hpp"

#include <algorithm>
#include <exception>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <utility>

namespace tile_develop::pipeline {

void CancellationToken::throw_if_cancelled() const {
    if (cancelled()) {
        throw RenderCancelled();
    }
}

namespace {

// Input, adjusted copy, blur scratch and the mask weight.
constexpr size_t kWorkingPlanes = 3 + 3 + 3 + 1;

bool needs_blend(const edit::AdjustmentGroup& group) {
    return !group.is_global() || group.opacity < 1.0f;
}

void blend_plane(Matrix2Df& adjusted, const Matrix2Df& input, const Matrix2Df& w) {
    adjusted = (input.array() + w.array() * (adjusted.array() - input.array())).matrix();
}

} // namespace

RgbPlanes apply_pass(const Pass& pass, const RgbPlanes& input, const KernelContext& ctx,
                     const MaskCompositor& compositor, const MaskRaster& raster) {
    RgbPlanes out = input;
    if (pass.is_noop()) {
        return out;
    }
    const auto& adjustments = pass.group.adjustments;
    for (size_t i = apply_geometry(adjustments, out, ctx); i < adjustments.size(); ++i) {
        apply_adjustment(adjustments[i], out, ctx);
    }
    if (needs_blend(pass.group)) {
        const Matrix2Df w = compositor.evaluate_group(pass.group, raster);
        blend_plane(out.R, input.R, w);
        blend_plane(out.G, input.G, w);
        blend_plane(out.B, input.B, w);
    }
    return out;
}

PassExecutor::PassExecutor(ComputeBackend& backend, DeviceMemory* device, ResultCache* cache,
                           ExecutorOptions options)
    : backend_(backend), device_(device), cache_(cache), options_(std::move(options)),
      compositor_(&backend) {}

size_t PassExecutor::working_bytes(const Rect& region) {
    return static_cast<size_t>(std::max(0, region.width)) *
           static_cast<size_t>(std::max(0, region.height)) * sizeof(float) * kWorkingPlanes;
}

RgbPlanes PassExecutor::run(const CompiledPipeline& pipeline, const RgbPlanes& source,
                            const std::vector<TileRegion>& tiles, const CancellationToken& token,
                            RunStats* stats) {
    if (source.rows() != pipeline.height || source.cols() != pipeline.width) {
        throw PipelineError("source is " + std::to_string(source.cols()) + "x" +
                            std::to_string(source.rows()) + ", pipeline expects " +
                            std::to_string(pipeline.width) + "x" +
                            std::to_string(pipeline.height));
    }
    token.throw_if_cancelled();

    core::EventEmitter* events = options_.events;
    if (events) {
        for (const auto& pass : pipeline.passes) {
            std::string names;
            for (const auto& k : pass.kernels) {
                names += names.empty() ? k : "," + k;
            }
            events->pass_start(options_.run_id, pass.id, names);
        }
    }

    RgbPlanes out;
    out.R = Matrix2Df::Zero(pipeline.height, pipeline.width);
    out.G = Matrix2Df::Zero(pipeline.height, pipeline.width);
    out.B = Matrix2Df::Zero(pipeline.height, pipeline.width);

    std::mutex out_mutex;

    // Pass outputs waiting for the commit. Each holds device memory until
    // it is handed to the cache.
    struct StagedOutput {
        CacheKey key;
        std::shared_ptr<const RgbPlanes> buffer;
        Rect region;
        DeviceMemory::Reservation reservation;
    };
    std::mutex stage_mutex;
    std::vector<StagedOutput> staged;
    std::atomic<size_t> staged_dropped{0};

    std::atomic<size_t> next_tile{0};
    std::atomic<size_t> tiles_done{0};
    std::atomic<size_t> computed_total{0};
    std::atomic<size_t> cached_total{0};
    std::atomic<bool> failed{false};
    std::exception_ptr first_error;
    std::mutex error_mutex;

    const int n_passes = static_cast<int>(pipeline.passes.size());
    const int width = pipeline.width;
    const int height = pipeline.height;

    // Margin around the core that passes after k still read.
    std::vector<int> margin_after(static_cast<size_t>(n_passes), 0);
    for (int k = n_passes - 2; k >= 0; --k) {
        margin_after[static_cast<size_t>(k)] =
            margin_after[static_cast<size_t>(k) + 1] +
            pipeline.passes[static_cast<size_t>(k) + 1].footprint;
    }

    auto drop_staged = [&]() {
        std::lock_guard<std::mutex> lock(stage_mutex);
        if (staged.empty()) {
            return;
        }
        std::cerr << "[EXEC] Dropping " << staged.size()
                  << " staged cache writes to free device memory" << std::endl;
        staged_dropped.fetch_add(staged.size());
        staged.clear();
    };

    auto reserve = [&](size_t bytes) -> std::optional<DeviceMemory::Reservation> {
        auto r = device_->try_reserve(bytes);
        if (!r && cache_) {
            cache_->reclaim(bytes);
            r = device_->try_reserve(bytes);
        }
        return r;
    };

    auto stage = [&](CacheKey key, std::shared_ptr<const RgbPlanes> buffer, const Rect& region) {
        DeviceMemory::Reservation held;
        if (device_) {
            auto r = reserve(buffer->byte_size());
            if (!r) {
                staged_dropped.fetch_add(1);
                return;
            }
            held = std::move(*r);
        }
        std::lock_guard<std::mutex> lock(stage_mutex);
        staged.push_back(StagedOutput{std::move(key), std::move(buffer), region, std::move(held)});
    };

    auto process_tile = [&](const TileRegion& tile) {
        std::optional<DeviceMemory::Reservation> reservation;
        if (device_) {
            const size_t need = working_bytes(tile.region);
            reservation = reserve(need);
            if (!reservation) {
                drop_staged();
                reservation = device_->try_reserve(need);
            }
            if (!reservation) {
                throw ResourceError("tile " + tile.tile_id + " needs " +
                                    core::format_bytes(need) + " of device memory, " +
                                    core::format_bytes(device_->available()) + " available");
            }
        }

        // Latest cached pass output that still covers what later passes read.
        std::shared_ptr<const RgbPlanes> buffer;
        Rect valid;
        int start = 0;
        if (cache_) {
            for (int k = n_passes - 1; k >= 0; --k) {
                const Pass& pass = pipeline.passes[static_cast<size_t>(k)];
                if (pass.is_noop()) {
                    continue;
                }
                const Rect needed = grow_region(tile.core, margin_after[static_cast<size_t>(k)],
                                                width, height);
                CacheKey key{pipeline.image_id, pass.id, pass.cache_key, tile.tile_id};
                auto hit = cache_->get(key, needed);
                if (!hit) {
                    continue;
                }
                valid = intersect_regions(hit->region, tile.region);
                if (valid == hit->region) {
                    buffer = hit->buffer;
                } else {
                    const Rect local{valid.x - hit->region.x, valid.y - hit->region.y,
                                     valid.width, valid.height};
                    buffer = std::make_shared<const RgbPlanes>(extract_region(*hit->buffer, local));
                }
                start = k + 1;
                break;
            }
        }
        if (!buffer) {
            valid = tile.region;
            buffer = std::make_shared<const RgbPlanes>(extract_region(source, valid));
        }

        KernelContext ctx;
        ctx.image_width = width;
        ctx.image_height = height;
        ctx.scale = pipeline.scale;
        ctx.hdr_sample_max = options_.hdr_sample_max;
        ctx.source = &source;
        ctx.backend = &backend_;

        MaskRaster raster;
        raster.image_width = width;
        raster.image_height = height;
        raster.full_width = pipeline.full_width;
        raster.full_height = pipeline.full_height;
        raster.scale = pipeline.scale;

        size_t computed = 0;
        for (int k = start; k < n_passes; ++k) {
            token.throw_if_cancelled();
            const Pass& pass = pipeline.passes[static_cast<size_t>(k)];
            if (pass.is_noop()) {
                continue;
            }
            ctx.region = valid;
            raster.region = valid;
            RgbPlanes result = apply_pass(pass, *buffer, ctx, compositor_, raster);

            const Rect exact = shrink_region(valid, pass.footprint, width, height);
            if (exact != valid) {
                const Rect local{exact.x - valid.x, exact.y - valid.y, exact.width,
                                 exact.height};
                result = extract_region(result, local);
                valid = exact;
            }
            buffer = std::make_shared<const RgbPlanes>(std::move(result));
            ++computed;
            if (cache_) {
                stage(CacheKey{pipeline.image_id, pass.id, pass.cache_key, tile.tile_id}, buffer,
                      valid);
            }
        }

        {
            std::lock_guard<std::mutex> lock(out_mutex);
            paste_core(tile.core, valid, *buffer, out);
        }

        computed_total.fetch_add(computed);
        cached_total.fetch_add(static_cast<size_t>(start));
        const size_t done = tiles_done.fetch_add(1) + 1;
        if (events) {
            events->tile_done(options_.run_id, static_cast<int>(done),
                              static_cast<int>(tiles.size()), start,
                              static_cast<int>(computed));
        }
    };

    auto worker = [&]() {
        while (!failed.load(std::memory_order_relaxed)) {
            const size_t ti = next_tile.fetch_add(1);
            if (ti >= tiles.size()) {
                break;
            }
            try {
                token.throw_if_cancelled();
                process_tile(tiles[ti]);
            } catch (...) {
                std::lock_guard<std::mutex> lock(error_mutex);
                if (!first_error) {
                    first_error = std::current_exception();
                }
                failed.store(true, std::memory_order_relaxed);
            }
        }
    };

    int n_workers = std::max(1, options_.worker_threads);
    n_workers = std::min<int>(n_workers, static_cast<int>(std::max<size_t>(1, tiles.size())));

    if (n_workers > 1) {
        std::vector<std::thread> workers;
        workers.reserve(static_cast<size_t>(n_workers));
        for (int w = 0; w < n_workers; ++w) {
            workers.emplace_back(worker);
        }
        for (auto& t : workers) {
            if (t.joinable()) {
                t.join();
            }
        }
    } else {
        worker();
    }

    if (first_error) {
        std::rethrow_exception(first_error);
    }
    token.throw_if_cancelled();

    size_t writes = 0;
    if (cache_) {
        for (auto& entry : staged) {
            // The cache takes its own reservation for what it keeps.
            entry.reservation.release();
            if (cache_->put(entry.key, std::move(entry.buffer), entry.region)) {
                ++writes;
            }
        }
        staged.clear();
    }

    if (stats) {
        stats->tiles = tiles.size();
        stats->passes_computed = computed_total.load();
        stats->passes_from_cache = cached_total.load();
        stats->cache_writes = writes;
        stats->staged_dropped = staged_dropped.load();
    }
    return out;
}

} // namespace tile_develop::pipeline
