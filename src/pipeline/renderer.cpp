#include "tile_develop/pipeline/renderer.hpp"
#include "tile_develop/core/errors.hpp"
#include "tile_develop/core/utils.hpp"
#include "tile_develop/pipeline/compiler.hpp"
#include "tile_develop/pipeline/tile_scheduler.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>

namespace tile_develop::pipeline {

namespace {

constexpr size_t kMiB = 1024 * 1024;

const char* lane_name(RenderLane lane) {
    return lane == RenderLane::PREVIEW ? "preview" : "full";
}

} // namespace

RenderHandle::RenderHandle(std::shared_future<image::PixelBuffer> future,
                           std::shared_ptr<CancellationToken> token, uint64_t version)
    : future_(std::move(future)), token_(std::move(token)), version_(version) {}

image::PixelBuffer RenderHandle::get() const {
    if (!future_.valid()) {
        throw PipelineError("render handle has no run");
    }
    return future_.get();
}

bool RenderHandle::ready() const {
    return future_.valid() &&
           future_.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

void RenderHandle::wait() const {
    if (future_.valid()) {
        future_.wait();
    }
}

void RenderHandle::cancel() {
    if (token_) {
        token_->cancel();
    }
}

bool RenderHandle::cancelled() const {
    return token_ && token_->cancelled();
}

Renderer::Renderer(config::Config cfg, std::ostream* events)
    : Renderer(cfg, make_backend(cfg.backend.name), events) {}

Renderer::Renderer(config::Config cfg, std::unique_ptr<ComputeBackend> backend,
                   std::ostream* events)
    : cfg_(std::move(cfg)),
      backend_(std::move(backend)),
      device_(static_cast<size_t>(cfg_.device.memory_budget_mb) * kMiB),
      events_(events) {
    cfg_.validate();
    if (!backend_) {
        throw BackendError("<none>", "no compute backend given");
    }
    if (cfg_.cache.enabled) {
        cache_ = std::make_unique<ResultCache>(
            static_cast<size_t>(cfg_.cache.memory_budget_mb) * kMiB, &device_);
    }
    std::cerr << "[RENDER] Backend " << backend_->name() << ", device budget "
              << core::format_bytes(device_.budget()) << ", cache "
              << (cache_ ? core::format_bytes(cache_->budget()) : std::string("disabled"))
              << std::endl;
}

Renderer::~Renderer() {
    std::vector<std::pair<std::shared_ptr<CancellationToken>,
                          std::shared_future<image::PixelBuffer>>> runs;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        runs.swap(runs_);
    }
    for (auto& run : runs) {
        run.first->cancel();
    }
    for (auto& run : runs) {
        run.second.wait();
    }
}

image::PixelBuffer Renderer::render(const edit::EditState& state,
                                    std::shared_ptr<const image::Image> image,
                                    int target_resolution) {
    return submit(state, std::move(image), target_resolution).get();
}

image::PixelBuffer Renderer::render(const edit::EditState& state, const image::Image& image,
                                    int target_resolution) {
    return submit(state, image, target_resolution).get();
}

RenderHandle Renderer::submit(const edit::EditState& state,
                              std::shared_ptr<const image::Image> image, int target_resolution) {
    return launch(RenderLane::FULL, state, std::move(image), target_resolution);
}

RenderHandle Renderer::submit(const edit::EditState& state, const image::Image& image,
                              int target_resolution) {
    return submit(state, std::make_shared<const image::Image>(image), target_resolution);
}

RenderHandle Renderer::submit_preview(const edit::EditState& state,
                                      std::shared_ptr<const image::Image> image) {
    const int edge = cfg_.preview.enabled ? cfg_.preview.max_edge : 0;
    return launch(RenderLane::PREVIEW, state, std::move(image), edge);
}

RenderHandle Renderer::submit_preview(const edit::EditState& state, const image::Image& image) {
    return submit_preview(state, std::make_shared<const image::Image>(image));
}

RenderHandle Renderer::launch(RenderLane lane, const edit::EditState& state,
                              std::shared_ptr<const image::Image> image, int target_resolution) {
    if (!image) {
        throw PipelineError("render submitted without an image");
    }
    auto token = std::make_shared<CancellationToken>();
    const auto slot = std::make_pair(image->id, lane);
    uint64_t version = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = in_flight_.find(slot);
        if (it != in_flight_.end()) {
            it->second->cancel();
        }
        in_flight_[slot] = token;
        version = ++versions_[slot];

        runs_.erase(std::remove_if(runs_.begin(), runs_.end(),
                                   [](const auto& run) {
                                       return run.second.wait_for(std::chrono::seconds(0)) ==
                                              std::future_status::ready;
                                   }),
                    runs_.end());
    }

    std::shared_future<image::PixelBuffer> future =
        std::async(std::launch::async,
                   [this, state, image, target_resolution, token]() {
                       return execute(state, *image, target_resolution, *token);
                   })
            .share();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        runs_.emplace_back(token, future);
    }
    std::cerr << "[RENDER] Submitted " << lane_name(lane) << " run v" << version << " for "
              << image->id << std::endl;
    return RenderHandle(future, token, version);
}

image::PixelBuffer Renderer::execute(const edit::EditState& state, const image::Image& image,
                                     int target_resolution, const CancellationToken& token) {
    const std::string run_id = core::get_run_id();
    core::EventEmitter* events = events_.enabled() ? &events_ : nullptr;

    try {
        const double scale = image::scale_for_target(image.width, image.height, target_resolution);
        if (events) {
            events->run_start(run_id, {{"image_id", image.id},
                                       {"width", image.width},
                                       {"height", image.height},
                                       {"target_resolution", target_resolution},
                                       {"scale", scale},
                                       {"backend", backend_->name()},
                                       {"groups", state.size()}});
        }

        const CompiledPipeline pipeline =
            compile(state, image.id, image.width, image.height, scale);
        for (const auto& pass : pipeline.passes) {
            backend_->prepare(pass);
        }
        token.throw_if_cancelled();

        image::Image scaled;
        const image::Image* src = &image;
        if (pipeline.scale < 1.0) {
            scaled = image::downscale(image, pipeline.scale);
            src = &scaled;
        }
        const RgbPlanes planes = image::to_planes(*src);
        const Matrix2Df alpha = image::alpha_plane(*src);

        ExecutorOptions opts;
        opts.worker_threads = cfg_.backend.worker_threads;
        opts.hdr_sample_max = cfg_.numeric.hdr_sample_max;
        opts.run_id = run_id;
        opts.events = events;
        PassExecutor executor(*backend_, &device_, cache_.get(), opts);

        const int margin = pipeline.halo + scaled_radius(cfg_.tiles.reserve_margin, pipeline.scale);
        int tile_size = cfg_.tiles.tile_size;
        bool retried = false;
        RgbPlanes out;
        RunStats stats;
        while (true) {
            const auto tiles = build_tile_grid(pipeline.width, pipeline.height, tile_size,
                                               margin);
            try {
                out = executor.run(pipeline, planes, tiles, token, &stats);
                break;
            } catch (const ResourceError& e) {
                const int smaller = std::max(cfg_.tiles.min_tile_size, tile_size / 2);
                if (retried || smaller >= tile_size) {
                    throw;
                }
                std::cerr << "[RENDER] " << e.what() << "; retrying with tile size " << smaller
                          << std::endl;
                if (events) {
                    events->warning(run_id, std::string(e.what()) + "; retrying with tile size " +
                                                std::to_string(smaller));
                }
                tile_size = smaller;
                retried = true;
            }
        }

        image::PixelBuffer result = image::from_planes(out, alpha, *src);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            last_stats_ = stats;
        }
        if (events) {
            events->run_end(run_id, true, "ok",
                            {{"tiles", stats.tiles},
                             {"passes", pipeline.passes.size()},
                             {"halo", pipeline.halo},
                             {"passes_computed", stats.passes_computed},
                             {"passes_from_cache", stats.passes_from_cache},
                             {"cache_writes", stats.cache_writes},
                             {"staged_dropped", stats.staged_dropped}});
        }
        return result;
    } catch (const RenderCancelled&) {
        if (events) {
            events->run_end(run_id, false, "cancelled");
        }
        throw;
    } catch (const std::exception& e) {
        std::cerr << "[RENDER] Run " << run_id << " failed: " << e.what() << std::endl;
        if (events) {
            events->error(run_id, e.what());
            events->run_end(run_id, false, "error");
        }
        throw;
    }
}

size_t Renderer::flush_cache(const ImageId& image_id) {
    if (!cache_) {
        return 0;
    }
    const size_t removed = cache_->flush(image_id);
    if (events_.enabled()) {
        events_.cache_flush(image_id, removed);
    }
    return removed;
}

RunStats Renderer::last_stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_stats_;
}

} // namespace tile_develop::pipeline
