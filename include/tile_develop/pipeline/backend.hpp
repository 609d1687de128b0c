#pragma once

#include "tile_develop/core/types.hpp"
#include "tile_develop/image/convolution.hpp"
#include "tile_develop/pipeline/compiler.hpp"

#include <memory>
#include <string>

namespace tile_develop::pipeline {

/**
 * Compute device abstraction. prepare() is called once per pass before any
 * tile is dispatched and throws KernelCompileError naming the pass on
 * failure. blur() is the separable Gaussian primitive every spatial kernel
 * and the mask feather run through; it must be safe to call concurrently.
 */
class ComputeBackend {
public:
    virtual ~ComputeBackend() = default;

    virtual std::string name() const = 0;

    virtual void prepare(const Pass& pass);

    virtual Matrix2Df blur(const Matrix2Df& plane, int radius, image::SampleRange range,
                           float hdr_sample_max) = 0;
};

// Eigen planes and the in-tree separable kernel.
class CpuBackend : public ComputeBackend {
public:
    std::string name() const override { return "cpu"; }

    Matrix2Df blur(const Matrix2Df& plane, int radius, image::SampleRange range,
                   float hdr_sample_max) override;
};

// cv::sepFilter2D with replicated borders; with use_opencl the work runs on
// cv::UMat through the OpenCL device.
class OpenCvBackend : public ComputeBackend {
public:
    explicit OpenCvBackend(bool use_opencl = false);

    std::string name() const override { return use_opencl_ ? "opencl" : "opencv"; }

    Matrix2Df blur(const Matrix2Df& plane, int radius, image::SampleRange range,
                   float hdr_sample_max) override;

private:
    bool use_opencl_;
};

// "cpu" | "opencv" | "opencl". Throws BackendError for an unknown name or a
// device that cannot be initialized; there is no fallback to another backend.
std::unique_ptr<ComputeBackend> make_backend(const std::string& name);

} // namespace tile_develop::pipeline
