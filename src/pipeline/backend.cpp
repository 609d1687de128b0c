#include "tile_develop/pipeline/backend.hpp"
#include "tile_develop/core/errors.hpp"
#include "tile_develop/pipeline/kernels.hpp"

#include <opencv2/core/ocl.hpp>
#include <opencv2/opencv.hpp>

#include <algorithm>
#include <iostream>

namespace tile_develop::pipeline {

void ComputeBackend::prepare(const Pass& pass) {
    for (const auto& k : pass.kernels) {
        if (!is_known_kernel(k)) {
            throw KernelCompileError(pass.id, "backend '" + name() + "' has no kernel '" + k + "'");
        }
    }
}

Matrix2Df CpuBackend::blur(const Matrix2Df& plane, int radius, image::SampleRange range,
                           float hdr_sample_max) {
    return image::separable_blur(plane, radius, range, hdr_sample_max);
}

OpenCvBackend::OpenCvBackend(bool use_opencl)
    : use_opencl_(use_opencl) {
    if (!use_opencl_) {
        return;
    }
    if (!cv::ocl::haveOpenCL()) {
        throw BackendError("opencl", "no OpenCL runtime available");
    }
    cv::ocl::setUseOpenCL(true);
    if (!cv::ocl::useOpenCL()) {
        throw BackendError("opencl", "OpenCL device could not be activated");
    }
    const cv::ocl::Device& dev = cv::ocl::Device::getDefault();
    std::cerr << "[RENDER] OpenCL device: " << dev.name() << std::endl;
}

Matrix2Df OpenCvBackend::blur(const Matrix2Df& plane, int radius, image::SampleRange range,
                              float hdr_sample_max) {
    const int rows = static_cast<int>(plane.rows());
    const int cols = static_cast<int>(plane.cols());
    if (plane.size() == 0) {
        return plane;
    }

    cv::Mat src(rows, cols, CV_32F, const_cast<float*>(plane.data()));
    cv::Mat work = src.clone();
    if (range == image::SampleRange::EXTENDED) {
        cv::patchNaNs(work, 0.0);
        cv::min(work, hdr_sample_max, work);
        cv::max(work, -hdr_sample_max, work);
    }

    std::vector<float> weights = image::make_gaussian_kernel(radius);
    double total = 0.0;
    for (float w : weights) total += w;

    cv::Mat result;
    if (radius <= 0 || total <= 0.0) {
        result = work;
    } else {
        cv::Mat kernel(static_cast<int>(weights.size()), 1, CV_32F);
        for (size_t i = 0; i < weights.size(); ++i) {
            kernel.at<float>(static_cast<int>(i)) = static_cast<float>(weights[i] / total);
        }
        if (use_opencl_) {
            cv::UMat usrc = work.getUMat(cv::ACCESS_READ);
            cv::UMat udst;
            cv::sepFilter2D(usrc, udst, CV_32F, kernel, kernel, cv::Point(-1, -1), 0.0,
                            cv::BORDER_REPLICATE);
            result = udst.getMat(cv::ACCESS_READ).clone();
        } else {
            cv::sepFilter2D(work, result, CV_32F, kernel, kernel, cv::Point(-1, -1), 0.0,
                            cv::BORDER_REPLICATE);
        }
    }

    Matrix2Df out(rows, cols);
    for (int y = 0; y < rows; ++y) {
        const float* row = result.ptr<float>(y);
        std::copy(row, row + cols, out.data() + static_cast<size_t>(y) * cols);
    }
    return out;
}

std::unique_ptr<ComputeBackend> make_backend(const std::string& name) {
    if (name == "cpu") {
        return std::make_unique<CpuBackend>();
    }
    if (name == "opencv") {
        return std::make_unique<OpenCvBackend>(false);
    }
    if (name == "opencl") {
        return std::make_unique<OpenCvBackend>(true);
    }
    throw BackendError(name, "unknown backend (expected cpu, opencv or opencl)");
}

} // namespace tile_develop::pipeline
