#pragma once

#include <stdexcept>
#include <string>

namespace tile_develop {

class TileDevelopError : public std::runtime_error {
public:
    explicit TileDevelopError(const std::string& message)
        : std::runtime_error(message) {}
};

class ConfigError : public TileDevelopError {
public:
    explicit ConfigError(const std::string& message)
        : TileDevelopError("Config error: " + message) {}
};

// Compute backend could not be initialized. The caller may retry with an
// explicit backend selection; there is no implicit fallback.
class BackendError : public ConfigError {
public:
    BackendError(const std::string& backend, const std::string& message)
        : ConfigError("backend '" + backend + "': " + message), backend_(backend) {}

    const std::string& backend() const { return backend_; }

private:
    std::string backend_;
};

class ValidationError : public TileDevelopError {
public:
    explicit ValidationError(const std::string& message)
        : TileDevelopError("Validation error: " + message) {}
};

class IOError : public TileDevelopError {
public:
    explicit IOError(const std::string& message)
        : TileDevelopError("I/O error: " + message) {}
};

class DecodeError : public IOError {
public:
    explicit DecodeError(const std::string& message)
        : IOError("decode error: " + message) {}
};

class PipelineError : public TileDevelopError {
public:
    explicit PipelineError(const std::string& message)
        : TileDevelopError("Pipeline error: " + message) {}
};

class KernelCompileError : public PipelineError {
public:
    KernelCompileError(int pass_id, const std::string& message)
        : PipelineError("kernel preparation failed for pass " + std::to_string(pass_id) +
                        ": " + message),
          pass_id_(pass_id) {}

    int pass_id() const { return pass_id_; }

private:
    int pass_id_;
};

class ResourceError : public TileDevelopError {
public:
    explicit ResourceError(const std::string& message)
        : TileDevelopError("Resource error: " + message) {}
};

class RenderCancelled : public TileDevelopError {
public:
    RenderCancelled() : TileDevelopError("Render cancelled") {}
};

} // namespace tile_develop
