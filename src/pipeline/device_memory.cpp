#include "tile_develop/pipeline/device_memory.hpp"

namespace tile_develop::pipeline {

DeviceMemory::Reservation::Reservation(Reservation&& other) noexcept
    : owner_(other.owner_), bytes_(other.bytes_) {
    other.owner_ = nullptr;
    other.bytes_ = 0;
}

DeviceMemory::Reservation& DeviceMemory::Reservation::operator=(Reservation&& other) noexcept {
    if (this != &other) {
        release();
        owner_ = other.owner_;
        bytes_ = other.bytes_;
        other.owner_ = nullptr;
        other.bytes_ = 0;
    }
    return *this;
}

DeviceMemory::Reservation::~Reservation() {
    release();
}

void DeviceMemory::Reservation::release() {
    if (owner_ != nullptr) {
        owner_->give_back(bytes_);
    }
    owner_ = nullptr;
    bytes_ = 0;
}

DeviceMemory::DeviceMemory(size_t budget_bytes)
    : budget_(budget_bytes) {}

std::optional<DeviceMemory::Reservation> DeviceMemory::try_reserve(size_t bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (bytes > budget_ - used_) {
        return std::nullopt;
    }
    used_ += bytes;
    return Reservation(this, bytes);
}

size_t DeviceMemory::used() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return used_;
}

size_t DeviceMemory::available() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return budget_ - used_;
}

void DeviceMemory::give_back(size_t bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    used_ -= bytes;
}

} // namespace tile_develop::pipeline
