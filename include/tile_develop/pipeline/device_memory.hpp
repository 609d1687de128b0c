#pragma once

#include <cstddef>
#include <mutex>
#include <optional>

namespace tile_develop::pipeline {

/**
 * Byte budget of the compute device, shared by tile working buffers and
 * cache entries. A Reservation returns its bytes when destroyed.
 */
class DeviceMemory {
public:
    class Reservation {
    public:
        Reservation() = default;
        Reservation(Reservation&& other) noexcept;
        Reservation& operator=(Reservation&& other) noexcept;
        Reservation(const Reservation&) = delete;
        Reservation& operator=(const Reservation&) = delete;
        ~Reservation();

        size_t bytes() const { return bytes_; }
        void release();

    private:
        friend class DeviceMemory;
        Reservation(DeviceMemory* owner, size_t bytes) : owner_(owner), bytes_(bytes) {}

        DeviceMemory* owner_ = nullptr;
        size_t bytes_ = 0;
    };

    explicit DeviceMemory(size_t budget_bytes);

    DeviceMemory(const DeviceMemory&) = delete;
    DeviceMemory& operator=(const DeviceMemory&) = delete;

    // Empty when the bytes do not fit into what is left of the budget.
    std::optional<Reservation> try_reserve(size_t bytes);

    size_t budget() const { return budget_; }
    size_t used() const;
    size_t available() const;

private:
    void give_back(size_t bytes);

    const size_t budget_;
    mutable std::mutex mutex_;
    size_t used_ = 0;
};

} // namespace tile_develop::pipeline
