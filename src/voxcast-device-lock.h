#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

struct voxcast_device_slot {
    std::string name;
    std::string engine_url;
    std::timed_mutex mtx;
    std::atomic<int32_t> waiting {0};
    std::atomic<bool> held {false};
};

// Exclusive hold on one device. Releases on destruction; movable, not copyable.
class voxcast_device_guard {
public:
    voxcast_device_guard() = default;
    ~voxcast_device_guard();

    voxcast_device_guard(voxcast_device_guard && other) noexcept;
    voxcast_device_guard & operator=(voxcast_device_guard && other) noexcept;

    voxcast_device_guard(const voxcast_device_guard &) = delete;
    voxcast_device_guard & operator=(const voxcast_device_guard &) = delete;

    bool owns() const { return slot_ != nullptr; }
    size_t device_index() const { return device_index_; }

    void release();

private:
    friend class voxcast_device_registry;

    voxcast_device_slot * slot_ = nullptr;
    size_t device_index_ = 0;
};

// One mutual-exclusion lock per accelerator, created at startup and kept for
// the process lifetime. Holders of different devices never block each other.
class voxcast_device_registry {
public:
    voxcast_device_registry(const std::vector<std::string> & names, const std::vector<std::string> & engine_urls = {});

    voxcast_device_registry(const voxcast_device_registry &) = delete;
    voxcast_device_registry & operator=(const voxcast_device_registry &) = delete;

    size_t size() const { return slots_.size(); }
    const std::string & name(size_t device_index) const;
    const std::string & engine_url(size_t device_index) const;

    // Blocks until the device is free. There is no timeout on this path.
    bool acquire(size_t device_index, voxcast_device_guard & guard, std::string & err);

    // Bounded wait; returns false with err set on timeout.
    bool try_acquire_for(
            size_t device_index,
            std::chrono::milliseconds timeout,
            voxcast_device_guard & guard,
            std::string & err);

    int32_t waiting(size_t device_index) const;
    bool held(size_t device_index) const;

private:
    bool check_index(size_t device_index, std::string & err) const;

    std::vector<std::unique_ptr<voxcast_device_slot>> slots_;
};
