#include "voxcast-device-lock.h"

#include <utility>

voxcast_device_guard::~voxcast_device_guard() {
    release();
}

voxcast_device_guard::voxcast_device_guard(voxcast_device_guard && other) noexcept
    : slot_(other.slot_), device_index_(other.device_index_) {
    other.slot_ = nullptr;
}

voxcast_device_guard & voxcast_device_guard::operator=(voxcast_device_guard && other) noexcept {
    if (this != &other) {
        release();
        slot_ = other.slot_;
        device_index_ = other.device_index_;
        other.slot_ = nullptr;
    }
    return *this;
}

void voxcast_device_guard::release() {
    if (slot_ == nullptr) {
        return;
    }
    slot_->held.store(false);
    slot_->mtx.unlock();
    slot_ = nullptr;
}

voxcast_device_registry::voxcast_device_registry(
        const std::vector<std::string> & names,
        const std::vector<std::string> & engine_urls) {
    slots_.reserve(names.size());
    for (size_t i = 0; i < names.size(); ++i) {
        auto slot = std::make_unique<voxcast_device_slot>();
        slot->name = names[i];
        if (!engine_urls.empty()) {
            slot->engine_url = engine_urls[i % engine_urls.size()];
        }
        slots_.push_back(std::move(slot));
    }
}

const std::string & voxcast_device_registry::name(size_t device_index) const {
    return slots_.at(device_index)->name;
}

const std::string & voxcast_device_registry::engine_url(size_t device_index) const {
    return slots_.at(device_index)->engine_url;
}

bool voxcast_device_registry::check_index(size_t device_index, std::string & err) const {
    if (device_index >= slots_.size()) {
        err = "invalid device index " + std::to_string(device_index) +
              " (available: " + std::to_string(slots_.size()) + ")";
        return false;
    }
    return true;
}

bool voxcast_device_registry::acquire(size_t device_index, voxcast_device_guard & guard, std::string & err) {
    if (!check_index(device_index, err)) {
        return false;
    }
    guard.release();

    voxcast_device_slot & slot = *slots_[device_index];
    slot.waiting.fetch_add(1);
    slot.mtx.lock();
    slot.waiting.fetch_sub(1);
    slot.held.store(true);

    guard.slot_ = &slot;
    guard.device_index_ = device_index;
    return true;
}

bool voxcast_device_registry::try_acquire_for(
        size_t device_index,
        std::chrono::milliseconds timeout,
        voxcast_device_guard & guard,
        std::string & err) {
    if (!check_index(device_index, err)) {
        return false;
    }
    guard.release();

    voxcast_device_slot & slot = *slots_[device_index];
    slot.waiting.fetch_add(1);
    const bool ok = slot.mtx.try_lock_for(timeout);
    slot.waiting.fetch_sub(1);
    if (!ok) {
        err = "device " + slot.name + " busy: timed out after " + std::to_string(timeout.count()) + " ms";
        return false;
    }
    slot.held.store(true);

    guard.slot_ = &slot;
    guard.device_index_ = device_index;
    return true;
}

int32_t voxcast_device_registry::waiting(size_t device_index) const {
    return device_index < slots_.size() ? slots_[device_index]->waiting.load() : 0;
}

bool voxcast_device_registry::held(size_t device_index) const {
    return device_index < slots_.size() && slots_[device_index]->held.load();
}
