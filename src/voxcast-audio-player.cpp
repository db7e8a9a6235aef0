#include "voxcast-audio-player.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <condition_variable>
#include <cstdio>
#include <deque>
#include <mutex>

#define MINIAUDIO_IMPLEMENTATION
#define MA_NO_ENCODING
#define MA_NO_DECODING
#define MA_NO_RESOURCE_MANAGER
#define MA_NO_NODE_GRAPH
#define MA_NO_ENGINE
#define MA_NO_GENERATION
#define MA_API static
#include <miniaudio.h>

namespace {

struct scheduled_buffer {
    uint64_t start_frame = 0;
    std::vector<float> samples;
};

} // namespace

struct voxcast_audio_player_impl {
    ma_device device;
    bool device_open = false;
    uint32_t sample_rate = 0;

    std::mutex mtx;
    std::condition_variable drained_cv;
    std::deque<scheduled_buffer> queue;
    std::atomic<uint64_t> frames_rendered {0};

    voxcast_gapless_scheduler scheduler;
    std::string last_error;

    voxcast_audio_player_impl()
        : scheduler([this]() { return clock_seconds(); }) {
    }

    double clock_seconds() const {
        if (sample_rate == 0) {
            return 0.0;
        }
        return (double) frames_rendered.load() / (double) sample_rate;
    }
};

static void data_callback(ma_device * device, void * output, const void * /* input */, ma_uint32 frame_count) {
    auto * impl = static_cast<voxcast_audio_player_impl *>(device->pUserData);
    float * out = static_cast<float *>(output);
    std::fill(out, out + frame_count, 0.0f);

    bool drained = false;
    {
        std::lock_guard<std::mutex> lock(impl->mtx);
        const uint64_t base = impl->frames_rendered.load();
        for (ma_uint32 i = 0; i < frame_count; ++i) {
            const uint64_t frame = base + i;
            while (!impl->queue.empty()) {
                const scheduled_buffer & front = impl->queue.front();
                if (frame < front.start_frame) {
                    break;
                }
                const uint64_t idx = frame - front.start_frame;
                if (idx >= front.samples.size()) {
                    impl->queue.pop_front();
                    continue;
                }
                out[i] = front.samples[(size_t) idx];
                break;
            }
        }
        impl->frames_rendered.store(base + frame_count);
        drained = impl->queue.empty();
    }
    if (drained) {
        impl->drained_cv.notify_all();
    }
}

voxcast_audio_player::voxcast_audio_player()
    : impl_(std::make_unique<voxcast_audio_player_impl>()) {
}

voxcast_audio_player::~voxcast_audio_player() {
    close();
}

bool voxcast_audio_player::open(int32_t sample_rate, std::string & err) {
    close();
    if (sample_rate <= 0) {
        err = "invalid playback sample rate: " + std::to_string(sample_rate);
        return false;
    }

    ma_device_config config = ma_device_config_init(ma_device_type_playback);
    config.playback.format = ma_format_f32;
    config.playback.channels = 1;
    config.sampleRate = (ma_uint32) sample_rate;
    config.dataCallback = data_callback;
    config.pUserData = impl_.get();

    impl_->frames_rendered.store(0);
    impl_->sample_rate = (uint32_t) sample_rate;
    impl_->scheduler.reset();

    ma_result result = ma_device_init(nullptr, &config, &impl_->device);
    if (result != MA_SUCCESS) {
        err = std::string("ma_device_init failed: ") + ma_result_description(result);
        return false;
    }
    result = ma_device_start(&impl_->device);
    if (result != MA_SUCCESS) {
        ma_device_uninit(&impl_->device);
        err = std::string("ma_device_start failed: ") + ma_result_description(result);
        return false;
    }
    impl_->device_open = true;
    return true;
}

void voxcast_audio_player::close() {
    if (!impl_->device_open) {
        return;
    }
    ma_device_uninit(&impl_->device);
    impl_->device_open = false;
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->queue.clear();
}

bool voxcast_audio_player::is_open() const {
    return impl_->device_open;
}

void voxcast_audio_player::play_chunk(const std::vector<float> & samples, int32_t sample_rate) {
    if (samples.empty()) {
        return;
    }
    if (!impl_->device_open || impl_->sample_rate != (uint32_t) sample_rate) {
        std::string err;
        if (!open(sample_rate, err)) {
            impl_->last_error = err;
            std::fprintf(stderr, "playback: open failed rate=%d err=%s\n", sample_rate, err.c_str());
            return;
        }
    }

    const double duration = (double) samples.size() / (double) sample_rate;
    const double start = impl_->scheduler.schedule_next(duration);

    scheduled_buffer buf;
    buf.start_frame = (uint64_t) std::llround(start * (double) sample_rate);
    buf.samples = samples;

    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->queue.push_back(std::move(buf));
}

void voxcast_audio_player::reset() {
    {
        std::lock_guard<std::mutex> lock(impl_->mtx);
        impl_->queue.clear();
    }
    impl_->scheduler.reset();
    impl_->drained_cv.notify_all();
}

double voxcast_audio_player::current_time() const {
    return impl_->clock_seconds();
}

bool voxcast_audio_player::wait_until_drained(int32_t timeout_ms) {
    if (!impl_->device_open) {
        return true;
    }
    std::unique_lock<std::mutex> lock(impl_->mtx);
    return impl_->drained_cv.wait_for(lock, std::chrono::milliseconds(timeout_ms), [&]() {
        return impl_->queue.empty();
    });
}

const std::string & voxcast_audio_player::last_error() const {
    return impl_->last_error;
}
