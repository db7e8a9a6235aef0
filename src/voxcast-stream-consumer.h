#pragma once

#include "voxcast-wav.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

static constexpr size_t k_voxcast_default_chunk_bytes   = 4800;
static constexpr size_t k_voxcast_default_probe_window  = 4096;

class voxcast_playback_sink {
public:
    virtual ~voxcast_playback_sink() = default;

    // Queues `samples` to start right after everything queued before.
    virtual void play_chunk(const std::vector<float> & samples, int32_t sample_rate) = 0;

    // Drops queued audio that has not started yet and rewinds the cursor.
    virtual void reset() = 0;
};

// Running cursor for back-to-back buffer starts.
class voxcast_gapless_scheduler {
public:
    using clock_fn = std::function<double()>;

    explicit voxcast_gapless_scheduler(clock_fn clock);

    // start = max(now, cursor); cursor = start + duration.
    double schedule_next(double duration_sec);
    void reset();

    double next_start_time() const { return next_start_; }

private:
    clock_fn clock_;
    double next_start_ = 0.0;
};

enum voxcast_consumer_state {
    VOXCAST_CONSUMER_AWAITING_HEADER = 0,
    VOXCAST_CONSUMER_STREAMING       = 1,
    VOXCAST_CONSUMER_TERMINATED      = 2,
};

struct voxcast_consumer_params {
    size_t chunk_bytes = k_voxcast_default_chunk_bytes;
    size_t probe_window = k_voxcast_default_probe_window;
};

// Incremental decoder for one streamed response. Bytes go in through feed()
// as they arrive; finish() is called once at end of stream.
class voxcast_stream_consumer {
public:
    voxcast_stream_consumer(const voxcast_consumer_params & params, voxcast_playback_sink * sink);

    // Returns false once the stream has failed. Bytes fed after termination are ignored.
    bool feed(const char * data, size_t len);
    bool finish();

    // Stops decoding; anything still arriving is drained and ignored.
    void cancel();

    voxcast_consumer_state state() const { return state_; }
    bool completed() const { return completed_; }
    bool failed() const { return failed_; }
    bool cancelled() const { return cancelled_; }
    const std::string & error() const { return error_; }
    const std::string & job_id() const { return job_id_; }
    int32_t sample_rate() const { return (int32_t) format_.sample_rate; }
    size_t chunks_scheduled() const { return chunks_scheduled_; }
    size_t pcm_bytes() const { return pcm_.size(); }

    // Length-correct WAV of every PCM byte received. Only for completed streams.
    bool build_artifact(std::vector<uint8_t> & wav_out, std::string & err) const;

private:
    bool consume_header();
    void drain_chunks();
    void schedule(size_t n_bytes);
    bool fail(const std::string & message);

    voxcast_consumer_params params_;
    voxcast_playback_sink * sink_ = nullptr;

    voxcast_consumer_state state_ = VOXCAST_CONSUMER_AWAITING_HEADER;
    bool completed_ = false;
    bool failed_ = false;
    bool cancelled_ = false;
    std::string error_;
    std::string job_id_;

    voxcast_wav_format format_;
    std::vector<uint8_t> buffer_;
    std::vector<uint8_t> pcm_;
    std::vector<float> scratch_;
    size_t chunks_scheduled_ = 0;
};

const char * voxcast_consumer_state_to_cstr(voxcast_consumer_state s);
