#include "voxcast-stream-consumer.h"
#include "voxcast-stream-protocol.h"

#include <algorithm>
#include <cstring>
#include <utility>

voxcast_gapless_scheduler::voxcast_gapless_scheduler(clock_fn clock)
    : clock_(std::move(clock)) {
}

double voxcast_gapless_scheduler::schedule_next(double duration_sec) {
    const double now = clock_ ? clock_() : 0.0;
    const double start = std::max(now, next_start_);
    next_start_ = start + std::max(duration_sec, 0.0);
    return start;
}

void voxcast_gapless_scheduler::reset() {
    next_start_ = 0.0;
}

voxcast_stream_consumer::voxcast_stream_consumer(const voxcast_consumer_params & params, voxcast_playback_sink * sink)
    : params_(params), sink_(sink) {
    if (params_.chunk_bytes < 2) {
        params_.chunk_bytes = 2;
    }
    if (params_.probe_window < k_voxcast_wav_header_bytes) {
        params_.probe_window = k_voxcast_wav_header_bytes;
    }
}

static bool starts_like_marker(const std::vector<uint8_t> & buf) {
    const size_t n = std::min(buf.size(), std::strlen(k_voxcast_marker_open));
    return n > 0 && std::memcmp(buf.data(), k_voxcast_marker_open, n) == 0;
}

bool voxcast_stream_consumer::fail(const std::string & message) {
    state_ = VOXCAST_CONSUMER_TERMINATED;
    failed_ = true;
    completed_ = false;
    error_ = message;
    buffer_.clear();
    return false;
}

bool voxcast_stream_consumer::consume_header() {
    if (starts_like_marker(buffer_)) {
        // header-less stream: the server failed before any audio
        const size_t probe_n = std::min(buffer_.size(), params_.probe_window);
        voxcast_marker marker;
        if (voxcast_find_marker(buffer_.data(), probe_n, marker)) {
            if (marker.type == VOXCAST_MARKER_ERROR) {
                return fail(marker.value);
            }
            return fail("stream ended before audio header");
        }
        if (buffer_.size() >= params_.probe_window) {
            return fail("invalid stream: unterminated marker before audio header");
        }
        return true;
    }

    if (buffer_.size() < k_voxcast_wav_header_bytes) {
        return true;
    }

    uint32_t data_size = 0;
    std::string err;
    if (!voxcast_wav_parse_header(buffer_.data(), buffer_.size(), format_, data_size, err)) {
        return fail(err);
    }
    buffer_.erase(buffer_.begin(), buffer_.begin() + (std::ptrdiff_t) k_voxcast_wav_header_bytes);
    state_ = VOXCAST_CONSUMER_STREAMING;
    return true;
}

void voxcast_stream_consumer::schedule(size_t n_bytes) {
    n_bytes &= ~(size_t) 1;
    if (n_bytes == 0) {
        return;
    }
    pcm_.insert(pcm_.end(), buffer_.begin(), buffer_.begin() + (std::ptrdiff_t) n_bytes);
    voxcast_pcm16le_to_float(buffer_.data(), n_bytes, scratch_);
    buffer_.erase(buffer_.begin(), buffer_.begin() + (std::ptrdiff_t) n_bytes);
    ++chunks_scheduled_;
    if (sink_ != nullptr) {
        sink_->play_chunk(scratch_, (int32_t) format_.sample_rate);
    }
}

void voxcast_stream_consumer::drain_chunks() {
    for (;;) {
        size_t limit = buffer_.size();
        const size_t marker_at = voxcast_find_marker_start(buffer_.data(), limit);
        if (marker_at != std::string::npos) {
            limit = marker_at;
        } else {
            limit -= voxcast_marker_partial_tail(buffer_.data(), limit);
        }
        if (limit < params_.chunk_bytes) {
            return;
        }
        schedule(limit);
        if (marker_at != std::string::npos) {
            return;
        }
    }
}

bool voxcast_stream_consumer::feed(const char * data, size_t len) {
    if (state_ == VOXCAST_CONSUMER_TERMINATED) {
        return !failed_;
    }
    if (len > 0) {
        buffer_.insert(buffer_.end(), reinterpret_cast<const uint8_t *>(data), reinterpret_cast<const uint8_t *>(data) + len);
    }

    if (state_ == VOXCAST_CONSUMER_AWAITING_HEADER) {
        if (!consume_header()) {
            return false;
        }
        if (state_ != VOXCAST_CONSUMER_STREAMING) {
            return true;
        }
    }

    drain_chunks();
    return true;
}

bool voxcast_stream_consumer::finish() {
    if (state_ == VOXCAST_CONSUMER_TERMINATED) {
        return completed_;
    }

    if (state_ == VOXCAST_CONSUMER_AWAITING_HEADER) {
        voxcast_marker marker;
        if (voxcast_find_marker(buffer_.data(), std::min(buffer_.size(), params_.probe_window), marker) &&
                marker.type == VOXCAST_MARKER_ERROR) {
            return fail(marker.value);
        }
        return fail(buffer_.empty() ? "empty stream" : "stream ended before audio header");
    }

    voxcast_marker marker;
    if (!voxcast_find_terminal_marker(buffer_.data(), buffer_.size(), marker)) {
        return fail("stream ended without a completion marker");
    }
    if (marker.type == VOXCAST_MARKER_ERROR) {
        return fail(marker.value);
    }

    schedule(marker.offset);
    buffer_.clear();
    job_id_ = marker.value;
    state_ = VOXCAST_CONSUMER_TERMINATED;
    completed_ = true;
    return true;
}

void voxcast_stream_consumer::cancel() {
    if (state_ == VOXCAST_CONSUMER_TERMINATED) {
        return;
    }
    cancelled_ = true;
    fail("cancelled");
}

bool voxcast_stream_consumer::build_artifact(std::vector<uint8_t> & wav_out, std::string & err) const {
    if (!completed_) {
        err = failed_ ? "stream failed: " + error_ : "stream not finished";
        return false;
    }
    wav_out = voxcast_wav_encode_pcm_bytes(pcm_.data(), pcm_.size(), format_.sample_rate);
    return true;
}

const char * voxcast_consumer_state_to_cstr(voxcast_consumer_state s) {
    switch (s) {
        case VOXCAST_CONSUMER_AWAITING_HEADER: return "awaiting_header";
        case VOXCAST_CONSUMER_STREAMING:       return "streaming";
        case VOXCAST_CONSUMER_TERMINATED:      return "terminated";
        default:                               return "unknown";
    }
}
