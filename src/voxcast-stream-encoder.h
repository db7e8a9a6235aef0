#pragma once

#include "voxcast-job-cache.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

// Receives one block of float samples in [-1, 1]. Returning false aborts the source.
using voxcast_chunk_callback = std::function<bool(const float * samples, size_t n_samples, int32_t sample_rate)>;

// Produces a finite, single-pass sequence of chunks by calling `on_chunk`.
// Failure is reported by returning false with `err` set, or by throwing.
using voxcast_chunk_source = std::function<bool(const voxcast_chunk_callback & on_chunk, std::string & err)>;

// Writes raw response bytes. Returning false means the peer is gone.
using voxcast_byte_writer = std::function<bool(const char * data, size_t len)>;

struct voxcast_stream_result {
    bool ok = false;
    bool header_sent = false;
    bool disconnected = false;
    std::string job_id;
    std::string error;
    int32_t sample_rate = 0;
    size_t n_chunks = 0;
    size_t n_samples = 0;
    size_t bytes_written = 0;
};

// Serializes chunks into an open-ended WAV stream followed by a terminal marker.
class voxcast_stream_encoder {
public:
    voxcast_stream_encoder(voxcast_job_cache & cache, voxcast_byte_writer writer);

    // Emits the header on the first call, then the chunk's PCM bytes.
    bool write_chunk(const float * samples, size_t n_samples, int32_t sample_rate, std::string & err);

    // Caches the accumulated samples and appends the job-id marker.
    bool finish(int64_t now_ms, std::string & job_id_out, std::string & err);

    // Appends the error marker. Valid whether or not the header went out.
    bool fail(const std::string & message);

    bool header_sent() const { return header_sent_; }
    bool writer_failed() const { return writer_failed_; }
    int32_t sample_rate() const { return sample_rate_; }
    size_t n_chunks() const { return n_chunks_; }
    size_t n_samples() const { return n_samples_; }
    size_t bytes_written() const { return bytes_written_; }

private:
    bool emit(const char * data, size_t len);

    voxcast_job_cache & cache_;
    voxcast_byte_writer writer_;

    bool header_sent_ = false;
    bool finished_ = false;
    bool writer_failed_ = false;
    int32_t sample_rate_ = 0;
    size_t n_chunks_ = 0;
    size_t n_samples_ = 0;
    size_t bytes_written_ = 0;

    std::vector<int16_t> accumulated_;
    std::string scratch_;
};

// Drives `source` through an encoder into `writer`. Always ends the stream with
// exactly one marker unless the writer itself failed.
bool voxcast_stream_run(
        const voxcast_chunk_source & source,
        voxcast_job_cache & cache,
        const voxcast_byte_writer & writer,
        voxcast_stream_result & result);

// Runs `source` to completion and returns the converted samples.
bool voxcast_chunk_source_collect(
        const voxcast_chunk_source & source,
        std::vector<int16_t> & samples_out,
        int32_t & sample_rate_out,
        std::string & err);
