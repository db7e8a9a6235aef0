#include "voxcast-stream-encoder.h"
#include "voxcast-stream-protocol.h"
#include "voxcast-wav.h"

#include <exception>
#include <utility>

voxcast_stream_encoder::voxcast_stream_encoder(voxcast_job_cache & cache, voxcast_byte_writer writer)
    : cache_(cache), writer_(std::move(writer)) {
}

bool voxcast_stream_encoder::emit(const char * data, size_t len) {
    if (writer_failed_) {
        return false;
    }
    if (len == 0) {
        return true;
    }
    if (!writer_(data, len)) {
        writer_failed_ = true;
        return false;
    }
    bytes_written_ += len;
    return true;
}

bool voxcast_stream_encoder::write_chunk(const float * samples, size_t n_samples, int32_t sample_rate, std::string & err) {
    if (finished_) {
        err = "stream already terminated";
        return false;
    }
    if (sample_rate < (int32_t) k_voxcast_wav_min_sample_rate || sample_rate > (int32_t) k_voxcast_wav_max_sample_rate) {
        err = "invalid sample rate from engine: " + std::to_string(sample_rate);
        return false;
    }

    if (!header_sent_) {
        voxcast_wav_format fmt;
        fmt.sample_rate = (uint32_t) sample_rate;
        const std::vector<uint8_t> header = voxcast_wav_stream_header(fmt);
        if (!emit(reinterpret_cast<const char *>(header.data()), header.size())) {
            err = "client disconnected";
            return false;
        }
        header_sent_ = true;
        sample_rate_ = sample_rate;
    } else if (sample_rate != sample_rate_) {
        err = "sample rate changed mid-stream: " + std::to_string(sample_rate_) + " -> " + std::to_string(sample_rate);
        return false;
    }

    ++n_chunks_;
    n_samples_ += n_samples;
    if (n_samples == 0) {
        return true;
    }

    const size_t base = accumulated_.size();
    accumulated_.resize(base + n_samples);
    voxcast_pcm16_from_float(samples, n_samples, accumulated_.data() + base);

    scratch_.clear();
    voxcast_pcm16le_append(accumulated_.data() + base, n_samples, scratch_);
    if (!emit(scratch_.data(), scratch_.size())) {
        err = "client disconnected";
        return false;
    }
    return true;
}

bool voxcast_stream_encoder::finish(int64_t now_ms, std::string & job_id_out, std::string & err) {
    if (finished_) {
        err = "stream already terminated";
        return false;
    }
    if (!header_sent_) {
        err = "generation produced no audio";
        return false;
    }
    finished_ = true;

    job_id_out = cache_.store(std::move(accumulated_), sample_rate_, now_ms);
    accumulated_.clear();

    const std::string marker = voxcast_format_job_id_marker(job_id_out);
    if (!emit(marker.data(), marker.size())) {
        err = "client disconnected";
        return false;
    }
    return true;
}

bool voxcast_stream_encoder::fail(const std::string & message) {
    if (finished_) {
        return false;
    }
    finished_ = true;
    const std::string marker = voxcast_format_error_marker(message);
    return emit(marker.data(), marker.size());
}

bool voxcast_stream_run(
        const voxcast_chunk_source & source,
        voxcast_job_cache & cache,
        const voxcast_byte_writer & writer,
        voxcast_stream_result & result) {
    result = voxcast_stream_result();
    voxcast_stream_encoder enc(cache, writer);

    std::string chunk_err;
    auto on_chunk = [&](const float * samples, size_t n_samples, int32_t sample_rate) -> bool {
        return enc.write_chunk(samples, n_samples, sample_rate, chunk_err);
    };

    bool ok = false;
    std::string err;
    try {
        ok = source(on_chunk, err);
    } catch (const std::exception & e) {
        ok = false;
        err = e.what();
    }

    // An error raised inside the callback explains the abort better than the source does.
    if (!chunk_err.empty()) {
        ok = false;
        err = chunk_err;
    }
    if (ok && !enc.header_sent()) {
        ok = false;
        err = "generation produced no audio";
    }
    if (!ok && err.empty()) {
        err = "generation failed";
    }

    if (ok) {
        std::string job_id;
        if (enc.finish(voxcast_now_ms(), job_id, err)) {
            result.ok = true;
            result.job_id = job_id;
        } else {
            // cached, but the marker did not reach the client
            result.job_id = job_id;
        }
    } else if (!enc.writer_failed()) {
        enc.fail(err);
    }

    result.header_sent = enc.header_sent();
    result.disconnected = enc.writer_failed();
    result.error = result.ok ? std::string() : err;
    result.sample_rate = enc.sample_rate();
    result.n_chunks = enc.n_chunks();
    result.n_samples = enc.n_samples();
    result.bytes_written = enc.bytes_written();
    return result.ok;
}

bool voxcast_chunk_source_collect(
        const voxcast_chunk_source & source,
        std::vector<int16_t> & samples_out,
        int32_t & sample_rate_out,
        std::string & err) {
    samples_out.clear();
    sample_rate_out = 0;

    std::string chunk_err;
    auto on_chunk = [&](const float * samples, size_t n_samples, int32_t sample_rate) -> bool {
        if (sample_rate_out == 0) {
            sample_rate_out = sample_rate;
        } else if (sample_rate != sample_rate_out) {
            chunk_err = "sample rate changed mid-stream: " + std::to_string(sample_rate_out) + " -> " + std::to_string(sample_rate);
            return false;
        }
        const size_t base = samples_out.size();
        samples_out.resize(base + n_samples);
        voxcast_pcm16_from_float(samples, n_samples, samples_out.data() + base);
        return true;
    };

    bool ok = false;
    try {
        ok = source(on_chunk, err);
    } catch (const std::exception & e) {
        ok = false;
        err = e.what();
    }
    if (!chunk_err.empty()) {
        err = chunk_err;
        return false;
    }
    if (!ok) {
        if (err.empty()) {
            err = "generation failed";
        }
        return false;
    }
    if (sample_rate_out < (int32_t) k_voxcast_wav_min_sample_rate || sample_rate_out > (int32_t) k_voxcast_wav_max_sample_rate) {
        err = sample_rate_out == 0 ? "generation produced no audio" : "invalid sample rate from engine: " + std::to_string(sample_rate_out);
        return false;
    }
    return true;
}
