#pragma once

#include "voxcast-stream-consumer.h"

#include <nlohmann/json.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

struct voxcast_client_config {
    std::string server_url = "http://127.0.0.1:18090";
    int32_t timeout_sec = 300;
    int32_t max_duration_sec = 600;
    size_t chunk_bytes = k_voxcast_default_chunk_bytes;
};

struct voxcast_generation_result {
    bool ok = false;
    bool cancelled = false;
    int http_status = 0;
    std::string job_id;
    std::string error;
    int32_t sample_rate = 0;
    size_t chunks_played = 0;
    std::vector<uint8_t> wav;
};

class voxcast_client {
public:
    voxcast_client(const voxcast_client_config & cfg, voxcast_playback_sink * sink);

    voxcast_client(const voxcast_client &) = delete;
    voxcast_client & operator=(const voxcast_client &) = delete;

    // Streams one generation, playing chunks as they arrive. Starting a new
    // generation (or calling cancel()) silences the previous one; its remaining
    // bytes are drained and ignored.
    bool generate_stream(const std::string & path, const nlohmann::ordered_json & body, voxcast_generation_result & out);

    // Non-streaming generation: the whole WAV in one response.
    bool generate(const std::string & path, const nlohmann::ordered_json & body, voxcast_generation_result & out);

    bool download(const std::string & job_id, std::vector<uint8_t> & wav_out, std::string & err);
    bool history_audio(const std::string & job_id, std::vector<uint8_t> & wav_out, std::string & err);

    void cancel();
    uint64_t generation() const { return epoch_.load(); }

private:
    uint64_t begin_generation();
    bool fetch_wav(const std::string & path, std::vector<uint8_t> & wav_out, std::string & err);

    voxcast_client_config cfg_;
    voxcast_playback_sink * sink_ = nullptr;

    std::mutex sink_mtx_;
    std::atomic<uint64_t> epoch_ {0};
};
