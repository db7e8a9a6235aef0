#pragma once

#include "voxcast-device-lock.h"
#include "voxcast-job-cache.h"
#include "voxcast-stream-encoder.h"

#include <nlohmann/json.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace httplib {
class Server;
}

struct voxcast_service_config {
    int32_t sample_rate = 24000;
    int64_t cache_ttl_sec = 3600;
    size_t cache_max_entries = 100;
    size_t max_text_length = 5000;
    size_t max_instruct_length = 500;
};

enum voxcast_tts_mode {
    VOXCAST_TTS_MODE_DEFAULT = 0,
    VOXCAST_TTS_MODE_CLONE   = 1,
    VOXCAST_TTS_MODE_CUSTOM  = 2,
    VOXCAST_TTS_MODE_DESIGN  = 3,
};

struct voxcast_tts_request {
    voxcast_tts_mode mode = VOXCAST_TTS_MODE_DEFAULT;
    std::string text;
    std::string language;
    std::string speaker;
    std::string instruct;
    std::vector<std::string> ref_audio_ids;
    size_t device_index = 0;

    // request body as received; forwarded to the engine
    nlohmann::ordered_json body;
};

bool voxcast_parse_tts_request(
        const nlohmann::ordered_json & body,
        voxcast_tts_mode mode,
        const voxcast_service_config & cfg,
        size_t n_devices,
        voxcast_tts_request & out,
        std::string & err);

const char * voxcast_tts_mode_to_cstr(voxcast_tts_mode mode);
bool voxcast_parse_tts_mode(const std::string & s, voxcast_tts_mode & out);

// Builds the chunk source for one request on one device.
using voxcast_source_factory = std::function<bool(
        const voxcast_tts_request & req,
        const std::string & device_name,
        const std::string & engine_url,
        voxcast_chunk_source & out,
        std::string & err)>;

// Process-wide state shared by every request handler.
class voxcast_service {
public:
    voxcast_service(
            const voxcast_service_config & cfg,
            const std::vector<std::string> & device_names,
            const std::vector<std::string> & engine_urls,
            voxcast_source_factory factory);

    voxcast_service(const voxcast_service &) = delete;
    voxcast_service & operator=(const voxcast_service &) = delete;

    const voxcast_service_config & config() const { return cfg_; }
    voxcast_job_cache & cache() { return cache_; }
    voxcast_device_registry & devices() { return devices_; }
    const voxcast_device_registry & devices() const { return devices_; }

    bool make_source(const voxcast_tts_request & req, voxcast_chunk_source & out, std::string & err) const;

    std::atomic<int32_t> inflight {0};

private:
    voxcast_service_config cfg_;
    voxcast_job_cache cache_;
    voxcast_device_registry devices_;
    voxcast_source_factory factory_;
};

// Factory that streams from the engine worker bound to each device.
voxcast_source_factory voxcast_make_upstream_factory(
        int32_t timeout_sec,
        int32_t default_sample_rate,
        const std::vector<std::pair<std::string, std::string>> & headers);

void voxcast_register_routes(httplib::Server & server, voxcast_service & service);
