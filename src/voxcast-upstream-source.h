#pragma once

#include "voxcast-stream-encoder.h"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

struct voxcast_http_url {
    bool https = false;
    std::string host;
    int32_t port = 0;
    std::string path = "/";
};

bool voxcast_parse_http_url(const std::string & raw, voxcast_http_url & out, std::string & err);

struct voxcast_upstream_config {
    std::string url;
    int32_t timeout_sec = 300;
    int32_t default_sample_rate = 24000;
    std::vector<std::pair<std::string, std::string>> headers;
};

// Chunk source backed by an engine worker that answers a JSON POST with a
// stream of little-endian float32 mono samples. The rate comes from the
// X-Sample-Rate response header, else `default_sample_rate`.
voxcast_chunk_source voxcast_make_upstream_source(const voxcast_upstream_config & cfg, std::string request_body);

std::string voxcast_truncate_text(const std::string & s, size_t max_len = 240);
