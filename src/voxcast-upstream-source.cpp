#include "voxcast-upstream-source.h"

#include <httplib.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <regex>

static bool parse_port(const std::string & s, int32_t & out) {
    char * end = nullptr;
    const long v = std::strtol(s.c_str(), &end, 10);
    if (end == nullptr || *end != '\0' || v < 1 || v > 65535) {
        return false;
    }
    out = (int32_t) v;
    return true;
}

bool voxcast_parse_http_url(const std::string & raw, voxcast_http_url & out, std::string & err) {
    static const std::regex re(R"(^(https?)://([^/:?#]+)(?::([0-9]+))?([^?#]*)?(\?[^#]*)?$)", std::regex::icase);
    std::smatch m;
    if (!std::regex_match(raw, m, re)) {
        err = "invalid engine URL: " + raw;
        return false;
    }

    std::string scheme = m[1].str();
    std::transform(scheme.begin(), scheme.end(), scheme.begin(), [](unsigned char c) {
        return (char) std::tolower(c);
    });

    out.https = scheme == "https";
    out.host = m[2].str();
    out.port = out.https ? 443 : 80;
    if (m[3].matched && !m[3].str().empty()) {
        if (!parse_port(m[3].str(), out.port)) {
            err = "invalid port in engine URL: " + raw;
            return false;
        }
    }
    out.path = m[4].matched ? m[4].str() : "/";
    if (out.path.empty()) {
        out.path = "/";
    }
    if (m[5].matched) {
        out.path += m[5].str();
    }
    return true;
}

std::string voxcast_truncate_text(const std::string & s, size_t max_len) {
    if (s.size() <= max_len) {
        return s;
    }
    return s.substr(0, max_len) + "...";
}

static float load_f32le(const char * p) {
    const auto * b = reinterpret_cast<const uint8_t *>(p);
    const uint32_t bits = (uint32_t) b[0] |
                          ((uint32_t) b[1] << 8) |
                          ((uint32_t) b[2] << 16) |
                          ((uint32_t) b[3] << 24);
    float v = 0.0f;
    std::memcpy(&v, &bits, sizeof(v));
    return v;
}

voxcast_chunk_source voxcast_make_upstream_source(const voxcast_upstream_config & cfg, std::string request_body) {
    return [cfg, body = std::move(request_body)](const voxcast_chunk_callback & on_chunk, std::string & err) -> bool {
        if (cfg.url.empty()) {
            err = "no engine configured for this device";
            return false;
        }
        voxcast_http_url endpoint;
        if (!voxcast_parse_http_url(cfg.url, endpoint, err)) {
            return false;
        }

        const std::string scheme_host_port =
                std::string(endpoint.https ? "https" : "http") + "://" + endpoint.host + ":" + std::to_string(endpoint.port);
        httplib::Client cli(scheme_host_port);
        if (!cli.is_valid()) {
            err = endpoint.https ? "https engine URL requires CPPHTTPLIB_OPENSSL_SUPPORT" : "invalid engine URL: " + cfg.url;
            return false;
        }
        cli.set_connection_timeout(cfg.timeout_sec, 0);
        cli.set_read_timeout(cfg.timeout_sec, 0);
        cli.set_write_timeout(cfg.timeout_sec, 0);

        httplib::Request req;
        req.method = "POST";
        req.path = endpoint.path;
        for (const auto & kv : cfg.headers) {
            req.set_header(kv.first, kv.second);
        }
        req.set_header("Content-Type", "application/json");
        req.set_header("Accept", "application/octet-stream");
        req.body = body;

        int status = 0;
        int32_t sample_rate = cfg.default_sample_rate;
        std::string error_body;
        std::string pending;
        std::vector<float> block;
        bool aborted = false;

        req.response_handler = [&](const httplib::Response & r) {
            status = r.status;
            if (r.has_header("X-Sample-Rate")) {
                const std::string v = r.get_header_value("X-Sample-Rate");
                char * end = nullptr;
                const long sr = std::strtol(v.c_str(), &end, 10);
                if (end != nullptr && *end == '\0' && sr > 0) {
                    sample_rate = (int32_t) sr;
                }
            }
            return true;
        };
        req.content_receiver = [&](const char * data, size_t len, uint64_t /* offset */, uint64_t /* total */) {
            if (status < 200 || status >= 300) {
                if (error_body.size() < 4096) {
                    error_body.append(data, std::min(len, 4096 - error_body.size()));
                }
                return true;
            }
            pending.append(data, len);
            const size_t n = pending.size() / sizeof(float);
            if (n == 0) {
                return true;
            }
            block.resize(n);
            for (size_t i = 0; i < n; ++i) {
                block[i] = load_f32le(pending.data() + i * sizeof(float));
            }
            pending.erase(0, n * sizeof(float));
            if (!on_chunk(block.data(), n, sample_rate)) {
                aborted = true;
                return false;
            }
            return true;
        };

        httplib::Response res;
        httplib::Error error = httplib::Error::Success;
        const bool sent = cli.send(req, res, error);

        if (aborted) {
            err = "generation aborted by callback";
            return false;
        }
        if (!sent) {
            err = "engine request failed: " + httplib::to_string(error);
            return false;
        }
        if (status < 200 || status >= 300) {
            err = "engine HTTP " + std::to_string(status) + ": " + voxcast_truncate_text(error_body);
            return false;
        }
        if (!pending.empty()) {
            err = "engine stream ended mid-sample (" + std::to_string(pending.size()) + " stray bytes)";
            return false;
        }
        return true;
    };
}
