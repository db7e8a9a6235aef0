#include "voxcast-args.h"
#include "voxcast-service.h"

#include "ggml.h"
#include "ggml-backend.h"

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <cctype>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <utility>
#include <vector>

using json = nlohmann::ordered_json;

struct server_config {
    std::string host = "127.0.0.1";
    int32_t port = 18090;

    int32_t sample_rate = 24000;
    int32_t cache_ttl_sec = 3600;
    int32_t cache_max_entries = 100;
    int32_t max_text_length = 5000;
    int32_t max_instruct_length = 500;

    // one lock per entry; detected from ggml GPU devices when empty
    std::vector<std::string> devices;

    // assigned to devices round-robin
    std::vector<std::string> engine_urls;
    std::string engine_path = "/generate";
    std::vector<std::pair<std::string, std::string>> engine_headers;
    int32_t engine_timeout_sec = 300;

    int32_t n_threads_http = 8;
};

static void print_usage(const char * argv0) {
    std::fprintf(stderr,
        "Usage:\n"
        "  %s --engine-urls LIST [options]\n\n"
        "Engines:\n"
        "  --engine-urls LIST              comma-separated engine base URLs, assigned to devices round-robin\n"
        "                                  (env: VOXCAST_ENGINE_URLS)\n"
        "  --engine-path PATH              generation path appended to each engine URL (default: /generate)\n"
        "  --engine-headers JSON           extra request headers as JSON object (env: VOXCAST_ENGINE_HEADERS)\n"
        "  --engine-timeout N              engine connect/read timeout seconds (default: 300)\n\n"
        "Devices:\n"
        "  --devices LIST                  comma-separated device names, one lock each (e.g. CUDA0,CUDA1)\n"
        "                                  (env: VOXCAST_DEVICES; default: detected GPU devices, else CPU)\n\n"
        "Server:\n"
        "  --host STR                      bind host (default: 127.0.0.1)\n"
        "  --port N                        bind port (default: 18090)\n"
        "  --http-threads N                HTTP worker threads (default: 8)\n\n"
        "Audio & cache:\n"
        "  --sample-rate N                 target sample rate (default: 24000)\n"
        "  --cache-ttl N                   seconds a finished job stays downloadable (default: 3600)\n"
        "  --cache-max N                   max finished jobs kept (default: 100)\n"
        "  --max-text-length N             max characters per request (default: 5000)\n"
        "  --max-instruct-length N         max characters of voice instruction (default: 500)\n",
        argv0);
}

static bool parse_headers_json(
        const std::string & raw,
        std::vector<std::pair<std::string, std::string>> & out,
        std::string & err) {
    try {
        const json j = json::parse(raw);
        if (!j.is_object()) {
            err = "--engine-headers must be a JSON object";
            return false;
        }
        out.clear();
        out.reserve(j.size());
        for (auto it = j.begin(); it != j.end(); ++it) {
            const std::string key = voxcast_trim_copy(it.key());
            if (key.empty()) {
                err = "--engine-headers contains empty header name";
                return false;
            }
            std::string value;
            if (it.value().is_string()) {
                value = it.value().get<std::string>();
            } else if (it.value().is_number_integer()) {
                value = std::to_string(it.value().get<long long>());
            } else if (it.value().is_boolean()) {
                value = it.value().get<bool>() ? "true" : "false";
            } else {
                err = "--engine-headers values must be strings, integers or booleans";
                return false;
            }
            out.emplace_back(key, value);
        }
        return true;
    } catch (const std::exception & e) {
        err = std::string("invalid --engine-headers JSON: ") + e.what();
        return false;
    }
}

static std::vector<std::string> detect_gpu_backend_names() {
    std::vector<std::string> out;
    const size_t n_dev = ggml_backend_dev_count();
    out.reserve(n_dev);
    for (size_t i = 0; i < n_dev; ++i) {
        ggml_backend_dev_t dev = ggml_backend_dev_get(i);
        if (dev == nullptr) {
            continue;
        }
        const auto type = ggml_backend_dev_type(dev);
        if (type != GGML_BACKEND_DEVICE_TYPE_GPU && type != GGML_BACKEND_DEVICE_TYPE_IGPU) {
            continue;
        }
        const char * name = ggml_backend_dev_name(dev);
        if (name != nullptr && name[0] != '\0') {
            out.emplace_back(name);
        }
    }
    return out;
}

static bool needs_value(int i, int argc) {
    return i + 1 < argc;
}

static bool parse_args(int argc, char ** argv, server_config & cfg) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--engine-urls") {
            if (!needs_value(i, argc) || !voxcast_parse_csv_list(argv[++i], cfg.engine_urls)) return false;
        } else if (arg == "--engine-path") {
            if (!needs_value(i, argc)) return false;
            cfg.engine_path = argv[++i];
        } else if (arg == "--engine-headers") {
            if (!needs_value(i, argc)) return false;
            std::string perr;
            if (!parse_headers_json(argv[++i], cfg.engine_headers, perr)) {
                std::fprintf(stderr, "%s\n", perr.c_str());
                return false;
            }
        } else if (arg == "--engine-timeout") {
            if (!needs_value(i, argc) || !voxcast_parse_i32(argv[++i], cfg.engine_timeout_sec)) return false;
        } else if (arg == "--devices") {
            if (!needs_value(i, argc) || !voxcast_parse_csv_list(argv[++i], cfg.devices)) return false;
        } else if (arg == "--host") {
            if (!needs_value(i, argc)) return false;
            cfg.host = argv[++i];
        } else if (arg == "--port") {
            if (!needs_value(i, argc) || !voxcast_parse_i32(argv[++i], cfg.port)) return false;
        } else if (arg == "--http-threads") {
            if (!needs_value(i, argc) || !voxcast_parse_i32(argv[++i], cfg.n_threads_http)) return false;
        } else if (arg == "--sample-rate") {
            if (!needs_value(i, argc) || !voxcast_parse_i32(argv[++i], cfg.sample_rate)) return false;
        } else if (arg == "--cache-ttl") {
            if (!needs_value(i, argc) || !voxcast_parse_i32(argv[++i], cfg.cache_ttl_sec)) return false;
        } else if (arg == "--cache-max") {
            if (!needs_value(i, argc) || !voxcast_parse_i32(argv[++i], cfg.cache_max_entries)) return false;
        } else if (arg == "--max-text-length") {
            if (!needs_value(i, argc) || !voxcast_parse_i32(argv[++i], cfg.max_text_length)) return false;
        } else if (arg == "--max-instruct-length") {
            if (!needs_value(i, argc) || !voxcast_parse_i32(argv[++i], cfg.max_instruct_length)) return false;
        } else {
            return false;
        }
    }

    if (cfg.engine_urls.empty()) {
        const char * v = std::getenv("VOXCAST_ENGINE_URLS");
        if (v != nullptr && v[0] != '\0' && !voxcast_parse_csv_list(v, cfg.engine_urls)) {
            std::fprintf(stderr, "warning: VOXCAST_ENGINE_URLS is set but lists no entries\n");
        }
    }
    if (cfg.devices.empty()) {
        const char * v = std::getenv("VOXCAST_DEVICES");
        if (v != nullptr && v[0] != '\0' && !voxcast_parse_csv_list(v, cfg.devices)) {
            std::fprintf(stderr, "warning: VOXCAST_DEVICES is set but lists no entries\n");
        }
    }
    if (cfg.engine_headers.empty()) {
        const char * v = std::getenv("VOXCAST_ENGINE_HEADERS");
        if (v != nullptr && v[0] != '\0') {
            std::string perr;
            if (!parse_headers_json(v, cfg.engine_headers, perr)) {
                std::fprintf(stderr, "%s\n", perr.c_str());
                return false;
            }
        }
    }

    if (cfg.port < 1 || cfg.port > 65535 || cfg.n_threads_http < 1) {
        return false;
    }
    if (cfg.sample_rate < 1000 || cfg.sample_rate > 384000) {
        return false;
    }
    if (cfg.cache_ttl_sec < 1 || cfg.cache_max_entries < 1 || cfg.engine_timeout_sec < 1) {
        return false;
    }
    if (cfg.max_text_length < 1 || cfg.max_instruct_length < 0) {
        return false;
    }

    return !cfg.engine_urls.empty();
}

static void ggml_log_callback_server(ggml_log_level level, const char * text, void * /* user_data */) {
    if (level >= GGML_LOG_LEVEL_WARN) {
        std::fputs(text, stderr);
    }
}

static std::string join_url(const std::string & base, const std::string & path) {
    if (path.empty()) {
        return base;
    }
    std::string out = base;
    while (!out.empty() && out.back() == '/') {
        out.pop_back();
    }
    return out + (path[0] == '/' ? path : "/" + path);
}

int main(int argc, char ** argv) {
    server_config cfg;
    if (!parse_args(argc, argv, cfg)) {
        print_usage(argv[0]);
        return 1;
    }

    ggml_log_set(ggml_log_callback_server, nullptr);
    ggml_backend_load_all();

    std::vector<std::string> device_names = cfg.devices;
    if (device_names.empty()) {
        device_names = detect_gpu_backend_names();
    }
    if (device_names.empty()) {
        std::fprintf(stderr, "info: no GPU backend detected; serving a single CPU device\n");
        device_names.emplace_back("CPU");
    }

    std::vector<std::string> engine_urls;
    engine_urls.reserve(cfg.engine_urls.size());
    for (const auto & base : cfg.engine_urls) {
        engine_urls.push_back(join_url(base, cfg.engine_path));
    }

    voxcast_service_config scfg;
    scfg.sample_rate = cfg.sample_rate;
    scfg.cache_ttl_sec = cfg.cache_ttl_sec;
    scfg.cache_max_entries = (size_t) cfg.cache_max_entries;
    scfg.max_text_length = (size_t) cfg.max_text_length;
    scfg.max_instruct_length = (size_t) cfg.max_instruct_length;

    voxcast_service service(
            scfg,
            device_names,
            engine_urls,
            voxcast_make_upstream_factory(cfg.engine_timeout_sec, cfg.sample_rate, cfg.engine_headers));

    std::fprintf(stderr, "device assignment:");
    for (size_t i = 0; i < service.devices().size(); ++i) {
        std::fprintf(stderr, " %zu:%s=%s", i, service.devices().name(i).c_str(), service.devices().engine_url(i).c_str());
    }
    std::fprintf(stderr, "\n");
    std::fprintf(stderr, "cache: ttl=%ds max_entries=%d sample_rate=%d\n",
            cfg.cache_ttl_sec, cfg.cache_max_entries, cfg.sample_rate);

    httplib::Server server;
    const int32_t n_threads_http = cfg.n_threads_http;
    server.new_task_queue = [n_threads_http] { return new httplib::ThreadPool((size_t) n_threads_http); };

    voxcast_register_routes(server, service);

    std::fprintf(stderr, "voxcast-server listening on http://%s:%d\n", cfg.host.c_str(), cfg.port);
    if (!server.listen(cfg.host, cfg.port)) {
        std::fprintf(stderr, "failed to listen on %s:%d\n", cfg.host.c_str(), cfg.port);
        return 1;
    }

    return 0;
}
