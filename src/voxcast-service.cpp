#include "voxcast-service.h"
#include "voxcast-stream-protocol.h"
#include "voxcast-upstream-source.h"
#include "voxcast-wav.h"

#include <httplib.h>

#include <cctype>
#include <chrono>
#include <cstdio>
#include <exception>
#include <utility>

using json = nlohmann::ordered_json;

static const char * k_json_content_type = "application/json; charset=utf-8";

static json make_error_json(const std::string & msg, int code = 400) {
    return json {
        {"ok", false},
        {"error", {
            {"message", msg},
            {"code", code},
        }},
    };
}

static void set_error(httplib::Response & res, const std::string & msg, int code) {
    res.status = code;
    res.set_content(make_error_json(msg, code).dump(), k_json_content_type);
}

static double ms_since(
        const std::chrono::steady_clock::time_point & t0,
        const std::chrono::steady_clock::time_point & t1) {
    return std::chrono::duration_cast<std::chrono::duration<double, std::milli>>(t1 - t0).count();
}

static size_t utf8_length(const std::string & s) {
    size_t n = 0;
    for (unsigned char c : s) {
        if ((c & 0xC0) != 0x80) {
            ++n;
        }
    }
    return n;
}

static bool is_blank(const std::string & s) {
    for (unsigned char c : s) {
        if (!std::isspace(c)) {
            return false;
        }
    }
    return true;
}

static bool get_json_string(const json & j, const char * key, std::string & out, std::string & err) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return true;
    }
    if (!it->is_string()) {
        err = std::string("'") + key + "' must be a string";
        return false;
    }
    out = it->get<std::string>();
    return true;
}

const char * voxcast_tts_mode_to_cstr(voxcast_tts_mode mode) {
    switch (mode) {
        case VOXCAST_TTS_MODE_CLONE:   return "clone";
        case VOXCAST_TTS_MODE_CUSTOM:  return "custom";
        case VOXCAST_TTS_MODE_DESIGN:  return "design";
        case VOXCAST_TTS_MODE_DEFAULT:
        default:                       return "default";
    }
}

bool voxcast_parse_tts_mode(const std::string & s, voxcast_tts_mode & out) {
    if (s.empty() || s == "default") {
        out = VOXCAST_TTS_MODE_DEFAULT;
    } else if (s == "clone") {
        out = VOXCAST_TTS_MODE_CLONE;
    } else if (s == "custom") {
        out = VOXCAST_TTS_MODE_CUSTOM;
    } else if (s == "design") {
        out = VOXCAST_TTS_MODE_DESIGN;
    } else {
        return false;
    }
    return true;
}

bool voxcast_parse_tts_request(
        const json & body,
        voxcast_tts_mode mode,
        const voxcast_service_config & cfg,
        size_t n_devices,
        voxcast_tts_request & out,
        std::string & err) {
    if (!body.is_object()) {
        err = "request body must be a JSON object";
        return false;
    }

    voxcast_tts_request r;
    r.mode = mode;
    if (!get_json_string(body, "text", r.text, err) ||
        !get_json_string(body, "language", r.language, err) ||
        !get_json_string(body, "speaker", r.speaker, err) ||
        !get_json_string(body, "instruct", r.instruct, err)) {
        return false;
    }

    if (r.text.empty() || is_blank(r.text)) {
        err = "Text is required";
        return false;
    }
    if (utf8_length(r.text) > cfg.max_text_length) {
        err = "Text too long (max " + std::to_string(cfg.max_text_length) + " characters)";
        return false;
    }
    if (utf8_length(r.instruct) > cfg.max_instruct_length) {
        err = "Instruct too long (max " + std::to_string(cfg.max_instruct_length) + " characters)";
        return false;
    }

    auto it_refs = body.find("ref_audio_ids");
    if (it_refs != body.end() && !it_refs->is_null()) {
        if (!it_refs->is_array()) {
            err = "'ref_audio_ids' must be an array";
            return false;
        }
        for (const auto & v : *it_refs) {
            if (!v.is_string() || !voxcast_is_valid_job_id(v.get<std::string>())) {
                err = "Invalid reference audio ID";
                return false;
            }
            r.ref_audio_ids.push_back(v.get<std::string>());
        }
    }

    switch (mode) {
        case VOXCAST_TTS_MODE_CLONE:
            if (r.ref_audio_ids.empty()) {
                err = "Reference audio is required";
                return false;
            }
            break;
        case VOXCAST_TTS_MODE_CUSTOM:
            if (r.speaker.empty()) {
                err = "Speaker is required";
                return false;
            }
            break;
        case VOXCAST_TTS_MODE_DESIGN:
            if (r.instruct.empty() || is_blank(r.instruct)) {
                err = "Voice description is required";
                return false;
            }
            break;
        case VOXCAST_TTS_MODE_DEFAULT:
        default:
            break;
    }

    auto it_dev = body.find("device");
    if (it_dev != body.end() && !it_dev->is_null()) {
        if (!it_dev->is_number_integer()) {
            err = "'device' must be an integer";
            return false;
        }
        const int64_t d = it_dev->get<int64_t>();
        if (d < 0 || (size_t) d >= n_devices) {
            err = "invalid device index " + std::to_string(d) + " (available: " + std::to_string(n_devices) + ")";
            return false;
        }
        r.device_index = (size_t) d;
    }

    r.body = body;
    out = std::move(r);
    return true;
}

voxcast_service::voxcast_service(
        const voxcast_service_config & cfg,
        const std::vector<std::string> & device_names,
        const std::vector<std::string> & engine_urls,
        voxcast_source_factory factory)
    : cfg_(cfg),
      cache_(cfg.cache_ttl_sec * 1000, cfg.cache_max_entries),
      devices_(device_names, engine_urls),
      factory_(std::move(factory)) {
}

bool voxcast_service::make_source(const voxcast_tts_request & req, voxcast_chunk_source & out, std::string & err) const {
    if (!factory_) {
        err = "no generation engine configured";
        return false;
    }
    if (req.device_index >= devices_.size()) {
        err = "invalid device index " + std::to_string(req.device_index);
        return false;
    }
    return factory_(req, devices_.name(req.device_index), devices_.engine_url(req.device_index), out, err);
}

voxcast_source_factory voxcast_make_upstream_factory(
        int32_t timeout_sec,
        int32_t default_sample_rate,
        const std::vector<std::pair<std::string, std::string>> & headers) {
    return [=](const voxcast_tts_request & req,
               const std::string & device_name,
               const std::string & engine_url,
               voxcast_chunk_source & out,
               std::string & err) -> bool {
        if (engine_url.empty()) {
            err = "no engine bound to device " + device_name;
            return false;
        }
        json payload = req.body;
        payload["mode"] = voxcast_tts_mode_to_cstr(req.mode);
        payload["device"] = req.device_index;
        payload["device_name"] = device_name;
        payload["sample_rate"] = default_sample_rate;

        voxcast_upstream_config ucfg;
        ucfg.url = engine_url;
        ucfg.timeout_sec = timeout_sec;
        ucfg.default_sample_rate = default_sample_rate;
        ucfg.headers = headers;
        out = voxcast_make_upstream_source(ucfg, payload.dump());
        return true;
    };
}

static bool parse_body(const httplib::Request & req, json & body, std::string & err) {
    try {
        body = json::parse(req.body.empty() ? "{}" : req.body);
    } catch (const std::exception & e) {
        err = std::string("invalid JSON: ") + e.what();
        return false;
    }
    return true;
}

static voxcast_tts_mode mode_from_request(const httplib::Request & req) {
    voxcast_tts_mode mode = VOXCAST_TTS_MODE_DEFAULT;
    if (req.matches.size() > 1 && !voxcast_parse_tts_mode(req.matches[1].str(), mode)) {
        mode = VOXCAST_TTS_MODE_DEFAULT;
    }
    return mode;
}

static void serve_cached_wav(
        voxcast_service & service,
        const httplib::Request & req,
        httplib::Response & res,
        bool attachment) {
    const std::string job_id = req.matches.size() > 1 ? req.matches[1].str() : std::string();
    if (!voxcast_is_valid_job_id(job_id)) {
        std::fprintf(stderr, "download: path=%s ok=false err=invalid_id\n", req.path.c_str());
        set_error(res, "Invalid job ID", 400);
        return;
    }

    voxcast_job job;
    if (!service.cache().get(job_id, voxcast_now_ms(), job)) {
        std::fprintf(stderr, "download: path=%s job=%s ok=false err=not_found\n", req.path.c_str(), job_id.c_str());
        set_error(res, "Audio not found or expired", 404);
        return;
    }

    const std::vector<uint8_t> wav = voxcast_wav_encode(job.samples.data(), job.samples.size(), (uint32_t) job.sample_rate);
    const std::string filename = "generated_" + job_id.substr(0, 8) + ".wav";
    res.status = 200;
    res.set_header("Content-Disposition",
            std::string(attachment ? "attachment" : "inline") + "; filename=\"" + filename + "\"");
    res.set_header("X-Job-Id", job_id);
    res.set_header("X-Sample-Rate", std::to_string(job.sample_rate));
    res.set_content(std::string(reinterpret_cast<const char *>(wav.data()), wav.size()), "audio/wav");
    std::fprintf(stderr, "download: path=%s job=%s ok=true samples=%zu sample_rate=%d\n",
            req.path.c_str(), job_id.c_str(), job.samples.size(), job.sample_rate);
}

void voxcast_register_routes(httplib::Server & server, voxcast_service & service) {
    server.set_default_headers({{"Server", "voxcast-server"}});

    server.set_pre_routing_handler([](const httplib::Request & req, httplib::Response & res) {
        res.set_header("Access-Control-Allow-Origin", req.get_header_value("Origin"));
        res.set_header("Access-Control-Expose-Headers", "X-Job-Id, X-Sample-Rate");
        if (req.method == "OPTIONS") {
            res.set_header("Access-Control-Allow-Credentials", "true");
            res.set_header("Access-Control-Allow-Methods", "GET, POST");
            res.set_header("Access-Control-Allow-Headers", "*");
            res.set_content("", "text/plain");
            return httplib::Server::HandlerResponse::Handled;
        }
        return httplib::Server::HandlerResponse::Unhandled;
    });

    server.Get("/health", [&service](const httplib::Request &, httplib::Response & res) {
        const voxcast_device_registry & devices = service.devices();
        json devs = json::array();
        for (size_t i = 0; i < devices.size(); ++i) {
            devs.push_back({
                {"index", i},
                {"name", devices.name(i)},
                {"engine", devices.engine_url(i)},
                {"held", devices.held(i)},
                {"waiting", devices.waiting(i)},
            });
        }
        json j = {
            {"status", "ok"},
            {"sample_rate", service.config().sample_rate},
            {"inflight", service.inflight.load()},
            {"cache", {
                {"entries", service.cache().size()},
                {"max_entries", service.cache().max_entries()},
                {"ttl_sec", service.cache().ttl_ms() / 1000},
            }},
            {"devices", devs},
        };
        res.set_content(j.dump(), k_json_content_type);
    });

    auto stream_handler = [&service](const httplib::Request & req, httplib::Response & res) {
        const auto t_req_begin = std::chrono::steady_clock::now();

        json body;
        std::string err;
        if (!parse_body(req, body, err)) {
            set_error(res, err, 400);
            return;
        }

        voxcast_tts_request tr;
        if (!voxcast_parse_tts_request(body, mode_from_request(req), service.config(), service.devices().size(), tr, err)) {
            set_error(res, err, 400);
            return;
        }

        voxcast_chunk_source source;
        if (!service.make_source(tr, source, err)) {
            set_error(res, err, 503);
            return;
        }

        res.set_header("Cache-Control", "no-cache");
        res.set_header("X-Accel-Buffering", "no");

        // The service outlives the server, so the provider may hold a raw pointer to it.
        voxcast_service * p_service = &service;
        res.set_chunked_content_provider(
            "audio/wav",
            [p_service,
             source = std::move(source),
             device_index = tr.device_index,
             mode = tr.mode,
             req_path = req.path,
             t_req_begin,
             first = true]
            (size_t, httplib::DataSink & sink) mutable -> bool {
                if (!first) return false;
                first = false;

                const auto t_wait_begin = std::chrono::steady_clock::now();
                voxcast_device_guard guard;
                std::string lock_err;
                if (!p_service->devices().acquire(device_index, guard, lock_err)) {
                    std::fprintf(stderr, "stream: path=%s device=%zu ok=false err=%s\n",
                            req_path.c_str(), device_index, lock_err.c_str());
                    const std::string marker = voxcast_format_error_marker(lock_err);
                    if (!sink.write(marker.data(), marker.size())) {
                        return false;
                    }
                    sink.done();
                    return true;
                }
                p_service->inflight.fetch_add(1);
                const auto t_gen_begin = std::chrono::steady_clock::now();

                voxcast_stream_result result;
                voxcast_stream_run(
                        source,
                        p_service->cache(),
                        [&sink](const char * data, size_t len) { return sink.write(data, len); },
                        result);

                guard.release();
                p_service->inflight.fetch_sub(1);

                const auto t_end = std::chrono::steady_clock::now();
                std::fprintf(
                        stderr,
                        "stream: path=%s device=%zu mode=%s ok=%s wait_ms=%.2f gen_ms=%.2f total_ms=%.2f "
                        "chunks=%zu samples=%zu sample_rate=%d bytes=%zu job=%s err=%s\n",
                        req_path.c_str(),
                        device_index,
                        voxcast_tts_mode_to_cstr(mode),
                        result.ok ? "true" : "false",
                        ms_since(t_wait_begin, t_gen_begin),
                        ms_since(t_gen_begin, t_end),
                        ms_since(t_req_begin, t_end),
                        result.n_chunks,
                        result.n_samples,
                        result.sample_rate,
                        result.bytes_written,
                        result.job_id.empty() ? "-" : result.job_id.c_str(),
                        result.error.empty() ? "-" : result.error.c_str());

                if (result.disconnected) {
                    return false;
                }
                sink.done();
                return true;
            });
    };

    auto generate_handler = [&service](const httplib::Request & req, httplib::Response & res) {
        const auto t_req_begin = std::chrono::steady_clock::now();

        json body;
        std::string err;
        if (!parse_body(req, body, err)) {
            set_error(res, err, 400);
            return;
        }

        voxcast_tts_request tr;
        if (!voxcast_parse_tts_request(body, mode_from_request(req), service.config(), service.devices().size(), tr, err)) {
            set_error(res, err, 400);
            return;
        }

        voxcast_chunk_source source;
        if (!service.make_source(tr, source, err)) {
            set_error(res, err, 503);
            return;
        }

        const auto t_wait_begin = std::chrono::steady_clock::now();
        voxcast_device_guard guard;
        if (!service.devices().acquire(tr.device_index, guard, err)) {
            set_error(res, err, 400);
            return;
        }
        service.inflight.fetch_add(1);
        const auto t_gen_begin = std::chrono::steady_clock::now();

        std::vector<int16_t> samples;
        int32_t sample_rate = 0;
        const bool ok = voxcast_chunk_source_collect(source, samples, sample_rate, err);

        guard.release();
        service.inflight.fetch_sub(1);
        const auto t_end = std::chrono::steady_clock::now();

        if (!ok) {
            std::fprintf(stderr,
                    "generate: path=%s device=%zu mode=%s ok=false wait_ms=%.2f gen_ms=%.2f err=%s\n",
                    req.path.c_str(), tr.device_index, voxcast_tts_mode_to_cstr(tr.mode),
                    ms_since(t_wait_begin, t_gen_begin), ms_since(t_gen_begin, t_end), err.c_str());
            set_error(res, err, 500);
            return;
        }

        const std::vector<uint8_t> wav = voxcast_wav_encode(samples.data(), samples.size(), (uint32_t) sample_rate);
        const size_t n_samples = samples.size();
        const std::string job_id = service.cache().store(std::move(samples), sample_rate, voxcast_now_ms());

        std::fprintf(stderr,
                "generate: path=%s device=%zu mode=%s ok=true wait_ms=%.2f gen_ms=%.2f total_ms=%.2f samples=%zu sample_rate=%d job=%s\n",
                req.path.c_str(), tr.device_index, voxcast_tts_mode_to_cstr(tr.mode),
                ms_since(t_wait_begin, t_gen_begin), ms_since(t_gen_begin, t_end), ms_since(t_req_begin, t_end),
                n_samples, sample_rate, job_id.c_str());

        res.status = 200;
        res.set_header("X-Job-Id", job_id);
        res.set_header("X-Sample-Rate", std::to_string(sample_rate));
        res.set_content(std::string(reinterpret_cast<const char *>(wav.data()), wav.size()), "audio/wav");
    };

    server.Post("/api/tts/stream", stream_handler);
    server.Post(R"(/api/tts/(clone|custom|design)/stream)", stream_handler);
    server.Post("/api/tts/generate", generate_handler);
    server.Post(R"(/api/tts/(clone|custom|design))", generate_handler);

    server.Get(R"(/api/tts/download/([^/]+))", [&service](const httplib::Request & req, httplib::Response & res) {
        serve_cached_wav(service, req, res, true);
    });
    server.Get(R"(/api/history/audio/([^/]+))", [&service](const httplib::Request & req, httplib::Response & res) {
        serve_cached_wav(service, req, res, false);
    });
}
