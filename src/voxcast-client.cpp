#include "voxcast-client.h"
#include "voxcast-upstream-source.h"

#include <httplib.h>

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <memory>

using json = nlohmann::ordered_json;

namespace {

// Forwards chunks only while its generation is still the current one.
class epoch_sink : public voxcast_playback_sink {
public:
    epoch_sink(voxcast_playback_sink * inner, std::mutex & mtx, const std::atomic<uint64_t> & epoch, uint64_t mine)
        : inner_(inner), mtx_(mtx), epoch_(epoch), mine_(mine) {
    }

    void play_chunk(const std::vector<float> & samples, int32_t sample_rate) override {
        std::lock_guard<std::mutex> lock(mtx_);
        if (inner_ == nullptr || epoch_.load() != mine_) {
            return;
        }
        inner_->play_chunk(samples, sample_rate);
    }

    void reset() override {
        std::lock_guard<std::mutex> lock(mtx_);
        if (inner_ != nullptr && epoch_.load() == mine_) {
            inner_->reset();
        }
    }

private:
    voxcast_playback_sink * inner_;
    std::mutex & mtx_;
    const std::atomic<uint64_t> & epoch_;
    uint64_t mine_;
};

struct client_target {
    std::string scheme_host_port;
    std::string base_path;
};

bool resolve_target(const std::string & server_url, client_target & out, std::string & err) {
    voxcast_http_url url;
    if (!voxcast_parse_http_url(server_url, url, err)) {
        return false;
    }
    out.scheme_host_port = std::string(url.https ? "https" : "http") + "://" + url.host + ":" + std::to_string(url.port);
    out.base_path = url.path == "/" ? std::string() : url.path;
    while (!out.base_path.empty() && out.base_path.back() == '/') {
        out.base_path.pop_back();
    }
    return true;
}

std::string error_from_body(int status, const std::string & body) {
    try {
        const json j = json::parse(body);
        if (j.contains("error") && j["error"].is_object() && j["error"].contains("message") &&
                j["error"]["message"].is_string()) {
            return j["error"]["message"].get<std::string>();
        }
    } catch (const std::exception &) {
        // not a JSON error body; report it raw
    }
    return "HTTP " + std::to_string(status) + (body.empty() ? std::string() : ": " + voxcast_truncate_text(body));
}

std::unique_ptr<httplib::Client> make_client(const client_target & target, int32_t timeout_sec, std::string & err) {
    auto cli = std::make_unique<httplib::Client>(target.scheme_host_port);
    if (!cli->is_valid()) {
        err = "invalid server URL: " + target.scheme_host_port;
        return nullptr;
    }
    cli->set_connection_timeout(timeout_sec, 0);
    cli->set_read_timeout(timeout_sec, 0);
    cli->set_write_timeout(timeout_sec, 0);
    return cli;
}

} // namespace

voxcast_client::voxcast_client(const voxcast_client_config & cfg, voxcast_playback_sink * sink)
    : cfg_(cfg), sink_(sink) {
}

uint64_t voxcast_client::begin_generation() {
    std::lock_guard<std::mutex> lock(sink_mtx_);
    const uint64_t mine = epoch_.fetch_add(1) + 1;
    if (sink_ != nullptr) {
        sink_->reset();
    }
    return mine;
}

void voxcast_client::cancel() {
    begin_generation();
}

bool voxcast_client::generate_stream(const std::string & path, const json & body, voxcast_generation_result & out) {
    out = voxcast_generation_result();
    const uint64_t mine = begin_generation();

    client_target target;
    std::string err;
    if (!resolve_target(cfg_.server_url, target, err)) {
        out.error = err;
        return false;
    }
    // a stalled read must not outlive the overall duration bound
    auto cli = make_client(target, std::min(cfg_.timeout_sec, cfg_.max_duration_sec), err);
    if (!cli) {
        out.error = err;
        return false;
    }

    epoch_sink sink(sink_, sink_mtx_, epoch_, mine);
    voxcast_consumer_params params;
    params.chunk_bytes = cfg_.chunk_bytes;
    voxcast_stream_consumer consumer(params, &sink);

    httplib::Request req;
    req.method = "POST";
    req.path = target.base_path + path;
    req.set_header("Content-Type", "application/json");
    req.set_header("Accept", "audio/wav");
    req.body = body.dump();

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(cfg_.max_duration_sec);
    int status = 0;
    bool timed_out = false;
    std::string error_body;

    req.response_handler = [&](const httplib::Response & r) {
        status = r.status;
        return true;
    };
    req.content_receiver = [&](const char * data, size_t len, uint64_t /* offset */, uint64_t /* total */) {
        if (status != 200) {
            if (error_body.size() < 4096) {
                error_body.append(data, std::min(len, 4096 - error_body.size()));
            }
            return true;
        }
        if (std::chrono::steady_clock::now() > deadline) {
            timed_out = true;
            return false;
        }
        if (epoch_.load() != mine) {
            // superseded: keep reading so the connection drains, but drop the bytes
            consumer.cancel();
            return true;
        }
        return consumer.feed(data, len);
    };

    httplib::Response res;
    httplib::Error error = httplib::Error::Success;
    const bool sent = cli->send(req, res, error);
    out.http_status = status;
    if (!sent && std::chrono::steady_clock::now() >= deadline) {
        timed_out = true;
    }

    if (consumer.cancelled() || epoch_.load() != mine) {
        out.cancelled = true;
        out.error = "cancelled";
        return false;
    }
    if (timed_out) {
        out.error = "stream exceeded maximum duration of " + std::to_string(cfg_.max_duration_sec) + " s";
        return false;
    }
    if (consumer.failed()) {
        out.error = consumer.error();
        out.chunks_played = consumer.chunks_scheduled();
        return false;
    }
    if (!sent) {
        out.error = "request failed: " + httplib::to_string(error);
        return false;
    }
    if (status != 200) {
        out.error = error_from_body(status, error_body);
        return false;
    }

    const bool ok = consumer.finish();
    out.sample_rate = consumer.sample_rate();
    out.chunks_played = consumer.chunks_scheduled();
    if (!ok) {
        out.error = consumer.error();
        return false;
    }
    if (!consumer.build_artifact(out.wav, err)) {
        out.error = err;
        return false;
    }
    out.job_id = consumer.job_id();
    out.ok = true;
    return true;
}

bool voxcast_client::generate(const std::string & path, const json & body, voxcast_generation_result & out) {
    out = voxcast_generation_result();

    client_target target;
    std::string err;
    if (!resolve_target(cfg_.server_url, target, err)) {
        out.error = err;
        return false;
    }
    auto cli = make_client(target, cfg_.timeout_sec, err);
    if (!cli) {
        out.error = err;
        return false;
    }

    auto res = cli->Post((target.base_path + path).c_str(), body.dump(), "application/json");
    if (!res) {
        out.error = "request failed: " + httplib::to_string(res.error());
        return false;
    }
    out.http_status = res->status;
    if (res->status != 200) {
        out.error = error_from_body(res->status, res->body);
        return false;
    }
    out.job_id = res->get_header_value("X-Job-Id");
    const std::string sr = res->get_header_value("X-Sample-Rate");
    out.sample_rate = sr.empty() ? 0 : std::atoi(sr.c_str());
    out.wav.assign(res->body.begin(), res->body.end());
    out.ok = true;
    return true;
}

bool voxcast_client::fetch_wav(const std::string & path, std::vector<uint8_t> & wav_out, std::string & err) {
    client_target target;
    if (!resolve_target(cfg_.server_url, target, err)) {
        return false;
    }
    auto cli = make_client(target, cfg_.timeout_sec, err);
    if (!cli) {
        return false;
    }
    auto res = cli->Get((target.base_path + path).c_str());
    if (!res) {
        err = "request failed: " + httplib::to_string(res.error());
        return false;
    }
    if (res->status != 200) {
        err = error_from_body(res->status, res->body);
        return false;
    }
    wav_out.assign(res->body.begin(), res->body.end());
    return true;
}

bool voxcast_client::download(const std::string & job_id, std::vector<uint8_t> & wav_out, std::string & err) {
    return fetch_wav("/api/tts/download/" + job_id, wav_out, err);
}

bool voxcast_client::history_audio(const std::string & job_id, std::vector<uint8_t> & wav_out, std::string & err) {
    return fetch_wav("/api/history/audio/" + job_id, wav_out, err);
}
