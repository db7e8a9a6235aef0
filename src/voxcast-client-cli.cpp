#include "voxcast-args.h"
#include "voxcast-audio-player.h"
#include "voxcast-client.h"
#include "voxcast-job-cache.h"

#include <nlohmann/json.hpp>

#include <cctype>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <string>
#include <vector>

using json = nlohmann::ordered_json;

struct cli_params {
    std::string server_url = "http://127.0.0.1:18090";
    std::string text;
    std::string mode = "default";
    std::string language;
    std::string speaker;
    std::string instruct;
    std::vector<std::string> ref_audio_ids;
    int32_t device = -1;

    std::string output_file;
    std::string download_id;
    std::string history_id;

    bool play = true;
    bool stream = true;

    int32_t chunk_bytes = 4800;
    int32_t timeout_sec = 300;
    int32_t max_duration_sec = 600;
    int32_t drain_timeout_ms = 60000;
};

static void print_usage(const char * argv0) {
    std::fprintf(stderr,
        "Usage:\n"
        "  %s --text STR [options]\n"
        "  %s --download JOB_ID -o FILE\n\n"
        "Request:\n"
        "  --server URL                    server base URL (default: http://127.0.0.1:18090, env: VOXCAST_SERVER)\n"
        "  -p, --text STR                  text to synthesize\n"
        "  --mode STR                      default | clone | custom | design (default: default)\n"
        "  --language STR                  language hint\n"
        "  --speaker STR                   speaker name (custom mode)\n"
        "  --instruct STR                  voice instruction (design mode)\n"
        "  --ref-audio-ids LIST            comma-separated reference audio ids (clone mode)\n"
        "  --device N                      device index on the server (default: 0)\n\n"
        "Output:\n"
        "  -o, --output FNAME              write the finished WAV here\n"
        "  --no-play                       do not play audio while streaming\n"
        "  --no-stream                     request the whole WAV in one response\n"
        "  --download JOB_ID               fetch a finished job instead of generating\n"
        "  --history JOB_ID                fetch a finished job through the history endpoint\n\n"
        "Transport:\n"
        "  --chunk-bytes N                 bytes buffered before each playback chunk (default: 4800)\n"
        "  --timeout N                     connect/read timeout seconds (default: 300)\n"
        "  --max-duration N                abort a stream running longer than N seconds (default: 600)\n",
        argv0, argv0);
}

static bool needs_value(int i, int argc) {
    return i + 1 < argc;
}

static bool parse_args(int argc, char ** argv, cli_params & p) {
    bool server_set = false;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--server") {
            if (!needs_value(i, argc)) return false;
            p.server_url = argv[++i];
            server_set = true;
        } else if (arg == "-p" || arg == "--text") {
            if (!needs_value(i, argc)) return false;
            p.text = argv[++i];
        } else if (arg == "--mode") {
            if (!needs_value(i, argc)) return false;
            p.mode = argv[++i];
        } else if (arg == "--language") {
            if (!needs_value(i, argc)) return false;
            p.language = argv[++i];
        } else if (arg == "--speaker") {
            if (!needs_value(i, argc)) return false;
            p.speaker = argv[++i];
        } else if (arg == "--instruct") {
            if (!needs_value(i, argc)) return false;
            p.instruct = argv[++i];
        } else if (arg == "--ref-audio-ids") {
            if (!needs_value(i, argc) || !voxcast_parse_csv_list(argv[++i], p.ref_audio_ids)) return false;
        } else if (arg == "--device") {
            if (!needs_value(i, argc) || !voxcast_parse_i32(argv[++i], p.device)) return false;
        } else if (arg == "-o" || arg == "--output") {
            if (!needs_value(i, argc)) return false;
            p.output_file = argv[++i];
        } else if (arg == "--no-play") {
            p.play = false;
        } else if (arg == "--no-stream") {
            p.stream = false;
        } else if (arg == "--download") {
            if (!needs_value(i, argc)) return false;
            p.download_id = argv[++i];
        } else if (arg == "--history") {
            if (!needs_value(i, argc)) return false;
            p.history_id = argv[++i];
        } else if (arg == "--chunk-bytes") {
            if (!needs_value(i, argc) || !voxcast_parse_i32(argv[++i], p.chunk_bytes)) return false;
        } else if (arg == "--timeout") {
            if (!needs_value(i, argc) || !voxcast_parse_i32(argv[++i], p.timeout_sec)) return false;
        } else if (arg == "--max-duration") {
            if (!needs_value(i, argc) || !voxcast_parse_i32(argv[++i], p.max_duration_sec)) return false;
        } else {
            return false;
        }
    }

    if (!server_set) {
        const char * v = std::getenv("VOXCAST_SERVER");
        if (v != nullptr && v[0] != '\0') {
            p.server_url = v;
        }
    }
    if (p.chunk_bytes < 2 || p.timeout_sec < 1 || p.max_duration_sec < 1) {
        return false;
    }
    if (p.mode != "default" && p.mode != "clone" && p.mode != "custom" && p.mode != "design") {
        return false;
    }

    const int n_actions = (p.text.empty() ? 0 : 1) + (p.download_id.empty() ? 0 : 1) + (p.history_id.empty() ? 0 : 1);
    return n_actions == 1;
}

static bool save_binary_file(const std::string & path, const std::vector<uint8_t> & data, std::string & err) {
    std::ofstream f(path, std::ios::binary);
    if (!f) {
        err = "failed to open output file: " + path;
        return false;
    }
    f.write(reinterpret_cast<const char *>(data.data()), (std::streamsize) data.size());
    if (!f) {
        err = "failed to write output file: " + path;
        return false;
    }
    return true;
}

static std::string request_path(const cli_params & p) {
    const std::string base = p.mode == "default" ? std::string("/api/tts") : "/api/tts/" + p.mode;
    if (p.stream) {
        return base + "/stream";
    }
    return p.mode == "default" ? base + "/generate" : base;
}

static json request_body(const cli_params & p) {
    json body = {
        {"text", p.text},
    };
    if (!p.language.empty()) body["language"] = p.language;
    if (!p.speaker.empty()) body["speaker"] = p.speaker;
    if (!p.instruct.empty()) body["instruct"] = p.instruct;
    if (!p.ref_audio_ids.empty()) body["ref_audio_ids"] = p.ref_audio_ids;
    if (p.device >= 0) body["device"] = p.device;
    return body;
}

int main(int argc, char ** argv) {
    cli_params p;
    if (!parse_args(argc, argv, p)) {
        print_usage(argv[0]);
        return 1;
    }

    voxcast_client_config ccfg;
    ccfg.server_url = p.server_url;
    ccfg.timeout_sec = p.timeout_sec;
    ccfg.max_duration_sec = p.max_duration_sec;
    ccfg.chunk_bytes = (size_t) p.chunk_bytes;

    if (!p.download_id.empty() || !p.history_id.empty()) {
        const bool is_history = !p.history_id.empty();
        const std::string & id = is_history ? p.history_id : p.download_id;
        if (!voxcast_is_valid_job_id(id)) {
            std::fprintf(stderr, "invalid job id: %s\n", id.c_str());
            return 1;
        }
        voxcast_client client(ccfg, nullptr);
        std::vector<uint8_t> wav;
        std::string err;
        const bool ok = is_history ? client.history_audio(id, wav, err) : client.download(id, wav, err);
        if (!ok) {
            std::fprintf(stderr, "%s failed: %s\n", is_history ? "history" : "download", err.c_str());
            return 1;
        }
        const std::string out_path = p.output_file.empty() ? "generated_" + id.substr(0, 8) + ".wav" : p.output_file;
        if (!save_binary_file(out_path, wav, err)) {
            std::fprintf(stderr, "%s\n", err.c_str());
            return 1;
        }
        std::fprintf(stderr, "saved %zu bytes to %s\n", wav.size(), out_path.c_str());
        return 0;
    }

    voxcast_audio_player player;
    voxcast_client client(ccfg, p.play && p.stream ? &player : nullptr);

    voxcast_generation_result result;
    const std::string path = request_path(p);
    const bool ok = p.stream ? client.generate_stream(path, request_body(p), result)
                             : client.generate(path, request_body(p), result);
    if (!ok) {
        std::fprintf(stderr, "generation failed: path=%s status=%d chunks_played=%zu err=%s\n",
                path.c_str(), result.http_status, result.chunks_played, result.error.c_str());
        return 1;
    }

    std::fprintf(stderr, "generation done: path=%s job=%s sample_rate=%d chunks_played=%zu wav_bytes=%zu\n",
            path.c_str(),
            result.job_id.empty() ? "-" : result.job_id.c_str(),
            result.sample_rate,
            result.chunks_played,
            result.wav.size());

    if (!p.output_file.empty()) {
        std::string err;
        if (!save_binary_file(p.output_file, result.wav, err)) {
            std::fprintf(stderr, "%s\n", err.c_str());
            return 1;
        }
        std::fprintf(stderr, "saved %s\n", p.output_file.c_str());
    }

    if (p.play && p.stream && player.is_open()) {
        if (!player.wait_until_drained(p.drain_timeout_ms)) {
            std::fprintf(stderr, "warning: playback did not finish within %d ms\n", p.drain_timeout_ms);
        }
    }
    if (!player.last_error().empty()) {
        std::fprintf(stderr, "warning: playback error: %s\n", player.last_error().c_str());
    }

    std::printf("%s\n", result.job_id.c_str());
    return 0;
}
