#include "accelerator.h"
#include "conversion-api.h"
#include "conversion-scheduler.h"
#include "conversion-service.h"
#include "plugin-engine.h"
#include "seedvc-common.h"

#include <cpp-httplib/httplib.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <deque>
#include <filesystem>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

struct server_config {
    std::string host = "0.0.0.0";
    int32_t port = 8000;

    std::string engine_lib;
    std::string ar_checkpoint_path;
    std::string cfm_checkpoint_path;
    std::string device;
    bool compile = false;
    int32_t n_threads = 0;
    int32_t n_parallel = 0; // 0 = derived from free accelerator memory

    std::string output_dir = "/tmp";
    float max_reference_seconds = 120.0f;
    float max_source_seconds = 0.0f;
    float silence_threshold_db = -40.0f;
    float min_silence_seconds = 0.3f;
    float search_window_seconds = 5.0f;
    int32_t crossfade_hops = 4;
    seedvc_output_format streaming_format = SEEDVC_OUTPUT_MP3;
};

static void print_usage(const char * argv0) {
    std::fprintf(stderr,
        "Usage:\n"
        "  %s --engine-lib LIB [options]\n\n"
        "Engine:\n"
        "  --engine-lib FNAME              voice conversion engine plugin (env SEEDVC_ENGINE_LIB)\n"
        "  --ar-checkpoint-path FNAME      AR model checkpoint (env SEEDVC_AR_CHECKPOINT)\n"
        "  --cfm-checkpoint-path FNAME     CFM model checkpoint (env SEEDVC_CFM_CHECKPOINT)\n"
        "  --device STR                    engine device (default: first accelerator, else cpu)\n"
        "  --compile on|off                ask the engine to compile its graphs (default: off)\n"
        "  --threads N                     engine threads (default: 0, auto)\n\n"
        "Server:\n"
        "  --host STR                      bind host (default: 0.0.0.0)\n"
        "  --port N                        bind port (default: 8000)\n"
        "  --output-dir DIR                output directory (default: /tmp)\n"
        "  --parallel N, -np N             concurrent conversion jobs (default: from accelerator memory)\n\n"
        "Conversion:\n"
        "  --max-reference-seconds F       reject longer reference audio (default: 120)\n"
        "  --max-source-seconds F          reject longer source audio, 0 = unlimited (default: 0)\n"
        "  --silence-threshold-db F        segmenter silence threshold (default: -40)\n"
        "  --min-silence-seconds F         minimum silence run for a cut (default: 0.3)\n"
        "  --search-window-seconds F       look-back window for a silent cut (default: 5)\n"
        "  --crossfade-hops N              chunk crossfade in engine hops (default: 4)\n"
        "  --streaming-format wav|mp3|ogg  streaming artifact format (default: mp3)\n",
        argv0);
}

static bool parse_i32(const char * s, int32_t & out) {
    return s != nullptr && seedvc_parse_i32(s, out);
}

static bool parse_f32(const char * s, float & out) {
    if (s == nullptr) {
        return false;
    }
    char * end = nullptr;
    const float v = std::strtof(s, &end);
    if (end == nullptr || *end != '\0') {
        return false;
    }
    out = v;
    return true;
}

static bool parse_on_off_bool(const char * s, bool & out) {
    if (s == nullptr) {
        return false;
    }
    const std::string v = seedvc_lower_copy(s);
    if (v == "on" || v == "true" || v == "1" || v == "yes") {
        out = true;
        return true;
    }
    if (v == "off" || v == "false" || v == "0" || v == "no") {
        out = false;
        return true;
    }
    return false;
}

static bool parse_streaming_format(const char * s, seedvc_output_format & out) {
    if (s == nullptr) {
        return false;
    }
    seedvc_error err;
    if (!seedvc_parse_output_format(s, out, err)) {
        std::fprintf(stderr, "--streaming-format: %s\n", err.message.c_str());
        return false;
    }
    return true;
}

static void env_fallback(std::string & dst, const char * name) {
    if (!dst.empty()) {
        return;
    }
    const char * v = std::getenv(name);
    if (v != nullptr && v[0] != '\0') {
        dst = v;
    }
}

static bool needs_value(int i, int argc) {
    return i + 1 < argc;
}

static bool parse_args(int argc, char ** argv, server_config & cfg) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--engine-lib") {
            if (!needs_value(i, argc)) return false;
            cfg.engine_lib = argv[++i];
        } else if (arg == "--ar-checkpoint-path") {
            if (!needs_value(i, argc)) return false;
            cfg.ar_checkpoint_path = argv[++i];
        } else if (arg == "--cfm-checkpoint-path") {
            if (!needs_value(i, argc)) return false;
            cfg.cfm_checkpoint_path = argv[++i];
        } else if (arg == "--device") {
            if (!needs_value(i, argc)) return false;
            cfg.device = argv[++i];
        } else if (arg == "--compile") {
            if (!needs_value(i, argc) || !parse_on_off_bool(argv[++i], cfg.compile)) return false;
        } else if (arg == "--threads") {
            if (!needs_value(i, argc) || !parse_i32(argv[++i], cfg.n_threads)) return false;
        } else if (arg == "--host") {
            if (!needs_value(i, argc)) return false;
            cfg.host = argv[++i];
        } else if (arg == "--port") {
            if (!needs_value(i, argc) || !parse_i32(argv[++i], cfg.port)) return false;
        } else if (arg == "--output-dir") {
            if (!needs_value(i, argc)) return false;
            cfg.output_dir = argv[++i];
        } else if (arg == "--parallel" || arg == "-np") {
            if (!needs_value(i, argc) || !parse_i32(argv[++i], cfg.n_parallel)) return false;
        } else if (arg == "--max-reference-seconds") {
            if (!needs_value(i, argc) || !parse_f32(argv[++i], cfg.max_reference_seconds)) return false;
        } else if (arg == "--max-source-seconds") {
            if (!needs_value(i, argc) || !parse_f32(argv[++i], cfg.max_source_seconds)) return false;
        } else if (arg == "--silence-threshold-db") {
            if (!needs_value(i, argc) || !parse_f32(argv[++i], cfg.silence_threshold_db)) return false;
        } else if (arg == "--min-silence-seconds") {
            if (!needs_value(i, argc) || !parse_f32(argv[++i], cfg.min_silence_seconds)) return false;
        } else if (arg == "--search-window-seconds") {
            if (!needs_value(i, argc) || !parse_f32(argv[++i], cfg.search_window_seconds)) return false;
        } else if (arg == "--crossfade-hops") {
            if (!needs_value(i, argc) || !parse_i32(argv[++i], cfg.crossfade_hops)) return false;
        } else if (arg == "--streaming-format") {
            if (!needs_value(i, argc) || !parse_streaming_format(argv[++i], cfg.streaming_format)) return false;
        } else if (arg == "-h" || arg == "--help") {
            return false;
        } else {
            std::fprintf(stderr, "unknown argument: %s\n", arg.c_str());
            return false;
        }
    }

    if (cfg.port < 1 || cfg.port > 65535) {
        return false;
    }
    if (cfg.n_parallel < 0 || cfg.crossfade_hops < 0) {
        return false;
    }
    if (cfg.max_reference_seconds <= 0.0f || cfg.max_source_seconds < 0.0f) {
        return false;
    }

    env_fallback(cfg.engine_lib, "SEEDVC_ENGINE_LIB");
    env_fallback(cfg.ar_checkpoint_path, "SEEDVC_AR_CHECKPOINT");
    env_fallback(cfg.cfm_checkpoint_path, "SEEDVC_CFM_CHECKPOINT");

    return true;
}

static const char * k_json_mime = "application/json; charset=utf-8";

static bool sse_write_event(httplib::DataSink & sink, const char * event, const std::string & data) {
    std::string msg;
    msg.reserve(16 + std::strlen(event) + data.size());
    msg += "event: ";
    msg += event;
    msg += "\ndata: ";
    msg += data;
    msg += "\n\n";
    return sink.write(msg.data(), msg.size());
}

static std::string pcm16_base64(const std::vector<float> & samples) {
    std::vector<uint8_t> bytes(samples.size() * sizeof(int16_t));
    int16_t * pcm = reinterpret_cast<int16_t *>(bytes.data());
    for (size_t i = 0; i < samples.size(); ++i) {
        const float x = std::clamp(samples[i], -1.0f, 1.0f);
        pcm[i] = (int16_t) std::lrintf(x * 32767.0f);
    }
    return seedvc_base64_encode(bytes);
}

static const char * mime_for_path(const std::string & path) {
    const std::string ext = seedvc_lower_copy(std::filesystem::path(path).extension().string());
    if (ext == ".wav") return seedvc_output_format_mime(SEEDVC_OUTPUT_WAV);
    if (ext == ".mp3") return seedvc_output_format_mime(SEEDVC_OUTPUT_MP3);
    if (ext == ".ogg") return seedvc_output_format_mime(SEEDVC_OUTPUT_OGG);
    return "application/octet-stream";
}

static void set_error(httplib::Response & res, const seedvc_error & err) {
    res.status = seedvc_error_kind_http_status(err.kind);
    res.set_content(seedvc_make_error_json(err).dump(), k_json_mime);
}

// Shared between the SSE content provider and the conversion it drives.
struct stream_state {
    std::mutex mtx;
    std::shared_ptr<conversion_job> job;
    std::deque<int32_t> completed_chunks;
    std::atomic<bool> client_gone{false};
};

int main(int argc, char ** argv) {
    server_config cfg;
    if (!parse_args(argc, argv, cfg)) {
        print_usage(argv[0]);
        return 1;
    }

    seedvc_accelerator_init();
    const std::vector<accelerator_device> accelerators = seedvc_list_accelerators();
    for (const auto & d : accelerators) {
        std::fprintf(stderr, "info: accelerator %s (%s) free=%zu MiB total=%zu MiB\n",
                d.name.c_str(), d.description.c_str(), d.memory_free >> 20, d.memory_total >> 20);
    }
    if (accelerators.empty()) {
        std::fprintf(stderr, "info: no accelerator found, running on cpu\n");
    }

    plugin_engine_config ecfg;
    ecfg.library_path = cfg.engine_lib;
    ecfg.ar_checkpoint_path = cfg.ar_checkpoint_path;
    ecfg.cfm_checkpoint_path = cfg.cfm_checkpoint_path;
    ecfg.device = cfg.device.empty() ? seedvc_default_device_name(accelerators) : cfg.device;
    ecfg.compile = cfg.compile;
    ecfg.n_threads = seedvc_resolve_threads(cfg.n_threads);

    plugin_voice_model_engine engine;
    {
        std::string load_err;
        if (!engine.load(ecfg, load_err)) {
            std::fprintf(stderr, "warning: engine not loaded: %s\n", load_err.c_str());
            std::fprintf(stderr, "warning: conversion requests will fail with model_unavailable\n");
        }
    }

    const int32_t n_parallel = cfg.n_parallel > 0
            ? cfg.n_parallel
            : seedvc_default_parallel_jobs(accelerators, engine.info().job_workspace_bytes);

    {
        std::error_code ec;
        std::filesystem::create_directories(cfg.output_dir, ec);
        if (ec) {
            std::fprintf(stderr, "failed to create --output-dir %s: %s\n", cfg.output_dir.c_str(), ec.message().c_str());
            return 1;
        }
    }

    conversion_scheduler scheduler(engine, n_parallel);

    service_config scfg;
    scfg.output_dir = cfg.output_dir;
    scfg.limits.max_reference_seconds = cfg.max_reference_seconds;
    scfg.limits.max_source_seconds = cfg.max_source_seconds;
    scfg.silence_threshold_db = cfg.silence_threshold_db;
    scfg.min_silence_seconds = cfg.min_silence_seconds;
    scfg.search_window_seconds = cfg.search_window_seconds;
    scfg.crossfade_hops = cfg.crossfade_hops;
    scfg.streaming_format = cfg.streaming_format;

    conversion_service service(engine, scheduler, scfg);

    std::fprintf(stderr, "info: parallel=%d engine_access=%s device=%s loaded=%s\n",
            n_parallel,
            scheduler.serializes_engine() ? "serialized" : "batched",
            ecfg.device.c_str(),
            engine.is_loaded() ? "yes" : "no");

    httplib::Server server;
    server.set_default_headers({{"Server", "seedvc-server"}});

    server.set_pre_routing_handler([](const httplib::Request & req, httplib::Response & res) {
        res.set_header("Access-Control-Allow-Origin", req.get_header_value("Origin"));
        if (req.method == "OPTIONS") {
            res.set_header("Access-Control-Allow-Credentials", "true");
            res.set_header("Access-Control-Allow-Methods", "GET, POST, DELETE");
            res.set_header("Access-Control-Allow-Headers", "*");
            res.set_content("", "text/plain");
            return httplib::Server::HandlerResponse::Handled;
        }
        return httplib::Server::HandlerResponse::Unhandled;
    });

    server.Get("/", [&](const httplib::Request &, httplib::Response & res) {
        json j = {
            {"service", "seedvc-server"},
            {"description", "zero-shot voice conversion"},
            {"endpoints", {
                {"GET /health", "model and worker status"},
                {"POST /convert", "convert audio given by path or base64"},
                {"POST /convert/files", "convert uploaded audio files (multipart)"},
                {"POST /convert/stream", "convert with server-sent chunk events"},
                {"GET /download/<path>", "fetch an output file"},
                {"DELETE /cleanup/<path>", "remove an output file"},
            }},
        };
        res.set_content(j.dump(), k_json_mime);
    });

    server.Get("/health", [&](const httplib::Request &, httplib::Response & res) {
        const engine_info & info = engine.info();
        json devices = json::array();
        for (const auto & d : accelerators) {
            devices.push_back({
                {"name", d.name},
                {"description", d.description},
                {"memory_free", d.memory_free},
                {"memory_total", d.memory_total},
            });
        }
        json j = {
            {"status", engine.is_loaded() ? "ok" : "model_unavailable"},
            {"models_loaded", engine.is_loaded()},
            {"load_error", engine.is_loaded() ? json(nullptr) : json(engine.load_error())},
            {"device", ecfg.device},
            {"accelerators", devices},
            {"parallel", scheduler.max_concurrent_jobs()},
            {"engine_access", scheduler.serializes_engine() ? "serialized" : "batched"},
            {"inflight", scheduler.active_jobs()},
            {"queued", scheduler.queued_jobs()},
            {"peak_inflight", scheduler.peak_active_jobs()},
        };
        if (engine.is_loaded()) {
            j["engine"] = {
                {"name", info.name},
                {"sample_rate", info.sample_rate},
                {"hop_size", info.hop_size},
                {"max_chunk_seconds", info.sample_rate > 0 ? (double) info.max_chunk_samples / info.sample_rate : 0.0},
                {"batched_occupancy", info.batched_occupancy},
            };
        }
        res.set_content(j.dump(), k_json_mime);
    });

    auto finish_response = [&](const httplib::Request & req, httplib::Response & res,
            const conversion_response & rsp, const std::chrono::steady_clock::time_point & t_req_begin) {
        res.status = seedvc_conversion_response_status(rsp);
        res.set_content(seedvc_conversion_response_json(rsp).dump(), k_json_mime);
        std::fprintf(stderr, "request: path=%s status=%d job=%llu total_ms=%.2f\n",
                req.path.c_str(), res.status, (unsigned long long) rsp.job_id,
                seedvc_ms_since(t_req_begin, std::chrono::steady_clock::now()));
    };

    server.Post("/convert", [&](const httplib::Request & req, httplib::Response & res) {
        const auto t_req_begin = std::chrono::steady_clock::now();
        json body;
        try {
            body = json::parse(req.body.empty() ? "{}" : req.body);
        } catch (const std::exception & e) {
            seedvc_error err;
            err.set(SEEDVC_ERROR_VALIDATION, std::string("invalid JSON: ") + e.what());
            set_error(res, err);
            return;
        }

        conversion_inputs in;
        seedvc_error err;
        if (!seedvc_parse_conversion_json(body, in, err)) {
            set_error(res, err);
            return;
        }

        const conversion_response rsp = service.convert(in);
        finish_response(req, res, rsp, t_req_begin);
    });

    server.Post("/convert/files", [&](const httplib::Request & req, httplib::Response & res) {
        const auto t_req_begin = std::chrono::steady_clock::now();
        seedvc_error err;
        if (!req.is_multipart_form_data()) {
            err.set(SEEDVC_ERROR_VALIDATION, "expected multipart/form-data with source_audio and target_audio files");
            set_error(res, err);
            return;
        }

        conversion_inputs in;
        std::map<std::string, std::string> fields;
        for (const auto & name : seedvc_conversion_param_names()) {
            if (req.form.has_field(name)) {
                fields[name] = req.form.get_field(name);
            }
        }
        if (!seedvc_parse_conversion_form(fields, in.params, err)) {
            set_error(res, err);
            return;
        }

        if (req.form.has_file("source_audio")) {
            const auto file = req.form.get_file("source_audio");
            if (!file.content.empty()) {
                in.source.upload = audio_source_upload{file.filename, file.content};
            }
        }
        for (const char * name : {"target_audio", "reference_audio"}) {
            if (in.reference.upload || !req.form.has_file(name)) {
                continue;
            }
            const auto file = req.form.get_file(name);
            if (!file.content.empty()) {
                in.reference.upload = audio_source_upload{file.filename, file.content};
            }
        }

        const conversion_response rsp = service.convert(in);
        finish_response(req, res, rsp, t_req_begin);
    });

    server.Post("/convert/stream", [&](const httplib::Request & req, httplib::Response & res) {
        json body;
        try {
            body = json::parse(req.body.empty() ? "{}" : req.body);
        } catch (const std::exception & e) {
            seedvc_error err;
            err.set(SEEDVC_ERROR_VALIDATION, std::string("invalid JSON: ") + e.what());
            set_error(res, err);
            return;
        }

        conversion_inputs in;
        seedvc_error err;
        if (!seedvc_parse_conversion_json(body, in, err)) {
            set_error(res, err);
            return;
        }

        auto * p_service = &service;
        auto req_path = req.path;
        const auto t_req_begin = std::chrono::steady_clock::now();

        res.set_header("Cache-Control", "no-cache");
        res.set_header("X-Accel-Buffering", "no");

        res.set_chunked_content_provider(
            "text/event-stream; charset=utf-8",
            [p_service,
             in = std::move(in),
             req_path = std::move(req_path),
             t_req_begin,
             first = true]
            (size_t, httplib::DataSink & sink) mutable -> bool {
                if (!first) return false;
                first = false;

                auto st = std::make_shared<stream_state>();

                conversion_observer obs;
                obs.on_submitted = [st](const std::shared_ptr<conversion_job> & job) {
                    std::lock_guard<std::mutex> lock(st->mtx);
                    st->job = job;
                };
                obs.on_chunk = [st](const conversion_job &, int32_t chunk_index) {
                    std::lock_guard<std::mutex> lock(st->mtx);
                    st->completed_chunks.push_back(chunk_index);
                };
                obs.is_cancelled = [st]() {
                    return st->client_gone.load();
                };

                auto fut = std::async(std::launch::async, [p_service, &in, &obs]() {
                    return p_service->convert(in, &obs);
                });

                std::shared_ptr<conversion_job> job;
                size_t sent = 0;
                bool job_announced = false;

                auto write_event = [&](const char * event, const json & data) {
                    if (st->client_gone.load()) {
                        return;
                    }
                    if (!sse_write_event(sink, event, data.dump())) {
                        st->client_gone.store(true);
                    }
                };

                auto drain = [&](bool final_flush) {
                    std::deque<int32_t> done;
                    {
                        std::lock_guard<std::mutex> lock(st->mtx);
                        if (!job) {
                            job = st->job;
                        }
                        done.swap(st->completed_chunks);
                    }
                    if (!job) {
                        return;
                    }
                    if (!job_announced) {
                        write_event("job", json {
                            {"job_id", job->id()},
                            {"n_chunks", job->n_chunks()},
                            {"sample_rate", job->sample_rate()},
                        });
                        job_announced = true;
                    }
                    int32_t last_index = -1;
                    for (int32_t idx : done) {
                        last_index = std::max(last_index, idx);
                    }
                    if (last_index < 0 && !(final_flush && job->state() == CONVERSION_JOB_SUCCEEDED)) {
                        return;
                    }
                    const std::vector<float> delta = job->streaming_since(sent);
                    if (delta.empty()) {
                        return;
                    }
                    write_event("chunk", json {
                        {"job_id", job->id()},
                        {"chunk_index", last_index >= 0 ? last_index : job->n_chunks() - 1},
                        {"n_chunks", job->n_chunks()},
                        {"offset", sent},
                        {"n_samples", delta.size()},
                        {"final", final_flush},
                        {"pcm16_base64", pcm16_base64(delta)},
                    });
                    sent += delta.size();
                };

                while (fut.wait_for(std::chrono::milliseconds(50)) != std::future_status::ready) {
                    drain(false);
                }
                drain(false);
                const conversion_response rsp = fut.get();
                drain(true);

                if (rsp.success) {
                    write_event("result", seedvc_conversion_response_json(rsp));
                } else {
                    write_event("error", seedvc_conversion_response_json(rsp));
                }

                std::fprintf(stderr, "request: path=%s status=%s job=%llu chunks_sent=%zu client_gone=%d total_ms=%.2f\n",
                        req_path.c_str(), rsp.success ? "ok" : seedvc_error_kind_to_cstr(rsp.error.kind),
                        (unsigned long long) rsp.job_id, sent, st->client_gone.load() ? 1 : 0,
                        seedvc_ms_since(t_req_begin, std::chrono::steady_clock::now()));

                if (st->client_gone.load()) {
                    return false;
                }
                sink.done();
                return true;
            });
    });

    server.Get(R"(/download/(.+))", [&](const httplib::Request & req, httplib::Response & res) {
        std::string path;
        seedvc_error err;
        if (!seedvc_resolve_output_path(cfg.output_dir, req.matches[1].str(), path, err)) {
            res.status = 403;
            res.set_content(seedvc_make_error_json(err).dump(), k_json_mime);
            return;
        }
        if (!std::filesystem::is_regular_file(path)) {
            err.set(SEEDVC_ERROR_INPUT, "file not found: " + path);
            res.status = 404;
            res.set_content(seedvc_make_error_json(err).dump(), k_json_mime);
            return;
        }

        auto data = std::make_shared<std::vector<uint8_t>>();
        std::string io_err;
        if (!seedvc_load_binary_file(path, *data, io_err)) {
            err.set(SEEDVC_ERROR_IO, io_err);
            set_error(res, err);
            return;
        }

        res.status = 200;
        res.set_header("Content-Disposition",
                "attachment; filename=\"" + std::filesystem::path(path).filename().string() + "\"");
        res.set_chunked_content_provider(
                mime_for_path(path),
                [data, offset = size_t(0)](size_t, httplib::DataSink & sink) mutable {
                    constexpr size_t CHUNK = 64 * 1024;
                    if (offset >= data->size()) {
                        sink.done();
                        return true;
                    }
                    const size_t n = std::min(CHUNK, data->size() - offset);
                    if (!sink.write(reinterpret_cast<const char *>(data->data() + offset), n)) {
                        return false;
                    }
                    offset += n;
                    return true;
                });
    });

    server.Delete(R"(/cleanup/(.+))", [&](const httplib::Request & req, httplib::Response & res) {
        std::string path;
        seedvc_error err;
        if (!seedvc_resolve_output_path(cfg.output_dir, req.matches[1].str(), path, err)) {
            res.status = 403;
            res.set_content(seedvc_make_error_json(err).dump(), k_json_mime);
            return;
        }

        std::error_code ec;
        const bool removed = std::filesystem::remove(path, ec);
        if (ec) {
            err.set(SEEDVC_ERROR_IO, "failed to remove " + path + ": " + ec.message());
            set_error(res, err);
            return;
        }
        if (!removed) {
            err.set(SEEDVC_ERROR_INPUT, "file not found: " + path);
            res.status = 404;
            res.set_content(seedvc_make_error_json(err).dump(), k_json_mime);
            return;
        }

        std::fprintf(stderr, "cleanup: path=%s\n", path.c_str());
        res.set_content(json({{"success", true}, {"message", "file removed"}, {"path", path}}).dump(), k_json_mime);
    });

    std::fprintf(stderr, "seedvc-server listening on http://%s:%d\n", cfg.host.c_str(), cfg.port);
    const bool listened = server.listen(cfg.host, cfg.port);
    scheduler.shutdown();
    if (!listened) {
        std::fprintf(stderr, "failed to listen on %s:%d\n", cfg.host.c_str(), cfg.port);
        return 1;
    }

    return 0;
}
