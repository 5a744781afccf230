#include "accelerator.h"
#include "conversion-scheduler.h"
#include "conversion-service.h"
#include "plugin-engine.h"
#include "seedvc-common.h"

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

struct cli_params {
    std::string engine_lib;
    std::string ar_checkpoint_path;
    std::string cfm_checkpoint_path;
    std::string device;
    bool compile = false;
    int32_t n_threads = 0;

    std::string source;
    std::string reference;
    std::string output = "output.wav";
    std::string output_streaming;
    std::string format; // empty = from the output extension
    bool pcm16 = false;

    conversion_params params;
    float max_reference_seconds = 120.0f;
    float silence_threshold_db = -40.0f;
    float min_silence_seconds = 0.3f;
    float search_window_seconds = 5.0f;
    int32_t crossfade_hops = 4;

    bool show_help = false;
};

static void print_usage(const char * argv0) {
    std::fprintf(stderr,
        "Usage:\n"
        "  %s --engine-lib LIB -s SOURCE -t TARGET [options]\n\n"
        "Required:\n"
        "  -s, --source FNAME              audio whose content is kept\n"
        "  -t, --target FNAME              reference audio whose voice is used (alias --reference)\n\n"
        "Engine:\n"
        "  --engine-lib FNAME              voice conversion engine plugin (env SEEDVC_ENGINE_LIB)\n"
        "  --ar-checkpoint-path FNAME      AR model checkpoint (env SEEDVC_AR_CHECKPOINT)\n"
        "  --cfm-checkpoint-path FNAME     CFM model checkpoint (env SEEDVC_CFM_CHECKPOINT)\n"
        "  --device STR                    engine device (default: first accelerator, else cpu)\n"
        "  --compile on|off                ask the engine to compile its graphs (default: off)\n"
        "  --threads N                     engine threads (default: 0, auto)\n\n"
        "Output:\n"
        "  -o, --output FNAME              full output (default: output.wav)\n"
        "  --output-streaming FNAME        also write the streaming output\n"
        "  --format wav|mp3|ogg            output format (default: from --output extension)\n"
        "  --pcm16                         write 16-bit PCM instead of float WAV\n\n"
        "Conversion:\n"
        "  --diffusion-steps N             [1, 200] (default: 30)\n"
        "  --length-adjust F               [0.5, 2.0] (default: 1.0)\n"
        "  --intelligibility-cfg-rate F    [0.0, 1.0] (default: 0.5)\n"
        "  --similarity-cfg-rate F         [0.0, 1.0] (default: 0.5)\n"
        "  --top-p F                       [0.1, 1.0] (default: 0.9)\n"
        "  --temperature F                 [0.1, 2.0] (default: 1.0)\n"
        "  --repetition-penalty F          [1.0, 3.0] (default: 1.0)\n"
        "  --convert-style                 also convert accent and emotion\n"
        "  --anonymization-only            ignore the reference timbre\n"
        "  --max-reference-seconds F       reject longer reference audio (default: 120)\n"
        "  --silence-threshold-db F        segmenter silence threshold (default: -40)\n"
        "  --min-silence-seconds F         minimum silence run for a cut (default: 0.3)\n"
        "  --search-window-seconds F       look-back window for a silent cut (default: 5)\n"
        "  --crossfade-hops N              chunk crossfade in engine hops (default: 4)\n",
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

static bool needs_value(int i, int argc) {
    return i + 1 < argc;
}

static bool parse_args(int argc, char ** argv, cli_params & p) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            p.show_help = true;
        } else if (arg == "--engine-lib") {
            if (!needs_value(i, argc)) return false;
            p.engine_lib = argv[++i];
        } else if (arg == "--ar-checkpoint-path") {
            if (!needs_value(i, argc)) return false;
            p.ar_checkpoint_path = argv[++i];
        } else if (arg == "--cfm-checkpoint-path") {
            if (!needs_value(i, argc)) return false;
            p.cfm_checkpoint_path = argv[++i];
        } else if (arg == "--device") {
            if (!needs_value(i, argc)) return false;
            p.device = argv[++i];
        } else if (arg == "--compile") {
            if (!needs_value(i, argc) || !parse_on_off_bool(argv[++i], p.compile)) return false;
        } else if (arg == "--threads") {
            if (!needs_value(i, argc) || !parse_i32(argv[++i], p.n_threads)) return false;
        } else if (arg == "-s" || arg == "--source") {
            if (!needs_value(i, argc)) return false;
            p.source = argv[++i];
        } else if (arg == "-t" || arg == "--target" || arg == "--reference") {
            if (!needs_value(i, argc)) return false;
            p.reference = argv[++i];
        } else if (arg == "-o" || arg == "--output") {
            if (!needs_value(i, argc)) return false;
            p.output = argv[++i];
        } else if (arg == "--output-streaming") {
            if (!needs_value(i, argc)) return false;
            p.output_streaming = argv[++i];
        } else if (arg == "--format") {
            if (!needs_value(i, argc)) return false;
            p.format = argv[++i];
        } else if (arg == "--pcm16") {
            p.pcm16 = true;
        } else if (arg == "--diffusion-steps") {
            if (!needs_value(i, argc) || !parse_i32(argv[++i], p.params.diffusion_steps)) return false;
        } else if (arg == "--length-adjust") {
            if (!needs_value(i, argc) || !parse_f32(argv[++i], p.params.length_adjust)) return false;
        } else if (arg == "--intelligibility-cfg-rate") {
            if (!needs_value(i, argc) || !parse_f32(argv[++i], p.params.intelligibility_cfg_rate)) return false;
        } else if (arg == "--similarity-cfg-rate") {
            if (!needs_value(i, argc) || !parse_f32(argv[++i], p.params.similarity_cfg_rate)) return false;
        } else if (arg == "--top-p") {
            if (!needs_value(i, argc) || !parse_f32(argv[++i], p.params.top_p)) return false;
        } else if (arg == "--temperature") {
            if (!needs_value(i, argc) || !parse_f32(argv[++i], p.params.temperature)) return false;
        } else if (arg == "--repetition-penalty") {
            if (!needs_value(i, argc) || !parse_f32(argv[++i], p.params.repetition_penalty)) return false;
        } else if (arg == "--convert-style") {
            p.params.convert_style = true;
        } else if (arg == "--anonymization-only") {
            p.params.anonymization_only = true;
        } else if (arg == "--max-reference-seconds") {
            if (!needs_value(i, argc) || !parse_f32(argv[++i], p.max_reference_seconds)) return false;
        } else if (arg == "--silence-threshold-db") {
            if (!needs_value(i, argc) || !parse_f32(argv[++i], p.silence_threshold_db)) return false;
        } else if (arg == "--min-silence-seconds") {
            if (!needs_value(i, argc) || !parse_f32(argv[++i], p.min_silence_seconds)) return false;
        } else if (arg == "--search-window-seconds") {
            if (!needs_value(i, argc) || !parse_f32(argv[++i], p.search_window_seconds)) return false;
        } else if (arg == "--crossfade-hops") {
            if (!needs_value(i, argc) || !parse_i32(argv[++i], p.crossfade_hops)) return false;
        } else {
            std::fprintf(stderr, "unknown argument: %s\n", arg.c_str());
            return false;
        }
    }

    if (p.show_help) {
        return true;
    }

    for (auto & kv : {std::make_pair(&p.engine_lib, "SEEDVC_ENGINE_LIB"),
                      std::make_pair(&p.ar_checkpoint_path, "SEEDVC_AR_CHECKPOINT"),
                      std::make_pair(&p.cfm_checkpoint_path, "SEEDVC_CFM_CHECKPOINT")}) {
        if (!kv.first->empty()) {
            continue;
        }
        const char * v = std::getenv(kv.second);
        if (v != nullptr && v[0] != '\0') {
            *kv.first = v;
        }
    }

    return !p.source.empty() && !p.reference.empty() && !p.output.empty();
}

static bool write_waveform(
        const std::string & path,
        const std::vector<float> & samples,
        int32_t sample_rate,
        seedvc_output_format format,
        bool pcm16,
        std::string & err) {
    std::vector<uint8_t> bytes;
    if (pcm16 && format == SEEDVC_OUTPUT_WAV) {
        if (!seedvc_encode_wav_pcm16(samples, sample_rate, bytes, err)) {
            return false;
        }
    } else {
        seedvc_error enc_err;
        if (!seedvc_encode_waveform(samples, sample_rate, format, bytes, enc_err)) {
            err = enc_err.message;
            return false;
        }
    }
    return seedvc_save_binary_file(path, bytes, err);
}

static bool format_from_path(const std::string & path, seedvc_output_format & out) {
    std::string ext = std::filesystem::path(path).extension().string();
    if (!ext.empty() && ext[0] == '.') {
        ext.erase(0, 1);
    }
    seedvc_error err;
    return seedvc_parse_output_format(ext, out, err);
}

int main(int argc, char ** argv) {
    cli_params p;
    if (!parse_args(argc, argv, p)) {
        print_usage(argv[0]);
        return 1;
    }
    if (p.show_help) {
        print_usage(argv[0]);
        return 0;
    }

    seedvc_output_format format = SEEDVC_OUTPUT_WAV;
    if (!p.format.empty()) {
        seedvc_error err;
        if (!seedvc_parse_output_format(p.format, format, err)) {
            std::fprintf(stderr, "%s\n", err.message.c_str());
            return 1;
        }
    } else if (!format_from_path(p.output, format)) {
        std::fprintf(stderr, "info: unknown extension on %s, writing wav\n", p.output.c_str());
    }
    seedvc_output_format streaming_format = format;
    if (!p.output_streaming.empty() && !format_from_path(p.output_streaming, streaming_format)) {
        streaming_format = format;
    }
    p.params.output_format = format;

    seedvc_accelerator_init();
    const std::vector<accelerator_device> accelerators = seedvc_list_accelerators();

    plugin_engine_config ecfg;
    ecfg.library_path = p.engine_lib;
    ecfg.ar_checkpoint_path = p.ar_checkpoint_path;
    ecfg.cfm_checkpoint_path = p.cfm_checkpoint_path;
    ecfg.device = p.device.empty() ? seedvc_default_device_name(accelerators) : p.device;
    ecfg.compile = p.compile;
    ecfg.n_threads = seedvc_resolve_threads(p.n_threads);

    plugin_voice_model_engine engine;
    std::string load_err;
    if (!engine.load(ecfg, load_err)) {
        std::fprintf(stderr, "engine load failed: %s\n", load_err.c_str());
        return 1;
    }

    conversion_scheduler scheduler(engine, 1);

    service_config scfg;
    scfg.limits.max_reference_seconds = p.max_reference_seconds;
    scfg.silence_threshold_db = p.silence_threshold_db;
    scfg.min_silence_seconds = p.min_silence_seconds;
    scfg.search_window_seconds = p.search_window_seconds;
    scfg.crossfade_hops = p.crossfade_hops;
    scfg.streaming_format = streaming_format;
    scfg.keep_waveforms = true;
    scfg.produce_artifacts = false;

    conversion_service service(engine, scheduler, scfg);

    conversion_inputs in;
    in.source.path = p.source;
    in.reference.path = p.reference;
    in.params = p.params;

    conversion_observer obs;
    obs.on_chunk = [](const conversion_job & job, int32_t chunk_index) {
        std::fprintf(stderr, "\rchunk %d/%d", chunk_index + 1, job.n_chunks());
        if (chunk_index + 1 == job.n_chunks()) {
            std::fprintf(stderr, "\n");
        }
    };

    const conversion_response rsp = service.convert(in, &obs);
    scheduler.shutdown();
    if (!rsp.success) {
        std::fprintf(stderr, "conversion failed (%s): %s\n",
                seedvc_error_kind_to_cstr(rsp.error.kind), rsp.message.c_str());
        return 1;
    }

    std::string err;
    if (!write_waveform(p.output, rsp.full_waveform, rsp.sample_rate, format, p.pcm16, err)) {
        std::fprintf(stderr, "failed to write %s: %s\n", p.output.c_str(), err.c_str());
        return 1;
    }
    if (!p.output_streaming.empty() &&
        !write_waveform(p.output_streaming, rsp.streaming_waveform, rsp.sample_rate, streaming_format, p.pcm16, err)) {
        std::fprintf(stderr, "failed to write %s: %s\n", p.output_streaming.c_str(), err.c_str());
        return 1;
    }

    std::fprintf(stderr,
            "wrote %s (%s, %.2f s, %d Hz, %d chunks) in %.2f s\n",
            p.output.c_str(), seedvc_output_format_to_cstr(format),
            rsp.output_duration_sec, rsp.sample_rate, rsp.n_chunks, rsp.processing_time_sec);
    return 0;
}
