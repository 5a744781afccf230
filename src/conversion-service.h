#pragma once

#include "audio-asset.h"
#include "conversion-request.h"
#include "conversion-scheduler.h"
#include "format-encoder.h"
#include "seedvc-common.h"
#include "segmenter.h"
#include "voice-engine.h"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

struct service_config {
    std::string output_dir = "/tmp";
    request_limits limits;

    float silence_threshold_db = -40.0f;
    float min_silence_seconds = 0.3f;
    float search_window_seconds = 5.0f;
    int32_t crossfade_hops = 4;

    seedvc_output_format streaming_format = SEEDVC_OUTPUT_MP3;

    // Copy the output waveforms into the response (CLI and tests).
    bool keep_waveforms = false;
    // When off, nothing is encoded or written; callers use the waveforms.
    bool produce_artifacts = true;
};

struct audio_input_info {
    double duration_sec = 0.0;
    int32_t sample_rate = 0; // native rate before resampling
    int32_t channels = 0;
    uint64_t file_size = 0;
    std::string file_format;
};

struct conversion_inputs {
    audio_source_slot source;
    audio_source_slot reference;
    conversion_params params;
};

struct conversion_observer {
    std::function<void(const std::shared_ptr<conversion_job> & job)> on_submitted;
    conversion_job::chunk_callback on_chunk;
    // Polled while the job waits in the queue; true cancels it.
    std::function<bool()> is_cancelled;
};

struct conversion_response {
    bool success = false;
    std::string message;
    seedvc_error error;

    uint64_t job_id = 0;
    std::string output_format;
    std::string streaming_format;

    std::string streaming_output_path;
    std::string full_output_path;
    std::string streaming_output_base64;
    std::string full_output_base64;

    double processing_time_sec = 0.0;
    double wait_ms = 0.0;
    double run_ms = 0.0;
    int32_t n_chunks = 0;
    int32_t sample_rate = 0;
    double output_duration_sec = 0.0;

    bool has_input_info = false;
    audio_input_info source_info;
    audio_input_info reference_info;

    std::vector<float> streaming_waveform;
    std::vector<float> full_waveform;
};

audio_input_info seedvc_describe_asset(const audio_asset & asset);

// Resolver -> request validation -> segmenter -> scheduler -> assembler -> encoder.
class conversion_service {
public:
    conversion_service(voice_model_engine & engine, conversion_scheduler & scheduler, const service_config & cfg);

    conversion_service(const conversion_service &) = delete;
    conversion_service & operator=(const conversion_service &) = delete;

    // Blocks until the job finished. Never throws; failures come back as
    // success = false with the error kind set.
    conversion_response convert(const conversion_inputs & in, const conversion_observer * observer = nullptr);

    segmenter_params make_segmenter_params() const;
    int32_t crossfade_samples() const;

    const service_config & config() const { return cfg_; }
    voice_model_engine & engine() { return engine_; }
    conversion_scheduler & scheduler() { return scheduler_; }

private:
    std::string make_output_path(uint64_t job_id, const char * kind, seedvc_output_format format) const;

    voice_model_engine & engine_;
    conversion_scheduler & scheduler_;
    const service_config cfg_;
    std::atomic<uint64_t> next_job_id_{1};
};
