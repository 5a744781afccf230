#pragma once

#include "audio-asset.h"
#include "format-encoder.h"
#include "seedvc-common.h"

#include <cstdint>

struct conversion_params {
    int32_t diffusion_steps = 30;           // [1, 200]
    float length_adjust = 1.0f;             // [0.5, 2.0]
    float intelligibility_cfg_rate = 0.5f;  // [0.0, 1.0]
    float similarity_cfg_rate = 0.5f;       // [0.0, 1.0]
    float top_p = 0.9f;                     // [0.1, 1.0]
    float temperature = 1.0f;               // [0.1, 2.0]
    float repetition_penalty = 1.0f;        // [1.0, 3.0]
    bool convert_style = false;
    bool anonymization_only = false;

    seedvc_output_format output_format = SEEDVC_OUTPUT_WAV;
    bool return_base64 = false;
    bool cleanup_temp_files = true;
};

struct request_limits {
    double max_reference_seconds = 120.0;
    double max_source_seconds = 0.0; // 0 = unlimited, long sources are segmented
};

bool seedvc_validate_conversion_params(const conversion_params & params, seedvc_error & err);

struct conversion_request {
    audio_asset source;
    audio_asset reference;
    conversion_params params;
};

// Builds a request only from validated parameters and admissible durations.
// On failure `out` is left untouched.
bool seedvc_make_conversion_request(
        audio_asset source,
        audio_asset reference,
        const conversion_params & params,
        const request_limits & limits,
        conversion_request & out,
        seedvc_error & err);
