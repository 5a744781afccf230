#pragma once

#include "seedvc-common.h"

#include <cstdint>
#include <vector>

struct audio_chunk {
    int32_t index = 0;
    int64_t start = 0; // inclusive sample offset into the source
    int64_t end = 0;   // exclusive
    std::vector<float> samples;

    int64_t size() const { return end - start; }
};

struct segmenter_params {
    int64_t max_chunk_samples = 0;       // Dmax, from the engine
    float silence_threshold_db = -40.0f; // frame RMS below this is silent (dBFS)
    int32_t frame_samples = 0;
    int64_t min_silence_samples = 0;
    int64_t search_window_samples = 0;   // how far before Dmax a silent cut may land
};

struct silence_span {
    int64_t start = 0;
    int64_t end = 0;

    int64_t center() const { return start + (end - start) / 2; }
};

// 20 ms frames, 0.3 s minimum silence, 5 s search window capped at Dmax / 2.
segmenter_params seedvc_segmenter_default_params(int32_t sample_rate, int64_t max_chunk_samples);

std::vector<silence_span> seedvc_find_silence_spans(
        const std::vector<float> & samples,
        const segmenter_params & params);

// Chunks are contiguous, in order, and cover every input sample.
bool seedvc_segment_audio(
        const std::vector<float> & samples,
        const segmenter_params & params,
        std::vector<audio_chunk> & out,
        seedvc_error & err);
