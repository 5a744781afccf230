#include "segmenter.h"

#include <algorithm>
#include <cmath>
#include <iterator>

segmenter_params seedvc_segmenter_default_params(int32_t sample_rate, int64_t max_chunk_samples) {
    segmenter_params p;
    p.max_chunk_samples = max_chunk_samples;
    p.frame_samples = std::max<int32_t>(1, sample_rate / 50);
    p.min_silence_samples = (int64_t) sample_rate * 3 / 10;
    p.search_window_samples = std::min<int64_t>((int64_t) sample_rate * 5, max_chunk_samples / 2);
    return p;
}

std::vector<silence_span> seedvc_find_silence_spans(
        const std::vector<float> & samples,
        const segmenter_params & params) {
    std::vector<silence_span> spans;
    const int64_t n = (int64_t) samples.size();
    const int64_t frame = std::max<int64_t>(1, params.frame_samples);
    const double threshold = std::pow(10.0, (double) params.silence_threshold_db / 20.0);

    int64_t run_start = -1;
    auto close_run = [&](int64_t run_end) {
        if (run_start >= 0 && run_end - run_start >= params.min_silence_samples) {
            spans.push_back({run_start, run_end});
        }
        run_start = -1;
    };

    for (int64_t f0 = 0; f0 < n; f0 += frame) {
        const int64_t f1 = std::min(n, f0 + frame);
        double acc = 0.0;
        for (int64_t i = f0; i < f1; ++i) {
            const double x = samples[(size_t) i];
            acc += x * x;
        }
        const double rms = std::sqrt(acc / (double) (f1 - f0));
        if (rms < threshold) {
            if (run_start < 0) {
                run_start = f0;
            }
        } else {
            close_run(f0);
        }
    }
    close_run(n);

    return spans;
}

bool seedvc_segment_audio(
        const std::vector<float> & samples,
        const segmenter_params & params,
        std::vector<audio_chunk> & out,
        seedvc_error & err) {
    out.clear();

    if (samples.empty()) {
        err.set(SEEDVC_ERROR_INPUT, "cannot segment empty audio");
        return false;
    }
    if (params.max_chunk_samples <= 0) {
        err.set(SEEDVC_ERROR_PROCESSING, "engine reported no maximum chunk length");
        return false;
    }

    const int64_t n = (int64_t) samples.size();

    auto emit = [&](int64_t start, int64_t end) {
        audio_chunk c;
        c.index = (int32_t) out.size();
        c.start = start;
        c.end = end;
        c.samples.assign(samples.begin() + start, samples.begin() + end);
        out.push_back(std::move(c));
    };

    if (n <= params.max_chunk_samples) {
        emit(0, n);
        return true;
    }

    std::vector<int64_t> cuts;
    for (const auto & span : seedvc_find_silence_spans(samples, params)) {
        cuts.push_back(span.center());
    }

    const int64_t window = std::max<int64_t>(0, params.search_window_samples);

    int64_t start = 0;
    while (n - start > params.max_chunk_samples) {
        const int64_t boundary = start + params.max_chunk_samples;

        // Latest candidate not past the boundary.
        int64_t end = boundary;
        auto it = std::upper_bound(cuts.begin(), cuts.end(), boundary);
        if (it != cuts.begin()) {
            const int64_t c = *std::prev(it);
            if (c > start && c >= boundary - window) {
                end = c;
            }
        }

        emit(start, end);
        start = end;
    }
    emit(start, n);

    return true;
}
