#pragma once

#include "format-encoder.h"
#include "seedvc-common.h"

#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <string>
#include <vector>

// Helper: sine wave
inline std::vector<float> make_sine(float freq, int32_t sample_rate, size_t n, float amp = 0.5f) {
    std::vector<float> out(n);
    const double two_pi = 6.283185307179586;
    for (size_t i = 0; i < n; ++i) {
        out[i] = (float) (amp * std::sin(two_pi * freq * ((double) i / sample_rate)));
    }
    return out;
}

// Tone bursts of `voiced_sec` separated by `gap_sec` of digital silence.
inline std::vector<float> make_bursts(int32_t sample_rate, double total_sec, double voiced_sec, double gap_sec) {
    const size_t n = (size_t) (total_sec * sample_rate);
    const size_t voiced = (size_t) (voiced_sec * sample_rate);
    const size_t period = voiced + (size_t) (gap_sec * sample_rate);
    std::vector<float> out = make_sine(220.0f, sample_rate, n, 0.3f);
    for (size_t i = 0; i < n; ++i) {
        if (i % period >= voiced) {
            out[i] = 0.0f;
        }
    }
    return out;
}

inline double rms(const std::vector<float> & x) {
    if (x.empty()) {
        return 0.0;
    }
    double acc = 0.0;
    for (float v : x) {
        acc += (double) v * v;
    }
    return std::sqrt(acc / (double) x.size());
}

// Best normalized cross-correlation of a window of `a` against `b` over lags
// in [-max_lag, max_lag].
inline double best_normalized_xcorr(
        const std::vector<float> & a,
        const std::vector<float> & b,
        size_t offset,
        size_t window,
        int32_t max_lag) {
    double best = -1.0;
    for (int32_t lag = -max_lag; lag <= max_lag; ++lag) {
        const int64_t b0 = (int64_t) offset + lag;
        if (b0 < 0 || (size_t) b0 + window > b.size() || offset + window > a.size()) {
            continue;
        }
        double ab = 0.0, aa = 0.0, bb = 0.0;
        for (size_t i = 0; i < window; ++i) {
            const double x = a[offset + i];
            const double y = b[(size_t) b0 + i];
            ab += x * y;
            aa += x * x;
            bb += y * y;
        }
        if (aa > 0.0 && bb > 0.0) {
            best = std::max(best, ab / std::sqrt(aa * bb));
        }
    }
    return best;
}

// Scratch directory removed with everything in it.
class temp_dir {
public:
    explicit temp_dir(const std::string & tag) {
        static std::atomic<int> counter{0};
        path_ = std::filesystem::temp_directory_path() /
                ("seedvc-test-" + tag + "-" + std::to_string((long long) getpid()) + "-" +
                 std::to_string(seedvc_now_ms()) + "-" + std::to_string(counter.fetch_add(1)));
        std::filesystem::create_directories(path_);
    }

    ~temp_dir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    temp_dir(const temp_dir &) = delete;
    temp_dir & operator=(const temp_dir &) = delete;

    std::string path() const { return path_.string(); }
    std::string file(const std::string & name) const { return (path_ / name).string(); }

    size_t count_files() const {
        size_t n = 0;
        for (const auto & e : std::filesystem::directory_iterator(path_)) {
            if (e.is_regular_file()) {
                ++n;
            }
        }
        return n;
    }

private:
    std::filesystem::path path_;
};

inline std::string write_wav_f32(const std::string & path, const std::vector<float> & samples, int32_t sample_rate) {
    std::vector<uint8_t> bytes;
    std::string err;
    if (!seedvc_encode_wav_f32(samples, sample_rate, bytes, err) || !seedvc_save_binary_file(path, bytes, err)) {
        return std::string();
    }
    return path;
}

// Interleaved 16-bit stereo WAV.
inline std::vector<uint8_t> make_stereo_wav_pcm16(
        const std::vector<float> & left,
        const std::vector<float> & right,
        int32_t sample_rate) {
    const size_t n = std::min(left.size(), right.size());
    const uint32_t data_size = (uint32_t) (n * 4);
    std::vector<uint8_t> out(44 + data_size);
    uint8_t * p = out.data();

    auto put_u32 = [&](uint32_t v) { std::memcpy(p, &v, 4); p += 4; };
    auto put_u16 = [&](uint16_t v) { std::memcpy(p, &v, 2); p += 2; };

    std::memcpy(p, "RIFF", 4); p += 4;
    put_u32(36 + data_size);
    std::memcpy(p, "WAVE", 4); p += 4;
    std::memcpy(p, "fmt ", 4); p += 4;
    put_u32(16);
    put_u16(1);
    put_u16(2);
    put_u32((uint32_t) sample_rate);
    put_u32((uint32_t) sample_rate * 4);
    put_u16(4);
    put_u16(16);
    std::memcpy(p, "data", 4); p += 4;
    put_u32(data_size);

    for (size_t i = 0; i < n; ++i) {
        put_u16((uint16_t) (int16_t) std::lrintf(std::clamp(left[i], -1.0f, 1.0f) * 32767.0f));
        put_u16((uint16_t) (int16_t) std::lrintf(std::clamp(right[i], -1.0f, 1.0f) * 32767.0f));
    }
    return out;
}
