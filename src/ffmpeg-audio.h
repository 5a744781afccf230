#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

enum seedvc_lossy_codec {
    SEEDVC_LOSSY_MP3 = 0,    // libmp3lame in an MP3 container
    SEEDVC_LOSSY_VORBIS = 1, // Vorbis in an Ogg container
};

// Encodes mono float samples entirely in memory.
bool seedvc_ffmpeg_encode(
        const std::vector<float> & samples,
        int32_t sample_rate,
        seedvc_lossy_codec codec,
        std::vector<uint8_t> & out,
        std::string & err);

// Decodes any FFmpeg-readable container from memory to mono float at
// target_sample_rate. native_* receive the first audio stream's parameters.
bool seedvc_ffmpeg_decode(
        const uint8_t * data,
        size_t size,
        int32_t target_sample_rate,
        std::vector<float> & out,
        int32_t & native_sample_rate,
        int32_t & native_channels,
        std::string & err);
