#pragma once

#include "seedvc-common.h"

#include <cstdint>
#include <string>
#include <vector>

enum seedvc_output_format {
    SEEDVC_OUTPUT_WAV = 0, // lossless, 32-bit float PCM
    SEEDVC_OUTPUT_MP3 = 1,
    SEEDVC_OUTPUT_OGG = 2, // Vorbis
};

// Accepts "wav", "mp3" or "ogg" (case-insensitive). Anything else is a
// validation error.
bool seedvc_parse_output_format(const std::string & tag, seedvc_output_format & out, seedvc_error & err);

const char * seedvc_output_format_to_cstr(seedvc_output_format format);
const char * seedvc_output_format_mime(seedvc_output_format format);
bool seedvc_output_format_is_lossless(seedvc_output_format format);

bool seedvc_encode_wav_f32(
        const std::vector<float> & samples,
        int32_t sample_rate,
        std::vector<uint8_t> & out,
        std::string & err);

// PCM16 WAV, used for previews and the CLI's --pcm16 option.
bool seedvc_encode_wav_pcm16(
        const std::vector<float> & samples,
        int32_t sample_rate,
        std::vector<uint8_t> & out,
        std::string & err);

bool seedvc_encode_waveform(
        const std::vector<float> & samples,
        int32_t sample_rate,
        seedvc_output_format format,
        std::vector<uint8_t> & out,
        seedvc_error & err);
