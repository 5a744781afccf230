#include "format-encoder.h"
#include "ffmpeg-audio.h"

#include <algorithm>
#include <cmath>
#include <cstring>

namespace {

struct wav_header {
    char riff[4] = {'R', 'I', 'F', 'F'};
    uint32_t chunk_size = 0;
    char wave[4] = {'W', 'A', 'V', 'E'};
    char fmt[4] = {'f', 'm', 't', ' '};
    uint32_t fmt_chunk_size = 16;
    uint16_t audio_format = 1; // 1 = PCM, 3 = IEEE float
    uint16_t num_channels = 1;
    uint32_t sample_rate = 0;
    uint32_t byte_rate = 0;
    uint16_t block_align = 0;
    uint16_t bits_per_sample = 16;
    char data[4] = {'d', 'a', 't', 'a'};
    uint32_t data_size = 0;
};

static_assert(sizeof(wav_header) == 44, "wav_header must be packed to 44 bytes");

bool write_wav(
        const std::vector<float> & samples,
        int32_t sample_rate,
        bool ieee_float,
        std::vector<uint8_t> & out,
        std::string & err) {
    if (sample_rate <= 0) {
        err = "invalid sample rate: " + std::to_string(sample_rate);
        return false;
    }

    const uint16_t bytes_per_sample = ieee_float ? 4 : 2;
    const uint64_t data_size = (uint64_t) samples.size() * bytes_per_sample;
    if (data_size > 0xFFFFFFFFull - 36) {
        err = "waveform too long for a RIFF container";
        return false;
    }

    wav_header header;
    header.audio_format = ieee_float ? 3 : 1;
    header.bits_per_sample = (uint16_t) (bytes_per_sample * 8);
    header.sample_rate = (uint32_t) sample_rate;
    header.byte_rate = header.sample_rate * header.num_channels * bytes_per_sample;
    header.block_align = (uint16_t) (header.num_channels * bytes_per_sample);
    header.data_size = (uint32_t) data_size;
    header.chunk_size = 36 + header.data_size;

    out.resize(sizeof(header) + (size_t) data_size);
    std::memcpy(out.data(), &header, sizeof(header));

    uint8_t * p = out.data() + sizeof(header);
    if (ieee_float) {
        std::memcpy(p, samples.data(), (size_t) data_size);
    } else {
        for (size_t i = 0; i < samples.size(); ++i) {
            const float x = std::clamp(samples[i], -1.0f, 1.0f);
            const int16_t pcm = (int16_t) std::lrintf(x * 32767.0f);
            std::memcpy(p + i * 2, &pcm, 2);
        }
    }
    return true;
}

} // namespace

bool seedvc_parse_output_format(const std::string & tag, seedvc_output_format & out, seedvc_error & err) {
    const std::string v = seedvc_lower_copy(seedvc_trim_copy(tag));
    if (v == "wav") {
        out = SEEDVC_OUTPUT_WAV;
        return true;
    }
    if (v == "mp3") {
        out = SEEDVC_OUTPUT_MP3;
        return true;
    }
    if (v == "ogg") {
        out = SEEDVC_OUTPUT_OGG;
        return true;
    }
    err.set(SEEDVC_ERROR_VALIDATION, "invalid output format: '" + tag + "'. Must be one of: wav, mp3, ogg");
    return false;
}

const char * seedvc_output_format_to_cstr(seedvc_output_format format) {
    switch (format) {
        case SEEDVC_OUTPUT_WAV: return "wav";
        case SEEDVC_OUTPUT_MP3: return "mp3";
        case SEEDVC_OUTPUT_OGG: return "ogg";
    }
    return "wav";
}

const char * seedvc_output_format_mime(seedvc_output_format format) {
    switch (format) {
        case SEEDVC_OUTPUT_WAV: return "audio/wav";
        case SEEDVC_OUTPUT_MP3: return "audio/mpeg";
        case SEEDVC_OUTPUT_OGG: return "audio/ogg";
    }
    return "application/octet-stream";
}

bool seedvc_output_format_is_lossless(seedvc_output_format format) {
    return format == SEEDVC_OUTPUT_WAV;
}

bool seedvc_encode_wav_f32(
        const std::vector<float> & samples,
        int32_t sample_rate,
        std::vector<uint8_t> & out,
        std::string & err) {
    return write_wav(samples, sample_rate, true, out, err);
}

bool seedvc_encode_wav_pcm16(
        const std::vector<float> & samples,
        int32_t sample_rate,
        std::vector<uint8_t> & out,
        std::string & err) {
    return write_wav(samples, sample_rate, false, out, err);
}

bool seedvc_encode_waveform(
        const std::vector<float> & samples,
        int32_t sample_rate,
        seedvc_output_format format,
        std::vector<uint8_t> & out,
        seedvc_error & err) {
    std::string enc_err;
    bool ok = false;
    switch (format) {
        case SEEDVC_OUTPUT_WAV:
            ok = seedvc_encode_wav_f32(samples, sample_rate, out, enc_err);
            break;
        case SEEDVC_OUTPUT_MP3:
            ok = seedvc_ffmpeg_encode(samples, sample_rate, SEEDVC_LOSSY_MP3, out, enc_err);
            break;
        case SEEDVC_OUTPUT_OGG:
            ok = seedvc_ffmpeg_encode(samples, sample_rate, SEEDVC_LOSSY_VORBIS, out, enc_err);
            break;
        default:
            err.set(SEEDVC_ERROR_VALIDATION, "invalid output format tag: " + std::to_string((int) format));
            return false;
    }
    if (!ok) {
        err.set(SEEDVC_ERROR_PROCESSING, std::string("failed to encode ") +
                seedvc_output_format_to_cstr(format) + ": " + enc_err);
        return false;
    }
    return true;
}
