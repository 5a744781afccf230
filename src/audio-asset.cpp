#include "audio-asset.h"
#include "ffmpeg-audio.h"

#define MINIAUDIO_IMPLEMENTATION
#define MA_NO_ENCODING
#define MA_NO_DEVICE_IO
#define MA_NO_RESOURCE_MANAGER
#define MA_NO_NODE_GRAPH
#define MA_NO_ENGINE
#define MA_NO_GENERATION
#define MA_API static
#include "miniaudio/miniaudio.h"

#include <cstdio>
#include <cstring>
#include <filesystem>

namespace {

constexpr ma_uint64 k_read_block_frames = 16384;

bool miniaudio_probe(const uint8_t * data, size_t size, int32_t & sample_rate, int32_t & channels, std::string & err) {
    ma_decoder_config cfg = ma_decoder_config_init(ma_format_f32, 0, 0);
    ma_decoder decoder;
    if (ma_decoder_init_memory(data, size, &cfg, &decoder) != MA_SUCCESS) {
        err = "failed to open audio stream";
        return false;
    }
    ma_format format = ma_format_unknown;
    ma_uint32 n_channels = 0;
    ma_uint32 rate = 0;
    const ma_result rc = ma_decoder_get_data_format(&decoder, &format, &n_channels, &rate, nullptr, 0);
    ma_decoder_uninit(&decoder);
    if (rc != MA_SUCCESS || n_channels == 0 || rate == 0) {
        err = "failed to read audio stream format";
        return false;
    }
    sample_rate = (int32_t) rate;
    channels = (int32_t) n_channels;
    return true;
}

// Decodes to mono f32 at target_sample_rate. miniaudio averages channels and
// runs its linear resampler when the native rate differs.
bool miniaudio_decode(const uint8_t * data, size_t size, int32_t target_sample_rate, std::vector<float> & out, std::string & err) {
    ma_decoder_config cfg = ma_decoder_config_init(ma_format_f32, 1, (ma_uint32) target_sample_rate);
    ma_decoder decoder;
    if (ma_decoder_init_memory(data, size, &cfg, &decoder) != MA_SUCCESS) {
        err = "failed to open audio stream";
        return false;
    }

    out.clear();
    ma_uint64 n_frames = 0;
    if (ma_decoder_get_length_in_pcm_frames(&decoder, &n_frames) == MA_SUCCESS && n_frames > 0) {
        out.reserve((size_t) n_frames);
    }

    std::vector<float> block((size_t) k_read_block_frames);
    ma_result rc = MA_SUCCESS;
    while (true) {
        ma_uint64 frames_read = 0;
        rc = ma_decoder_read_pcm_frames(&decoder, block.data(), k_read_block_frames, &frames_read);
        out.insert(out.end(), block.begin(), block.begin() + (size_t) frames_read);
        if (rc != MA_SUCCESS || frames_read == 0) {
            break;
        }
    }
    ma_decoder_uninit(&decoder);

    if (rc != MA_SUCCESS && rc != MA_AT_END) {
        err = "failed while decoding audio frames";
        return false;
    }
    return true;
}

seedvc_audio_container container_from_extension(const std::string & filename) {
    const std::string ext = seedvc_lower_copy(std::filesystem::path(filename).extension().string());
    if (ext == ".wav" || ext == ".wave") return SEEDVC_CONTAINER_WAV;
    if (ext == ".mp3") return SEEDVC_CONTAINER_MP3;
    if (ext == ".flac") return SEEDVC_CONTAINER_FLAC;
    if (ext == ".ogg" || ext == ".oga") return SEEDVC_CONTAINER_OGG;
    return SEEDVC_CONTAINER_UNKNOWN;
}

bool is_populated(const std::optional<std::string> & v) {
    return v.has_value() && !seedvc_trim_copy(*v).empty();
}

} // namespace

const char * seedvc_container_to_cstr(seedvc_audio_container c) {
    switch (c) {
        case SEEDVC_CONTAINER_WAV:  return "wav";
        case SEEDVC_CONTAINER_MP3:  return "mp3";
        case SEEDVC_CONTAINER_FLAC: return "flac";
        case SEEDVC_CONTAINER_OGG:  return "ogg";
        case SEEDVC_CONTAINER_UNKNOWN: break;
    }
    return "unknown";
}

const char * seedvc_provenance_to_cstr(seedvc_audio_provenance p) {
    switch (p) {
        case SEEDVC_PROVENANCE_PATH:   return "path";
        case SEEDVC_PROVENANCE_INLINE: return "inline";
        case SEEDVC_PROVENANCE_UPLOAD: return "upload";
    }
    return "unknown";
}

seedvc_audio_container seedvc_detect_container(const uint8_t * data, size_t size) {
    if (data == nullptr || size < 4) {
        return SEEDVC_CONTAINER_UNKNOWN;
    }
    if (size >= 12 &&
        (std::memcmp(data, "RIFF", 4) == 0 || std::memcmp(data, "RIFX", 4) == 0 || std::memcmp(data, "RF64", 4) == 0) &&
        std::memcmp(data + 8, "WAVE", 4) == 0) {
        return SEEDVC_CONTAINER_WAV;
    }
    if (std::memcmp(data, "fLaC", 4) == 0) {
        return SEEDVC_CONTAINER_FLAC;
    }
    if (std::memcmp(data, "OggS", 4) == 0) {
        return SEEDVC_CONTAINER_OGG;
    }
    if (std::memcmp(data, "ID3", 3) == 0) {
        // ID3v2 also prefixes FLAC files written by some taggers.
        if (size >= 10) {
            const size_t tag_size = ((size_t) (data[6] & 0x7F) << 21) |
                                    ((size_t) (data[7] & 0x7F) << 14) |
                                    ((size_t) (data[8] & 0x7F) << 7) |
                                    ((size_t) (data[9] & 0x7F));
            const size_t body = 10 + tag_size;
            if (body + 4 <= size && std::memcmp(data + body, "fLaC", 4) == 0) {
                return SEEDVC_CONTAINER_FLAC;
            }
        }
        return SEEDVC_CONTAINER_MP3;
    }
    // MPEG audio frame sync: 11 set bits, layer != reserved.
    if (data[0] == 0xFF && (data[1] & 0xE0) == 0xE0 && (data[1] & 0x06) != 0) {
        return SEEDVC_CONTAINER_MP3;
    }
    return SEEDVC_CONTAINER_UNKNOWN;
}

bool seedvc_select_audio_source(
        const audio_source_slot & slot,
        const char * slot_name,
        audio_source & out,
        seedvc_error & err) {
    const bool has_path = is_populated(slot.path);
    const bool has_base64 = is_populated(slot.base64);
    const bool has_upload = slot.upload.has_value() && !slot.upload->content.empty();

    const int n = (int) has_path + (int) has_base64 + (int) has_upload;
    if (n == 0) {
        err.set(SEEDVC_ERROR_INPUT, std::string(slot_name) +
                " audio is missing: provide one of path, base64 or uploaded file");
        return false;
    }
    if (n > 1) {
        err.set(SEEDVC_ERROR_INPUT, std::string(slot_name) +
                " audio is ambiguous: provide only one of path, base64 or uploaded file");
        return false;
    }

    if (has_path) {
        out = audio_source_path{seedvc_trim_copy(*slot.path)};
    } else if (has_base64) {
        out = audio_source_inline{*slot.base64};
    } else {
        out = *slot.upload;
    }
    return true;
}

bool seedvc_decode_audio_bytes(
        const uint8_t * data,
        size_t size,
        int32_t canonical_sample_rate,
        audio_asset & out,
        seedvc_error & err) {
    if (canonical_sample_rate <= 0) {
        err.set(SEEDVC_ERROR_PROCESSING, "invalid canonical sample rate: " + std::to_string(canonical_sample_rate));
        return false;
    }
    if (data == nullptr || size == 0) {
        err.set(SEEDVC_ERROR_INPUT, "audio payload is empty");
        return false;
    }

    const seedvc_audio_container container = seedvc_detect_container(data, size);
    if (container == SEEDVC_CONTAINER_UNKNOWN) {
        err.set(SEEDVC_ERROR_INPUT, "unsupported audio format: expected wav, mp3, flac or ogg");
        return false;
    }

    std::string decode_err;
    int32_t native_rate = 0;
    int32_t native_channels = 0;
    std::vector<float> samples;
    if (container == SEEDVC_CONTAINER_OGG) {
        if (!seedvc_ffmpeg_decode(data, size, canonical_sample_rate, samples, native_rate, native_channels, decode_err)) {
            err.set(SEEDVC_ERROR_INPUT, "failed to decode ogg audio: " + decode_err);
            return false;
        }
    } else {
        if (!miniaudio_probe(data, size, native_rate, native_channels, decode_err) ||
            !miniaudio_decode(data, size, canonical_sample_rate, samples, decode_err)) {
            err.set(SEEDVC_ERROR_INPUT, std::string("failed to decode ") + seedvc_container_to_cstr(container) +
                    " audio: " + decode_err);
            return false;
        }
    }

    if (samples.empty()) {
        err.set(SEEDVC_ERROR_INPUT, "audio contains no samples");
        return false;
    }

    out.samples = std::move(samples);
    out.sample_rate = canonical_sample_rate;
    out.container = container;
    out.native_sample_rate = native_rate;
    out.native_channels = native_channels;
    out.byte_size = (uint64_t) size;
    return true;
}

bool seedvc_resolve_audio_asset(
        const audio_source & src,
        int32_t canonical_sample_rate,
        audio_asset & out,
        seedvc_error & err) {
    out = audio_asset();

    if (const auto * p = std::get_if<audio_source_path>(&src)) {
        std::error_code ec;
        if (p->path.empty() || !std::filesystem::is_regular_file(p->path, ec)) {
            err.set(SEEDVC_ERROR_INPUT, "audio file not found: " + p->path);
            return false;
        }
        std::vector<uint8_t> bytes;
        std::string io_err;
        if (!seedvc_load_binary_file(p->path, bytes, io_err)) {
            err.set(SEEDVC_ERROR_INPUT, io_err);
            return false;
        }
        if (!seedvc_decode_audio_bytes(bytes.data(), bytes.size(), canonical_sample_rate, out, err)) {
            err.message += " (" + p->path + ")";
            return false;
        }
        out.provenance = SEEDVC_PROVENANCE_PATH;
        out.path = p->path;
        return true;
    }

    if (const auto * b = std::get_if<audio_source_inline>(&src)) {
        std::vector<uint8_t> bytes;
        std::string b64_err;
        if (!seedvc_base64_decode(b->base64, bytes, b64_err)) {
            err.set(SEEDVC_ERROR_INPUT, "invalid base64 audio: " + b64_err);
            return false;
        }
        if (!seedvc_decode_audio_bytes(bytes.data(), bytes.size(), canonical_sample_rate, out, err)) {
            return false;
        }
        out.provenance = SEEDVC_PROVENANCE_INLINE;
        return true;
    }

    const auto & u = std::get<audio_source_upload>(src);
    const auto * data = reinterpret_cast<const uint8_t *>(u.content.data());
    if (!seedvc_decode_audio_bytes(data, u.content.size(), canonical_sample_rate, out, err)) {
        if (!u.filename.empty()) {
            err.message += " (" + u.filename + ")";
        }
        return false;
    }
    const seedvc_audio_container hinted = container_from_extension(u.filename);
    if (hinted != SEEDVC_CONTAINER_UNKNOWN && hinted != out.container) {
        std::fprintf(stderr, "warning: upload '%s' has extension of %s but contains %s\n",
                u.filename.c_str(), seedvc_container_to_cstr(hinted), seedvc_container_to_cstr(out.container));
    }
    out.provenance = SEEDVC_PROVENANCE_UPLOAD;
    out.path = u.filename;
    return true;
}
