#pragma once

#include "seedvc-common.h"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

enum seedvc_audio_container {
    SEEDVC_CONTAINER_UNKNOWN = 0,
    SEEDVC_CONTAINER_WAV,
    SEEDVC_CONTAINER_MP3,
    SEEDVC_CONTAINER_FLAC,
    SEEDVC_CONTAINER_OGG,
};

enum seedvc_audio_provenance {
    SEEDVC_PROVENANCE_PATH = 0,
    SEEDVC_PROVENANCE_INLINE,
    SEEDVC_PROVENANCE_UPLOAD,
};

const char * seedvc_container_to_cstr(seedvc_audio_container c);
const char * seedvc_provenance_to_cstr(seedvc_audio_provenance p);

// Sniffs the container from its leading bytes.
seedvc_audio_container seedvc_detect_container(const uint8_t * data, size_t size);

struct audio_source_path {
    std::string path;
};

struct audio_source_inline {
    std::string base64;
};

struct audio_source_upload {
    std::string filename;
    std::string content;
};

using audio_source = std::variant<audio_source_path, audio_source_inline, audio_source_upload>;

// One request slot (source or reference). At most one form may be populated;
// empty strings count as absent.
struct audio_source_slot {
    std::optional<std::string> path;
    std::optional<std::string> base64;
    std::optional<audio_source_upload> upload;
};

struct audio_asset {
    std::vector<float> samples; // mono, at sample_rate
    int32_t sample_rate = 0;

    seedvc_audio_provenance provenance = SEEDVC_PROVENANCE_PATH;
    seedvc_audio_container container = SEEDVC_CONTAINER_UNKNOWN;
    std::string path;

    int32_t native_sample_rate = 0;
    int32_t native_channels = 0;
    uint64_t byte_size = 0;

    double duration_sec() const {
        return sample_rate > 0 ? (double) samples.size() / (double) sample_rate : 0.0;
    }
};

bool seedvc_select_audio_source(
        const audio_source_slot & slot,
        const char * slot_name,
        audio_source & out,
        seedvc_error & err);

bool seedvc_decode_audio_bytes(
        const uint8_t * data,
        size_t size,
        int32_t canonical_sample_rate,
        audio_asset & out,
        seedvc_error & err);

// Reads, decodes, resamples and down-mixes. Never writes to disk.
bool seedvc_resolve_audio_asset(
        const audio_source & src,
        int32_t canonical_sample_rate,
        audio_asset & out,
        seedvc_error & err);
