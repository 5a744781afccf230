#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

enum seedvc_error_kind {
    SEEDVC_ERROR_NONE = 0,
    SEEDVC_ERROR_VALIDATION,        // out-of-range, missing or conflicting parameters
    SEEDVC_ERROR_INPUT,             // unreadable, missing or unsupported audio
    SEEDVC_ERROR_MODEL_UNAVAILABLE, // engine not loaded
    SEEDVC_ERROR_PROCESSING,        // engine failure mid-job
    SEEDVC_ERROR_IO,                // artifact read/write failure
};

struct seedvc_error {
    seedvc_error_kind kind = SEEDVC_ERROR_NONE;
    std::string message;

    bool ok() const { return kind == SEEDVC_ERROR_NONE; }

    void set(seedvc_error_kind k, const std::string & msg) {
        kind = k;
        message = msg;
    }

    void clear() {
        kind = SEEDVC_ERROR_NONE;
        message.clear();
    }
};

// Stable machine-readable name, e.g. "validation_error".
const char * seedvc_error_kind_to_cstr(seedvc_error_kind kind);
int seedvc_error_kind_http_status(seedvc_error_kind kind);

std::string seedvc_base64_encode(const uint8_t * data, size_t len);
std::string seedvc_base64_encode(const std::vector<uint8_t> & data);

// Accepts an optional "data:<mime>;base64," prefix and ignores whitespace.
bool seedvc_base64_decode(const std::string & in, std::vector<uint8_t> & out, std::string & err);

bool seedvc_save_binary_file(const std::string & path, const std::vector<uint8_t> & data, std::string & err);
bool seedvc_load_binary_file(const std::string & path, std::vector<uint8_t> & out, std::string & err);

int64_t seedvc_now_ms();

double seedvc_ms_since(
        const std::chrono::steady_clock::time_point & t0,
        const std::chrono::steady_clock::time_point & t1);

int seedvc_resolve_threads(int n_threads);

// Base-10 integer with no trailing characters; values outside int32_t are rejected.
bool seedvc_parse_i32(const std::string & in, int32_t & out);

std::string seedvc_trim_copy(const std::string & in);
std::string seedvc_lower_copy(const std::string & in);
