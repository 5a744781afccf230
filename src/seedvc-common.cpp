#include "seedvc-common.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <limits>
#include <thread>

const char * seedvc_error_kind_to_cstr(seedvc_error_kind kind) {
    switch (kind) {
        case SEEDVC_ERROR_NONE:              return "none";
        case SEEDVC_ERROR_VALIDATION:        return "validation_error";
        case SEEDVC_ERROR_INPUT:             return "input_error";
        case SEEDVC_ERROR_MODEL_UNAVAILABLE: return "model_unavailable";
        case SEEDVC_ERROR_PROCESSING:        return "processing_error";
        case SEEDVC_ERROR_IO:                return "io_error";
    }
    return "unknown";
}

int seedvc_error_kind_http_status(seedvc_error_kind kind) {
    switch (kind) {
        case SEEDVC_ERROR_NONE:              return 200;
        case SEEDVC_ERROR_VALIDATION:        return 400;
        case SEEDVC_ERROR_INPUT:             return 400;
        case SEEDVC_ERROR_MODEL_UNAVAILABLE: return 503;
        case SEEDVC_ERROR_PROCESSING:        return 500;
        case SEEDVC_ERROR_IO:                return 500;
    }
    return 500;
}

std::string seedvc_base64_encode(const uint8_t * data, size_t len) {
    static const char table[] =
            "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    std::string result;
    result.reserve(((len + 2) / 3) * 4);
    for (size_t i = 0; i < len; i += 3) {
        const uint32_t a = data[i];
        const uint32_t b = (i + 1 < len) ? data[i + 1] : 0;
        const uint32_t c = (i + 2 < len) ? data[i + 2] : 0;
        const uint32_t triple = (a << 16) | (b << 8) | c;
        result += table[(triple >> 18) & 0x3F];
        result += table[(triple >> 12) & 0x3F];
        result += (i + 1 < len) ? table[(triple >> 6) & 0x3F] : '=';
        result += (i + 2 < len) ? table[triple & 0x3F] : '=';
    }
    return result;
}

std::string seedvc_base64_encode(const std::vector<uint8_t> & data) {
    return seedvc_base64_encode(data.data(), data.size());
}

static int base64_value(unsigned char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+' || c == '-') return 62;
    if (c == '/' || c == '_') return 63;
    return -1;
}

bool seedvc_base64_decode(const std::string & in, std::vector<uint8_t> & out, std::string & err) {
    out.clear();

    size_t begin = 0;
    if (in.compare(0, 5, "data:") == 0) {
        const size_t comma = in.find(',');
        if (comma == std::string::npos) {
            err = "malformed data URI: missing ','";
            return false;
        }
        begin = comma + 1;
    }

    out.reserve((in.size() - begin) / 4 * 3 + 3);

    uint32_t acc = 0;
    int n_bits = 0;
    size_t n_pad = 0;
    size_t n_symbols = 0;
    for (size_t i = begin; i < in.size(); ++i) {
        const unsigned char c = (unsigned char) in[i];
        if (std::isspace(c)) {
            continue;
        }
        if (c == '=') {
            ++n_pad;
            continue;
        }
        if (n_pad > 0) {
            err = "malformed base64: data after padding at offset " + std::to_string(i);
            return false;
        }
        const int v = base64_value(c);
        if (v < 0) {
            err = "malformed base64: invalid character at offset " + std::to_string(i);
            return false;
        }
        ++n_symbols;
        acc = (acc << 6) | (uint32_t) v;
        n_bits += 6;
        if (n_bits >= 8) {
            n_bits -= 8;
            out.push_back((uint8_t) ((acc >> n_bits) & 0xFF));
        }
    }

    if (n_pad > 2 || n_symbols % 4 == 1) {
        err = "malformed base64: truncated input";
        return false;
    }
    if (out.empty()) {
        err = "base64 payload is empty";
        return false;
    }
    return true;
}

bool seedvc_save_binary_file(const std::string & path, const std::vector<uint8_t> & data, std::string & err) {
    std::filesystem::path p(path);
    if (p.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(p.parent_path(), ec);
    }

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        err = "failed to open file for write: " + path;
        return false;
    }
    file.write(reinterpret_cast<const char *>(data.data()), (std::streamsize) data.size());
    if (!file.good()) {
        err = "failed to write file: " + path;
        return false;
    }
    return true;
}

bool seedvc_load_binary_file(const std::string & path, std::vector<uint8_t> & out, std::string & err) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        err = "failed to open file for read: " + path;
        return false;
    }
    file.seekg(0, std::ios::end);
    const auto end_pos = file.tellg();
    if (end_pos < 0) {
        err = "failed to seek file: " + path;
        return false;
    }
    out.resize((size_t) end_pos);
    file.seekg(0, std::ios::beg);
    if (!out.empty()) {
        file.read(reinterpret_cast<char *>(out.data()), (std::streamsize) out.size());
        if (!file.good()) {
            err = "failed to read file: " + path;
            return false;
        }
    }
    return true;
}

int64_t seedvc_now_ms() {
    const auto now = std::chrono::system_clock::now();
    return std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
}

double seedvc_ms_since(
        const std::chrono::steady_clock::time_point & t0,
        const std::chrono::steady_clock::time_point & t1) {
    return std::chrono::duration_cast<std::chrono::duration<double, std::milli>>(t1 - t0).count();
}

int seedvc_resolve_threads(int n_threads) {
    if (n_threads > 0) {
        return n_threads;
    }
    const unsigned hc = std::thread::hardware_concurrency();
    return (int) (hc > 0 ? hc : 1);
}

bool seedvc_parse_i32(const std::string & in, int32_t & out) {
    if (in.empty()) {
        return false;
    }
    char * end = nullptr;
    errno = 0;
    const long long v = std::strtoll(in.c_str(), &end, 10);
    if (end == in.c_str() || *end != '\0' || errno == ERANGE) {
        return false;
    }
    if (v < std::numeric_limits<int32_t>::min() || v > std::numeric_limits<int32_t>::max()) {
        return false;
    }
    out = (int32_t) v;
    return true;
}

std::string seedvc_trim_copy(const std::string & in) {
    size_t b = 0;
    while (b < in.size() && std::isspace((unsigned char) in[b])) {
        ++b;
    }
    size_t e = in.size();
    while (e > b && std::isspace((unsigned char) in[e - 1])) {
        --e;
    }
    return in.substr(b, e - b);
}

std::string seedvc_lower_copy(const std::string & in) {
    std::string v(in);
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) {
        return (char) std::tolower(c);
    });
    return v;
}
