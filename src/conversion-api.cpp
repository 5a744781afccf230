#include "conversion-api.h"

#include <cstdlib>
#include <filesystem>
#include <limits>
#include <optional>
#include <stdexcept>
#include <utility>

namespace {

bool get_json_string(const json & j, const char * key, std::string & out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return false;
    }
    if (!it->is_string()) {
        throw std::runtime_error(std::string("field '") + key + "' must be string");
    }
    out = it->get<std::string>();
    return true;
}

template<typename T>
bool get_json_number(const json & j, const char * key, T & out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return false;
    }
    if (!it->is_number()) {
        throw std::runtime_error(std::string("field '") + key + "' must be number");
    }
    out = it->get<T>();
    return true;
}

bool get_json_i32(const json & j, const char * key, int32_t & out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return false;
    }
    if (!it->is_number_integer()) {
        throw std::runtime_error(std::string("field '") + key + "' must be integer");
    }
    const bool in_range = it->is_number_unsigned()
        ? it->get<uint64_t>() <= (uint64_t) std::numeric_limits<int32_t>::max()
        : it->get<int64_t>() >= std::numeric_limits<int32_t>::min() &&
          it->get<int64_t>() <= std::numeric_limits<int32_t>::max();
    if (!in_range) {
        throw std::runtime_error(std::string("field '") + key + "' is out of range");
    }
    out = (int32_t) it->get<int64_t>();
    return true;
}

bool get_json_bool(const json & j, const char * key, bool & out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return false;
    }
    if (!it->is_boolean()) {
        throw std::runtime_error(std::string("field '") + key + "' must be bool");
    }
    out = it->get<bool>();
    return true;
}

void set_if_present(std::optional<std::string> & dst, const std::string & value) {
    if (!value.empty()) {
        dst = value;
    }
}

bool parse_form_i32(const std::string & s, int32_t & out) {
    return seedvc_parse_i32(seedvc_trim_copy(s), out);
}

bool parse_form_f32(const std::string & s, float & out) {
    const std::string v = seedvc_trim_copy(s);
    if (v.empty()) {
        return false;
    }
    char * end = nullptr;
    const float x = std::strtof(v.c_str(), &end);
    if (end == nullptr || *end != '\0') {
        return false;
    }
    out = x;
    return true;
}

bool parse_form_bool(const std::string & s, bool & out) {
    const std::string v = seedvc_lower_copy(seedvc_trim_copy(s));
    if (v == "true" || v == "1" || v == "on" || v == "yes") {
        out = true;
        return true;
    }
    if (v == "false" || v == "0" || v == "off" || v == "no") {
        out = false;
        return true;
    }
    return false;
}

json input_info_json(const audio_input_info & info) {
    return json {
        {"duration", info.duration_sec},
        {"sample_rate", info.sample_rate},
        {"channels", info.channels},
        {"file_size", info.file_size},
        {"file_format", info.file_format},
    };
}

json nullable_string(const std::string & s) {
    return s.empty() ? json(nullptr) : json(s);
}

} // namespace

const std::vector<std::string> & seedvc_conversion_param_names() {
    static const std::vector<std::string> names = {
        "diffusion_steps",
        "length_adjust",
        "intelligibility_cfg_rate",
        "similarity_cfg_rate",
        "top_p",
        "temperature",
        "repetition_penalty",
        "convert_style",
        "anonymization_only",
        "output_format",
        "return_base64",
        "cleanup_temp_files",
    };
    return names;
}

bool seedvc_parse_conversion_json(const json & body, conversion_inputs & out, seedvc_error & err) {
    if (!body.is_object()) {
        err.set(SEEDVC_ERROR_VALIDATION, "request body must be a JSON object");
        return false;
    }

    conversion_inputs in;
    std::string output_format;
    try {
        std::string v;
        if (get_json_string(body, "source_audio_path", v)) {
            set_if_present(in.source.path, v);
        }
        v.clear();
        if (get_json_string(body, "source_audio_base64", v)) {
            set_if_present(in.source.base64, v);
        }

        v.clear();
        if (!get_json_string(body, "target_audio_path", v) || v.empty()) {
            get_json_string(body, "reference_audio_path", v);
        }
        set_if_present(in.reference.path, v);
        v.clear();
        if (!get_json_string(body, "target_audio_base64", v) || v.empty()) {
            get_json_string(body, "reference_audio_base64", v);
        }
        set_if_present(in.reference.base64, v);

        conversion_params & p = in.params;
        get_json_i32(body, "diffusion_steps", p.diffusion_steps);
        get_json_number(body, "length_adjust", p.length_adjust);
        get_json_number(body, "intelligibility_cfg_rate", p.intelligibility_cfg_rate);
        get_json_number(body, "similarity_cfg_rate", p.similarity_cfg_rate);
        get_json_number(body, "top_p", p.top_p);
        get_json_number(body, "temperature", p.temperature);
        get_json_number(body, "repetition_penalty", p.repetition_penalty);
        get_json_bool(body, "convert_style", p.convert_style);
        get_json_bool(body, "anonymization_only", p.anonymization_only);
        get_json_bool(body, "return_base64", p.return_base64);
        get_json_bool(body, "cleanup_temp_files", p.cleanup_temp_files);
        get_json_string(body, "output_format", output_format);
    } catch (const std::exception & e) {
        err.set(SEEDVC_ERROR_VALIDATION, e.what());
        return false;
    }

    if (!output_format.empty() &&
        !seedvc_parse_output_format(output_format, in.params.output_format, err)) {
        return false;
    }

    out = std::move(in);
    return true;
}

bool seedvc_parse_conversion_form(
        const std::map<std::string, std::string> & fields,
        conversion_params & out,
        seedvc_error & err) {
    conversion_params p = out;

    auto bad = [&](const std::string & key, const char * type) {
        err.set(SEEDVC_ERROR_VALIDATION, "field '" + key + "' must be " + type);
        return false;
    };

    for (const auto & kv : fields) {
        const std::string & key = kv.first;
        const std::string & value = kv.second;
        if (key == "diffusion_steps") {
            if (!parse_form_i32(value, p.diffusion_steps)) return bad(key, "integer");
        } else if (key == "length_adjust") {
            if (!parse_form_f32(value, p.length_adjust)) return bad(key, "number");
        } else if (key == "intelligibility_cfg_rate") {
            if (!parse_form_f32(value, p.intelligibility_cfg_rate)) return bad(key, "number");
        } else if (key == "similarity_cfg_rate") {
            if (!parse_form_f32(value, p.similarity_cfg_rate)) return bad(key, "number");
        } else if (key == "top_p") {
            if (!parse_form_f32(value, p.top_p)) return bad(key, "number");
        } else if (key == "temperature") {
            if (!parse_form_f32(value, p.temperature)) return bad(key, "number");
        } else if (key == "repetition_penalty") {
            if (!parse_form_f32(value, p.repetition_penalty)) return bad(key, "number");
        } else if (key == "convert_style") {
            if (!parse_form_bool(value, p.convert_style)) return bad(key, "bool");
        } else if (key == "anonymization_only") {
            if (!parse_form_bool(value, p.anonymization_only)) return bad(key, "bool");
        } else if (key == "return_base64") {
            if (!parse_form_bool(value, p.return_base64)) return bad(key, "bool");
        } else if (key == "cleanup_temp_files") {
            if (!parse_form_bool(value, p.cleanup_temp_files)) return bad(key, "bool");
        } else if (key == "output_format") {
            if (!seedvc_parse_output_format(seedvc_trim_copy(value), p.output_format, err)) {
                return false;
            }
        }
    }

    out = p;
    return true;
}

json seedvc_conversion_response_json(const conversion_response & rsp) {
    json j = {
        {"success", rsp.success},
        {"message", rsp.message},
        {"job_id", rsp.job_id},
        {"streaming_output_path", nullable_string(rsp.streaming_output_path)},
        {"full_output_path", nullable_string(rsp.full_output_path)},
        {"streaming_output_base64", nullable_string(rsp.streaming_output_base64)},
        {"full_output_base64", nullable_string(rsp.full_output_base64)},
        {"processing_time", rsp.processing_time_sec},
        {"output_format", rsp.output_format},
        {"streaming_format", rsp.streaming_format},
        {"n_chunks", rsp.n_chunks},
        {"sample_rate", rsp.sample_rate},
        {"output_duration", rsp.output_duration_sec},
    };

    if (rsp.has_input_info) {
        j["input_info"] = {
            {"source", input_info_json(rsp.source_info)},
            {"target", input_info_json(rsp.reference_info)},
        };
    } else {
        j["input_info"] = nullptr;
    }

    if (!rsp.success) {
        j["error"] = seedvc_make_error_json(rsp.error)["error"];
    }
    return j;
}

json seedvc_make_error_json(const seedvc_error & err) {
    return json {
        {"success", false},
        {"message", err.message},
        {"error", {
            {"kind", seedvc_error_kind_to_cstr(err.kind)},
            {"message", err.message},
            {"code", seedvc_error_kind_http_status(err.kind)},
        }},
    };
}

int seedvc_conversion_response_status(const conversion_response & rsp) {
    if (rsp.success) {
        return 200;
    }
    return seedvc_error_kind_http_status(rsp.error.kind);
}

bool seedvc_resolve_output_path(
        const std::string & output_dir,
        const std::string & requested,
        std::string & resolved,
        seedvc_error & err) {
    namespace fs = std::filesystem;

    if (requested.empty()) {
        err.set(SEEDVC_ERROR_VALIDATION, "file path is empty");
        return false;
    }

    std::error_code ec;
    const fs::path root = fs::weakly_canonical(fs::path(output_dir.empty() ? "/tmp" : output_dir), ec);
    if (ec) {
        err.set(SEEDVC_ERROR_IO, "cannot resolve output directory: " + output_dir);
        return false;
    }

    fs::path p(requested);
    if (p.is_relative()) {
        p = root / p;
    }
    const fs::path canon = fs::weakly_canonical(p, ec);
    if (ec) {
        err.set(SEEDVC_ERROR_VALIDATION, "invalid file path: " + requested);
        return false;
    }

    // Component-wise prefix check so "/tmp/out2" is not inside "/tmp/out".
    auto it_root = root.begin();
    auto it_path = canon.begin();
    for (; it_root != root.end(); ++it_root, ++it_path) {
        if (it_root->empty()) {
            continue;
        }
        if (it_path == canon.end() || *it_root != *it_path) {
            err.set(SEEDVC_ERROR_VALIDATION, "path is outside the output directory: " + requested);
            return false;
        }
    }
    if (it_path == canon.end()) {
        err.set(SEEDVC_ERROR_VALIDATION, "path is the output directory itself: " + requested);
        return false;
    }

    resolved = canon.string();
    return true;
}
