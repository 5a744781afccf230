#pragma once

#include "conversion-service.h"
#include "seedvc-common.h"

#include <nlohmann/json.hpp>

#include <map>
#include <string>
#include <vector>

using json = nlohmann::ordered_json;

// JSON body of POST /convert. Field type mismatches and bad output formats are
// validation errors; ranges are checked later by the service.
bool seedvc_parse_conversion_json(const json & body, conversion_inputs & out, seedvc_error & err);

// Parameter fields of a multipart POST /convert/files. Audio files are filled
// in by the caller.
bool seedvc_parse_conversion_form(
        const std::map<std::string, std::string> & fields,
        conversion_params & out,
        seedvc_error & err);

// Names of every parameter accepted as a form field.
const std::vector<std::string> & seedvc_conversion_param_names();

json seedvc_conversion_response_json(const conversion_response & rsp);

json seedvc_make_error_json(const seedvc_error & err);

int seedvc_conversion_response_status(const conversion_response & rsp);

// Maps a /download or /cleanup path onto a file inside output_dir. Relative
// paths are taken relative to output_dir; anything resolving outside it is a
// validation error.
bool seedvc_resolve_output_path(
        const std::string & output_dir,
        const std::string & requested,
        std::string & resolved,
        seedvc_error & err);
