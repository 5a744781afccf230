#include <catch2/catch.hpp>

#include "conversion-api.h"
#include "test-utils.h"

#include <algorithm>
#include <filesystem>

TEST_CASE("json request fills both slots and parameters", "[api]") {
    const json body = json::parse(R"({
        "source_audio_path": "/data/in.wav",
        "target_audio_base64": "UklGRg==",
        "diffusion_steps": 50,
        "length_adjust": 1.2,
        "top_p": 0.7,
        "convert_style": true,
        "output_format": "ogg",
        "return_base64": true,
        "cleanup_temp_files": false
    })");

    conversion_inputs in;
    seedvc_error err;
    REQUIRE(seedvc_parse_conversion_json(body, in, err));

    REQUIRE(in.source.path.has_value());
    CHECK(*in.source.path == "/data/in.wav");
    CHECK_FALSE(in.source.base64.has_value());
    REQUIRE(in.reference.base64.has_value());
    CHECK(*in.reference.base64 == "UklGRg==");
    CHECK_FALSE(in.reference.path.has_value());

    CHECK(in.params.diffusion_steps == 50);
    CHECK(in.params.length_adjust == Approx(1.2f));
    CHECK(in.params.top_p == Approx(0.7f));
    CHECK(in.params.convert_style);
    CHECK_FALSE(in.params.anonymization_only);
    CHECK(in.params.output_format == SEEDVC_OUTPUT_OGG);
    CHECK(in.params.return_base64);
    CHECK_FALSE(in.params.cleanup_temp_files);
    // Untouched fields keep their defaults.
    CHECK(in.params.temperature == Approx(1.0f));
}

TEST_CASE("reference fields are accepted as aliases", "[api]") {
    conversion_inputs in;
    seedvc_error err;

    REQUIRE(seedvc_parse_conversion_json(json::parse(R"({"reference_audio_path": "/r.wav"})"), in, err));
    REQUIRE(in.reference.path.has_value());
    CHECK(*in.reference.path == "/r.wav");

    // An empty target falls back to the alias.
    REQUIRE(seedvc_parse_conversion_json(json::parse(R"({"target_audio_path": "", "reference_audio_path": "/r.wav"})"), in, err));
    CHECK(*in.reference.path == "/r.wav");

    REQUIRE(seedvc_parse_conversion_json(json::parse(R"({"target_audio_path": "/t.wav", "reference_audio_path": "/r.wav"})"), in, err));
    CHECK(*in.reference.path == "/t.wav");
}

TEST_CASE("empty strings and nulls count as absent", "[api]") {
    conversion_inputs in;
    seedvc_error err;
    REQUIRE(seedvc_parse_conversion_json(json::parse(R"({"source_audio_path": "", "source_audio_base64": null, "top_p": null})"), in, err));
    CHECK_FALSE(in.source.path.has_value());
    CHECK_FALSE(in.source.base64.has_value());
    CHECK(in.params.top_p == Approx(0.9f));
}

TEST_CASE("json type mismatches are validation errors", "[api]") {
    conversion_inputs in;
    seedvc_error err;

    REQUIRE_FALSE(seedvc_parse_conversion_json(json::parse(R"({"diffusion_steps": "30"})"), in, err));
    CHECK(err.kind == SEEDVC_ERROR_VALIDATION);
    CHECK(err.message == "field 'diffusion_steps' must be integer");

    REQUIRE_FALSE(seedvc_parse_conversion_json(json::parse(R"({"top_p": "0.5"})"), in, err));
    CHECK(err.message == "field 'top_p' must be number");

    REQUIRE_FALSE(seedvc_parse_conversion_json(json::parse(R"({"return_base64": 1})"), in, err));
    CHECK(err.message == "field 'return_base64' must be bool");

    REQUIRE_FALSE(seedvc_parse_conversion_json(json::parse(R"({"source_audio_path": 12})"), in, err));
    CHECK(err.message == "field 'source_audio_path' must be string");

    REQUIRE_FALSE(seedvc_parse_conversion_json(json::parse(R"({"output_format": "flac"})"), in, err));
    CHECK(err.kind == SEEDVC_ERROR_VALIDATION);
    CHECK(err.message.find("invalid output format: 'flac'") == 0);

    REQUIRE_FALSE(seedvc_parse_conversion_json(json::parse("[1, 2]"), in, err));
    CHECK(err.message == "request body must be a JSON object");
}

TEST_CASE("integer fields do not wrap or truncate", "[api]") {
    conversion_inputs in;
    seedvc_error err;

    REQUIRE_FALSE(seedvc_parse_conversion_json(json::parse(R"({"diffusion_steps": 4294967326})"), in, err));
    CHECK(err.kind == SEEDVC_ERROR_VALIDATION);
    CHECK(err.message == "field 'diffusion_steps' is out of range");

    REQUIRE_FALSE(seedvc_parse_conversion_json(json::parse(R"({"diffusion_steps": -4294967266})"), in, err));
    CHECK(err.message == "field 'diffusion_steps' is out of range");

    REQUIRE_FALSE(seedvc_parse_conversion_json(json::parse(R"({"diffusion_steps": 30.5})"), in, err));
    CHECK(err.message == "field 'diffusion_steps' must be integer");

    REQUIRE_FALSE(seedvc_parse_conversion_json(json::parse(R"({"diffusion_steps": 1e10})"), in, err));
    CHECK(err.message == "field 'diffusion_steps' must be integer");

    // In range for int32 but not for the parameter: caught by validation.
    REQUIRE(seedvc_parse_conversion_json(json::parse(R"({"diffusion_steps": 2147483647})"), in, err));
    CHECK(in.params.diffusion_steps == 2147483647);
    CHECK_FALSE(seedvc_validate_conversion_params(in.params, err));
    CHECK(err.kind == SEEDVC_ERROR_VALIDATION);

    conversion_params p;
    REQUIRE_FALSE(seedvc_parse_conversion_form({{"diffusion_steps", "4294967326"}}, p, err));
    CHECK(err.kind == SEEDVC_ERROR_VALIDATION);
    CHECK(err.message == "field 'diffusion_steps' must be integer");
    CHECK(p.diffusion_steps == 30);

    REQUIRE_FALSE(seedvc_parse_conversion_form({{"diffusion_steps", "99999999999999999999999"}}, p, err));
    CHECK(p.diffusion_steps == 30);
}

TEST_CASE("form fields are parsed as typed parameters", "[api]") {
    conversion_params p;
    seedvc_error err;

    const std::map<std::string, std::string> fields = {
        {"diffusion_steps", "12"},
        {"similarity_cfg_rate", " 0.25 "},
        {"anonymization_only", "on"},
        {"cleanup_temp_files", "No"},
        {"output_format", "MP3"},
        {"unrelated", "ignored"},
    };
    REQUIRE(seedvc_parse_conversion_form(fields, p, err));
    CHECK(p.diffusion_steps == 12);
    CHECK(p.similarity_cfg_rate == Approx(0.25f));
    CHECK(p.anonymization_only);
    CHECK_FALSE(p.cleanup_temp_files);
    CHECK(p.output_format == SEEDVC_OUTPUT_MP3);
}

TEST_CASE("malformed form fields are validation errors", "[api]") {
    conversion_params p;
    seedvc_error err;

    REQUIRE_FALSE(seedvc_parse_conversion_form({{"diffusion_steps", "12.5"}}, p, err));
    CHECK(err.kind == SEEDVC_ERROR_VALIDATION);
    CHECK(err.message == "field 'diffusion_steps' must be integer");

    REQUIRE_FALSE(seedvc_parse_conversion_form({{"top_p", "abc"}}, p, err));
    CHECK(err.message == "field 'top_p' must be number");

    REQUIRE_FALSE(seedvc_parse_conversion_form({{"convert_style", "maybe"}}, p, err));
    CHECK(err.message == "field 'convert_style' must be bool");

    // A failed parse leaves the parameters unchanged.
    CHECK(p.diffusion_steps == 30);
}

TEST_CASE("every parameter name is accepted as a form field", "[api]") {
    const auto & names = seedvc_conversion_param_names();
    CHECK(names.size() == 12);
    CHECK(std::find(names.begin(), names.end(), "repetition_penalty") != names.end());
}

TEST_CASE("successful response json", "[api]") {
    conversion_response rsp;
    rsp.success = true;
    rsp.message = "Voice conversion completed successfully";
    rsp.job_id = 7;
    rsp.output_format = "wav";
    rsp.streaming_format = "mp3";
    rsp.full_output_path = "/tmp/seedvc-7-full.wav";
    rsp.streaming_output_path = "/tmp/seedvc-7-stream.mp3";
    rsp.processing_time_sec = 1.5;
    rsp.n_chunks = 3;
    rsp.sample_rate = 22050;
    rsp.has_input_info = true;
    rsp.source_info.duration_sec = 12.0;
    rsp.source_info.sample_rate = 44100;
    rsp.source_info.channels = 2;
    rsp.source_info.file_size = 1234;
    rsp.source_info.file_format = "wav";

    const json j = seedvc_conversion_response_json(rsp);
    CHECK(j["success"] == true);
    CHECK(j["job_id"] == 7);
    CHECK(j["full_output_path"] == "/tmp/seedvc-7-full.wav");
    CHECK(j["full_output_base64"].is_null());
    CHECK(j["streaming_output_base64"].is_null());
    CHECK(j["processing_time"] == 1.5);
    CHECK(j["n_chunks"] == 3);
    CHECK(j["input_info"]["source"]["sample_rate"] == 44100);
    CHECK(j["input_info"]["source"]["channels"] == 2);
    CHECK(j["input_info"]["source"]["file_format"] == "wav");
    CHECK(j["input_info"].contains("target"));
    CHECK_FALSE(j.contains("error"));
    CHECK(seedvc_conversion_response_status(rsp) == 200);
}

TEST_CASE("failed response json carries the error kind", "[api]") {
    conversion_response rsp;
    rsp.error.set(SEEDVC_ERROR_MODEL_UNAVAILABLE, "models not loaded: engine library not loaded");
    rsp.message = rsp.error.message;

    const json j = seedvc_conversion_response_json(rsp);
    CHECK(j["success"] == false);
    CHECK(j["input_info"].is_null());
    CHECK(j["error"]["kind"] == "model_unavailable");
    CHECK(j["error"]["code"] == 503);
    CHECK(seedvc_conversion_response_status(rsp) == 503);

    seedvc_error e;
    e.set(SEEDVC_ERROR_INPUT, "source audio is missing");
    const json ej = seedvc_make_error_json(e);
    CHECK(ej["success"] == false);
    CHECK(ej["message"] == "source audio is missing");
    CHECK(ej["error"]["kind"] == "input_error");
    CHECK(ej["error"]["code"] == 400);
}

TEST_CASE("download paths are confined to the output directory", "[api]") {
    temp_dir out("api-out");
    std::string io_err;
    REQUIRE(seedvc_save_binary_file(out.file("result.wav"), {1, 2, 3}, io_err));

    const std::string expected = std::filesystem::weakly_canonical(out.file("result.wav")).string();
    std::string resolved;
    seedvc_error err;

    REQUIRE(seedvc_resolve_output_path(out.path(), "result.wav", resolved, err));
    CHECK(resolved == expected);
    REQUIRE(seedvc_resolve_output_path(out.path(), out.file("result.wav"), resolved, err));
    CHECK(resolved == expected);

    CHECK_FALSE(seedvc_resolve_output_path(out.path(), "../result.wav", resolved, err));
    CHECK(err.kind == SEEDVC_ERROR_VALIDATION);
    CHECK(err.message.find("outside the output directory") != std::string::npos);

    err.clear();
    CHECK_FALSE(seedvc_resolve_output_path(out.path(), "/etc/passwd", resolved, err));
    CHECK(err.kind == SEEDVC_ERROR_VALIDATION);

    err.clear();
    CHECK_FALSE(seedvc_resolve_output_path(out.path(), out.path() + "2/result.wav", resolved, err));
    CHECK(err.kind == SEEDVC_ERROR_VALIDATION);

    err.clear();
    CHECK_FALSE(seedvc_resolve_output_path(out.path(), "", resolved, err));
    CHECK(err.message == "file path is empty");

    err.clear();
    CHECK_FALSE(seedvc_resolve_output_path(out.path(), ".", resolved, err));
    CHECK(err.kind == SEEDVC_ERROR_VALIDATION);
}
