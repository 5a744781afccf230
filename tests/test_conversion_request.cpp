#include <catch2/catch.hpp>

#include "conversion-request.h"

#include <limits>

namespace {

audio_asset make_asset(double seconds, int32_t rate = 22050) {
    audio_asset a;
    a.sample_rate = rate;
    a.samples.assign((size_t) (seconds * rate), 0.1f);
    return a;
}

} // namespace

TEST_CASE("default parameters are valid", "[request]") {
    conversion_params p;
    seedvc_error err;
    CHECK(seedvc_validate_conversion_params(p, err));
    CHECK(p.diffusion_steps == 30);
    CHECK(p.output_format == SEEDVC_OUTPUT_WAV);
    CHECK(p.cleanup_temp_files);
    CHECK_FALSE(p.return_base64);
}

TEST_CASE("out-of-range parameters are validation errors", "[request]") {
    seedvc_error err;

    SECTION("diffusion_steps") {
        conversion_params p;
        p.diffusion_steps = 0;
        REQUIRE_FALSE(seedvc_validate_conversion_params(p, err));
        CHECK(err.kind == SEEDVC_ERROR_VALIDATION);
        CHECK(err.message == "diffusion_steps must be in [1, 200], got 0");
        p.diffusion_steps = 201;
        CHECK_FALSE(seedvc_validate_conversion_params(p, err));
        p.diffusion_steps = 200;
        CHECK(seedvc_validate_conversion_params(p, err));
    }
    SECTION("length_adjust") {
        conversion_params p;
        p.length_adjust = 2.5f;
        REQUIRE_FALSE(seedvc_validate_conversion_params(p, err));
        CHECK(err.message.find("length_adjust must be in [0.5, 2]") == 0);
    }
    SECTION("top_p") {
        conversion_params p;
        p.top_p = 0.05f;
        REQUIRE_FALSE(seedvc_validate_conversion_params(p, err));
        CHECK(err.message.find("top_p") == 0);
    }
    SECTION("repetition_penalty") {
        conversion_params p;
        p.repetition_penalty = 0.9f;
        REQUIRE_FALSE(seedvc_validate_conversion_params(p, err));
        CHECK(err.message.find("repetition_penalty") == 0);
    }
    SECTION("non-finite") {
        conversion_params p;
        p.temperature = std::numeric_limits<float>::quiet_NaN();
        REQUIRE_FALSE(seedvc_validate_conversion_params(p, err));
        CHECK(err.message.find("temperature") == 0);
    }
}

TEST_CASE("request carries validated inputs", "[request]") {
    conversion_request req;
    seedvc_error err;
    REQUIRE(seedvc_make_conversion_request(make_asset(250.0), make_asset(90.0), conversion_params(), request_limits(), req, err));
    CHECK(req.source.duration_sec() == Approx(250.0));
    CHECK(req.reference.duration_sec() == Approx(90.0));
}

TEST_CASE("reference longer than the limit is rejected", "[request]") {
    conversion_request req;
    seedvc_error err;
    REQUIRE_FALSE(seedvc_make_conversion_request(make_asset(10.0), make_asset(130.0), conversion_params(), request_limits(), req, err));
    CHECK(err.kind == SEEDVC_ERROR_VALIDATION);
    CHECK(err.message == "reference audio is 130.00 s, maximum is 120.00 s");
    CHECK(req.source.samples.empty());
}

TEST_CASE("source limit applies only when set", "[request]") {
    conversion_request req;
    seedvc_error err;
    request_limits limits;
    REQUIRE(seedvc_make_conversion_request(make_asset(600.0, 8000), make_asset(5.0, 8000), conversion_params(), limits, req, err));

    limits.max_source_seconds = 300.0;
    REQUIRE_FALSE(seedvc_make_conversion_request(make_asset(600.0, 8000), make_asset(5.0, 8000), conversion_params(), limits, req, err));
    CHECK(err.kind == SEEDVC_ERROR_VALIDATION);
    CHECK(err.message.find("source audio is 600.00 s") == 0);
}

TEST_CASE("empty or mismatched audio is an input error", "[request]") {
    conversion_request req;
    seedvc_error err;

    REQUIRE_FALSE(seedvc_make_conversion_request(audio_asset(), make_asset(5.0), conversion_params(), request_limits(), req, err));
    CHECK(err.kind == SEEDVC_ERROR_INPUT);

    REQUIRE_FALSE(seedvc_make_conversion_request(make_asset(5.0, 16000), make_asset(5.0, 22050), conversion_params(), request_limits(), req, err));
    CHECK(err.kind == SEEDVC_ERROR_INPUT);
}

TEST_CASE("parameters are checked before durations", "[request]") {
    conversion_params p;
    p.similarity_cfg_rate = 1.5f;
    conversion_request req;
    seedvc_error err;
    REQUIRE_FALSE(seedvc_make_conversion_request(make_asset(5.0), make_asset(130.0), p, request_limits(), req, err));
    CHECK(err.message.find("similarity_cfg_rate") == 0);
}
