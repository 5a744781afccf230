#include "conversion-request.h"

#include <cmath>
#include <cstdio>
#include <utility>

namespace {

bool check_range(const char * name, double v, double lo, double hi, seedvc_error & err) {
    if (!std::isfinite(v) || v < lo || v > hi) {
        char buf[256];
        std::snprintf(buf, sizeof(buf), "%s must be in [%g, %g], got %g", name, lo, hi, v);
        err.set(SEEDVC_ERROR_VALIDATION, buf);
        return false;
    }
    return true;
}

} // namespace

bool seedvc_validate_conversion_params(const conversion_params & p, seedvc_error & err) {
    if (p.diffusion_steps < 1 || p.diffusion_steps > 200) {
        err.set(SEEDVC_ERROR_VALIDATION,
                "diffusion_steps must be in [1, 200], got " + std::to_string(p.diffusion_steps));
        return false;
    }
    return check_range("length_adjust", p.length_adjust, 0.5, 2.0, err) &&
           check_range("intelligibility_cfg_rate", p.intelligibility_cfg_rate, 0.0, 1.0, err) &&
           check_range("similarity_cfg_rate", p.similarity_cfg_rate, 0.0, 1.0, err) &&
           check_range("top_p", p.top_p, 0.1, 1.0, err) &&
           check_range("temperature", p.temperature, 0.1, 2.0, err) &&
           check_range("repetition_penalty", p.repetition_penalty, 1.0, 3.0, err);
}

bool seedvc_make_conversion_request(
        audio_asset source,
        audio_asset reference,
        const conversion_params & params,
        const request_limits & limits,
        conversion_request & out,
        seedvc_error & err) {
    if (!seedvc_validate_conversion_params(params, err)) {
        return false;
    }
    if (source.sample_rate <= 0 || source.samples.empty()) {
        err.set(SEEDVC_ERROR_INPUT, "source audio is empty");
        return false;
    }
    if (reference.sample_rate <= 0 || reference.samples.empty()) {
        err.set(SEEDVC_ERROR_INPUT, "reference audio is empty");
        return false;
    }
    if (source.sample_rate != reference.sample_rate) {
        err.set(SEEDVC_ERROR_INPUT, "source and reference were decoded at different sample rates");
        return false;
    }

    const double ref_sec = reference.duration_sec();
    if (limits.max_reference_seconds > 0.0 && ref_sec > limits.max_reference_seconds) {
        char buf[160];
        std::snprintf(buf, sizeof(buf), "reference audio is %.2f s, maximum is %.2f s",
                ref_sec, limits.max_reference_seconds);
        err.set(SEEDVC_ERROR_VALIDATION, buf);
        return false;
    }
    const double src_sec = source.duration_sec();
    if (limits.max_source_seconds > 0.0 && src_sec > limits.max_source_seconds) {
        char buf[160];
        std::snprintf(buf, sizeof(buf), "source audio is %.2f s, maximum is %.2f s",
                src_sec, limits.max_source_seconds);
        err.set(SEEDVC_ERROR_VALIDATION, buf);
        return false;
    }

    out.source = std::move(source);
    out.reference = std::move(reference);
    out.params = params;
    return true;
}
