#pragma once

// C ABI implemented by voice-model engine plugins. seedvc-server and
// seedvc-cli dlopen() a shared library exporting these symbols.

#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>

#if defined(_WIN32)
#    define SEEDVC_ENGINE_API __declspec(dllexport)
#else
#    define SEEDVC_ENGINE_API __attribute__((visibility("default")))
#endif

#define SEEDVC_ENGINE_ABI_VERSION 1

#ifdef __cplusplus
extern "C" {
#endif

struct seedvc_engine;
struct seedvc_engine_session;

struct seedvc_engine_config {
    const char * ar_checkpoint_path;  // may be null: engine default
    const char * cfm_checkpoint_path; // may be null: engine default
    const char * device;              // e.g. "CUDA0", null for auto
    int32_t compile;                  // non-zero: compile/capture graphs at load
    int32_t n_threads;
};

struct seedvc_engine_info {
    int32_t abi_version;
    const char * name;               // owned by the engine
    int32_t sample_rate;             // canonical rate for all audio in and out
    int32_t hop_size;                // samples per model frame
    int64_t max_chunk_samples;       // longest admissible input chunk
    int32_t batched_occupancy;       // non-zero: calls from different jobs may overlap
    uint64_t job_workspace_bytes;    // accelerator memory one in-flight job needs
};

struct seedvc_engine_conversion_params {
    int32_t diffusion_steps;
    float length_adjust;
    float intelligibility_cfg_rate;
    float similarity_cfg_rate;
    float top_p;
    float temperature;
    float repetition_penalty;
    int32_t convert_style;
    int32_t anonymization_only;
};

// level: 0 debug, 1 info, 2 warning, 3 error
typedef void (*seedvc_engine_log_callback)(int32_t level, const char * text, void * user_data);

SEEDVC_ENGINE_API struct seedvc_engine * seedvc_engine_create(
        const struct seedvc_engine_config * cfg,
        char * err,
        size_t err_size);

SEEDVC_ENGINE_API void seedvc_engine_destroy(struct seedvc_engine * engine);

SEEDVC_ENGINE_API bool seedvc_engine_get_info(
        const struct seedvc_engine * engine,
        struct seedvc_engine_info * out);

// Computes the reference conditioning once per job. The session also carries
// any continuity state between consecutive chunks of that job.
SEEDVC_ENGINE_API struct seedvc_engine_session * seedvc_engine_prepare_reference(
        struct seedvc_engine * engine,
        const float * reference,
        size_t n_reference,
        const struct seedvc_engine_conversion_params * params,
        char * err,
        size_t err_size);

// Chunks of one session arrive strictly in index order. *audio_out must be
// released with seedvc_engine_audio_free.
SEEDVC_ENGINE_API bool seedvc_engine_convert(
        struct seedvc_engine * engine,
        struct seedvc_engine_session * session,
        const float * chunk,
        size_t n_chunk,
        int32_t chunk_index,
        const struct seedvc_engine_conversion_params * params,
        float ** audio_out,
        size_t * n_audio_out,
        char * err,
        size_t err_size);

SEEDVC_ENGINE_API void seedvc_engine_session_free(struct seedvc_engine_session * session);
SEEDVC_ENGINE_API void seedvc_engine_audio_free(float * audio);

// Optional export.
SEEDVC_ENGINE_API void seedvc_engine_set_log_callback(seedvc_engine_log_callback cb, void * user_data);

#ifdef __cplusplus
}
#endif
