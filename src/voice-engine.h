#pragma once

#include "conversion-request.h"
#include "segmenter.h"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

struct engine_info {
    std::string name;
    int32_t sample_rate = 0;
    int32_t hop_size = 0;
    int64_t max_chunk_samples = 0;
    bool batched_occupancy = false;
    uint64_t job_workspace_bytes = 0;
};

// Reference conditioning plus per-job continuity state. Created once per job
// and passed to every convert() call of that job.
class engine_session {
public:
    virtual ~engine_session() = default;
};

// The generative model. Calls on one session are never concurrent; calls on
// different sessions may overlap only when info().batched_occupancy is set.
class voice_model_engine {
public:
    virtual ~voice_model_engine() = default;

    virtual bool is_loaded() const = 0;

    // Why the engine is not loaded; empty when it is.
    virtual std::string load_error() const = 0;

    virtual const engine_info & info() const = 0;

    virtual std::unique_ptr<engine_session> prepare_reference(
            const std::vector<float> & reference,
            const conversion_params & params,
            std::string & err) = 0;

    virtual bool convert(
            engine_session & session,
            const audio_chunk & chunk,
            const conversion_params & params,
            std::vector<float> & out,
            std::string & err) = 0;
};
