#pragma once

#include "chunk-assembler.h"
#include "conversion-request.h"
#include "segmenter.h"
#include "seedvc-common.h"
#include "temp-artifacts.h"
#include "voice-engine.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

enum conversion_job_state {
    CONVERSION_JOB_QUEUED = 0,
    CONVERSION_JOB_RUNNING,
    CONVERSION_JOB_SUCCEEDED,
    CONVERSION_JOB_FAILED,
    CONVERSION_JOB_CANCELLED,
};

const char * seedvc_job_state_to_cstr(conversion_job_state state);

struct conversion_result {
    std::vector<float> streaming; // equals full once the job succeeded
    std::vector<float> full;
    int32_t sample_rate = 0;
    int32_t n_chunks = 0;
    double wait_ms = 0.0; // queued until a worker picked the job up
    double run_ms = 0.0;
};

class conversion_job {
public:
    // Called on the worker thread after chunk `chunk_index` was appended to the
    // streaming buffer.
    using chunk_callback = std::function<void(const conversion_job & job, int32_t chunk_index)>;

    conversion_job(
            uint64_t id,
            std::vector<audio_chunk> chunks,
            std::vector<float> reference,
            const conversion_params & params,
            int32_t sample_rate,
            int32_t crossfade_samples);

    conversion_job(const conversion_job &) = delete;
    conversion_job & operator=(const conversion_job &) = delete;

    uint64_t id() const { return id_; }
    int32_t n_chunks() const { return (int32_t) chunks_.size(); }
    int32_t sample_rate() const { return sample_rate_; }
    const conversion_params & params() const { return params_; }

    conversion_job_state state() const;
    bool is_terminal() const;
    int32_t chunk_cursor() const;

    // Copy of the committed streaming prefix.
    std::vector<float> streaming_snapshot() const;
    size_t streaming_samples() const;
    // Samples of the committed prefix from `offset` on.
    std::vector<float> streaming_since(size_t offset) const;

    // Must be set before submission.
    void set_chunk_callback(chunk_callback cb);

    void wait() const;
    bool wait_for(std::chrono::milliseconds timeout) const;

    // Valid once state() is CONVERSION_JOB_SUCCEEDED.
    const conversion_result & result() const;
    // Valid once state() is CONVERSION_JOB_FAILED or CONVERSION_JOB_CANCELLED.
    seedvc_error error() const;

    temp_artifact_set & artifacts() { return artifacts_; }

private:
    friend class conversion_scheduler;

    void mark_running();
    void finish_success(double wait_ms, double run_ms);
    void finish_failure(seedvc_error_kind kind, const std::string & msg);
    void finish_cancelled(const std::string & msg);
    bool append_chunk_output(int32_t chunk_index, const std::vector<float> & out);

    const uint64_t id_;
    std::vector<audio_chunk> chunks_;
    std::vector<float> reference_;
    const conversion_params params_;
    const int32_t sample_rate_;
    chunk_callback on_chunk_;

    std::chrono::steady_clock::time_point t_submit_;

    mutable std::mutex mtx_;
    mutable std::condition_variable cv_;
    conversion_job_state state_ = CONVERSION_JOB_QUEUED;
    int32_t cursor_ = 0;
    chunk_assembler assembler_;
    conversion_result result_;
    seedvc_error error_;

    // Declared last so files go away after the buffers above are released.
    temp_artifact_set artifacts_;
};

// Worker pool of `max_concurrent_jobs` threads over a FIFO queue. It is the
// only component that calls into the engine. Per job: prepare_reference once,
// then every chunk in index order.
class conversion_scheduler {
public:
    conversion_scheduler(voice_model_engine & engine, int32_t max_concurrent_jobs);
    ~conversion_scheduler();

    conversion_scheduler(const conversion_scheduler &) = delete;
    conversion_scheduler & operator=(const conversion_scheduler &) = delete;

    bool submit(const std::shared_ptr<conversion_job> & job, seedvc_error & err);

    // Succeeds only while the job is still queued.
    bool cancel(const std::shared_ptr<conversion_job> & job);

    // Cancels queued jobs, lets running ones finish and joins the workers.
    void shutdown();

    int32_t max_concurrent_jobs() const { return max_jobs_; }
    bool serializes_engine() const { return serialize_engine_; }
    int32_t active_jobs() const { return active_.load(); }
    int32_t peak_active_jobs() const { return peak_active_.load(); }
    size_t queued_jobs() const;

private:
    void worker_loop();
    void run_job(conversion_job & job, double wait_ms);

    voice_model_engine & engine_;
    const int32_t max_jobs_;
    const bool serialize_engine_;

    std::mutex engine_mtx_;

    mutable std::mutex queue_mtx_;
    std::condition_variable queue_cv_;
    std::deque<std::shared_ptr<conversion_job>> queue_;
    bool stopping_ = false;

    std::atomic<int32_t> active_{0};
    std::atomic<int32_t> peak_active_{0};

    std::vector<std::thread> workers_;
};
