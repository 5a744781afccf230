#include "conversion-scheduler.h"

#include <algorithm>
#include <cstddef>
#include <cstdio>
#include <exception>
#include <string>

const char * seedvc_job_state_to_cstr(conversion_job_state state) {
    switch (state) {
        case CONVERSION_JOB_QUEUED:    return "queued";
        case CONVERSION_JOB_RUNNING:   return "running";
        case CONVERSION_JOB_SUCCEEDED: return "succeeded";
        case CONVERSION_JOB_FAILED:    return "failed";
        case CONVERSION_JOB_CANCELLED: return "cancelled";
    }
    return "unknown";
}

conversion_job::conversion_job(
        uint64_t id,
        std::vector<audio_chunk> chunks,
        std::vector<float> reference,
        const conversion_params & params,
        int32_t sample_rate,
        int32_t crossfade_samples)
    : id_(id),
      chunks_(std::move(chunks)),
      reference_(std::move(reference)),
      params_(params),
      sample_rate_(sample_rate),
      assembler_(crossfade_samples) {
}

conversion_job_state conversion_job::state() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return state_;
}

bool conversion_job::is_terminal() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return state_ == CONVERSION_JOB_SUCCEEDED || state_ == CONVERSION_JOB_FAILED || state_ == CONVERSION_JOB_CANCELLED;
}

int32_t conversion_job::chunk_cursor() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return cursor_;
}

std::vector<float> conversion_job::streaming_snapshot() const {
    std::lock_guard<std::mutex> lock(mtx_);
    if (state_ == CONVERSION_JOB_SUCCEEDED) {
        return result_.streaming;
    }
    return assembler_.committed();
}

size_t conversion_job::streaming_samples() const {
    std::lock_guard<std::mutex> lock(mtx_);
    if (state_ == CONVERSION_JOB_SUCCEEDED) {
        return result_.streaming.size();
    }
    return assembler_.committed().size();
}

std::vector<float> conversion_job::streaming_since(size_t offset) const {
    std::lock_guard<std::mutex> lock(mtx_);
    const std::vector<float> & src = state_ == CONVERSION_JOB_SUCCEEDED ? result_.streaming : assembler_.committed();
    if (offset >= src.size()) {
        return {};
    }
    return std::vector<float>(src.begin() + (std::ptrdiff_t) offset, src.end());
}

void conversion_job::set_chunk_callback(chunk_callback cb) {
    std::lock_guard<std::mutex> lock(mtx_);
    on_chunk_ = std::move(cb);
}

void conversion_job::wait() const {
    std::unique_lock<std::mutex> lock(mtx_);
    cv_.wait(lock, [&] {
        return state_ == CONVERSION_JOB_SUCCEEDED || state_ == CONVERSION_JOB_FAILED || state_ == CONVERSION_JOB_CANCELLED;
    });
}

bool conversion_job::wait_for(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mtx_);
    return cv_.wait_for(lock, timeout, [&] {
        return state_ == CONVERSION_JOB_SUCCEEDED || state_ == CONVERSION_JOB_FAILED || state_ == CONVERSION_JOB_CANCELLED;
    });
}

const conversion_result & conversion_job::result() const {
    return result_;
}

seedvc_error conversion_job::error() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return error_;
}

void conversion_job::mark_running() {
    std::lock_guard<std::mutex> lock(mtx_);
    state_ = CONVERSION_JOB_RUNNING;
}

bool conversion_job::append_chunk_output(int32_t chunk_index, const std::vector<float> & out) {
    chunk_callback cb;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (chunk_index != cursor_) {
            return false;
        }
        assembler_.append(out);
        cursor_ = chunk_index + 1;
        cb = on_chunk_;
    }
    if (cb) {
        cb(*this, chunk_index);
    }
    return true;
}

void conversion_job::finish_success(double wait_ms, double run_ms) {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        assembler_.finish();
        result_.full = assembler_.committed();
        result_.streaming = assembler_.committed();
        result_.sample_rate = sample_rate_;
        result_.n_chunks = assembler_.n_chunks();
        result_.wait_ms = wait_ms;
        result_.run_ms = run_ms;
        assembler_.reset();
        state_ = CONVERSION_JOB_SUCCEEDED;
    }
    cv_.notify_all();
}

void conversion_job::finish_failure(seedvc_error_kind kind, const std::string & msg) {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        assembler_.reset();
        error_.set(kind, msg);
        state_ = CONVERSION_JOB_FAILED;
    }
    cv_.notify_all();
}

void conversion_job::finish_cancelled(const std::string & msg) {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        error_.set(SEEDVC_ERROR_PROCESSING, msg);
        state_ = CONVERSION_JOB_CANCELLED;
    }
    cv_.notify_all();
}

conversion_scheduler::conversion_scheduler(voice_model_engine & engine, int32_t max_concurrent_jobs)
    : engine_(engine),
      max_jobs_(std::max<int32_t>(1, max_concurrent_jobs)),
      serialize_engine_(!engine.info().batched_occupancy) {
    workers_.reserve((size_t) max_jobs_);
    for (int32_t i = 0; i < max_jobs_; ++i) {
        workers_.emplace_back([this]() { worker_loop(); });
    }
}

conversion_scheduler::~conversion_scheduler() {
    shutdown();
}

bool conversion_scheduler::submit(const std::shared_ptr<conversion_job> & job, seedvc_error & err) {
    if (!job) {
        err.set(SEEDVC_ERROR_PROCESSING, "null job");
        return false;
    }
    if (!engine_.is_loaded()) {
        err.set(SEEDVC_ERROR_MODEL_UNAVAILABLE, "models not loaded: " + engine_.load_error());
        return false;
    }
    if (job->chunks_.empty()) {
        err.set(SEEDVC_ERROR_PROCESSING, "job has no chunks");
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(queue_mtx_);
        if (stopping_) {
            err.set(SEEDVC_ERROR_PROCESSING, "scheduler is shutting down");
            return false;
        }
        job->t_submit_ = std::chrono::steady_clock::now();
        queue_.push_back(job);
    }
    queue_cv_.notify_one();
    return true;
}

bool conversion_scheduler::cancel(const std::shared_ptr<conversion_job> & job) {
    {
        std::lock_guard<std::mutex> lock(queue_mtx_);
        auto it = std::find(queue_.begin(), queue_.end(), job);
        if (it == queue_.end()) {
            return false;
        }
        queue_.erase(it);
    }
    job->finish_cancelled("job cancelled before dispatch");
    return true;
}

void conversion_scheduler::shutdown() {
    std::deque<std::shared_ptr<conversion_job>> dropped;
    {
        std::lock_guard<std::mutex> lock(queue_mtx_);
        if (stopping_ && workers_.empty()) {
            return;
        }
        stopping_ = true;
        dropped.swap(queue_);
    }
    queue_cv_.notify_all();
    for (auto & job : dropped) {
        job->finish_cancelled("scheduler shut down before dispatch");
    }
    for (auto & t : workers_) {
        if (t.joinable()) {
            t.join();
        }
    }
    workers_.clear();
}

size_t conversion_scheduler::queued_jobs() const {
    std::lock_guard<std::mutex> lock(queue_mtx_);
    return queue_.size();
}

void conversion_scheduler::worker_loop() {
    while (true) {
        std::shared_ptr<conversion_job> job;
        {
            std::unique_lock<std::mutex> lock(queue_mtx_);
            queue_cv_.wait(lock, [&] { return stopping_ || !queue_.empty(); });
            if (queue_.empty()) {
                return;
            }
            job = queue_.front();
            queue_.pop_front();
            // The job leaves the queue and becomes running under the queue lock
            // so cancel() never sees it in between.
            job->mark_running();
        }

        const int32_t now_active = active_.fetch_add(1) + 1;
        int32_t peak = peak_active_.load();
        while (now_active > peak && !peak_active_.compare_exchange_weak(peak, now_active)) {
        }

        const double wait_ms = seedvc_ms_since(job->t_submit_, std::chrono::steady_clock::now());
        try {
            run_job(*job, wait_ms);
        } catch (const std::exception & e) {
            std::fprintf(stderr, "job %llu: unexpected error: %s\n", (unsigned long long) job->id_, e.what());
            if (!job->is_terminal()) {
                job->finish_failure(SEEDVC_ERROR_PROCESSING, std::string("unexpected error: ") + e.what());
            }
        }

        active_.fetch_sub(1);
    }
}

void conversion_scheduler::run_job(conversion_job & job, double wait_ms) {
    const auto t_run = std::chrono::steady_clock::now();

    std::unique_lock<std::mutex> engine_lock(engine_mtx_, std::defer_lock);
    auto lock_engine = [&]() {
        if (serialize_engine_) {
            engine_lock.lock();
        }
    };
    auto unlock_engine = [&]() {
        if (engine_lock.owns_lock()) {
            engine_lock.unlock();
        }
    };

    std::string err;
    std::unique_ptr<engine_session> session;
    try {
        lock_engine();
        session = engine_.prepare_reference(job.reference_, job.params_, err);
        unlock_engine();
    } catch (const std::exception & e) {
        unlock_engine();
        session.reset();
        err = e.what();
    }

    if (!session) {
        std::fprintf(stderr, "job %llu: reference preparation failed: %s\n",
                (unsigned long long) job.id_, err.c_str());
        job.finish_failure(SEEDVC_ERROR_PROCESSING, "reference preparation failed: " + err);
        return;
    }

    bool ok = true;
    for (auto & chunk : job.chunks_) {
        std::vector<float> out;
        err.clear();
        bool chunk_ok = false;
        try {
            lock_engine();
            chunk_ok = engine_.convert(*session, chunk, job.params_, out, err);
            unlock_engine();
        } catch (const std::exception & e) {
            unlock_engine();
            chunk_ok = false;
            err = e.what();
        }

        if (!chunk_ok || out.empty()) {
            if (err.empty()) {
                err = "engine returned no audio";
            }
            job.finish_failure(SEEDVC_ERROR_PROCESSING,
                    "chunk " + std::to_string(chunk.index + 1) + "/" + std::to_string(job.chunks_.size()) +
                    " failed: " + err);
            ok = false;
            break;
        }
        bool appended = false;
        try {
            appended = job.append_chunk_output(chunk.index, out);
        } catch (const std::exception & e) {
            job.finish_failure(SEEDVC_ERROR_PROCESSING,
                    "chunk " + std::to_string(chunk.index + 1) + " callback failed: " + e.what());
            ok = false;
            break;
        }
        if (!appended) {
            job.finish_failure(SEEDVC_ERROR_PROCESSING,
                    "chunk " + std::to_string(chunk.index) + " completed out of order");
            ok = false;
            break;
        }

        chunk.samples.clear();
        chunk.samples.shrink_to_fit();
    }

    lock_engine();
    session.reset();
    unlock_engine();

    if (ok) {
        job.finish_success(wait_ms, seedvc_ms_since(t_run, std::chrono::steady_clock::now()));
    }
}
