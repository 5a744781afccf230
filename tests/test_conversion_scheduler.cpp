#include <catch2/catch.hpp>

#include "conversion-scheduler.h"
#include "fake-engine.h"

#include <chrono>
#include <map>
#include <stdexcept>
#include <thread>

namespace {

std::shared_ptr<conversion_job> make_job(uint64_t id, float tag, int32_t n_chunks, size_t chunk_len = 4000) {
    return std::make_shared<conversion_job>(
            id, make_test_chunks(n_chunks, chunk_len), std::vector<float>(100, tag),
            conversion_params(), 22050, 1024);
}

bool wait_until_running(const conversion_job & job) {
    for (int i = 0; i < 200; ++i) {
        if (job.state() != CONVERSION_JOB_QUEUED) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return false;
}

} // namespace

TEST_CASE("job output is the crossfaded concatenation of its chunks", "[scheduler]") {
    fake_voice_model_engine::options opt;
    opt.gain = 2.0f;
    fake_voice_model_engine engine(opt);
    conversion_scheduler scheduler(engine, 1);

    auto job = make_job(1, 1.0f, 3);
    seedvc_error err;
    REQUIRE(scheduler.submit(job, err));
    job->wait();

    REQUIRE(job->state() == CONVERSION_JOB_SUCCEEDED);
    const conversion_result & res = job->result();
    CHECK(res.n_chunks == 3);
    CHECK(res.sample_rate == 22050);
    CHECK(res.full.size() == 3 * 4000 - 2 * 1024);
    CHECK(res.streaming == res.full);
    CHECK(res.full.front() == Approx(0.5f));
    CHECK(job->chunk_cursor() == 3);
    CHECK(engine.prepare_calls == 1);
    CHECK(engine.convert_calls == 3);
}

TEST_CASE("jobs are dispatched in submission order", "[scheduler]") {
    fake_voice_model_engine::options opt;
    opt.call_delay_ms = 5;
    fake_voice_model_engine engine(opt);
    conversion_scheduler scheduler(engine, 1);

    std::vector<std::shared_ptr<conversion_job>> jobs;
    seedvc_error err;
    for (int i = 0; i < 4; ++i) {
        jobs.push_back(make_job((uint64_t) i + 1, (float) (i + 1), 2));
        REQUIRE(scheduler.submit(jobs.back(), err));
    }
    for (auto & j : jobs) {
        j->wait();
        CHECK(j->state() == CONVERSION_JOB_SUCCEEDED);
    }

    const auto calls = engine.calls();
    REQUIRE(calls.size() == 8);
    for (size_t i = 0; i < calls.size(); ++i) {
        CHECK(calls[i].tag == (float) (i / 2 + 1));
        CHECK(calls[i].chunk_index == (int32_t) (i % 2));
    }
}

TEST_CASE("concurrency never exceeds the configured bound", "[scheduler]") {
    fake_voice_model_engine::options opt;
    opt.call_delay_ms = 20;
    opt.batched_occupancy = true;
    fake_voice_model_engine engine(opt);
    conversion_scheduler scheduler(engine, 2);
    REQUIRE(scheduler.max_concurrent_jobs() == 2);
    REQUIRE_FALSE(scheduler.serializes_engine());

    std::vector<std::shared_ptr<conversion_job>> jobs;
    seedvc_error err;
    for (int i = 0; i < 6; ++i) {
        jobs.push_back(make_job((uint64_t) i + 1, (float) (i + 1), 3));
        REQUIRE(scheduler.submit(jobs.back(), err));
    }
    for (auto & j : jobs) {
        j->wait();
        CHECK(j->state() == CONVERSION_JOB_SUCCEEDED);
    }

    CHECK(scheduler.peak_active_jobs() == 2);
    CHECK(engine.max_inflight <= 2);

    // Every job saw its chunks in index order.
    std::map<float, int32_t> next;
    for (const auto & c : engine.calls()) {
        CHECK(c.chunk_index == next[c.tag]);
        next[c.tag] = c.chunk_index + 1;
    }
    CHECK(next.size() == 6);
}

TEST_CASE("engine without batched occupancy is called one chunk at a time", "[scheduler]") {
    fake_voice_model_engine::options opt;
    opt.call_delay_ms = 10;
    fake_voice_model_engine engine(opt);
    conversion_scheduler scheduler(engine, 3);
    REQUIRE(scheduler.serializes_engine());

    std::vector<std::shared_ptr<conversion_job>> jobs;
    seedvc_error err;
    for (int i = 0; i < 3; ++i) {
        jobs.push_back(make_job((uint64_t) i + 1, (float) (i + 1), 4));
        REQUIRE(scheduler.submit(jobs.back(), err));
    }
    for (auto & j : jobs) {
        j->wait();
        CHECK(j->state() == CONVERSION_JOB_SUCCEEDED);
    }

    CHECK(engine.max_inflight == 1);
    CHECK(scheduler.peak_active_jobs() <= 3);
}

TEST_CASE("queued job can be cancelled, running job cannot", "[scheduler]") {
    fake_voice_model_engine::options opt;
    opt.call_delay_ms = 100;
    fake_voice_model_engine engine(opt);
    conversion_scheduler scheduler(engine, 1);

    auto running = make_job(1, 1.0f, 2);
    auto queued = make_job(2, 2.0f, 2);
    seedvc_error err;
    REQUIRE(scheduler.submit(running, err));
    REQUIRE(wait_until_running(*running));
    REQUIRE(scheduler.submit(queued, err));
    CHECK(scheduler.queued_jobs() == 1);

    CHECK_FALSE(scheduler.cancel(running));
    CHECK(scheduler.cancel(queued));
    CHECK(queued->state() == CONVERSION_JOB_CANCELLED);
    CHECK(queued->error().kind == SEEDVC_ERROR_PROCESSING);
    CHECK(scheduler.queued_jobs() == 0);

    running->wait();
    CHECK(running->state() == CONVERSION_JOB_SUCCEEDED);

    // The cancelled job never reached the engine.
    for (const auto & c : engine.calls()) {
        CHECK(c.tag == 1.0f);
    }
    CHECK(engine.prepare_calls == 1);
}

TEST_CASE("chunk failure fails the job and discards partial output", "[scheduler]") {
    fake_voice_model_engine::options opt;
    opt.fail_on_chunk = 1;
    fake_voice_model_engine engine(opt);
    conversion_scheduler scheduler(engine, 1);

    auto job = make_job(1, 1.0f, 3);
    seedvc_error err;
    REQUIRE(scheduler.submit(job, err));
    job->wait();

    REQUIRE(job->state() == CONVERSION_JOB_FAILED);
    const seedvc_error e = job->error();
    CHECK(e.kind == SEEDVC_ERROR_PROCESSING);
    CHECK(e.message == "chunk 2/3 failed: synthetic engine failure");
    CHECK(job->streaming_snapshot().empty());
    CHECK(engine.convert_calls == 2);
}

TEST_CASE("failing job does not disturb the next one", "[scheduler]") {
    fake_voice_model_engine::options opt;
    opt.fail_on_chunk = 2;
    fake_voice_model_engine engine(opt);
    conversion_scheduler scheduler(engine, 1);

    auto bad = make_job(1, 1.0f, 3);
    auto good = make_job(2, 2.0f, 2);
    seedvc_error err;
    REQUIRE(scheduler.submit(bad, err));
    REQUIRE(scheduler.submit(good, err));
    bad->wait();
    good->wait();
    CHECK(bad->state() == CONVERSION_JOB_FAILED);
    CHECK(good->state() == CONVERSION_JOB_SUCCEEDED);
}

TEST_CASE("engine exception mid-job fails only that job", "[scheduler]") {
    fake_voice_model_engine::options opt;
    opt.throw_on_chunk = 2;
    fake_voice_model_engine engine(opt);
    conversion_scheduler scheduler(engine, 1);

    auto bad = make_job(1, 1.0f, 3);
    auto good = make_job(2, 2.0f, 2);
    seedvc_error err;
    REQUIRE(scheduler.submit(bad, err));
    REQUIRE(scheduler.submit(good, err));

    // The worker survives and the engine lock is released for the next job.
    REQUIRE(bad->wait_for(std::chrono::seconds(10)));
    REQUIRE(good->wait_for(std::chrono::seconds(10)));

    REQUIRE(bad->state() == CONVERSION_JOB_FAILED);
    const seedvc_error e = bad->error();
    CHECK(e.kind == SEEDVC_ERROR_PROCESSING);
    CHECK(e.message == "chunk 3/3 failed: CUDA out of memory");
    CHECK(bad->streaming_snapshot().empty());
    CHECK(good->state() == CONVERSION_JOB_SUCCEEDED);
}

TEST_CASE("engine exception while preparing the reference fails the job", "[scheduler]") {
    fake_voice_model_engine::options opt;
    opt.throw_on_prepare = true;
    fake_voice_model_engine engine(opt);
    conversion_scheduler scheduler(engine, 1);

    auto job = make_job(1, 1.0f, 2);
    seedvc_error err;
    REQUIRE(scheduler.submit(job, err));
    REQUIRE(job->wait_for(std::chrono::seconds(10)));

    REQUIRE(job->state() == CONVERSION_JOB_FAILED);
    CHECK(job->error().kind == SEEDVC_ERROR_PROCESSING);
    CHECK(job->error().message == "reference preparation failed: CUDA out of memory");
    CHECK(engine.convert_calls == 0);
}

TEST_CASE("throwing chunk callback fails the job without killing the worker", "[scheduler]") {
    fake_voice_model_engine engine(fake_voice_model_engine::options{});
    conversion_scheduler scheduler(engine, 1);

    auto job = make_job(1, 1.0f, 3);
    job->set_chunk_callback([](const conversion_job &, int32_t chunk_index) {
        if (chunk_index == 1) {
            throw std::runtime_error("client went away");
        }
    });
    auto next = make_job(2, 2.0f, 1);

    seedvc_error err;
    REQUIRE(scheduler.submit(job, err));
    REQUIRE(scheduler.submit(next, err));
    REQUIRE(job->wait_for(std::chrono::seconds(10)));
    REQUIRE(next->wait_for(std::chrono::seconds(10)));

    REQUIRE(job->state() == CONVERSION_JOB_FAILED);
    CHECK(job->error().message == "chunk 2 callback failed: client went away");
    CHECK(next->state() == CONVERSION_JOB_SUCCEEDED);
}

TEST_CASE("chunk callback sees a growing streaming prefix", "[scheduler]") {
    fake_voice_model_engine engine(fake_voice_model_engine::options{});
    conversion_scheduler scheduler(engine, 1);

    auto job = make_job(1, 1.0f, 4);
    std::vector<int32_t> indices;
    std::vector<size_t> sizes;
    job->set_chunk_callback([&](const conversion_job & j, int32_t chunk_index) {
        indices.push_back(chunk_index);
        sizes.push_back(j.streaming_samples());
    });

    seedvc_error err;
    REQUIRE(scheduler.submit(job, err));
    job->wait();
    REQUIRE(job->state() == CONVERSION_JOB_SUCCEEDED);

    CHECK(indices == std::vector<int32_t>{0, 1, 2, 3});
    REQUIRE(sizes.size() == 4);
    for (size_t i = 1; i < sizes.size(); ++i) {
        CHECK(sizes[i] > sizes[i - 1]);
    }
    CHECK(sizes.back() < job->result().full.size());
    CHECK(job->streaming_samples() == job->result().full.size());
    CHECK(job->streaming_since(sizes[0]).size() == job->result().full.size() - sizes[0]);
}

TEST_CASE("submit fails while the engine is not loaded", "[scheduler]") {
    fake_voice_model_engine::options opt;
    opt.loaded = false;
    fake_voice_model_engine engine(opt);
    conversion_scheduler scheduler(engine, 1);

    auto job = make_job(1, 1.0f, 1);
    seedvc_error err;
    REQUIRE_FALSE(scheduler.submit(job, err));
    CHECK(err.kind == SEEDVC_ERROR_MODEL_UNAVAILABLE);
    CHECK(err.message == "models not loaded: fake engine is offline");
    CHECK(engine.prepare_calls == 0);
}

TEST_CASE("shutdown cancels queued jobs", "[scheduler]") {
    fake_voice_model_engine::options opt;
    opt.call_delay_ms = 50;
    fake_voice_model_engine engine(opt);
    conversion_scheduler scheduler(engine, 1);

    auto first = make_job(1, 1.0f, 2);
    auto second = make_job(2, 2.0f, 2);
    seedvc_error err;
    REQUIRE(scheduler.submit(first, err));
    REQUIRE(wait_until_running(*first));
    REQUIRE(scheduler.submit(second, err));

    scheduler.shutdown();
    CHECK(first->state() == CONVERSION_JOB_SUCCEEDED);
    CHECK(second->state() == CONVERSION_JOB_CANCELLED);

    auto late = make_job(3, 3.0f, 1);
    CHECK_FALSE(scheduler.submit(late, err));
}
