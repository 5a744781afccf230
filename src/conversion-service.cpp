#include "conversion-service.h"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <utility>

audio_input_info seedvc_describe_asset(const audio_asset & asset) {
    audio_input_info info;
    info.duration_sec = asset.duration_sec();
    info.sample_rate = asset.native_sample_rate;
    info.channels = asset.native_channels;
    info.file_size = asset.byte_size;
    info.file_format = seedvc_container_to_cstr(asset.container);
    return info;
}

conversion_service::conversion_service(
        voice_model_engine & engine,
        conversion_scheduler & scheduler,
        const service_config & cfg)
    : engine_(engine), scheduler_(scheduler), cfg_(cfg) {
}

segmenter_params conversion_service::make_segmenter_params() const {
    const engine_info & info = engine_.info();
    segmenter_params p = seedvc_segmenter_default_params(info.sample_rate, info.max_chunk_samples);
    p.silence_threshold_db = cfg_.silence_threshold_db;
    p.min_silence_samples = (int64_t) ((double) cfg_.min_silence_seconds * info.sample_rate);
    p.search_window_samples = std::min<int64_t>(
            (int64_t) ((double) cfg_.search_window_seconds * info.sample_rate),
            info.max_chunk_samples / 2);
    return p;
}

int32_t conversion_service::crossfade_samples() const {
    return std::max<int32_t>(0, cfg_.crossfade_hops) * engine_.info().hop_size;
}

std::string conversion_service::make_output_path(uint64_t job_id, const char * kind, seedvc_output_format format) const {
    std::filesystem::path dir(cfg_.output_dir.empty() ? "/tmp" : cfg_.output_dir);
    return (dir / ("seedvc-" + std::to_string(job_id) + "-" + std::to_string(seedvc_now_ms()) + "-" + kind + "." +
                   seedvc_output_format_to_cstr(format))).string();
}

conversion_response conversion_service::convert(const conversion_inputs & in, const conversion_observer * observer) {
    const auto t_begin = std::chrono::steady_clock::now();
    const conversion_params & params = in.params;

    conversion_response rsp;
    rsp.output_format = seedvc_output_format_to_cstr(params.output_format);
    rsp.streaming_format = seedvc_output_format_to_cstr(cfg_.streaming_format);

    std::shared_ptr<conversion_job> job;

    auto fail = [&](const seedvc_error & e) {
        if (job && !params.cleanup_temp_files) {
            job->artifacts().retain_all();
        }
        rsp.success = false;
        rsp.error = e;
        rsp.message = e.message;
        rsp.processing_time_sec = seedvc_ms_since(t_begin, std::chrono::steady_clock::now()) / 1000.0;
        std::fprintf(stderr, "convert: job=%llu ok=0 kind=%s error=\"%s\" total_ms=%.1f\n",
                (unsigned long long) rsp.job_id, seedvc_error_kind_to_cstr(e.kind), e.message.c_str(),
                rsp.processing_time_sec * 1000.0);
        return rsp;
    };

    seedvc_error err;
    if (!seedvc_validate_conversion_params(params, err)) {
        return fail(err);
    }
    if (!engine_.is_loaded()) {
        err.set(SEEDVC_ERROR_MODEL_UNAVAILABLE, "models not loaded: " + engine_.load_error());
        return fail(err);
    }

    audio_source src;
    audio_source ref;
    if (!seedvc_select_audio_source(in.source, "source", src, err) ||
        !seedvc_select_audio_source(in.reference, "reference", ref, err)) {
        return fail(err);
    }

    const int32_t sample_rate = engine_.info().sample_rate;
    audio_asset src_asset;
    audio_asset ref_asset;
    if (!seedvc_resolve_audio_asset(src, sample_rate, src_asset, err)) {
        err.message = "source audio: " + err.message;
        return fail(err);
    }
    if (!seedvc_resolve_audio_asset(ref, sample_rate, ref_asset, err)) {
        err.message = "reference audio: " + err.message;
        return fail(err);
    }

    conversion_request request;
    if (!seedvc_make_conversion_request(std::move(src_asset), std::move(ref_asset), params, cfg_.limits, request, err)) {
        return fail(err);
    }
    rsp.has_input_info = true;
    rsp.source_info = seedvc_describe_asset(request.source);
    rsp.reference_info = seedvc_describe_asset(request.reference);

    std::vector<audio_chunk> chunks;
    if (!seedvc_segment_audio(request.source.samples, make_segmenter_params(), chunks, err)) {
        return fail(err);
    }
    request.source.samples.clear();
    request.source.samples.shrink_to_fit();

    rsp.job_id = next_job_id_.fetch_add(1);
    job = std::make_shared<conversion_job>(
            rsp.job_id, std::move(chunks), std::move(request.reference.samples),
            request.params, sample_rate, crossfade_samples());
    if (observer != nullptr && observer->on_chunk) {
        job->set_chunk_callback(observer->on_chunk);
    }

    if (!scheduler_.submit(job, err)) {
        return fail(err);
    }
    if (observer != nullptr && observer->on_submitted) {
        observer->on_submitted(job);
    }

    while (!job->wait_for(std::chrono::milliseconds(100))) {
        if (observer != nullptr && observer->is_cancelled &&
            job->state() == CONVERSION_JOB_QUEUED && observer->is_cancelled()) {
            if (scheduler_.cancel(job)) {
                break;
            }
        }
    }

    if (job->state() != CONVERSION_JOB_SUCCEEDED) {
        return fail(job->error());
    }

    const conversion_result & res = job->result();
    rsp.n_chunks = res.n_chunks;
    rsp.sample_rate = res.sample_rate;
    rsp.wait_ms = res.wait_ms;
    rsp.run_ms = res.run_ms;
    rsp.output_duration_sec = res.sample_rate > 0 ? (double) res.full.size() / res.sample_rate : 0.0;

    if (cfg_.keep_waveforms) {
        rsp.full_waveform = res.full;
        rsp.streaming_waveform = res.streaming;
    }

    if (cfg_.produce_artifacts) {
        std::vector<uint8_t> full_bytes;
        std::vector<uint8_t> stream_bytes;
        if (!seedvc_encode_waveform(res.full, res.sample_rate, params.output_format, full_bytes, err) ||
            !seedvc_encode_waveform(res.streaming, res.sample_rate, cfg_.streaming_format, stream_bytes, err)) {
            return fail(err);
        }

        // base64 with cleanup enabled is served from memory only.
        const bool write_files = !params.return_base64 || !params.cleanup_temp_files;
        if (write_files) {
            const std::string full_path = make_output_path(rsp.job_id, "full", params.output_format);
            const std::string stream_path = make_output_path(rsp.job_id, "stream", cfg_.streaming_format);
            job->artifacts().add(full_path);
            job->artifacts().add(stream_path);

            std::string io_err;
            if (!seedvc_save_binary_file(full_path, full_bytes, io_err) ||
                !seedvc_save_binary_file(stream_path, stream_bytes, io_err)) {
                err.set(SEEDVC_ERROR_IO, io_err);
                return fail(err);
            }
            job->artifacts().retain(full_path);
            job->artifacts().retain(stream_path);
            rsp.full_output_path = full_path;
            rsp.streaming_output_path = stream_path;
        }
        if (params.return_base64) {
            rsp.full_output_base64 = seedvc_base64_encode(full_bytes);
            rsp.streaming_output_base64 = seedvc_base64_encode(stream_bytes);
        }
    }

    rsp.success = true;
    rsp.message = "Voice conversion completed successfully";
    rsp.processing_time_sec = seedvc_ms_since(t_begin, std::chrono::steady_clock::now()) / 1000.0;

    std::fprintf(stderr,
            "convert: job=%llu ok=1 chunks=%d src_sec=%.2f ref_sec=%.2f out_sec=%.2f format=%s wait_ms=%.1f run_ms=%.1f total_ms=%.1f\n",
            (unsigned long long) rsp.job_id, rsp.n_chunks,
            rsp.source_info.duration_sec, rsp.reference_info.duration_sec, rsp.output_duration_sec,
            rsp.output_format.c_str(), rsp.wait_ms, rsp.run_ms, rsp.processing_time_sec * 1000.0);

    return rsp;
}
