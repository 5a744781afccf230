#include "accelerator.h"

#include "ggml.h"
#include "ggml-backend.h"

#include <algorithm>
#include <cstdio>
#include <mutex>

static void ggml_log_callback_seedvc(ggml_log_level level, const char * text, void * /* user_data */) {
    // Backend discovery is chatty at info level; keep startup logs short.
    if (level >= GGML_LOG_LEVEL_WARN) {
        std::fputs(text, stderr);
    }
}

void seedvc_accelerator_init() {
    static std::once_flag once;
    std::call_once(once, []() {
        ggml_log_set(ggml_log_callback_seedvc, nullptr);
        ggml_backend_load_all();
    });
}

std::vector<accelerator_device> seedvc_list_accelerators() {
    seedvc_accelerator_init();

    std::vector<accelerator_device> out;
    const size_t n_dev = ggml_backend_dev_count();
    for (size_t i = 0; i < n_dev; ++i) {
        ggml_backend_dev_t dev = ggml_backend_dev_get(i);
        if (dev == nullptr) {
            continue;
        }
        const auto type = ggml_backend_dev_type(dev);
        if (type != GGML_BACKEND_DEVICE_TYPE_GPU && type != GGML_BACKEND_DEVICE_TYPE_IGPU) {
            continue;
        }
        accelerator_device d;
        const char * name = ggml_backend_dev_name(dev);
        const char * desc = ggml_backend_dev_description(dev);
        d.name = name != nullptr ? name : "";
        d.description = desc != nullptr ? desc : "";
        ggml_backend_dev_memory(dev, &d.memory_free, &d.memory_total);
        out.push_back(std::move(d));
    }
    return out;
}

int32_t seedvc_default_parallel_jobs(
        const std::vector<accelerator_device> & devices,
        uint64_t job_workspace_bytes,
        int32_t max_jobs) {
    max_jobs = std::max<int32_t>(1, max_jobs);
    if (devices.empty() || job_workspace_bytes == 0) {
        return 1;
    }
    uint64_t free_bytes = 0;
    for (const auto & d : devices) {
        free_bytes += (uint64_t) d.memory_free;
    }
    const uint64_t fit = free_bytes / job_workspace_bytes;
    return (int32_t) std::clamp<uint64_t>(fit, 1, (uint64_t) max_jobs);
}

std::string seedvc_default_device_name(const std::vector<accelerator_device> & devices) {
    for (const auto & d : devices) {
        if (!d.name.empty()) {
            return d.name;
        }
    }
    return "cpu";
}
