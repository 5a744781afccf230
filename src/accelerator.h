#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

struct accelerator_device {
    std::string name;
    std::string description;
    size_t memory_free = 0;
    size_t memory_total = 0;
};

// Loads the ggml backends once and routes ggml's log through stderr,
// keeping warnings and errors only.
void seedvc_accelerator_init();

// GPU and integrated-GPU devices known to ggml, in registry order.
std::vector<accelerator_device> seedvc_list_accelerators();

// Worker count that fits the free accelerator memory: free / per-job bytes,
// clamped to [1, max_jobs]. 1 without an accelerator or a per-job estimate.
int32_t seedvc_default_parallel_jobs(
        const std::vector<accelerator_device> & devices,
        uint64_t job_workspace_bytes,
        int32_t max_jobs = 8);

// Name of the first accelerator, or "cpu".
std::string seedvc_default_device_name(const std::vector<accelerator_device> & devices);
