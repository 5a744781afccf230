#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

// Joins converted chunks with a constant-power cross-fade at each internal
// boundary. The last crossfade_samples of the newest chunk are held back
// because the next boundary may still blend them; everything before that is
// committed and forms the streaming prefix. Not thread-safe.
class chunk_assembler {
public:
    explicit chunk_assembler(int32_t crossfade_samples);

    void append(const std::vector<float> & chunk);

    // Commits the held-back tail. committed() equals the full output afterwards.
    void finish();

    // Drops all audio, e.g. when the owning job fails.
    void reset();

    const std::vector<float> & committed() const { return committed_; }
    size_t pending_samples() const { return tail_.size(); }
    size_t total_samples() const { return committed_.size() + tail_.size(); }
    int32_t n_chunks() const { return n_chunks_; }
    int32_t crossfade_samples() const { return crossfade_samples_; }
    bool finished() const { return finished_; }

private:
    int32_t crossfade_samples_ = 0;
    int32_t n_chunks_ = 0;
    bool finished_ = false;

    std::vector<float> committed_;
    std::vector<float> tail_;
};

std::vector<float> seedvc_assemble_chunks(const std::vector<std::vector<float>> & chunks, int32_t crossfade_samples);
