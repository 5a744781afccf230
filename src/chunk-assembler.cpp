#include "chunk-assembler.h"

#include <algorithm>
#include <cmath>
#include <cstddef>

chunk_assembler::chunk_assembler(int32_t crossfade_samples)
    : crossfade_samples_(std::max<int32_t>(0, crossfade_samples)) {
}

void chunk_assembler::append(const std::vector<float> & chunk) {
    if (finished_) {
        return;
    }

    std::vector<float> buf;
    if (n_chunks_ == 0) {
        buf = chunk;
    } else {
        const size_t L = std::min(tail_.size(), chunk.size());
        const size_t head = tail_.size() - L;
        committed_.insert(committed_.end(), tail_.begin(), tail_.begin() + (std::ptrdiff_t) head);

        buf.resize(chunk.size());
        const double half_pi = 1.57079632679489661923;
        for (size_t i = 0; i < L; ++i) {
            const double t = ((double) i + 0.5) / (double) L;
            const double g_out = std::cos(t * half_pi);
            const double g_in = std::sin(t * half_pi);
            buf[i] = (float) (tail_[head + i] * g_out + chunk[i] * g_in);
        }
        std::copy(chunk.begin() + (std::ptrdiff_t) L, chunk.end(), buf.begin() + (std::ptrdiff_t) L);
    }
    ++n_chunks_;

    const size_t hold = std::min(buf.size(), (size_t) crossfade_samples_);
    committed_.insert(committed_.end(), buf.begin(), buf.end() - (std::ptrdiff_t) hold);
    tail_.assign(buf.end() - (std::ptrdiff_t) hold, buf.end());
}

void chunk_assembler::finish() {
    if (finished_) {
        return;
    }
    committed_.insert(committed_.end(), tail_.begin(), tail_.end());
    tail_.clear();
    finished_ = true;
}

void chunk_assembler::reset() {
    committed_.clear();
    committed_.shrink_to_fit();
    tail_.clear();
    n_chunks_ = 0;
    finished_ = false;
}

std::vector<float> seedvc_assemble_chunks(const std::vector<std::vector<float>> & chunks, int32_t crossfade_samples) {
    chunk_assembler assembler(crossfade_samples);
    for (const auto & c : chunks) {
        assembler.append(c);
    }
    assembler.finish();
    return assembler.committed();
}
