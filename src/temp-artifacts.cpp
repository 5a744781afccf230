#include "temp-artifacts.h"

#include <cstdio>
#include <filesystem>

temp_artifact_set::~temp_artifact_set() {
    remove_unretained();
}

void temp_artifact_set::add(const std::string & path) {
    if (path.empty()) {
        return;
    }
    std::lock_guard<std::mutex> lock(mtx_);
    for (const auto & e : entries_) {
        if (e.first == path) {
            return;
        }
    }
    entries_.emplace_back(path, false);
}

void temp_artifact_set::retain(const std::string & path) {
    std::lock_guard<std::mutex> lock(mtx_);
    for (auto & e : entries_) {
        if (e.first == path) {
            e.second = true;
        }
    }
}

void temp_artifact_set::retain_all() {
    std::lock_guard<std::mutex> lock(mtx_);
    for (auto & e : entries_) {
        e.second = true;
    }
}

size_t temp_artifact_set::remove_unretained() {
    std::lock_guard<std::mutex> lock(mtx_);
    size_t n_removed = 0;
    std::vector<std::pair<std::string, bool>> kept;
    for (const auto & e : entries_) {
        if (e.second) {
            kept.push_back(e);
            continue;
        }
        std::error_code ec;
        if (std::filesystem::remove(e.first, ec)) {
            ++n_removed;
        } else if (ec) {
            std::fprintf(stderr, "warning: failed to remove temp file %s: %s\n", e.first.c_str(), ec.message().c_str());
        }
    }
    entries_.swap(kept);
    return n_removed;
}

std::vector<std::string> temp_artifact_set::paths() const {
    std::lock_guard<std::mutex> lock(mtx_);
    std::vector<std::string> out;
    out.reserve(entries_.size());
    for (const auto & e : entries_) {
        out.push_back(e.first);
    }
    return out;
}
