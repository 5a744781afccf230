#pragma once

#include <mutex>
#include <string>
#include <utility>
#include <vector>

// Files produced on behalf of one job. Everything not explicitly retained is
// removed when the set is destroyed, whichever way the job ended.
class temp_artifact_set {
public:
    temp_artifact_set() = default;
    ~temp_artifact_set();

    temp_artifact_set(const temp_artifact_set &) = delete;
    temp_artifact_set & operator=(const temp_artifact_set &) = delete;

    void add(const std::string & path);
    void retain(const std::string & path);
    void retain_all();

    // Removes every non-retained file now. Returns how many were deleted.
    size_t remove_unretained();

    std::vector<std::string> paths() const;

private:
    mutable std::mutex mtx_;
    std::vector<std::pair<std::string, bool>> entries_; // path, retained
};
