#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace canvas::server {

// Only the first errors are echoed to clients and the run report.
inline constexpr std::size_t kMaxReportedErrors = 20;

struct CourseStats {
    std::size_t downloaded = 0;
    std::size_t skipped = 0;
    std::size_t failed = 0;
    std::size_t uploaded = 0;
    std::size_t upload_skipped = 0;
    std::size_t upload_failed = 0;
    std::uint64_t bytes = 0;
    std::vector<std::string> errors;

    std::size_t processed() const { return downloaded + skipped + failed; }

    void record_error(std::string message) {
        if (errors.size() < kMaxReportedErrors) {
            errors.push_back(std::move(message));
        }
    }
};

}  // namespace canvas::server
