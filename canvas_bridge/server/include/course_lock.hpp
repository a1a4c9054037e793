#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace canvas::server {

// One mutex per course id, shared by every job in the process. Entries are
// never erased so a returned lock always refers to a live mutex.
class CourseLockTable {
public:
    std::unique_lock<std::mutex> acquire(const std::string& course_id) {
        std::mutex* course_mutex = nullptr;
        {
            std::lock_guard<std::mutex> lock(table_mutex_);
            auto& slot = locks_[course_id];
            if (!slot) {
                slot = std::make_unique<std::mutex>();
            }
            course_mutex = slot.get();
        }
        return std::unique_lock<std::mutex>(*course_mutex);
    }

private:
    std::mutex table_mutex_;
    std::map<std::string, std::unique_ptr<std::mutex>> locks_;
};

}  // namespace canvas::server
