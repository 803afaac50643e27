/**
 * @file job_queue.cpp
 * @brief Implementation of the transfer job queue
 */

#include <kcenon/file_ripper/core/job_queue.h>

#include <utility>

namespace kcenon::file_ripper {

void job_queue::add(transfer_job job) {
    std::lock_guard<std::mutex> lock(mutex_);
    jobs_.push_back(std::move(job));
    ++added_;
}

auto job_queue::pop() -> std::optional<transfer_job> {
    std::lock_guard<std::mutex> lock(mutex_);
    if (jobs_.empty()) {
        return std::nullopt;
    }

    transfer_job job = std::move(jobs_.front());
    jobs_.pop_front();
    ++popped_;
    return job;
}

auto job_queue::count() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_.size();
}

auto job_queue::empty() const -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_.empty();
}

auto job_queue::added_count() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return added_;
}

auto job_queue::popped_count() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return popped_;
}

}  // namespace kcenon::file_ripper
