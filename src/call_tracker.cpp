#include "incidentguard/call_tracker.hpp"
#include "incidentguard/exceptions.hpp"

namespace incidentguard {

CallTracker::CallTracker(std::size_t limit)
    : limit_(limit)
{
    if (limit_ == 0) {
        throw InvalidConfigurationException("Outstanding call limit must be at least 1");
    }
}

bool CallTracker::try_acquire() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (outstanding_ >= limit_) {
        return false;
    }
    ++outstanding_;
    return true;
}

void CallTracker::release() noexcept {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (outstanding_ > 0) --outstanding_;
    }
    idle_cv_.notify_all();
}

std::size_t CallTracker::outstanding() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return outstanding_;
}

std::size_t CallTracker::limit() const noexcept {
    return limit_;
}

bool CallTracker::wait_idle(Timestamp deadline) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return idle_cv_.wait_until(lock, deadline, [this] { return outstanding_ == 0; });
}

} // namespace incidentguard
