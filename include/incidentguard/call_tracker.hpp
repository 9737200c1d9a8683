#pragma once

#include "incidentguard/types.hpp"

#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace incidentguard {

// Counts calls running on detached threads for one external capability.
// A provider or executor that ignores its deadline keeps its thread alive;
// the tracker caps how many such threads may pile up and lets shutdown
// wait for them.
class CallTracker {
public:
    explicit CallTracker(std::size_t limit);

    CallTracker(const CallTracker&) = delete;
    CallTracker& operator=(const CallTracker&) = delete;

    // Reserves a slot. False when `limit` calls are already outstanding.
    bool try_acquire();
    void release() noexcept;

    std::size_t outstanding() const;
    std::size_t limit() const noexcept;

    // True once no call is outstanding, false if `deadline` passed first
    bool wait_idle(Timestamp deadline) const;

private:
    std::size_t limit_;
    mutable std::mutex mutex_;
    mutable std::condition_variable idle_cv_;
    std::size_t outstanding_{0};
};

} // namespace incidentguard
