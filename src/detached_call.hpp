#pragma once

#include "incidentguard/call_tracker.hpp"

#include <exception>
#include <future>
#include <memory>
#include <thread>

namespace incidentguard::detail {

// Runs fn on a detached thread and returns a future for its result.
// The caller bounds the wait with wait_until(); a call that overruns keeps
// running to completion on its own thread, so fn must own everything it
// touches. The caller acquires a slot on `tracker` first; the thread
// releases it when fn returns.
template <typename Fn>
auto launch_detached(Fn fn, std::shared_ptr<CallTracker> tracker) -> std::future<decltype(fn())> {
    using Result = decltype(fn());
    auto promise = std::make_shared<std::promise<Result>>();
    auto future = promise->get_future();

    struct SlotGuard {
        std::shared_ptr<CallTracker> tracker;
        ~SlotGuard() { if (tracker) tracker->release(); }
    };

    try {
        std::thread([promise, fn = std::move(fn), tracker]() mutable {
            SlotGuard slot{std::move(tracker)};
            try {
                promise->set_value(fn());
            } catch (...) {
                // Forwarded to whoever calls get()
                promise->set_exception(std::current_exception());
            }
        }).detach();
    } catch (...) {
        if (tracker) tracker->release();
        throw;
    }

    return future;
}

} // namespace incidentguard::detail
