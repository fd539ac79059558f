#include "snmpkit/event/response_listener.hpp"
#include <chrono>
#include <iostream>

namespace snmpkit::event {

// Longer timeouts wait without a deadline
static constexpr uint64_t MAX_TIMED_WAIT_USEC =
    static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::hours(24 * 365)).count());

void SyncResponseListener::on_response(const ResponseEventPtr& event) {
    if (!event) {
        std::cerr << "WARNING: Ignoring null response event." << std::endl;
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (response_) {
            std::cerr << "WARNING: Ignoring second response event for request "
                      << event->get_request()->request_id << std::endl;
            return;
        }
        response_ = event;
    }
    cv_.notify_all();
}

ResponseEventPtr SyncResponseListener::wait(uint64_t timeout_usec) {
    std::unique_lock<std::mutex> lock(mtx_);
    auto delivered = [this] { return response_ != nullptr; };
    if (timeout_usec > MAX_TIMED_WAIT_USEC) {
        cv_.wait(lock, delivered);
    } else {
        cv_.wait_for(lock, std::chrono::microseconds(static_cast<int64_t>(timeout_usec)), delivered);
    }
    return response_;
}

ResponseEventPtr SyncResponseListener::get_response() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return response_;
}

} // namespace snmpkit::event
