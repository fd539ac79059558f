#pragma once

#include "response_event_factory.hpp"
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>

namespace snmpkit::event {

class IResponseListener {
public:
    virtual ~IResponseListener() = default;

    /**
     * @brief Called once when the request the listener was registered for is resolved.
     * May be called from a transport or timer thread.
     */
    virtual void on_response(const ResponseEventPtr& event) = 0;
};

class CallbackResponseListener : public IResponseListener {
public:
    using Callback = std::function<void(const ResponseEventPtr&)>;

    explicit CallbackResponseListener(Callback callback) : callback_(std::move(callback)) {}

    void on_response(const ResponseEventPtr& event) override {
        if (callback_) {
            callback_(event);
        }
    }

private:
    Callback callback_;
};

/*
 * Backs a blocking send-and-wait: keeps the first delivered event
 * and wakes the waiting thread.
 */
class SyncResponseListener : public IResponseListener {
public:
    void on_response(const ResponseEventPtr& event) override;

    /**
     * @brief Blocks until an event has been delivered or the timeout elapses.
     * @param timeout_usec Maximum time to wait in microseconds. Values above one year
     *        wait until an event is delivered.
     * @return The delivered event, or nullptr on timeout.
     */
    ResponseEventPtr wait(uint64_t timeout_usec);

    ResponseEventPtr get_response() const;

private:
    mutable std::mutex mtx_;
    std::condition_variable cv_;
    ResponseEventPtr response_;
};

} // namespace snmpkit::event
