#include "snmpkit/event/statistics_response_event_factory.hpp"
#include <limits>
#include <mutex>

namespace snmpkit::event {

static constexpr uint64_t NO_MIN_DURATION = std::numeric_limits<uint64_t>::max();

StatisticsResponseEventFactory::StatisticsResponseEventFactory(std::shared_ptr<IResponseEventFactory> delegate)
    : DelegatingResponseEventFactory(std::move(delegate)), min_duration_nanos_(NO_MIN_DURATION) {}

ResponseEventPtr StatisticsResponseEventFactory::create_response_event(
    const void* source,
    const std::optional<smi::TransportAddress>& peer_address,
    const PduPtr& request,
    const PduPtr& response,
    const UserObject& user_object,
    std::optional<uint64_t> duration_nanos,
    const std::exception_ptr& error) {
    auto event = delegate_->create_response_event(source, peer_address, request, response,
                                                  user_object, duration_nanos, error);
    record(event->get_kind(), duration_nanos);
    return event;
}

void StatisticsResponseEventFactory::record(OutcomeKind kind, std::optional<uint64_t> duration_nanos) {
    std::shared_lock<std::shared_mutex> lock(stats_mtx_);
    switch (kind) {
    case OutcomeKind::SUCCESS:
        success_count_.fetch_add(1, std::memory_order_relaxed);
        break;
    case OutcomeKind::TIMEOUT:
        timeout_count_.fetch_add(1, std::memory_order_relaxed);
        break;
    case OutcomeKind::ERROR:
        error_count_.fetch_add(1, std::memory_order_relaxed);
        break;
    case OutcomeKind::PARTIAL_ERROR:
        partial_error_count_.fetch_add(1, std::memory_order_relaxed);
        break;
    }
    if (!duration_nanos) {
        return;
    }
    uint64_t value = *duration_nanos;
    measured_count_.fetch_add(1, std::memory_order_relaxed);
    total_duration_nanos_.fetch_add(value, std::memory_order_relaxed);

    uint64_t current = min_duration_nanos_.load(std::memory_order_relaxed);
    while (value < current && !min_duration_nanos_.compare_exchange_weak(current, value, std::memory_order_relaxed)) {
    }
    current = max_duration_nanos_.load(std::memory_order_relaxed);
    while (value > current && !max_duration_nanos_.compare_exchange_weak(current, value, std::memory_order_relaxed)) {
    }
}

ResponseStatistics StatisticsResponseEventFactory::get_statistics() const {
    std::unique_lock<std::shared_mutex> lock(stats_mtx_);
    ResponseStatistics stats;
    stats.success_count = success_count_.load(std::memory_order_relaxed);
    stats.timeout_count = timeout_count_.load(std::memory_order_relaxed);
    stats.error_count = error_count_.load(std::memory_order_relaxed);
    stats.partial_error_count = partial_error_count_.load(std::memory_order_relaxed);
    stats.measured_count = measured_count_.load(std::memory_order_relaxed);
    stats.total_duration_nanos = total_duration_nanos_.load(std::memory_order_relaxed);
    uint64_t min_value = min_duration_nanos_.load(std::memory_order_relaxed);
    stats.min_duration_nanos = (min_value == NO_MIN_DURATION) ? 0 : min_value;
    stats.max_duration_nanos = max_duration_nanos_.load(std::memory_order_relaxed);
    return stats;
}

void StatisticsResponseEventFactory::reset() {
    std::unique_lock<std::shared_mutex> lock(stats_mtx_);
    success_count_.store(0, std::memory_order_relaxed);
    timeout_count_.store(0, std::memory_order_relaxed);
    error_count_.store(0, std::memory_order_relaxed);
    partial_error_count_.store(0, std::memory_order_relaxed);
    measured_count_.store(0, std::memory_order_relaxed);
    total_duration_nanos_.store(0, std::memory_order_relaxed);
    min_duration_nanos_.store(NO_MIN_DURATION, std::memory_order_relaxed);
    max_duration_nanos_.store(0, std::memory_order_relaxed);
}

} // namespace snmpkit::event
