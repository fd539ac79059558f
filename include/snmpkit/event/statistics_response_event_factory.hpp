#pragma once

#include "response_event_factory.hpp"
#include <atomic>
#include <cstdint>
#include <shared_mutex>

namespace snmpkit::event {

struct ResponseStatistics {
    uint64_t success_count = 0;
    uint64_t timeout_count = 0;
    uint64_t error_count = 0;
    uint64_t partial_error_count = 0;

    // Latency of outcomes with a measured duration
    uint64_t measured_count = 0;
    uint64_t total_duration_nanos = 0;
    uint64_t min_duration_nanos = 0;
    uint64_t max_duration_nanos = 0;

    uint64_t get_total_count() const {
        return success_count + timeout_count + error_count + partial_error_count;
    }
    uint64_t get_average_duration_nanos() const {
        return measured_count == 0 ? 0 : total_duration_nanos / measured_count;
    }
};

/**
 * @brief Counts outcomes by kind and accumulates response times, then delegates.
 *
 * Resolving threads update the counters concurrently with each other. get_statistics()
 * and reset() are exclusive with updates, so a snapshot never holds half a record.
 */
class StatisticsResponseEventFactory : public DelegatingResponseEventFactory {
public:
    explicit StatisticsResponseEventFactory(std::shared_ptr<IResponseEventFactory> delegate = nullptr);

    ResponseEventPtr create_response_event(
        const void* source,
        const std::optional<smi::TransportAddress>& peer_address,
        const PduPtr& request,
        const PduPtr& response,
        const UserObject& user_object,
        std::optional<uint64_t> duration_nanos,
        const std::exception_ptr& error) override;

    ResponseStatistics get_statistics() const;
    void reset();

private:
    std::atomic<uint64_t> success_count_{0};
    std::atomic<uint64_t> timeout_count_{0};
    std::atomic<uint64_t> error_count_{0};
    std::atomic<uint64_t> partial_error_count_{0};
    std::atomic<uint64_t> measured_count_{0};
    std::atomic<uint64_t> total_duration_nanos_{0};
    std::atomic<uint64_t> min_duration_nanos_;
    std::atomic<uint64_t> max_duration_nanos_{0};
    mutable std::shared_mutex stats_mtx_;

    void record(OutcomeKind kind, std::optional<uint64_t> duration_nanos);
};

} // namespace snmpkit::event
