#pragma once

#include "logging_response_event_factory.hpp"
#include "statistics_response_event_factory.hpp"
#include <memory>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace snmpkit::event {

struct ResponseEventFactoryConfig {
    bool logging_enabled = false;
    LogLevel log_level = LogLevel::DEBUG;
    bool statistics_enabled = false;
};

/*
 * Builds the factory chain described by the "response_event_factory"
 * section of a JSON config file:
 *   Default <- Statistics (optional) <- Logging (optional)
 */
class ResponseEventFactoryLoader {
public:
    ResponseEventFactoryLoader() = default;

    bool load(const std::string& config_path);
    bool load_from_json(const nlohmann::json& json_config);

    /**
     * @brief Creates a new factory chain from the loaded configuration.
     * @param log_out Stream used by the logging factory.
     */
    std::shared_ptr<IResponseEventFactory> create_factory(std::ostream& log_out = std::cerr);

    // The statistics factory of the last created chain, or nullptr if disabled.
    std::shared_ptr<StatisticsResponseEventFactory> get_statistics_factory() const { return statistics_factory_; }

    const ResponseEventFactoryConfig& get_config() const { return config_; }

private:
    ResponseEventFactoryConfig config_;
    std::shared_ptr<StatisticsResponseEventFactory> statistics_factory_;
};

} // namespace snmpkit::event
