#include "snmpkit/event/response_event_factory_loader.hpp"
#include "nlohmann/json.hpp"
#include <fstream>
#include <iostream>

namespace snmpkit::event {

bool ResponseEventFactoryLoader::load(const std::string& config_path) {
    std::ifstream ifs(config_path);
    if (!ifs.is_open()) {
        std::cerr << "ERROR: Failed to open response event config file: " << config_path << std::endl;
        return false;
    }
    nlohmann::json json_config;
    try {
        ifs >> json_config;
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "ERROR: Failed to parse response event config JSON: " << e.what() << std::endl;
        return false;
    }
    return load_from_json(json_config);
}

bool ResponseEventFactoryLoader::load_from_json(const nlohmann::json& json_config) {
    ResponseEventFactoryConfig config;
    try {
        if (!json_config.is_object()) {
            std::cerr << "ERROR: Response event config must be a JSON object." << std::endl;
            return false;
        }
        if (!json_config.contains("response_event_factory")) {
            std::cout << "INFO: No response_event_factory section, using the default factory." << std::endl;
            config_ = config;
            return true;
        }
        const auto& factory_config = json_config.at("response_event_factory");

        if (factory_config.contains("logging")) {
            const auto& logging = factory_config.at("logging");
            config.logging_enabled = logging.value("enabled", false);
            std::string level = logging.value("level", std::string(to_string(LogLevel::DEBUG)));
            if (!parse_log_level(level, config.log_level)) {
                std::cerr << "ERROR: Unknown log level: " << level << std::endl;
                return false;
            }
        }
        if (factory_config.contains("statistics")) {
            config.statistics_enabled = factory_config.at("statistics").value("enabled", false);
        }
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "ERROR: Malformed response event config JSON: " << e.what() << std::endl;
        return false;
    }
    config_ = config;
    return true;
}

std::shared_ptr<IResponseEventFactory> ResponseEventFactoryLoader::create_factory(std::ostream& log_out) {
    std::shared_ptr<IResponseEventFactory> factory = std::make_shared<DefaultResponseEventFactory>();
    statistics_factory_.reset();

    if (config_.statistics_enabled) {
        statistics_factory_ = std::make_shared<StatisticsResponseEventFactory>(factory);
        factory = statistics_factory_;
    }
    if (config_.logging_enabled) {
        factory = std::make_shared<LoggingResponseEventFactory>(factory, config_.log_level, log_out);
    }
    std::cout << "INFO: Created response event factory (statistics="
              << (config_.statistics_enabled ? "on" : "off")
              << ", logging=" << (config_.logging_enabled ? to_string(config_.log_level) : "off")
              << ")" << std::endl;
    return factory;
}

} // namespace snmpkit::event
