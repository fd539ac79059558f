#include <gtest/gtest.h>
#include "snmpkit/event/response_event_factory_loader.hpp"
#include "nlohmann/json.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

using namespace snmpkit::event;
using snmpkit::smi::Pdu;
using snmpkit::smi::PduType;

// Test fixture for loading the response event factory configuration
class ResponseEventFactoryLoaderTest : public ::testing::Test {
protected:
    const std::string config_dir_ = "tmp_response_event_configs";

    void SetUp() override {
        std::filesystem::create_directories(config_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(config_dir_, ec);
    }

    // Helper to create a config file
    void CreateConfigFile(const std::string& path, const std::string& content) {
        std::ofstream ofs(path);
        ASSERT_TRUE(ofs.is_open());
        ofs << content;
        ofs.close();
    }

    PduPtr make_request() {
        auto pdu = std::make_shared<Pdu>();
        pdu->type = PduType::GETNEXT;
        pdu->request_id = 9;
        return pdu;
    }
};

TEST_F(ResponseEventFactoryLoaderTest, MissingConfigFile) {
    ResponseEventFactoryLoader loader;
    ASSERT_FALSE(loader.load("non_existent_config.json"));
}

TEST_F(ResponseEventFactoryLoaderTest, MalformedJsonConfigFile) {
    const std::string config_path = config_dir_ + "/malformed.json";
    CreateConfigFile(config_path, "{ \"response_event_factory\": [ }");

    ResponseEventFactoryLoader loader;
    ASSERT_FALSE(loader.load(config_path));
}

TEST_F(ResponseEventFactoryLoaderTest, UnknownLogLevel) {
    const std::string config_path = config_dir_ + "/bad_level.json";
    CreateConfigFile(config_path, R"({
        "response_event_factory": {
            "logging": {"enabled": true, "level": "TRACE"}
        }
    })");

    ResponseEventFactoryLoader loader;
    ASSERT_FALSE(loader.load(config_path));
}

TEST_F(ResponseEventFactoryLoaderTest, WrongFieldType) {
    const std::string config_path = config_dir_ + "/wrong_type.json";
    CreateConfigFile(config_path, R"({
        "response_event_factory": {
            "statistics": {"enabled": "yes"}
        }
    })");

    ResponseEventFactoryLoader loader;
    ASSERT_FALSE(loader.load(config_path));
}

TEST_F(ResponseEventFactoryLoaderTest, NonObjectConfig) {
    ResponseEventFactoryLoader loader;
    ASSERT_FALSE(loader.load_from_json(nlohmann::json::array({1, 2, 3})));
}

TEST_F(ResponseEventFactoryLoaderTest, MissingSectionUsesDefaultFactory) {
    ResponseEventFactoryLoader loader;
    ASSERT_TRUE(loader.load_from_json(nlohmann::json::object()));

    auto factory = loader.create_factory();
    ASSERT_NE(std::dynamic_pointer_cast<DefaultResponseEventFactory>(factory), nullptr);
    ASSERT_EQ(loader.get_statistics_factory(), nullptr);
}

TEST_F(ResponseEventFactoryLoaderTest, FullChainFromFile) {
    const std::string config_path = config_dir_ + "/full.json";
    CreateConfigFile(config_path, R"({
        "response_event_factory": {
            "logging": {"enabled": true, "level": "INFO"},
            "statistics": {"enabled": true}
        }
    })");

    ResponseEventFactoryLoader loader;
    ASSERT_TRUE(loader.load(config_path));
    ASSERT_TRUE(loader.get_config().logging_enabled);
    ASSERT_EQ(loader.get_config().log_level, LogLevel::INFO);
    ASSERT_TRUE(loader.get_config().statistics_enabled);

    std::ostringstream log;
    auto factory = loader.create_factory(log);
    auto logging = std::dynamic_pointer_cast<LoggingResponseEventFactory>(factory);
    ASSERT_NE(logging, nullptr);
    ASSERT_EQ(logging->get_level(), LogLevel::INFO);
    ASSERT_EQ(logging->get_delegate(), loader.get_statistics_factory());

    int source = 0;
    auto event = factory->create_response_event(&source, std::nullopt, make_request(), nullptr, nullptr, 100, nullptr);
    ASSERT_TRUE(event->is_timeout());
    ASSERT_EQ(loader.get_statistics_factory()->get_statistics().timeout_count, 1u);
    ASSERT_NE(log.str().find(", timed out"), std::string::npos);
}

TEST_F(ResponseEventFactoryLoaderTest, StatisticsOnly) {
    ResponseEventFactoryLoader loader;
    ASSERT_TRUE(loader.load_from_json(nlohmann::json::parse(R"({
        "response_event_factory": {
            "logging": {"enabled": false},
            "statistics": {"enabled": true}
        }
    })")));

    auto factory = loader.create_factory();
    ASSERT_EQ(factory, loader.get_statistics_factory());
}
