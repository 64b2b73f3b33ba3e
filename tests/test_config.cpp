#include <catch2/catch.hpp>

#include "core/Config.hpp"
#include "engine/EngineConfiguration.hpp"
#include "transport/HttpTransport.hpp"

#include <string>
#include <vector>

using downlink::core::Config;
using downlink::engine::EngineConfiguration;
using downlink::models::NetworkType;

namespace {

// Config is a process-wide singleton; every test starts from the defaults
struct ConfigReset {
    ConfigReset() { Config::instance().setDefaults(); }
    ~ConfigReset() { Config::instance().setDefaults(); }
};

} // namespace

TEST_CASE("Config defaults") {
    ConfigReset reset;
    auto& config = Config::instance();

    REQUIRE(config.get<int>("engine.concurrentLimit", -1) == 1);
    REQUIRE(config.get<std::string>("engine.globalNetworkType", "") == "global_off");
    REQUIRE(config.get<std::string>("logging.level", "") == "info");
    REQUIRE(config.has("transport.segments"));
    REQUIRE_FALSE(config.has("transport.proxy"));
}

TEST_CASE("Config falls back to the default on a missing key or another type") {
    ConfigReset reset;
    auto& config = Config::instance();

    REQUIRE(config.get<int>("engine.missing", 7) == 7);
    REQUIRE(config.get<int>("engine.namespace", 7) == 7);
}

TEST_CASE("Config overrides parse JSON values and keep plain text as strings") {
    ConfigReset reset;
    auto& config = Config::instance();

    auto rejected = config.applyOverrides({
        "engine.concurrentLimit=4",
        "logging.enabled=false",
        "engine.namespace=my.app",
        "noequals",
        "=5",
        "engine.concurrentLimit.extra=1"
    });

    REQUIRE(config.get<int>("engine.concurrentLimit", 0) == 4);
    REQUIRE(config.get<bool>("logging.enabled", true) == false);
    REQUIRE(config.get<std::string>("engine.namespace", "") == "my.app");
    REQUIRE(rejected == std::vector<std::string>{"noequals", "=5", "engine.concurrentLimit.extra=1"});
}

TEST_CASE("Config merges a JSON document over the defaults") {
    ConfigReset reset;
    auto& config = Config::instance();

    REQUIRE(config.loadFromString(R"({"engine": {"networkCheckIntervalMs": 100}})"));
    REQUIRE(config.get<int64_t>("engine.networkCheckIntervalMs", 0) == 100);
    REQUIRE(config.get<int>("engine.concurrentLimit", 0) == 1);

    REQUIRE_FALSE(config.loadFromString("[1, 2]"));
    REQUIRE_FALSE(config.loadFromString("{broken"));
}

TEST_CASE("Engine configuration reads the engine keys") {
    ConfigReset reset;
    auto& config = Config::instance();
    config.applyOverrides({
        "engine.namespace=tests.config",
        "engine.concurrentLimit=3",
        "engine.globalNetworkType=wifi_only",
        "engine.autoRetryMaxAttempts=2",
        "logging.enabled=false"
    });

    EngineConfiguration engine = EngineConfiguration::fromConfig(config);
    REQUIRE(engine.nameSpace == "tests.config");
    REQUIRE(engine.downloadConcurrentLimit == 3);
    REQUIRE(engine.globalNetworkType == NetworkType::WifiOnly);
    REQUIRE(engine.autoRetryMaxAttempts == 2);
    REQUIRE(engine.progressReportingIntervalMs == 2000);
    REQUIRE_FALSE(engine.loggingEnabled);
    REQUIRE_FALSE(engine.transport);
}

TEST_CASE("Unknown network type in the configuration keeps global_off") {
    ConfigReset reset;
    auto& config = Config::instance();
    config.set("engine.globalNetworkType", std::string("satellite"));

    REQUIRE(EngineConfiguration::fromConfig(config).globalNetworkType == NetworkType::GlobalOff);
}

TEST_CASE("Engine configuration fills in local collaborators") {
    EngineConfiguration engine;
    engine.catalogDirectory = "catalog";

    EngineConfiguration filled = engine.withDefaults();
    REQUIRE(filled.connectivity);
    REQUIRE(filled.fileSystem);
    REQUIRE(filled.persistenceFactory);
    REQUIRE_FALSE(engine.connectivity);
}

TEST_CASE("HTTP options read the transport keys") {
    ConfigReset reset;
    auto& config = Config::instance();
    config.applyOverrides({"transport.segments=0", "transport.userAgent=agent/2"});

    auto options = downlink::transport::HttpOptions::fromConfig(config);
    REQUIRE(options.segments == 1);
    REQUIRE(options.userAgent == "agent/2");
    REQUIRE(options.timeoutMs == 30000);
}
