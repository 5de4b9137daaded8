#include <catch2/catch_all.hpp>
#include "torlink/util/logging.hpp"

using namespace torlink::util;

TEST_CASE("Log level parsing", "[logging][unit]") {
    CHECK(parse_log_level("trace") == LogLevel::Trace);
    CHECK(parse_log_level("WARN") == LogLevel::Warn);
    CHECK(parse_log_level("warning") == LogLevel::Warn);
    CHECK(parse_log_level("off") == LogLevel::Off);
    CHECK_FALSE(parse_log_level("loud").has_value());
}

TEST_CASE("Logger filtering", "[logging][unit]") {
    Logger logger("test");
    auto sink = std::make_shared<MemorySink>();
    logger.add_sink(sink);
    logger.set_level(LogLevel::Info);

    logger.debug("hidden {}", 1);
    logger.info("shown {}", 2);
    logger.error("cell {} failed", "CERTS");

    auto records = sink->records();
    REQUIRE(records.size() == 2);
    CHECK(records[0].level == LogLevel::Info);
    CHECK(records[0].message == "shown 2");
    CHECK(records[0].category == "test");
    CHECK(records[1].message == "cell CERTS failed");

    SECTION("Formatted record carries level and category") {
        auto line = records[1].format();
        CHECK(line.find("[ERROR]") != std::string::npos);
        CHECK(line.find("[test]") != std::string::npos);
        CHECK(line.ends_with("cell CERTS failed"));
    }

    SECTION("Off disables everything") {
        sink->clear();
        logger.set_level(LogLevel::Off);
        logger.fatal("never");
        CHECK(sink->records().empty());
    }
}
