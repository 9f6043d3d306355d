#include <catch2/catch.hpp>

#include "core/Logger.hpp"
#include "test_helpers.hpp"

#include <sstream>
#include <string>
#include <vector>

using namespace debris;

TEST_CASE("Log config sets default and facility levels", "[Logger]") {
    test::LoggerStateGuard guard;

    REQUIRE(Logger::parseLogConfig("4,ConvexHullBuilder=6"));
    REQUIRE(Logger::getDefaultLevel() == LogLevel::DETAILED);
    REQUIRE(Logger::getFacilityLevel("ConvexHullBuilder") == LogLevel::TRACE);
    REQUIRE(Logger::getFacilityLevel("ScaleNormalizer") == LogLevel::DETAILED);
}

TEST_CASE("Log config accepts default= and clamps levels", "[Logger]") {
    test::LoggerStateGuard guard;

    REQUIRE(Logger::parseLogConfig("default=2"));
    REQUIRE(Logger::getDefaultLevel() == LogLevel::WARNING);

    REQUIRE(Logger::parseLogConfig("9"));
    REQUIRE(Logger::getDefaultLevel() == LogLevel::TRACE);

    REQUIRE(Logger::parseLogConfig(""));
    REQUIRE(Logger::getDefaultLevel() == LogLevel::TRACE);
}

TEST_CASE("A log config with any invalid token changes nothing", "[Logger]") {
    test::LoggerStateGuard guard;
    Logger::setDefaultLevel(LogLevel::INFO);

    REQUIRE_FALSE(Logger::parseLogConfig("ScaleNormalizer=loud,STLExporter=5"));
    REQUIRE(Logger::getFacilityLevel("STLExporter") == LogLevel::INFO);
    REQUIRE(Logger::getFacilityLevel("ScaleNormalizer") == LogLevel::INFO);

    REQUIRE_FALSE(Logger::parseLogConfig("6,Foo=x"));
    REQUIRE(Logger::getDefaultLevel() == LogLevel::INFO);
    REQUIRE(Logger::getFacilityLevel("Foo") == LogLevel::INFO);
}

TEST_CASE("Facility level takes precedence over instance level", "[Logger]") {
    test::LoggerStateGuard guard;
    Logger::setDefaultLevel(LogLevel::INFO);

    Logger logger("MeshAdapter");
    REQUIRE(logger.shouldOutput(LogLevel::INFO));
    REQUIRE_FALSE(logger.shouldOutput(LogLevel::SILENT));

    logger.setLogLevel(LogLevel::ERROR);
    REQUIRE_FALSE(logger.shouldOutput(LogLevel::WARNING));

    Logger::setFacilityLevel("MeshAdapter", LogLevel::DEBUG);
    REQUIRE(logger.shouldOutput(LogLevel::DEBUG));
    REQUIRE_FALSE(logger.shouldOutput(LogLevel::TRACE));
}

TEST_CASE("Repeated messages are folded in the log file", "[Logger]") {
    test::TempDir dir;
    test::LoggerStateGuard guard;
    Logger::setDefaultLevel(LogLevel::INFO);

    const std::string log_path = dir.file("logs/run.log");
    REQUIRE(Logger::setLogFile(log_path));

    {
        Logger logger("Folding");
        logger.info("same message");
        logger.info("same message");
        logger.info("same message");
        logger.info("another message");
        logger.debug("hidden at INFO");
    }
    REQUIRE(Logger::setLogFile(std::nullopt));

    std::istringstream content(test::read_file(log_path));
    std::vector<std::string> lines;
    for (std::string line; std::getline(content, line);) {
        lines.push_back(line);
    }

    REQUIRE(lines.size() == 3);
    CHECK(lines[0].find("INFO  Folding: same message") != std::string::npos);
    CHECK(lines[1].find("The previous message occurred 3 times.") != std::string::npos);
    CHECK(lines[2].find("Folding: another message") != std::string::npos);
}
