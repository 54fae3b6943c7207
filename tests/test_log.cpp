#include <catch2/catch_test_macros.hpp>
#include "log.hpp"
#include <iostream>
#include <sstream>

using namespace qwstream;

// Captures std::cerr for the lifetime of the guard
struct CerrCapture {
    std::ostringstream out;
    std::streambuf* old;
    CerrCapture() : old(std::cerr.rdbuf(out.rdbuf())) {}
    ~CerrCapture() { std::cerr.rdbuf(old); }
};

TEST_CASE("parse_log_level: known names", "[log]") {
    REQUIRE(parse_log_level("debug") == LogLevel::Debug);
    REQUIRE(parse_log_level("INFO") == LogLevel::Info);
    REQUIRE(parse_log_level(" warning ") == LogLevel::Warn);
    REQUIRE(parse_log_level("error") == LogLevel::Error);
}

TEST_CASE("parse_log_level: unknown name uses fallback", "[log]") {
    REQUIRE(parse_log_level("loud") == LogLevel::Warn);
    REQUIRE(parse_log_level("", LogLevel::Error) == LogLevel::Error);
}

TEST_CASE("StderrLogger: tagged lines with level prefix", "[log]") {
    CerrCapture cap;
    StderrLogger log(LogLevel::Debug);
    log.warn("query", "slow");
    log.error("confirm", "gone");
    log.info("config", "ok");
    REQUIRE(cap.out.str() == "[query] Warning: slow\n[confirm] Error: gone\n[config] ok\n");
}

TEST_CASE("StderrLogger: drops lines below the minimum level", "[log]") {
    CerrCapture cap;
    StderrLogger log;
    log.debug("query", "POST");
    log.info("query", "HTTP 200");
    REQUIRE(cap.out.str().empty());

    log.set_min_level(LogLevel::Debug);
    log.debug("query", "POST");
    REQUIRE(cap.out.str() == "[query] POST\n");
}
