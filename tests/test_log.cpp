// VaultUSD - Logger Tests

#include <catch2/catch_test_macros.hpp>
#include "fixtures.hpp"

#include <sstream>

using namespace vusd;
using namespace vusd::test;

namespace {

// Redirects the log for one test and restores it afterwards
class CapturedLog {
public:
    explicit CapturedLog(LogLevel level) : saved_(Logger::level()) {
        Logger::set_sink(&stream_);
        Logger::set_level(level);
    }
    ~CapturedLog() {
        Logger::set_sink(nullptr);
        Logger::set_level(saved_);
    }

    std::string text() const { return stream_.str(); }

private:
    std::ostringstream stream_;
    LogLevel saved_;
};

} // namespace

TEST_CASE("Log levels parse by name", "[log]") {
    REQUIRE(Logger::parse_level("debug") == LogLevel::DEBUG);
    REQUIRE(Logger::parse_level("info") == LogLevel::INFO);
    REQUIRE(Logger::parse_level("warning") == LogLevel::WARNING);
    REQUIRE(Logger::parse_level("warn") == LogLevel::WARNING);
    REQUIRE(Logger::parse_level("error") == LogLevel::ERROR);
    REQUIRE(Logger::parse_level("critical") == LogLevel::CRITICAL);
    REQUIRE_FALSE(Logger::parse_level("verbose").has_value());
}

TEST_CASE("Messages below the level are dropped", "[log]") {
    CapturedLog log(LogLevel::WARNING);

    VUSD_LOG_DEBUG("hidden debug");
    VUSD_LOG_INFO("hidden info");
    VUSD_LOG_WARNING("shown warning");
    VUSD_LOG_CRITICAL("shown critical");

    std::string text = log.text();
    REQUIRE(text.find("hidden") == std::string::npos);
    REQUIRE(text.find("[WARN]") != std::string::npos);
    REQUIRE(text.find("[CRIT]") != std::string::npos);
    REQUIRE(text.find("test_log.cpp:") != std::string::npos);
    REQUIRE(text.find(" - shown warning\n") != std::string::npos);
}

TEST_CASE("Ledger reports rejections and rollbacks", "[log]") {
    Deployment d;
    REQUIRE(d.open(ALICE, eth(10), vusd_units(10000)) == errors::OK);

    CapturedLog log(LogLevel::DEBUG);

    REQUIRE(d.ledger.mint_debt(ALICE, vusd_units(10000)) == errors::RATIO_VIOLATION);
    REQUIRE(log.text().find("mint_debt rejected") != std::string::npos);
    REQUIRE(log.text().find("error=ratio_violation") != std::string::npos);

    REQUIRE(d.ledger.repay_debt(ALICE, vusd_units(1)) == errors::OK);
    REQUIRE(log.text().find("[INFO]") != std::string::npos);
    REQUIRE(log.text().find("debt repaid") != std::string::npos);
}
