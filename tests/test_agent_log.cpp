#include <catch2/catch_test_macros.hpp>
#include "agent_log.hpp"
#include "test_support.hpp"

using namespace log_collector;
using namespace log_collector::testing;

TEST_CASE("AgentLog routes messages to the active sink", "[log]") {
    LogCapture capture;

    AgentLog::log("Registry", "Watching: /var/log/a.log");
    AgentLog::warn("Tail", "File truncated");
    AgentLog::error("Main", "boom");

    REQUIRE(capture.entries.size() == 3);
    REQUIRE(capture.entries[0].level == AgentLog::Level::Info);
    REQUIRE(capture.entries[0].component == "Registry");
    REQUIRE(capture.entries[1].level == AgentLog::Level::Warning);
    REQUIRE(capture.entries[2].level == AgentLog::Level::Error);
    REQUIRE(capture.entries[2].message == "boom");
}

TEST_CASE("AgentLog level names", "[log]") {
    REQUIRE(std::string(AgentLog::level_name(AgentLog::Level::Info)) == "info");
    REQUIRE(std::string(AgentLog::level_name(AgentLog::Level::Warning)) == "warning");
    REQUIRE(std::string(AgentLog::level_name(AgentLog::Level::Error)) == "error");
}
