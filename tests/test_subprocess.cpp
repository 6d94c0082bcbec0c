#include <catch2/catch_test_macros.hpp>

#include "platform/subprocess.hpp"

#include <chrono>

using namespace std::chrono_literals;

TEST_CASE("Subprocess runner", "[subprocess]") {

    SECTION("CapturesStdoutAndStderr") {
        auto res = platform::run_process({"/bin/sh", "-c", "echo out; echo err >&2"}, 5s);
        REQUIRE(res.has_value());
        REQUIRE(res->exit_code == 0);
        REQUIRE(res->out == "out\n");
        REQUIRE(res->err == "err\n");
    }

    SECTION("ReportsExitCode") {
        auto res = platform::run_process({"/bin/sh", "-c", "exit 3"}, 5s);
        REQUIRE(res.has_value());
        REQUIRE(res->exit_code == 3);
    }

    SECTION("MissingExecutable") {
        auto res = platform::run_process({"vn-test-no-such-tool"}, 5s);
        REQUIRE(res.has_value());
        REQUIRE(res->exit_code == platform::kExecFailedCode);
    }

    SECTION("KillsOnTimeout") {
        auto start = std::chrono::steady_clock::now();
        auto res = platform::run_process({"/bin/sh", "-c", "sleep 10"}, 200ms);
        auto elapsed = std::chrono::steady_clock::now() - start;

        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().find("timed out") != std::string::npos);
        REQUIRE(elapsed < 5s);
    }

    SECTION("StdinIsClosed") {
        auto res = platform::run_process({"/bin/cat"}, 5s);
        REQUIRE(res.has_value());
        REQUIRE(res->exit_code == 0);
        REQUIRE(res->out.empty());
    }

    SECTION("EmptyCommand") {
        auto res = platform::run_process({}, 1s);
        REQUIRE_FALSE(res.has_value());
    }
}
