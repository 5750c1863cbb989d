// Unit tests for the shared stop signal
#include <catch2/catch_test_macros.hpp>
#include "sim/stop_signal.hpp"
#include <chrono>
#include <thread>

using namespace lorasim::sim;
using namespace std::chrono_literals;

TEST_CASE("StopSignal - first request wins", "[stop]") {
    StopSignal stop;
    REQUIRE_FALSE(stop.IsSet());
    REQUIRE(stop.reason() == StopReason::NONE);

    REQUIRE(stop.Request(StopReason::DURATION_ELAPSED));
    REQUIRE_FALSE(stop.Request(StopReason::INTERRUPT));
    REQUIRE(stop.IsSet());
    REQUIRE(stop.reason() == StopReason::DURATION_ELAPSED);
    REQUIRE(StopReasonToString(stop.reason()) == "duration elapsed");
}

TEST_CASE("StopSignal - SleepUntil", "[stop]") {
    StopSignal stop;

    SECTION("Reaches the deadline when not stopped") {
        auto start = std::chrono::steady_clock::now();
        REQUIRE(stop.SleepUntil(start + 80ms));
        REQUIRE(std::chrono::steady_clock::now() - start >= 80ms);
    }

    SECTION("Past deadline returns immediately") {
        REQUIRE(stop.SleepUntil(std::chrono::steady_clock::now() - 1s));
    }

    SECTION("Stop interrupts within the poll interval") {
        std::thread stopper([&stop]() {
            std::this_thread::sleep_for(50ms);
            stop.Request(StopReason::INTERACTIVE);
        });
        auto start = std::chrono::steady_clock::now();
        REQUIRE_FALSE(stop.SleepUntil(start + 10s));
        auto elapsed = std::chrono::steady_clock::now() - start;
        stopper.join();
        REQUIRE(elapsed < 50ms + StopSignal::kPollInterval + 500ms);
    }

    SECTION("Already stopped") {
        stop.Request(StopReason::INTERRUPT);
        REQUIRE_FALSE(stop.SleepUntil(std::chrono::steady_clock::now() + 10s));
    }
}
