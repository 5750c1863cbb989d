// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "util/threadsafe_containers.hpp"
#include <thread>
#include <vector>
#include <atomic>
#include <chrono>

using namespace lorasim::util;
using namespace std::chrono_literals;

// ============================================================================
// ThreadSafeMap Tests
// ============================================================================

TEST_CASE("ThreadSafeMap: Basic operations", "[util][threadsafe][map]") {
    ThreadSafeMap<int, std::string> map;

    SECTION("TryInsert doesn't overwrite") {
        REQUIRE(map.TryInsert(1, "one"));
        REQUIRE(!map.TryInsert(1, "ONE"));  // Fails, doesn't overwrite
        std::string result;
        REQUIRE(map.Read(1, [&](const std::string& value) { result = value; }));
        REQUIRE(result == "one");  // Original value preserved
    }

    SECTION("Read non-existent key") {
        std::string result;
        REQUIRE(!map.Read(999, [&](const std::string& value) { result = value; }));
        REQUIRE(result.empty());
    }
}

TEST_CASE("ThreadSafeMap: Concurrent TryInsert", "[util][threadsafe][map]") {
    ThreadSafeMap<int, int> map;
    constexpr int NUM_THREADS = 8;
    std::atomic<int> inserted{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < NUM_THREADS; ++t) {
        threads.emplace_back([&, t]() {
            for (int i = 0; i < 100; ++i) {
                if (map.TryInsert(i, t)) {
                    inserted++;
                }
            }
        });
    }
    for (auto& th : threads) th.join();

    // Each key inserted exactly once, first writer kept
    REQUIRE(inserted == 100);
    for (int i = 0; i < 100; ++i) {
        int owner = -1;
        REQUIRE(map.Read(i, [&](int v) { owner = v; }));
        REQUIRE(owner >= 0);
        REQUIRE(owner < NUM_THREADS);
    }
}

// ============================================================================
// LatestValueSlot Tests
// ============================================================================

TEST_CASE("LatestValueSlot: Most recent value wins", "[util][threadsafe][slot]") {
    LatestValueSlot<std::string> slot;
    auto now = [] { return std::chrono::steady_clock::now(); };

    SECTION("Empty slot") {
        REQUIRE(!slot.TakeUntil(now()).has_value());
        REQUIRE(!slot.Clear());
    }

    SECTION("Put then take") {
        REQUIRE(!slot.Put("a"));
        REQUIRE(slot.TakeUntil(now()) == "a");
        REQUIRE(!slot.TakeUntil(now()).has_value());
    }

    SECTION("Put overwrites unconsumed value") {
        slot.Put("old");
        REQUIRE(slot.Put("new"));
        REQUIRE(slot.TakeUntil(now()) == "new");
        REQUIRE(!slot.TakeUntil(now()).has_value());
    }

    SECTION("Clear discards") {
        slot.Put("stale");
        REQUIRE(slot.Clear());
        REQUIRE(!slot.Clear());
        REQUIRE(!slot.TakeUntil(now()).has_value());
    }
}

TEST_CASE("LatestValueSlot: TakeUntil", "[util][threadsafe][slot]") {
    LatestValueSlot<std::string> slot;

    SECTION("Times out without a value, within a bounded margin") {
        auto start = std::chrono::steady_clock::now();
        auto v = slot.TakeUntil(start + 100ms);
        auto elapsed = std::chrono::steady_clock::now() - start;
        REQUIRE(!v.has_value());
        REQUIRE(elapsed >= 100ms);
        REQUIRE(elapsed < 1s);
    }

    SECTION("Wakes when a producer puts a value") {
        std::thread producer([&slot]() {
            std::this_thread::sleep_for(50ms);
            slot.Put("answer");
        });
        auto v = slot.TakeUntil(std::chrono::steady_clock::now() + 5s);
        producer.join();
        REQUIRE(v == "answer");
    }

    SECTION("Returns an already present value immediately") {
        slot.Put("ready");
        auto v = slot.TakeUntil(std::chrono::steady_clock::now());
        REQUIRE(v == "ready");
    }
}
