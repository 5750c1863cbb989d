// Unit tests for connectivity-gated routing
#include <catch2/catch_test_macros.hpp>
#include "sim/router.hpp"
#include "sim/infra/event_capture.hpp"
#include "sim/infra/fake_node.hpp"
#include <atomic>
#include <functional>
#include <spdlog/sinks/base_sink.h>
#include <thread>

using namespace lorasim;
using namespace lorasim::sim;
using namespace std::chrono_literals;

namespace {

Router::Options NoProbes() {
    Router::Options options;
    options.probe_timeout = 0ms;
    return options;
}

// Runs a callback while each record is being written
class RecordHookSink : public spdlog::sinks::base_sink<std::mutex> {
public:
    void set_hook(std::function<void(const std::string&)> hook) { hook_ = std::move(hook); }

protected:
    void sink_it_(const spdlog::details::log_msg& msg) override {
        std::string line(msg.payload.data(), msg.payload.size());
        if (hook_) hook_(line);
    }
    void flush_() override {}

private:
    std::function<void(const std::string&)> hook_;
};

} // namespace

TEST_CASE("Router - registration", "[router]") {
    EventCapture capture;
    util::SimClock clock;
    Router router({"A", "B"}, capture.log(), clock, NoProbes());

    auto a = MakeFakeNode("A");
    REQUIRE(router.RegisterNode(a));
    REQUIRE_FALSE(router.RegisterNode(MakeFakeNode("A")));  // duplicate
    REQUIRE_FALSE(router.RegisterNode(MakeFakeNode("C")));  // not configured
    REQUIRE_FALSE(router.RegisterNode(nullptr));

    REQUIRE(router.FindNode("A") == a);
    REQUIRE(router.FindNode("B") == nullptr);
    REQUIRE(router.node_count() == 2);
}

TEST_CASE("Router - matrix starts disconnected", "[router]") {
    EventCapture capture;
    util::SimClock clock;
    Router router({"A", "B", "C"}, capture.log(), clock, NoProbes());

    REQUIRE(router.ConnectivityString() == "000000000");
    REQUIRE(router.ReachableFrom("A").empty());
}

TEST_CASE("Router - invalid connectivity strings leave the matrix unchanged", "[router]") {
    EventCapture capture;
    util::SimClock clock;
    Router router({"A", "B"}, capture.log(), clock, NoProbes());

    REQUIRE(router.UpdateConnectivity("0110", 0.0));
    REQUIRE(capture.bodies_of_kind("connectivity_update").size() == 1);

    for (const std::string bad : {"", "011", "01100", "0110011001100", "01x0", "0 10", "0120"}) {
        INFO("bitstring: '" << bad << "'");
        REQUIRE_FALSE(router.UpdateConnectivity(bad, 1.0));
        REQUIRE(router.ConnectivityString() == "0110");
    }

    // Rejected updates are not recorded
    REQUIRE(capture.bodies_of_kind("connectivity_update").size() == 1);
}

TEST_CASE("Router - every valid bitstring maps to reachability", "[router]") {
    EventCapture capture;
    util::SimClock clock;
    const std::vector<std::string> names{"A", "B", "C"};
    Router router(names, capture.log(), clock, NoProbes());
    const size_t n = names.size();

    // All 2^9 matrices over three nodes
    for (unsigned mask = 0; mask < (1u << (n * n)); ++mask) {
        std::string bits;
        for (size_t k = 0; k < n * n; ++k) {
            bits.push_back((mask >> k) & 1u ? '1' : '0');
        }
        REQUIRE(router.UpdateConnectivity(bits, 0.0));
        REQUIRE(router.ConnectivityString() == bits);

        for (size_t i = 0; i < n; ++i) {
            std::vector<std::string> expected;
            for (size_t j = 0; j < n; ++j) {
                REQUIRE(router.IsReachable(names[i], names[j]) == (bits[i * n + j] == '1'));
                if (j != i && bits[i * n + j] == '1') {
                    expected.push_back(names[j]);
                }
            }
            REQUIRE(router.ReachableFrom(names[i]) == expected);
        }
    }
}

TEST_CASE("Router - deliver reaches exactly the reachable set, never self", "[router]") {
    EventCapture capture;
    util::SimClock clock;
    Router router({"A", "B", "C"}, capture.log(), clock, NoProbes());

    auto a = MakeFakeNode("A");
    auto b = MakeFakeNode("B");
    auto c = MakeFakeNode("C");
    REQUIRE(router.RegisterNode(a));
    REQUIRE(router.RegisterNode(b));
    REQUIRE(router.RegisterNode(c));

    // A reaches A (self), B; not C. B reaches C.
    REQUIRE(router.UpdateConnectivity("110" "001" "000", 0.0));

    REQUIRE(router.Deliver("A", "DEAD") == 1);
    REQUIRE(a->sent().empty());
    REQUIRE(b->sent() == std::vector<std::string>{"network_receive_packet,DEAD"});
    REQUIRE(c->sent().empty());

    auto forwards = capture.bodies_of_kind("forward");
    REQUIRE(forwards == std::vector<std::string>{"forward,A,B,DEAD"});

    SECTION("No outgoing edges") {
        REQUIRE(router.Deliver("C", "BEEF") == 0);
        REQUIRE(capture.bodies_of_kind("forward").size() == 1);
    }

    SECTION("Unknown source") {
        REQUIRE(router.Deliver("Z", "BEEF") == 0);
    }

    SECTION("Failed send is not recorded as a forward") {
        c->close();
        REQUIRE(router.Deliver("B", "BEEF") == 0);
        REQUIRE(capture.bodies_of_kind("forward").size() == 1);
    }
}

TEST_CASE("Router - unregistered destinations are skipped", "[router]") {
    EventCapture capture;
    util::SimClock clock;
    Router router({"A", "B"}, capture.log(), clock, NoProbes());
    REQUIRE(router.RegisterNode(MakeFakeNode("A")));
    REQUIRE(router.UpdateConnectivity("0110", 0.0));

    REQUIRE(router.ReachableFrom("A") == std::vector<std::string>{"B"});
    REQUIRE(router.Deliver("A", "DEAD") == 0);
    REQUIRE(capture.bodies_of_kind("forward").empty());
}

TEST_CASE("Router - identical update twice is idempotent but logged twice", "[router]") {
    EventCapture capture;
    util::SimClock clock;
    Router router({"A", "B"}, capture.log(), clock, NoProbes());

    REQUIRE(router.UpdateConnectivity("0110", 1.0));
    auto before = router.ConnectivityString();
    REQUIRE(router.UpdateConnectivity("0110", 2.0));
    REQUIRE(router.ConnectivityString() == before);

    auto records = capture.records();
    REQUIRE(records == std::vector<std::string>{"1.000,connectivity_update,0110",
                                                "2.000,connectivity_update,0110"});
}

TEST_CASE("Router - post-forward state probe", "[router]") {
    EventCapture capture;
    util::SimClock clock;
    Router::Options options;
    options.probe_timeout = 100ms;
    Router router({"A", "B"}, capture.log(), clock, options);

    auto a = MakeFakeNode("A");
    auto b = MakeFakeNode("B");
    b->set_state("get_state,10,A,1,2,3");
    REQUIRE(router.RegisterNode(a));
    REQUIRE(router.RegisterNode(b));
    REQUIRE(router.UpdateConnectivity("0110", 0.0));

    REQUIRE(router.Deliver("A", "DEAD") == 1);
    router.Stop();  // drains queued probes

    REQUIRE(b->query_count() == 1);
    REQUIRE(a->query_count() == 0);
    auto states = capture.bodies_of_kind("state");
    REQUIRE(states == std::vector<std::string>{"state,B,get_state,10,A,1,2,3"});

    SECTION("No probes after stop") {
        REQUIRE(router.Deliver("A", "BEEF") == 1);
        REQUIRE(b->query_count() == 1);
    }
}

TEST_CASE("Router - silent node produces no state record", "[router]") {
    EventCapture capture;
    util::SimClock clock;
    Router::Options options;
    options.probe_timeout = 50ms;
    Router router({"A", "B"}, capture.log(), clock, options);

    REQUIRE(router.RegisterNode(MakeFakeNode("A")));
    auto b = MakeFakeNode("B");
    REQUIRE(router.RegisterNode(b));
    REQUIRE(router.UpdateConnectivity("0110", 0.0));

    REQUIRE(router.Deliver("A", "DEAD") == 1);
    router.Stop();

    REQUIRE(b->query_count() == 1);
    REQUIRE(capture.bodies_of_kind("state").empty());
}

TEST_CASE("Router - concurrent updates never expose a torn matrix", "[router][threading]") {
    EventCapture capture;
    util::SimClock clock;
    Router router({"A", "B", "C"}, capture.log(), clock, NoProbes());

    const std::string all = "011101110";
    const std::string none = "000000000";
    std::atomic<bool> done{false};

    std::thread writer([&]() {
        for (int i = 0; i < 2000; ++i) {
            router.UpdateConnectivity(i % 2 ? all : none, 0.0);
        }
        done = true;
    });

    while (!done) {
        auto s = router.ConnectivityString();
        REQUIRE((s == all || s == none));
    }
    writer.join();
}

TEST_CASE("Router - new links are not usable until their update is recorded", "[router][threading]") {
    auto sink = std::make_shared<RecordHookSink>();
    EventLog log({sink});
    util::SimClock clock;
    Router router({"A", "B"}, log, clock, NoProbes());

    std::atomic<bool> lookup_done{false};
    bool lookup_done_while_recording = true;
    std::vector<std::string> seen;
    std::thread lookup;

    sink->set_hook([&](const std::string& line) {
        if (line.find("connectivity_update") == std::string::npos) return;
        lookup = std::thread([&]() {
            seen = router.ReachableFrom("A");
            lookup_done = true;
        });
        auto deadline = std::chrono::steady_clock::now() + 150ms;
        while (!lookup_done && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(5ms);
        }
        lookup_done_while_recording = lookup_done.load();
    });

    REQUIRE(router.UpdateConnectivity("0110", 1.0));
    REQUIRE(lookup.joinable());
    lookup.join();

    // The lookup waited for the record, then saw the new link
    CHECK_FALSE(lookup_done_while_recording);
    CHECK(seen == std::vector<std::string>{"B"});
}

TEST_CASE("Router - forward records follow the update that enabled them", "[router]") {
    EventCapture capture;
    util::SimClock clock;
    Router router({"A", "B"}, capture.log(), clock, NoProbes());
    REQUIRE(router.RegisterNode(MakeFakeNode("A")));
    REQUIRE(router.RegisterNode(MakeFakeNode("B")));

    REQUIRE(router.Deliver("A", "DEAD") == 0);
    REQUIRE(router.UpdateConnectivity("0110", 0.0));
    REQUIRE(router.Deliver("A", "BEEF") == 1);

    REQUIRE(capture.bodies() == std::vector<std::string>{"connectivity_update,0110",
                                                         "forward,A,B,BEEF"});
}
