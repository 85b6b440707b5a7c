#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "telemon/resource_sampler.hpp"
#include "fake_metrics_collector.hpp"
#include <stdexcept>

using Catch::Approx;

TEST_CASE("ResourceSampler assembles a sample from the collector", "[resources]") {
    auto host = std::make_shared<FakeHostState>();
    telemon::ResourceSampler sampler(make_fake_collector(host), "/data");

    auto sample = sampler.sample();

    // 75 of 100 ticks idle since the baseline read
    REQUIRE(sample.cpu.usage_percent == Approx(25.0));
    REQUIRE(sample.cpu.load_averages == (std::vector<double>{0.5, 0.25, 0.1}));
    REQUIRE(sample.memory.total_bytes == 16384);
    REQUIRE(sample.memory.usage_percent == Approx(25.0));
    REQUIRE(sample.disk.total_bytes == 150);
    REQUIRE(sample.network.bytes_in == 1000000);
    REQUIRE(sample.network.active_connections == 25);
    REQUIRE(host->last_mount_point == "/data");
}

TEST_CASE("ResourceSampler CPU usage uses the delta since the previous read", "[resources][cpu]") {
    auto host = std::make_shared<FakeHostState>();
    telemon::ResourceSampler sampler(make_fake_collector(host));

    host->total_step = 200;
    host->idle_step = 30;
    REQUIRE(sampler.sample().cpu.usage_percent == Approx(85.0));

    host->total_step = 300;
    host->idle_step = 100;
    // 100 - round(33.33...) = 67
    REQUIRE(sampler.sample().cpu.usage_percent == Approx(67.0));

    host->total_step = 0;
    host->idle_step = 0;
    REQUIRE(sampler.sample().cpu.usage_percent == Approx(0.0));
}

TEST_CASE("ResourceSampler history", "[resources][history]") {
    auto host = std::make_shared<FakeHostState>();

    SECTION("Latest is empty before the first sample") {
        telemon::ResourceSampler sampler(make_fake_collector(host));
        REQUIRE_FALSE(sampler.latest().has_value());
        REQUIRE(sampler.history().empty());
    }

    SECTION("History is capped and chronological") {
        telemon::ResourceSampler sampler(make_fake_collector(host), "/", 4);
        for (int i = 0; i < 9; ++i) {
            host->network.bytes_out = static_cast<uint64_t>(i);
            sampler.sample();
        }

        auto history = sampler.history();
        REQUIRE(history.size() == 4);
        REQUIRE(history.front().network.bytes_out == 5);
        REQUIRE(history.back().network.bytes_out == 8);
        REQUIRE(sampler.latest()->network.bytes_out == 8);
        for (size_t i = 1; i < history.size(); ++i) {
            REQUIRE(history[i - 1].timestamp <= history[i].timestamp);
        }
    }

    SECTION("Default cap is 1000 samples") {
        telemon::ResourceSampler sampler(make_fake_collector(host));
        for (int i = 0; i < 1003; ++i) {
            sampler.sample();
        }
        REQUIRE(sampler.history().size() == 1000);
    }
}

TEST_CASE("ResourceSampler propagates collector failures", "[resources]") {
    auto host = std::make_shared<FakeHostState>();
    telemon::ResourceSampler sampler(make_fake_collector(host));

    host->fail_memory = true;
    REQUIRE_THROWS_AS(sampler.sample(), std::runtime_error);
    REQUIRE(sampler.history().empty());
}

TEST_CASE("ResourceSampler requires a collector", "[resources]") {
    REQUIRE_THROWS_AS(telemon::ResourceSampler(nullptr), std::invalid_argument);
}
