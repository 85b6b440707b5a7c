#include <catch2/catch_test_macros.hpp>
#include "telemon/dashboard.hpp"
#include "telemon/display.hpp"
#include "fake_metrics_collector.hpp"
#include <limits>
#include <sstream>
#include <stdexcept>

namespace {

struct DashboardFixture {
    std::shared_ptr<FakeHostState> host = std::make_shared<FakeHostState>();
    telemon::ResourceSampler sampler{make_fake_collector(host)};
    telemon::ApplicationAggregator application;
    telemon::AlertEngine alerts;
    telemon::HealthChecker health;
    telemon::Dashboard dashboard{sampler, application, alerts, health};
};

} // namespace

TEST_CASE("Dashboard composes the current view", "[dashboard]") {
    DashboardFixture f;

    SECTION("Before any sample the resource view is empty") {
        auto data = f.dashboard.data();
        REQUIRE_FALSE(data.resources.has_value());
        REQUIRE(data.active_alerts.empty());
        REQUIRE(data.health.overall);
        REQUIRE(data.uptime.count() >= 0.0);
    }

    SECTION("Latest sample, live counters, unresolved alerts and health") {
        f.sampler.sample();
        f.application.record_call(true, 120);
        auto resolved = f.alerts.create_alert("old", telemon::Severity::Low, "old");
        f.alerts.resolve_alert(resolved.id);
        f.alerts.create_alert("open", telemon::Severity::High, "open");
        f.health.register_check("stt", []() -> telemon::HealthCheckResult {
            throw std::runtime_error("timeout");
        });

        auto data = f.dashboard.data();
        REQUIRE(data.resources.has_value());
        REQUIRE(data.application.calls.total == 1);
        REQUIRE(f.application.history().empty());
        REQUIRE(data.active_alerts.size() == 1);
        REQUIRE(data.active_alerts[0].kind == "open");
        REQUIRE_FALSE(data.health.overall);
        REQUIRE(data.health.find("stt")->error == std::string("timeout"));
    }
}

TEST_CASE("Dashboard history filters by age", "[dashboard][history]") {
    DashboardFixture f;
    f.sampler.sample();
    f.application.snapshot();
    f.sampler.sample();
    f.application.snapshot();

    SECTION("Recent entries fall inside the window") {
        auto history = f.dashboard.history(1.0);
        REQUIRE(history.resources.size() == 2);
        REQUIRE(history.application.size() == 2);
    }

    SECTION("Entries older than the window are dropped") {
        auto later = std::chrono::system_clock::now() + std::chrono::hours(3);
        auto history = f.dashboard.history(2.0, later);
        REQUIRE(history.resources.empty());
        REQUIRE(history.application.empty());

        auto wide = f.dashboard.history(24.0, later);
        REQUIRE(wide.resources.size() == 2);
        REQUIRE(wide.application.size() == 2);
    }

    SECTION("Windows wider than the clock range return everything") {
        for (double hours : {1e6, 1e7, 1e9, std::numeric_limits<double>::infinity(),
                             std::numeric_limits<double>::quiet_NaN()}) {
            auto history = f.dashboard.history(hours);
            REQUIRE(history.resources.size() == 2);
            REQUIRE(history.application.size() == 2);
        }
    }

    SECTION("Negative windows keep only entries at or after now") {
        auto later = std::chrono::system_clock::now() + std::chrono::hours(1);
        auto history = f.dashboard.history(-1e12, later);
        REQUIRE(history.resources.empty());
        REQUIRE(history.application.empty());
    }

    SECTION("Cutoff is inclusive") {
        auto newest = f.application.history().back().timestamp;
        auto history = f.dashboard.history(0.0, newest);
        REQUIRE(history.application.size() >= 1);
        REQUIRE(history.application.back().timestamp == newest);
    }
}

TEST_CASE("Display renders a dashboard", "[dashboard][display]") {
    DashboardFixture f;
    telemon::DisplayConfig config;
    config.color_scheme = "mono";
    telemon::Display display(config);

    SECTION("Without a resource sample") {
        std::ostringstream out;
        display.render(f.dashboard.data(), out);
        REQUIRE(out.str().find("no sample collected yet") != std::string::npos);
        REQUIRE(out.str().find("No active alerts") != std::string::npos);
        REQUIRE(out.str().find("HEALTHY") != std::string::npos);
        REQUIRE(out.str().find("\033[") == std::string::npos);
    }

    SECTION("With data") {
        f.sampler.sample();
        f.application.record_error("llm_quota", "quota exceeded");
        f.alerts.create_alert("high_error_rate", telemon::Severity::High, "High error rate detected");
        f.health.register_check("tts", [] {
            return telemon::HealthCheckResult{false, {}, std::string("connection refused")};
        });

        std::ostringstream out;
        display.render(f.dashboard.data(), out);
        const std::string text = out.str();
        REQUIRE(text.find("[CPU]") != std::string::npos);
        REQUIRE(text.find("llm_quota=1") != std::string::npos);
        REQUIRE(text.find("HIGH: high_error_rate") != std::string::npos);
        REQUIRE(text.find("UNHEALTHY") != std::string::npos);
        REQUIRE(text.find("connection refused") != std::string::npos);
    }
}

TEST_CASE("Display leaves the stream format untouched", "[display]") {
    DashboardFixture f;
    f.application.record_call(true, 12.345);
    telemon::DisplayConfig config;
    config.color_scheme = "mono";
    telemon::Display display(config);

    std::ostringstream out;
    const auto flags_before = out.flags();
    const auto precision_before = out.precision();

    display.render(f.dashboard.data(), out);
    REQUIRE(out.flags() == flags_before);
    REQUIRE(out.precision() == precision_before);

    std::ostringstream tail;
    tail.flags(out.flags());
    tail.precision(out.precision());
    tail << 1.0 / 3.0;
    REQUIRE(tail.str() == "0.333333");
}

TEST_CASE("Formatting helpers", "[display]") {
    REQUIRE(telemon::format_bytes(512) == "512.00 B");
    REQUIRE(telemon::format_bytes(1536) == "1.50 KB");
    REQUIRE(telemon::format_duration(std::chrono::seconds(3725)) == "01:02:05");
    REQUIRE(telemon::format_duration(std::chrono::seconds(90061)) == "1d 01:01:01");
}
