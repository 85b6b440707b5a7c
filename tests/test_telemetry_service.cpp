#include <catch2/catch_test_macros.hpp>
#include "telemon/telemetry_service.hpp"
#include "fake_metrics_collector.hpp"
#include <stdexcept>

namespace {

telemon::TelemonConfig quiet_config() {
    telemon::TelemonConfig config;
    config.collection_interval = 3600;
    return config;
}

} // namespace

TEST_CASE("TelemetryService initializes once", "[service]") {
    auto host = std::make_shared<FakeHostState>();
    telemon::TelemetryService service(quiet_config(), make_fake_collector(host));

    REQUIRE_FALSE(service.is_initialized());
    REQUIRE(service.initialize(false));
    REQUIRE(service.is_initialized());
    REQUIRE_FALSE(service.initialize(false));
    REQUIRE(service.alerts().rule_count() == 5);
    REQUIRE_FALSE(service.scheduler().is_running());
}

TEST_CASE("TelemetryService tick samples, snapshots and evaluates", "[service]") {
    auto host = std::make_shared<FakeHostState>();
    telemon::TelemetryService service(quiet_config(), make_fake_collector(host));
    service.initialize(false);

    for (int i = 0; i < 11; ++i) {
        service.application().record_error("stt", "stream dropped");
    }
    service.application().record_call(true, 100);
    service.application().record_call(false, 100);

    service.collect_once();

    REQUIRE(service.resources().history().size() == 1);
    REQUIRE(service.application().history().size() == 1);

    auto alerts = service.all_alerts();
    REQUIRE(alerts.size() == 2);
    REQUIRE(alerts[0].kind == "high_error_rate");
    REQUIRE(alerts[1].kind == "low_success_rate");

    SECTION("The same condition fires again on the next tick") {
        service.collect_once();
        REQUIRE(service.all_alerts().size() == 4);
        REQUIRE(service.alerts_by_severity(telemon::Severity::High).size() == 2);
    }

    SECTION("Resolution through the facade") {
        REQUIRE(service.resolve_alert(alerts[0].id));
        REQUIRE_FALSE(service.resolve_alert(alerts[0].id));
        REQUIRE(service.active_alerts().size() == 1);
        REQUIRE(service.dashboard_data().active_alerts.size() == 1);
    }

    SECTION("History covers the collected tick") {
        auto history = service.metrics_history();
        REQUIRE(history.resources.size() == 1);
        REQUIRE(history.application.size() == 1);
    }
}

TEST_CASE("TelemetryService memory rule uses the tick's resource sample", "[service]") {
    auto host = std::make_shared<FakeHostState>();
    host->memory.usage_percent = 97.0;
    telemon::TelemetryService service(quiet_config(), make_fake_collector(host));
    service.initialize(false);

    service.collect_once();

    auto alerts = service.active_alerts();
    REQUIRE(alerts.size() == 1);
    REQUIRE(alerts[0].kind == "high_memory_usage");
}

TEST_CASE("TelemetryService without alert rules", "[service]") {
    auto host = std::make_shared<FakeHostState>();
    auto config = quiet_config();
    config.alerts.enabled = false;
    telemon::TelemetryService service(config, make_fake_collector(host));
    service.initialize(false);

    service.application().record_call(false, 10);
    service.collect_once();
    REQUIRE(service.all_alerts().empty());
}

TEST_CASE("TelemetryService collection failures surface to the scheduler", "[service]") {
    auto host = std::make_shared<FakeHostState>();
    telemon::TelemetryService service(quiet_config(), make_fake_collector(host));
    service.initialize(false);

    host->fail_memory = true;
    REQUIRE_THROWS_AS(service.collect_once(), std::runtime_error);
    REQUIRE_FALSE(service.scheduler().run_tick());
    REQUIRE(service.scheduler().failed_ticks() == 1);

    host->fail_memory = false;
    REQUIRE(service.scheduler().run_tick());
    REQUIRE(service.resources().history().size() == 1);
}

TEST_CASE("TelemetryService health registry feeds the dashboard", "[service][health]") {
    auto host = std::make_shared<FakeHostState>();
    telemon::TelemetryService service(quiet_config(), make_fake_collector(host));
    service.initialize(false);

    service.register_check("database", [] {
        return telemon::HealthCheckResult{true, {{"connection", "active"}}, std::nullopt};
    });

    auto data = service.dashboard_data();
    REQUIRE(data.health.overall);
    REQUIRE(data.health.checks.size() == 1);
    REQUIRE_FALSE(data.resources.has_value());
}

TEST_CASE("TelemetryService honours configured capacities", "[service]") {
    auto host = std::make_shared<FakeHostState>();
    auto config = quiet_config();
    config.history.resource_history = 2;
    config.history.application_history = 3;
    config.history.alert_ledger = 4;
    config.history.recent_errors = 5;
    telemon::TelemetryService service(config, make_fake_collector(host));
    service.initialize(false);

    for (int i = 0; i < 20; ++i) {
        service.application().record_error("stt", "dropped");
        service.collect_once();
    }

    REQUIRE(service.resources().history().size() == 2);
    REQUIRE(service.application().history().size() == 3);
    REQUIRE(service.all_alerts().size() == 4);
    REQUIRE(service.application().current_snapshot().errors.recent.size() == 5);
}

TEST_CASE("TelemetryService rejects non-positive capacities", "[service][config]") {
    auto host = std::make_shared<FakeHostState>();

    SECTION("Negative resource history") {
        auto config = quiet_config();
        config.history.resource_history = -1;
        REQUIRE_THROWS_AS(telemon::TelemetryService(config, make_fake_collector(host)),
                          std::invalid_argument);
    }

    SECTION("Negative alert ledger") {
        auto config = quiet_config();
        config.history.alert_ledger = -500;
        REQUIRE_THROWS_AS(telemon::TelemetryService(config, make_fake_collector(host)),
                          std::invalid_argument);
    }

    SECTION("Zero recent errors") {
        auto config = quiet_config();
        config.history.recent_errors = 0;
        REQUIRE_THROWS_AS(telemon::TelemetryService(config, make_fake_collector(host)),
                          std::invalid_argument);
    }
}
