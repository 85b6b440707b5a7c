#include "telemon/config_manager.hpp"
#include "telemon/display.hpp"
#include "telemon/logger.hpp"
#include "telemon/telemetry_service.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <thread>

namespace {

std::atomic<bool> g_running{true};

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_running = false;
    }
}

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [config_file]\n";
    std::cout << "\n";
    std::cout << "Options:\n";
    std::cout << "  config_file    Path to YAML configuration file (default: config/default_config.yaml)\n";
    std::cout << "  -h, --help     Show this help message\n";
    std::cout << "\n";
}

void register_builtin_checks(telemon::TelemetryService& service, const telemon::TelemonConfig& config) {
    service.register_check("collection", [&service]() {
        auto& scheduler = service.scheduler();
        telemon::HealthCheckResult result;
        result.healthy = scheduler.is_running();
        result.details["completed_ticks"] = std::to_string(scheduler.completed_ticks());
        result.details["failed_ticks"] = std::to_string(scheduler.failed_ticks());
        return result;
    });

    service.register_check("memory", [&service, limit = config.alerts.max_memory_usage_percent]() {
        telemon::HealthCheckResult result;
        auto latest = service.resources().latest();
        result.healthy = !latest || latest->memory.usage_percent <= limit;
        if (latest) {
            result.details["usage_percent"] = std::to_string(latest->memory.usage_percent);
        }
        return result;
    });
}

} // namespace

int main(int argc, char* argv[]) {
    std::string config_path = "config/default_config.yaml";

    if (argc > 1) {
        std::string arg = argv[1];
        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        }
        config_path = arg;
    }

    telemon::ConfigManager config_manager(config_path);
    if (!config_manager.load()) {
        std::cerr << "Failed to load configuration from " << config_path << "\n";
        return 1;
    }

    std::string validation_error;
    if (!config_manager.validate_config(validation_error)) {
        std::cerr << "Configuration validation failed: " << validation_error << "\n";
        return 1;
    }

    const auto& config = config_manager.get_config();

    telemon::LogLevel level = telemon::LogLevel::Info;
    telemon::parse_log_level(config.logging.level, level);
    telemon::Logger::set_level(level);
    if (config.logging.log_to_file && !telemon::Logger::set_log_file(config.logging.log_path)) {
        return 1;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    // Declared before the service so it outlives the scheduler thread
    telemon::Display display(config.display);

    std::unique_ptr<telemon::TelemetryService> service;
    try {
        service = std::make_unique<telemon::TelemetryService>(config);
    } catch (const std::exception& e) {
        std::cerr << "Failed to create telemetry service: " << e.what() << "\n";
        return 1;
    }

    register_builtin_checks(*service, config);

    telemon::TelemetryService& telemetry = *service;
    service->set_tick_listener([&telemetry, &display]() {
        display.render(telemetry.dashboard_data(), std::cout, true);
    });

    if (!service->initialize()) {
        std::cerr << "Failed to initialize telemetry service\n";
        return 1;
    }

    std::cout << "telemond started with config: " << config_path
              << " (collecting every " << config.collection_interval << "s)\n";
    std::cout << "Press Ctrl+C to exit.\n\n";

    while (g_running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    std::cout << "\ntelemond stopped.\n";
    return 0;
}
