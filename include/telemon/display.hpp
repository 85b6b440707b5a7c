#pragma once

#include "telemon/config_manager.hpp"
#include "telemon/dashboard.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

namespace telemon {

enum class Tone {
    Ok,
    Warning,
    Critical
};

class Display {
public:
    explicit Display(const DisplayConfig& config);

    // Render the full dashboard; clear_screen redraws in place on a terminal
    void render(const DashboardData& data, std::ostream& out, bool clear_screen = false);

private:
    void render_header(std::ostream& out, std::chrono::duration<double> uptime);
    void render_resources(std::ostream& out, const std::optional<ResourceSample>& resources);
    void render_application(std::ostream& out, const ApplicationSnapshot& app);
    void render_alerts(std::ostream& out, const std::vector<Alert>& alerts);
    void render_health(std::ostream& out, const HealthReport& health);

    std::string create_progress_bar(double percentage, int width, Tone tone);
    static Tone tone_for_percent(double value);
    static Tone tone_for(Severity severity);

    std::string colorize(const std::string& text, Tone tone);
    std::string color_code(Tone tone);
    std::string reset_color();

    DisplayConfig config_;
};

// Helper functions for formatting
std::string format_bytes(uint64_t bytes);
std::string format_duration(std::chrono::duration<double> duration);

} // namespace telemon
