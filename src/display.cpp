#include "telemon/display.hpp"
#include "telemon/logger.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace telemon {

namespace {
constexpr double kWarningPercent = 70.0;
constexpr double kCriticalPercent = 90.0;
constexpr int kBarWidth = 20;
}

Display::Display(const DisplayConfig& config)
    : config_(config)
{
}

std::string Display::color_code(Tone tone) {
    if (config_.color_scheme == "mono") {
        return "";
    }

    switch (tone) {
        case Tone::Ok:       return "\033[32m";  // Green
        case Tone::Warning:  return "\033[33m";  // Yellow
        case Tone::Critical: return "\033[31m";  // Red
    }
    return "\033[0m";
}

std::string Display::reset_color() {
    if (config_.color_scheme == "mono") {
        return "";
    }
    return "\033[0m";
}

std::string Display::colorize(const std::string& text, Tone tone) {
    return color_code(tone) + text + reset_color();
}

std::string format_bytes(uint64_t bytes) {
    const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    int unit_index = 0;
    double size = static_cast<double>(bytes);

    while (size >= 1024.0 && unit_index < 4) {
        size /= 1024.0;
        unit_index++;
    }

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << size << " " << units[unit_index];
    return oss.str();
}

std::string format_duration(std::chrono::duration<double> duration) {
    auto total = static_cast<long long>(duration.count());
    long long days = total / 86400;
    long long hours = (total % 86400) / 3600;
    long long minutes = (total % 3600) / 60;
    long long seconds = total % 60;

    std::ostringstream oss;
    if (days > 0) {
        oss << days << "d ";
    }
    oss << std::setfill('0') << std::setw(2) << hours << ":"
        << std::setw(2) << minutes << ":" << std::setw(2) << seconds;
    return oss.str();
}

Tone Display::tone_for_percent(double value) {
    if (value >= kCriticalPercent) {
        return Tone::Critical;
    } else if (value >= kWarningPercent) {
        return Tone::Warning;
    }
    return Tone::Ok;
}

Tone Display::tone_for(Severity severity) {
    switch (severity) {
        case Severity::Critical:
        case Severity::High:   return Tone::Critical;
        case Severity::Medium: return Tone::Warning;
        case Severity::Low:    return Tone::Ok;
    }
    return Tone::Ok;
}

std::string Display::create_progress_bar(double percentage, int width, Tone tone) {
    int filled = static_cast<int>(std::clamp(percentage, 0.0, 100.0) / 100.0 * width);
    std::string bar;
    for (int i = 0; i < filled; ++i) bar += "█";
    for (int i = filled; i < width; ++i) bar += "░";
    return colorize(bar, tone);
}

void Display::render_header(std::ostream& out, std::chrono::duration<double> uptime) {
    const int box_width = 60;
    const std::string title = "TELEMON  (uptime " + format_duration(uptime) + ")";
    const int padding = (box_width - static_cast<int>(title.length())) / 2;

    out << "╔";
    for (int i = 0; i < box_width; ++i) out << "═";
    out << "╗\n";

    out << "║";
    for (int i = 0; i < padding; ++i) out << " ";
    out << title;
    for (int i = 0; i < box_width - padding - static_cast<int>(title.length()); ++i) out << " ";
    out << "║\n";

    out << "╚";
    for (int i = 0; i < box_width; ++i) out << "═";
    out << "╝\n\n";
}

void Display::render_resources(std::ostream& out, const std::optional<ResourceSample>& resources) {
    if (!resources) {
        out << "[Resources]  " << colorize("no sample collected yet", Tone::Warning) << "\n\n";
        return;
    }

    const auto& r = *resources;

    Tone cpu_tone = tone_for_percent(r.cpu.usage_percent);
    out << "[CPU]     " << create_progress_bar(r.cpu.usage_percent, kBarWidth, cpu_tone)
        << "  " << colorize(std::to_string(static_cast<int>(r.cpu.usage_percent)) + "%", cpu_tone);
    if (!r.cpu.load_averages.empty()) {
        out << "  load";
        for (double load : r.cpu.load_averages) {
            out << " " << std::fixed << std::setprecision(2) << load;
        }
    }
    out << "\n";

    Tone mem_tone = tone_for_percent(r.memory.usage_percent);
    out << "[Memory]  " << create_progress_bar(r.memory.usage_percent, kBarWidth, mem_tone)
        << "  " << colorize(std::to_string(static_cast<int>(r.memory.usage_percent)) + "%", mem_tone)
        << " (" << format_bytes(r.memory.used_bytes) << " / " << format_bytes(r.memory.total_bytes) << ")\n";

    Tone disk_tone = tone_for_percent(r.disk.usage_percent);
    out << "[Disk]    " << create_progress_bar(r.disk.usage_percent, kBarWidth, disk_tone)
        << "  " << colorize(std::to_string(static_cast<int>(r.disk.usage_percent)) + "%", disk_tone)
        << " (" << format_bytes(r.disk.used_bytes) << " / " << format_bytes(r.disk.total_bytes) << ")\n";

    out << "[Network] RX: " << format_bytes(r.network.bytes_in)
        << ", TX: " << format_bytes(r.network.bytes_out)
        << ", connections: " << r.network.active_connections << "\n\n";
}

void Display::render_application(std::ostream& out, const ApplicationSnapshot& app) {
    const std::ios_base::fmtflags flags = out.flags();
    const std::streamsize precision = out.precision();

    out << std::fixed << std::setprecision(1);
    out << "[Application]\n";
    out << "  Sessions   active " << app.sessions.active << ", total " << app.sessions.total
        << ", expired " << app.sessions.expired_count << "\n";
    out << "  Calls      " << app.calls.successful << "/" << app.calls.total << " ok, "
        << app.calls.failed << " failed, avg " << app.calls.average_duration_ms << " ms\n";
    out << "  API        " << app.api.successful_requests << "/" << app.api.total_requests << " ok, "
        << app.api.failed_requests << " failed, avg " << app.api.average_response_time_ms << " ms\n";
    out << "  Inference  " << app.inference.successful_requests << "/" << app.inference.total_requests
        << " ok, " << app.inference.failed_requests << " failed, avg "
        << app.inference.average_response_time_ms << " ms, " << app.inference.tokens_consumed << " tokens\n";
    out << "  Errors     " << app.errors.total;
    for (const auto& [kind, count] : app.errors.count_by_kind) {
        out << "  " << kind << "=" << count;
    }
    out << "\n\n";

    out.flags(flags);
    out.precision(precision);
}

void Display::render_alerts(std::ostream& out, const std::vector<Alert>& alerts) {
    const std::size_t limit = static_cast<std::size_t>(std::max(0, config_.max_alerts_shown));
    out << "[Active Alerts - " << alerts.size() << "]\n";

    if (alerts.empty()) {
        out << "  " << colorize("No active alerts", Tone::Ok) << "\n";
    } else {
        // Newest last
        size_t start = alerts.size() > limit ? alerts.size() - limit : 0;
        for (size_t i = start; i < alerts.size(); ++i) {
            const auto& alert = alerts[i];
            out << "  " << format_timestamp(alert.timestamp) << " | "
                << colorize(alert.title, tone_for(alert.severity)) << " | " << alert.message << "\n";
        }
    }
    out << "\n";
}

void Display::render_health(std::ostream& out, const HealthReport& health) {
    out << "[Health]  " << (health.overall ? colorize("HEALTHY", Tone::Ok)
                                           : colorize("UNHEALTHY", Tone::Critical)) << "\n";
    for (const auto& check : health.checks) {
        out << "  " << std::setw(15) << std::left << check.name << std::right
            << (check.result.healthy ? colorize("ok", Tone::Ok) : colorize("failing", Tone::Critical));
        if (check.result.error) {
            out << "  " << *check.result.error;
        }
        out << "\n";
    }
    out << "\n";
}

void Display::render(const DashboardData& data, std::ostream& out, bool clear_screen) {
    if (clear_screen) {
        out << "\033[2J\033[H";
    }

    render_header(out, data.uptime);
    render_resources(out, data.resources);
    render_application(out, data.application);
    render_alerts(out, data.active_alerts);
    render_health(out, data.health);
    out << std::flush;
}

} // namespace telemon
