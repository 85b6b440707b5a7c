#include "telemon/metrics_collector.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <sys/statvfs.h>

namespace telemon {

class LinuxMetricsCollector : public MetricsCollector {
public:
    CpuTimes read_cpu_times() override {
        std::ifstream stat_file("/proc/stat");
        std::string line;
        if (!std::getline(stat_file, line)) {
            throw std::runtime_error("Failed to read /proc/stat");
        }

        std::istringstream iss(line);
        std::string cpu;
        unsigned long long user = 0, nice = 0, system = 0, idle = 0, iowait = 0,
                           irq = 0, softirq = 0, steal = 0;
        iss >> cpu >> user >> nice >> system >> idle >> iowait >> irq >> softirq >> steal;
        if (cpu != "cpu") {
            throw std::runtime_error("Unexpected /proc/stat layout");
        }

        CpuTimes times;
        times.total_ticks = user + nice + system + idle + iowait + irq + softirq + steal;
        times.idle_ticks = idle + iowait;
        return times;
    }

    std::vector<double> load_averages() override {
        std::ifstream loadavg("/proc/loadavg");
        double one = 0.0, five = 0.0, fifteen = 0.0;
        if (!(loadavg >> one >> five >> fifteen)) {
            throw std::runtime_error("Failed to read /proc/loadavg");
        }
        return {one, five, fifteen};
    }

    MemoryUsage collect_memory() override {
        MemoryUsage metrics;

        std::ifstream meminfo("/proc/meminfo");
        if (!meminfo.is_open()) {
            throw std::runtime_error("Failed to open /proc/meminfo");
        }

        std::string line;
        while (std::getline(meminfo, line)) {
            std::istringstream iss(line);
            std::string key;
            uint64_t value = 0;
            iss >> key >> value;

            // Convert kB to bytes
            value *= 1024;

            if (key == "MemTotal:") {
                metrics.total_bytes = value;
            } else if (key == "MemAvailable:") {
                metrics.free_bytes = value;
            }
        }

        metrics.used_bytes = metrics.total_bytes - metrics.free_bytes;
        if (metrics.total_bytes > 0) {
            metrics.usage_percent = static_cast<double>(metrics.used_bytes) / metrics.total_bytes * 100.0;
        }
        return metrics;
    }

    DiskUsage collect_disk(const std::string& mount_point) override {
        DiskUsage disk;

        struct statvfs stat;
        if (statvfs(mount_point.c_str(), &stat) != 0) {
            throw std::runtime_error("statvfs failed for " + mount_point);
        }

        disk.total_bytes = static_cast<uint64_t>(stat.f_blocks) * stat.f_frsize;
        disk.free_bytes = static_cast<uint64_t>(stat.f_bfree) * stat.f_frsize;
        disk.used_bytes = disk.total_bytes - disk.free_bytes;
        if (disk.total_bytes > 0) {
            disk.usage_percent = static_cast<double>(disk.used_bytes) / disk.total_bytes * 100.0;
        }
        return disk;
    }

    NetworkUsage collect_network() override {
        NetworkUsage usage;

        std::ifstream net_file("/proc/net/dev");
        std::string line;

        // Skip header lines
        std::getline(net_file, line);
        std::getline(net_file, line);

        while (std::getline(net_file, line)) {
            size_t colon = line.find(':');
            if (colon == std::string::npos) continue;

            std::string if_name = line.substr(0, colon);
            if_name.erase(0, if_name.find_first_not_of(' '));
            if (if_name == "lo") continue;

            // 8 receive columns, then transmit bytes
            std::istringstream iss(line.substr(colon + 1));
            uint64_t rx_bytes = 0, tx_bytes = 0, skip = 0;
            iss >> rx_bytes;
            for (int i = 0; i < 7; ++i) iss >> skip;
            iss >> tx_bytes;

            usage.bytes_in += rx_bytes;
            usage.bytes_out += tx_bytes;
        }

        usage.active_connections = count_established("/proc/net/tcp") +
                                   count_established("/proc/net/tcp6");
        return usage;
    }

private:
    static uint32_t count_established(const std::string& path) {
        std::ifstream tcp_file(path);
        std::string line;
        uint32_t count = 0;

        std::getline(tcp_file, line); // header
        while (std::getline(tcp_file, line)) {
            std::istringstream iss(line);
            std::string slot, local, remote, state;
            iss >> slot >> local >> remote >> state;
            if (state == "01") {  // TCP_ESTABLISHED
                ++count;
            }
        }
        return count;
    }
};

std::unique_ptr<MetricsCollector> create_linux_metrics_collector() {
    return std::make_unique<LinuxMetricsCollector>();
}

} // namespace telemon
