#include "telemon/metrics_collector.hpp"

namespace telemon {

// Platform-specific implementations are in platform/ subdirectory

#ifdef __linux__
    std::unique_ptr<MetricsCollector> create_metrics_collector() {
        extern std::unique_ptr<MetricsCollector> create_linux_metrics_collector();
        return create_linux_metrics_collector();
    }
#else
    #error "Unsupported platform"
#endif

} // namespace telemon
