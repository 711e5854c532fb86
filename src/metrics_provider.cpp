#include "vitalmon/metrics_provider.hpp"

namespace vitalmon {

// Platform-specific implementations are in platform/ subdirectory

#if defined(__linux__)
    std::unique_ptr<MetricsProvider> create_metrics_provider() {
        extern std::unique_ptr<MetricsProvider> create_linux_metrics_provider();
        return create_linux_metrics_provider();
    }
#else
    #error "Unsupported platform"
#endif

} // namespace vitalmon
