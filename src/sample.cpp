#include "vitalmon/sample.hpp"
#include <numeric>

namespace vitalmon {

std::optional<double> Sample::cpu_mean() const {
    if (!cpu_per_core || cpu_per_core->empty()) {
        return std::nullopt;
    }
    double sum = std::accumulate(cpu_per_core->begin(), cpu_per_core->end(), 0.0);
    return sum / static_cast<double>(cpu_per_core->size());
}

} // namespace vitalmon
