#include "core/time_utils.hpp"

#include <chrono>
#include <cmath>

namespace camio {

int64_t nowSteadyNs() {
    const auto now = std::chrono::steady_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::nanoseconds>(now).count();
}

int64_t secondsToNs(double seconds) {
    return static_cast<int64_t>(std::llround(seconds * 1e9));
}

double nsToSeconds(int64_t ns) {
    return static_cast<double>(ns) * 1e-9;
}

}  // namespace camio
