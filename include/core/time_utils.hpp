#pragma once

#include <cstdint>

namespace camio {

int64_t nowSteadyNs();
int64_t secondsToNs(double seconds);
double nsToSeconds(int64_t ns);

}  // namespace camio
