#pragma once

#include <chrono>
#include <cstdint>

namespace relaystore::util {

using Stopwatch = std::chrono::steady_clock;

// Milliseconds since a Stopwatch::now() reading.
int64_t ElapsedMillis(Stopwatch::time_point start);

} // namespace relaystore::util
