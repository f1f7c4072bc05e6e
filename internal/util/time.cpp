#include "time.hpp"

namespace relaystore::util {

int64_t ElapsedMillis(Stopwatch::time_point start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(Stopwatch::now() - start).count();
}

} // namespace relaystore::util
