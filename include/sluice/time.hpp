#ifndef SLUICE_TIME_HEADER
#define SLUICE_TIME_HEADER

#include <chrono>

namespace sluice {

using clock = std::chrono::steady_clock;

using time_point = clock::time_point;
using duration = clock::duration;

using std::chrono::milliseconds;
using std::chrono::seconds;

using std::chrono::duration_cast;

} // namespace sluice

#endif // SLUICE_TIME_HEADER
