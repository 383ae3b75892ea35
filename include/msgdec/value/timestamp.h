#pragma once
#include <chrono>
#include <cstdint>
#include <string>

namespace msgdec::value {

// UTC instant with nanosecond resolution. On the wire it is a 2-element
// sequence of signed 64-bit integers: seconds since the epoch, then the
// nanosecond offset.
using Timestamp = std::chrono::sys_time<std::chrono::nanoseconds>;

// True when (seconds, nanos), after carrying the nanoseconds into the
// seconds, lies within the range a Timestamp holds (about +/-292 years
// around 1970).
bool timestamp_representable(int64_t seconds, int64_t nanos);

// Builds the instant for (seconds, nanos). A nanosecond offset outside
// [0, 1e9) carries into the seconds. The pair must be representable.
Timestamp make_timestamp(int64_t seconds, int64_t nanos);

int64_t timestamp_seconds(const Timestamp& ts);
int64_t timestamp_nanos(const Timestamp& ts);

// "2024-01-02T03:04:05.000000006Z"
std::string format_timestamp(const Timestamp& ts);

}  // namespace msgdec::value
