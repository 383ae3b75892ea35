#include <msgdec/value/timestamp.h>

#include <cstdio>
#include <limits>

namespace msgdec::value {

namespace {

constexpr int64_t kNanosPerSecond = 1'000'000'000;

// Whole seconds whose every sub-second offset fits an int64 nanosecond count.
constexpr int64_t kMaxSeconds = std::numeric_limits<int64_t>::max() / kNanosPerSecond - 1;
constexpr int64_t kMinSeconds = std::numeric_limits<int64_t>::min() / kNanosPerSecond;
// |nanos / 1e9| never exceeds this.
constexpr int64_t kMaxCarry = std::numeric_limits<int64_t>::max() / kNanosPerSecond + 1;

}  // namespace

bool timestamp_representable(int64_t seconds, int64_t nanos) {
    if (seconds > kMaxSeconds + kMaxCarry || seconds < kMinSeconds - kMaxCarry) {
        return false;
    }
    int64_t carry = nanos / kNanosPerSecond;
    if (nanos % kNanosPerSecond < 0) {
        carry -= 1;
    }
    const int64_t total = seconds + carry;
    return total >= kMinSeconds && total <= kMaxSeconds;
}

Timestamp make_timestamp(int64_t seconds, int64_t nanos) {
    seconds += nanos / kNanosPerSecond;
    nanos %= kNanosPerSecond;
    if (nanos < 0) {
        nanos += kNanosPerSecond;
        seconds -= 1;
    }
    return Timestamp(std::chrono::seconds(seconds)) + std::chrono::nanoseconds(nanos);
}

int64_t timestamp_seconds(const Timestamp& ts) {
    return std::chrono::floor<std::chrono::seconds>(ts).time_since_epoch().count();
}

int64_t timestamp_nanos(const Timestamp& ts) {
    auto whole = std::chrono::floor<std::chrono::seconds>(ts);
    return (ts - whole).count();
}

std::string format_timestamp(const Timestamp& ts) {
    auto day = std::chrono::floor<std::chrono::days>(ts);
    std::chrono::year_month_day ymd{day};
    std::chrono::hh_mm_ss<std::chrono::nanoseconds> tod{ts - day};

    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02u-%02uT%02lld:%02lld:%02lld.%09lldZ",
                  static_cast<int>(ymd.year()),
                  static_cast<unsigned>(ymd.month()),
                  static_cast<unsigned>(ymd.day()),
                  static_cast<long long>(tod.hours().count()),
                  static_cast<long long>(tod.minutes().count()),
                  static_cast<long long>(tod.seconds().count()),
                  static_cast<long long>(tod.subseconds().count()));
    return buffer;
}

}  // namespace msgdec::value
