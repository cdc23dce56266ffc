#include "synccore/core/time.hpp"

#include <cctype>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace synccore {
namespace {

std::time_t utc_to_time_t(std::tm& tm) {
#ifdef _WIN32
    return _mkgmtime(&tm);
#else
    return timegm(&tm);
#endif
}

bool utc_breakdown(std::time_t seconds, std::tm& out) {
#ifdef _WIN32
    return gmtime_s(&out, &seconds) == 0;
#else
    return gmtime_r(&seconds, &out) != nullptr;
#endif
}

} // namespace

std::string format_timestamp(Timestamp timestamp) {
    using namespace std::chrono;
    const auto since_epoch = duration_cast<microseconds>(timestamp.time_since_epoch());
    auto seconds = duration_cast<std::chrono::seconds>(since_epoch);
    auto micros = since_epoch - duration_cast<microseconds>(seconds);
    if (micros.count() < 0) {
        seconds -= std::chrono::seconds(1);
        micros += std::chrono::seconds(1);
    }

    std::tm tm{};
    if (!utc_breakdown(static_cast<std::time_t>(seconds.count()), tm)) {
        return std::string();
    }

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(6) << std::setfill('0') << micros.count() << 'Z';
    return oss.str();
}

Result<Timestamp> parse_timestamp(const std::string& text) {
    std::tm tm{};
    std::istringstream iss(text);
    iss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (iss.fail()) {
        return Err<Timestamp>(Error{ErrorCode::Serialization, "Invalid timestamp: " + text});
    }

    std::int64_t micros = 0;
    if (iss.peek() == '.') {
        iss.get();
        int digits = 0;
        while (std::isdigit(iss.peek())) {
            const int digit = iss.get() - '0';
            if (digits < 6) {
                micros = micros * 10 + digit;
            }
            ++digits;
        }
        if (digits == 0 || digits > 9) {
            return Err<Timestamp>(Error{ErrorCode::Serialization, "Invalid fractional seconds: " + text});
        }
        for (int i = digits; i < 6; ++i) {
            micros *= 10;
        }
    }

    if (iss.peek() == 'Z') {
        iss.get();
    }
    if (iss.peek() != std::char_traits<char>::eof()) {
        return Err<Timestamp>(Error{ErrorCode::Serialization, "Trailing characters in timestamp: " + text});
    }

    const std::time_t seconds = utc_to_time_t(tm);
    return Ok(Timestamp(std::chrono::seconds(seconds)) + std::chrono::microseconds(micros));
}

Timestamp timestamp_from_millis(std::int64_t millis) {
    return Timestamp(std::chrono::milliseconds(millis));
}

} // namespace synccore
