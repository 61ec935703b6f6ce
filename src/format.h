#pragma once

#include <chrono>
#include <cstdint>
#include <iomanip>
#include <ios>
#include <limits>
#include <stdexcept>
#include <sstream>
#include <string>
#include <type_traits>

using Clock = std::chrono::system_clock;

enum class Precision : std::uint8_t { One = 1, Two, Three, Four, Five, Six, Seven, Eight, Nine, Ten, Full };

template<Precision P = Precision::Six, typename T>
inline std::string f(const std::string& key, const T& value) {
    std::stringstream ss;
    // For floating-point types, set precision based on the Precision enum.
    if constexpr(std::is_floating_point_v<T>) {
        if constexpr(P == Precision::Full) {
            ss << std::fixed << std::setprecision(std::numeric_limits<T>::max_digits10);
        } else {
            ss << std::fixed << std::setprecision(static_cast<int>(P));
        }
    }
    ss << std::boolalpha;
    ss << key << "=";
    // If T is convertible to std::string, check for spaces and add quotes if needed.
    if constexpr(std::is_convertible<T, std::string>::value) {
        std::string s_value = value;
        if(s_value.find(' ') != std::string::npos) {
            ss << "\"" << s_value << "\"";
        } else {
            ss << s_value;
        }
    } else {
        ss << value;
    }
    return ss.str();
}

// Format Clock::duration as "XhYmZsNms"
inline std::string format_duration(const Clock::duration& duration) {
    auto hours = std::chrono::duration_cast<std::chrono::hours>(duration);
    auto remainder = duration - hours;
    auto minutes = std::chrono::duration_cast<std::chrono::minutes>(remainder);
    remainder -= minutes;
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(remainder);
    remainder -= seconds;
    auto milliseconds = std::chrono::duration_cast<std::chrono::milliseconds>(remainder);

    std::stringstream ss;
    bool needs_separator = false;

    if(hours.count() > 0) {
        ss << hours.count() << "h";
        needs_separator = true;
    }
    if(needs_separator || minutes.count() > 0) {
        ss << minutes.count() << "m";
        needs_separator = true;
    }
    if(needs_separator || seconds.count() > 0) {
        ss << seconds.count() << "s";
        needs_separator = true;
    }
    if(milliseconds.count() > 0) {
        ss << milliseconds.count() << "ms";
    }

    if(ss.str().empty()) {
        return "0ms";
    }
    return ss.str();
}

// Format std::chrono::system_clock::time_point as "YYYY-MM-DDTHH:MM:SS.NNNNNN"
inline std::string format_time_point_iso8601(const Clock::time_point& time_point) {
    if(time_point == Clock::time_point{}) {
        return "-";
    }
    std::time_t tt = Clock::to_time_t(time_point);

    std::tm utc_tm;
    if(!gmtime_r(&tt, &utc_tm)) {
        throw std::runtime_error("Failed to convert time to UTC");
    }

    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(time_point.time_since_epoch()) % 1000000;

    std::ostringstream ss;
    ss << std::put_time(&utc_tm, "%Y-%m-%dT%H:%M:%S");
    ss << '.' << std::setfill('0') << std::setw(6) << micros.count() << 'Z';

    return ss.str();
}

// Seconds as a double, for key=value fields and status snapshots
inline double to_seconds(const Clock::duration& duration) {
    return std::chrono::duration<double>(duration).count();
}
