#pragma once
#include <iostream>
#include <string>
#include <string_view>
#include <ctime>
#include <iomanip>
#include <locale>
#include <sstream>
#include <cctype>
#include <cstdint>
#include <thread>

#include "errors.hpp"

#ifdef _WIN32
#include <windows.h>
#include <pthread.h>
#else
#include <sched.h> // Required for CPU affinity functions on Linux/POSIX
#endif

inline bool is_leap_year(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

inline int days_in_month(int year, int month) {
    static constexpr int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && is_leap_year(year)) {
        return 29;
    }
    return days[month - 1];
}

/**
 * @brief Converts a feed timestamp (yyyy-mm-ddThh:mm:ssZ) into the store format (yyyy-mm-dd hh:mm:ss).
 *
 * No timezone shift is applied; only the representation changes.
 * @throws TimestampError when the input does not match the wire format or names an impossible date.
 */
inline std::string normalize_feed_timestamp(const std::string& timestamp_str) {
    // std::get_time skips leading whitespace; the wire format starts with the year.
    if (timestamp_str.empty() || !std::isdigit(static_cast<unsigned char>(timestamp_str.front()))) {
        throw TimestampError("cannot parse '" + timestamp_str + "'");
    }

    std::tm t = {};
    std::istringstream ss(timestamp_str);
    ss.imbue(std::locale::classic());

    ss >> std::get_time(&t, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) {
        throw TimestampError("cannot parse '" + timestamp_str + "'");
    }
    if (ss.get() != 'Z' || ss.peek() != std::char_traits<char>::eof()) {
        throw TimestampError("expected trailing 'Z' in '" + timestamp_str + "'");
    }

    const int year = t.tm_year + 1900;
    const int month = t.tm_mon + 1;
    if (month < 1 || month > 12 || t.tm_mday < 1 || t.tm_mday > days_in_month(year, month)) {
        throw TimestampError("no such date in '" + timestamp_str + "'");
    }
    if (t.tm_hour > 23 || t.tm_min > 59 || t.tm_sec > 59) {
        throw TimestampError("no such time in '" + timestamp_str + "'");
    }

    std::ostringstream out;
    out.imbue(std::locale::classic());
    out << std::put_time(&t, "%Y-%m-%d %H:%M:%S");
    return out.str();
}

// "Low Temperature Diamonds " -> "LowTemperatureDiamonds"
inline std::string strip_whitespace(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            out.push_back(c);
        }
    }
    return out;
}


/**
 * @brief Pins a thread to a specific CPU core.
 * @param cpu_num The CPU core number to pin the thread to.
 * @return false when the affinity could not be applied.
 */
inline bool pin_thread_to_cpu(std::thread& t, int cpu_num) {
#ifdef _WIN32
    // Windows implementation
    HANDLE handle = static_cast<HANDLE>(t.native_handle());
    DWORD_PTR mask = 1LL << cpu_num;
    if (SetThreadAffinityMask(handle, mask) == 0) {
        std::cerr << "Error: Failed to pin thread to CPU " << cpu_num << ". Error code: " << GetLastError() << std::endl;
        return false;
    }
#else
    // Linux/POSIX implementation
    cpu_set_t cpuset;
    CPU_ZERO(&cpuset);
    CPU_SET(cpu_num, &cpuset);
    int rc = pthread_setaffinity_np(t.native_handle(), sizeof(cpu_set_t), &cpuset);
    if (rc != 0) {
        std::cerr << "Error: Failed to pin thread to CPU " << cpu_num << ". Error code: " << rc << std::endl;
        return false;
    }
#endif
    return true;
}
