#pragma once

#include <string>
#include <chrono>
#include <sstream>
#include <iomanip>
#include <ctime>
#include <cstdint>
#include <cctype>

namespace ordercore::domain {

/**
 * @brief Временная метка (UTC, точность до миллисекунд)
 */
class Timestamp {
public:
    std::chrono::system_clock::time_point value;

    Timestamp() : value(std::chrono::system_clock::now()) {}

    explicit Timestamp(std::chrono::system_clock::time_point tp) : value(tp) {}

    static Timestamp now() {
        return Timestamp(std::chrono::system_clock::now());
    }

    static Timestamp fromMillis(int64_t epochMillis) {
        return Timestamp(std::chrono::system_clock::time_point(std::chrono::milliseconds(epochMillis)));
    }

    int64_t toMillis() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(value.time_since_epoch()).count();
    }

    /**
     * @brief Разбор ISO 8601 ("2024-05-01T10:00:00.123Z"), миллисекунды опциональны
     */
    static Timestamp fromString(const std::string& str) {
        std::tm tm = {};
        std::istringstream ss(str);
        ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
        auto tp = std::chrono::system_clock::from_time_t(timegm(&tm));

        auto dot = str.find('.');
        if (dot != std::string::npos) {
            int millis = 0;
            int digits = 0;
            for (size_t i = dot + 1; i < str.size() && digits < 3 && std::isdigit(static_cast<unsigned char>(str[i])); ++i, ++digits) {
                millis = millis * 10 + (str[i] - '0');
            }
            for (; digits < 3; ++digits) {
                millis *= 10;
            }
            tp += std::chrono::milliseconds(millis);
        }
        return Timestamp(tp);
    }

    std::string toString() const {
        auto time_t_val = std::chrono::system_clock::to_time_t(value);
        std::tm tm = {};
        gmtime_r(&time_t_val, &tm);
        auto millis = toMillis() % 1000;
        if (millis < 0) millis += 1000;

        std::ostringstream ss;
        ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
           << '.' << std::setfill('0') << std::setw(3) << millis << 'Z';
        return ss.str();
    }

    template <typename Rep, typename Period>
    Timestamp plus(std::chrono::duration<Rep, Period> d) const {
        return Timestamp(value + std::chrono::duration_cast<std::chrono::system_clock::duration>(d));
    }

    bool operator<(const Timestamp& other) const { return value < other.value; }
    bool operator>(const Timestamp& other) const { return value > other.value; }
    bool operator<=(const Timestamp& other) const { return value <= other.value; }
    bool operator>=(const Timestamp& other) const { return value >= other.value; }
    bool operator==(const Timestamp& other) const { return value == other.value; }
};

} // namespace ordercore::domain
