#pragma once

#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace ledger::domain {

/**
 * @brief Временная метка (UTC, точность до секунды)
 *
 * Локальные даты тенантов вычисляются по смещению в минутах
 * (по умолчанию JST, +540).
 */
class Timestamp {
public:
    std::chrono::system_clock::time_point value;

    Timestamp() : value(std::chrono::system_clock::now()) {}

    explicit Timestamp(std::chrono::system_clock::time_point tp) : value(tp) {}

    static Timestamp now() {
        return Timestamp(std::chrono::system_clock::now());
    }

    static Timestamp fromEpochSeconds(int64_t seconds) {
        return Timestamp(std::chrono::system_clock::time_point(std::chrono::seconds(seconds)));
    }

    static Timestamp fromString(const std::string& str) {
        // ISO 8601, всегда UTC
        std::tm tm = {};
        std::istringstream ss(str);
        ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
        return Timestamp(std::chrono::system_clock::from_time_t(timegm(&tm)));
    }

    int64_t epochSeconds() const {
        return std::chrono::duration_cast<std::chrono::seconds>(value.time_since_epoch()).count();
    }

    std::string toString() const {
        auto time_t_val = std::chrono::system_clock::to_time_t(value);
        std::tm tm = *std::gmtime(&time_t_val);

        std::ostringstream ss;
        ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
        return ss.str();
    }

    Timestamp addMinutes(int64_t minutes) const {
        return Timestamp(value + std::chrono::minutes(minutes));
    }

    Timestamp addHours(int64_t hours) const {
        return Timestamp(value + std::chrono::hours(hours));
    }

    Timestamp addDays(int64_t days) const {
        return Timestamp(value + std::chrono::hours(24 * days));
    }

    /// "YYYY-MM-DD" в часовом поясе тенанта
    std::string localDate(int offsetMinutes) const {
        return formatLocal(offsetMinutes, "%Y-%m-%d");
    }

    /// "YYYY-MM" в часовом поясе тенанта
    std::string localYearMonth(int offsetMinutes) const {
        return formatLocal(offsetMinutes, "%Y-%m");
    }

    int localDayOfMonth(int offsetMinutes) const {
        return localTm(offsetMinutes).tm_mday;
    }

    bool operator<(const Timestamp& other) const { return value < other.value; }
    bool operator<=(const Timestamp& other) const { return value <= other.value; }
    bool operator>(const Timestamp& other) const { return value > other.value; }
    bool operator==(const Timestamp& other) const { return value == other.value; }

private:
    std::tm localTm(int offsetMinutes) const {
        auto shifted = value + std::chrono::minutes(offsetMinutes);
        auto time_t_val = std::chrono::system_clock::to_time_t(shifted);
        return *std::gmtime(&time_t_val);
    }

    std::string formatLocal(int offsetMinutes, const char* format) const {
        std::tm tm = localTm(offsetMinutes);
        std::ostringstream ss;
        ss << std::put_time(&tm, format);
        return ss.str();
    }
};

} // namespace ledger::domain
