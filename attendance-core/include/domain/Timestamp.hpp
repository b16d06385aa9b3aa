#pragma once

#include <string>
#include <chrono>
#include <sstream>
#include <iomanip>
#include <optional>
#include <ctime>

namespace proximity::domain {

using TimePoint = std::chrono::system_clock::time_point;

/**
 * @brief Преобразования времени для wire-формата (ISO 8601, UTC)
 */
class Timestamp {
public:
    /**
     * @brief "2025-01-15T10:00:00Z"
     */
    static std::string format(TimePoint tp) {
        auto time_t_val = std::chrono::system_clock::to_time_t(tp);
        std::tm tm{};
        gmtime_r(&time_t_val, &tm);

        std::ostringstream ss;
        ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
        return ss.str();
    }

    /**
     * @brief Разбор ISO 8601 в UTC (секундная точность, суффикс Z необязателен)
     */
    static std::optional<TimePoint> parse(const std::string& str) {
        std::tm tm{};
        std::istringstream ss(str);
        ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
        if (ss.fail()) {
            return std::nullopt;
        }
        return std::chrono::system_clock::from_time_t(timegm(&tm));
    }

    static int64_t toEpochSeconds(TimePoint tp) {
        return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
    }

    static TimePoint fromEpochSeconds(int64_t seconds) {
        return TimePoint(std::chrono::seconds(seconds));
    }

    /**
     * @brief Отбросить доли секунды (точность хранения и wire-формата)
     */
    static TimePoint wholeSeconds(TimePoint tp) {
        return fromEpochSeconds(toEpochSeconds(tp));
    }

    /**
     * @brief Оставшиеся целые секунды до deadline (0, если уже прошло)
     */
    static int64_t secondsUntil(TimePoint now, TimePoint deadline) {
        if (now >= deadline) {
            return 0;
        }
        return std::chrono::duration_cast<std::chrono::seconds>(deadline - now).count();
    }
};

} // namespace proximity::domain
