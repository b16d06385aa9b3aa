#pragma once

#include <map>
#include <string>

namespace registry::ports::input {

/**
 * @brief Счётчики в формате Prometheus
 *
 * @example
 * ```cpp
 * metrics->increment("sessions_created_total");
 * metrics->increment("attendance_submissions_total", {{"status", "success"}});
 * ```
 */
class IMetricsService {
public:
    virtual ~IMetricsService() = default;

    /**
     * @brief Увеличить счётчик на 1, создав его при отсутствии
     */
    virtual void increment(
        const std::string& name,
        const std::map<std::string, std::string>& labels = {}
    ) = 0;

    virtual int64_t value(
        const std::string& name,
        const std::map<std::string, std::string>& labels = {}
    ) const = 0;

    /**
     * @return Prometheus text format (version 0.0.4)
     */
    virtual std::string toPrometheusFormat() const = 0;
};

} // namespace registry::ports::input
