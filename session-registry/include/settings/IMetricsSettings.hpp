#pragma once

#include <string>
#include <vector>

namespace registry::settings {

/**
 * @brief Определение метрики для Prometheus (HELP и TYPE)
 */
struct MetricDefinition {
    std::string name;   ///< Имя метрики (например, "http_requests_total")
    std::string help;   ///< Описание метрики для HELP
    std::string type;   ///< Тип метрики: "counter", "gauge"
};

/**
 * @brief Интерфейс настроек метрик
 *
 * @note Ключи перечисляются заранее: они же задают порядок вывода
 *       и инициализируются нулями при старте.
 */
class IMetricsSettings {
public:
    virtual ~IMetricsSettings() = default;

    virtual std::vector<MetricDefinition> getDefinitions() const = 0;

    /**
     * @return Ключи в формате "metric_name{label1=\"value1\"}"
     */
    virtual std::vector<std::string> getAllKeys() const = 0;
};

} // namespace registry::settings
