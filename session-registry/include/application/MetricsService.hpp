#pragma once

#include "ports/input/IMetricsService.hpp"
#include "settings/IMetricsSettings.hpp"

#include <atomic>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <sstream>
#include <string>
#include <unordered_map>

namespace registry::application {

/**
 * @brief Счётчики реестра в памяти процесса
 *
 * Ключи из MetricsSettings заводятся нулями при старте, поэтому /metrics
 * показывает все исходы отметки ещё до первого запроса. Ключи вне настроек
 * считаются (value() их видит), но в экспорт не попадают.
 * Инкремент существующего ключа идёт под shared_lock.
 */
class MetricsService : public ports::input::IMetricsService {
public:
    explicit MetricsService(std::shared_ptr<settings::IMetricsSettings> settings)
        : settings_(std::move(settings))
    {
        for (const auto& key : settings_->getAllKeys()) {
            counters_[key] = std::make_unique<std::atomic<int64_t>>(0);
        }

        std::cout << "[MetricsService] Initialized with "
                  << counters_.size() << " metrics" << std::endl;
    }

    void increment(
        const std::string& name,
        const std::map<std::string, std::string>& labels = {}
    ) override {
        std::string key = buildKey(name, labels);

        {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            auto it = counters_.find(key);
            if (it != counters_.end()) {
                it->second->fetch_add(1, std::memory_order_relaxed);
                return;
            }
        }

        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = counters_.find(key);
        if (it != counters_.end()) {
            it->second->fetch_add(1, std::memory_order_relaxed);
        } else {
            counters_[key] = std::make_unique<std::atomic<int64_t>>(1);
        }
    }

    int64_t value(
        const std::string& name,
        const std::map<std::string, std::string>& labels = {}
    ) const override {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = counters_.find(buildKey(name, labels));
        return it == counters_.end() ? 0 : it->second->load(std::memory_order_relaxed);
    }

    std::string toPrometheusFormat() const override {
        std::ostringstream oss;

        for (const auto& def : settings_->getDefinitions()) {
            oss << "# HELP " << def.name << " " << def.help << "\n";
            oss << "# TYPE " << def.name << " " << def.type << "\n";
        }

        std::shared_lock<std::shared_mutex> lock(mutex_);
        for (const auto& key : settings_->getAllKeys()) {
            auto it = counters_.find(key);
            if (it != counters_.end()) {
                oss << key << " " << it->second->load(std::memory_order_relaxed) << "\n";
            }
        }
        return oss.str();
    }

private:
    std::shared_ptr<settings::IMetricsSettings> settings_;
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::unique_ptr<std::atomic<int64_t>>> counters_;

    /// name{a="1",b="2"}, метки в порядке std::map
    static std::string buildKey(
        const std::string& name,
        const std::map<std::string, std::string>& labels
    ) {
        if (labels.empty()) {
            return name;
        }

        std::string key = name + "{";
        for (auto it = labels.begin(); it != labels.end(); ++it) {
            if (it != labels.begin()) {
                key += ",";
            }
            key += it->first + "=\"" + escapeLabelValue(it->second) + "\"";
        }
        return key + "}";
    }

    /// Prometheus text format: \\, \" и \n в значениях меток экранируются
    static std::string escapeLabelValue(const std::string& value) {
        std::string escaped;
        escaped.reserve(value.size());
        for (char c : value) {
            switch (c) {
                case '\\': escaped += "\\\\"; break;
                case '"':  escaped += "\\\""; break;
                case '\n': escaped += "\\n"; break;
                default:   escaped += c;
            }
        }
        return escaped;
    }
};

} // namespace registry::application
