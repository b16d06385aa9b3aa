#pragma once

#include "settings/IMetricsSettings.hpp"
#include <string>
#include <vector>

namespace registry::settings {

/**
 * @brief Метрики Session Registry
 *
 * - HTTP метрики (method + нормализованный path)
 * - Бизнес метрики (создание, остановка, отметки, коллизии токенов)
 */
class MetricsSettings : public IMetricsSettings {
public:
    std::vector<MetricDefinition> getDefinitions() const override {
        return {
            {"http_requests_total", "Total HTTP requests", "counter"},
            {"sessions_created_total", "Total sessions created", "counter"},
            {"sessions_stopped_total", "Total stop requests for existing sessions", "counter"},
            {"attendance_submissions_total", "Attendance submissions by outcome", "counter"},
            {"token_collisions_total", "Generated tokens rejected as already taken", "counter"}
        };
    }

    std::vector<std::string> getAllKeys() const override {
        return {
            // ============================================
            // HTTP метрики (method + path)
            // ============================================
            "http_requests_total{method=\"GET\",path=\"/health\"}",
            "http_requests_total{method=\"GET\",path=\"/metrics\"}",
            "http_requests_total{method=\"POST\",path=\"/api/v1/sessions\"}",
            "http_requests_total{method=\"POST\",path=\"/api/v1/sessions/*/stop\"}",
            "http_requests_total{method=\"GET\",path=\"/api/v1/sessions/*/status\"}",
            "http_requests_total{method=\"GET\",path=\"/api/v1/organizations/*/sessions/active\"}",
            "http_requests_total{method=\"POST\",path=\"/api/v1/attendance\"}",

            // ============================================
            // Бизнес метрики
            // ============================================
            "sessions_created_total",
            "sessions_stopped_total",
            "attendance_submissions_total{status=\"success\"}",
            "attendance_submissions_total{status=\"already_recorded\"}",
            "attendance_submissions_total{status=\"session_expired\"}",
            "attendance_submissions_total{status=\"invalid_token\"}",
            "token_collisions_total"
        };
    }
};

} // namespace registry::settings
