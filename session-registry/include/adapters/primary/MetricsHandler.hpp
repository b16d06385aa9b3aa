#pragma once

#include <IHttpHandler.hpp>
#include <IRequest.hpp>
#include <IResponse.hpp>
#include "ports/input/IMetricsService.hpp"

#include <memory>

namespace registry::adapters::primary {

/**
 * @brief GET /metrics
 *
 * @example
 * ```
 * # HELP attendance_submissions_total Attendance submissions by outcome
 * # TYPE attendance_submissions_total counter
 * attendance_submissions_total{status="success"} 42
 * attendance_submissions_total{status="session_expired"} 3
 * ```
 */
class MetricsHandler : public IHttpHandler {
public:
    static constexpr const char* CONTENT_TYPE = "text/plain; version=0.0.4; charset=utf-8";

    explicit MetricsHandler(std::shared_ptr<ports::input::IMetricsService> metrics)
        : metrics_(std::move(metrics)) {}

    void handle(IRequest& req, IResponse& res) override {
        res.setResult(200, CONTENT_TYPE, metrics_->toPrometheusFormat());
    }

private:
    std::shared_ptr<ports::input::IMetricsService> metrics_;
};

} // namespace registry::adapters::primary
