#pragma once

#include <IHttpHandler.hpp>
#include <IRequest.hpp>
#include <IResponse.hpp>
#include "domain/Timestamp.hpp"
#include "ports/output/IClock.hpp"
#include <nlohmann/json.hpp>
#include <memory>

namespace registry::adapters::primary {

/**
 * @brief GET /health
 *
 * Кроме статуса отдаёт часы реестра: истечение сессий считается
 * только по ним, и по server_time удобно сверять расхождение часов устройства.
 */
class HealthHandler : public IHttpHandler {
public:
    explicit HealthHandler(std::shared_ptr<proximity::ports::output::IClock> clock)
        : clock_(std::move(clock)) {}

    void handle(IRequest& req, IResponse& res) override {
        auto now = clock_->now();

        nlohmann::json response;
        response["status"] = "healthy";
        response["service"] = "session-registry";
        response["version"] = "1.0.0";
        response["server_time"] = proximity::domain::Timestamp::format(now);
        response["server_epoch_seconds"] = proximity::domain::Timestamp::toEpochSeconds(now);

        res.setResult(200, "application/json", response.dump());
    }

private:
    std::shared_ptr<proximity::ports::output::IClock> clock_;
};

} // namespace registry::adapters::primary
