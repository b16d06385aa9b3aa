#pragma once

#include <IHttpHandler.hpp>
#include <IRequest.hpp>
#include <IResponse.hpp>
#include "ports/input/ISessionRegistry.hpp"
#include "settings/RegistrySettings.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <memory>
#include <optional>

namespace registry::adapters::primary {

/**
 * @brief POST /api/v1/sessions
 *
 * Request:
 * ```json
 * {"org_id": "org-nhs-lincoln", "title": "Chapter Meeting",
 *  "starts_at": "2025-01-15T10:00:00Z", "duration_seconds": 3600}
 * ```
 * starts_at по умолчанию "сейчас" по часам реестра,
 * duration_seconds по умолчанию REGISTRY_DEFAULT_SESSION_SECONDS.
 *
 * 201 возвращает org_slug и server_time (часы реестра в момент создания),
 * по ним устройство проверяет, что окно уже открыто.
 *
 * Responses: 201 created, 400 validation_error, 404 unknown_organization,
 * 503 token_generation_failed.
 */
class CreateSessionHandler : public IHttpHandler {
public:
    CreateSessionHandler(
        std::shared_ptr<ports::input::ISessionRegistry> registry,
        std::shared_ptr<settings::RegistrySettings> settings
    ) : registry_(std::move(registry))
      , settings_(std::move(settings))
    {
        std::cout << "[CreateSessionHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override {
        using proximity::domain::CreateSessionStatus;
        using proximity::domain::Timestamp;

        try {
            auto body = nlohmann::json::parse(req.getBody());

            std::string orgId = body.value("org_id", "");
            std::string title = body.value("title", "");
            int64_t duration = body.value("duration_seconds", settings_->getDefaultSessionSeconds());

            std::optional<proximity::domain::TimePoint> startsAt;
            if (body.contains("starts_at") && !body["starts_at"].is_null()) {
                auto parsed = Timestamp::parse(body["starts_at"].get<std::string>());
                if (!parsed) {
                    sendStatus(res, 400, CreateSessionStatus::VALIDATION_ERROR, "starts_at must be ISO 8601");
                    return;
                }
                startsAt = *parsed;
            }

            auto result = registry_->createSession(orgId, title, startsAt, duration);

            if (result.created()) {
                nlohmann::json response;
                response["status"] = proximity::domain::toString(result.status);
                response["session_token"] = result.token->value();
                response["org_id"] = orgId;
                response["starts_at"] = Timestamp::format(result.startsAt);
                response["ends_at"] = Timestamp::format(result.endsAt);
                response["org_slug"] = result.orgSlug;
                response["server_time"] = Timestamp::format(result.registryNow);
                res.setResult(201, "application/json", response.dump());
                return;
            }

            sendStatus(res, httpStatusFor(result.status), result.status, result.message);

        } catch (const nlohmann::json::exception& e) {
            sendStatus(res, 400, CreateSessionStatus::VALIDATION_ERROR,
                std::string("Invalid JSON: ") + e.what());
        } catch (const std::exception& e) {
            std::cerr << "[CreateSessionHandler] Error: " << e.what() << std::endl;
            sendError(res, 500, "Internal server error");
        }
    }

private:
    std::shared_ptr<ports::input::ISessionRegistry> registry_;
    std::shared_ptr<settings::RegistrySettings> settings_;

    static int httpStatusFor(proximity::domain::CreateSessionStatus status) {
        switch (status) {
            case proximity::domain::CreateSessionStatus::CREATED: return 201;
            case proximity::domain::CreateSessionStatus::VALIDATION_ERROR: return 400;
            case proximity::domain::CreateSessionStatus::UNKNOWN_ORGANIZATION: return 404;
            case proximity::domain::CreateSessionStatus::TOKEN_GENERATION_FAILED: return 503;
        }
        return 500;
    }

    static void sendStatus(IResponse& res, int httpStatus,
                           proximity::domain::CreateSessionStatus status, const std::string& message) {
        nlohmann::json response;
        response["status"] = proximity::domain::toString(status);
        response["error"] = message;
        res.setResult(httpStatus, "application/json", response.dump());
    }

    static void sendError(IResponse& res, int status, const std::string& message) {
        nlohmann::json error;
        error["error"] = message;
        res.setResult(status, "application/json", error.dump());
    }
};

} // namespace registry::adapters::primary
