#pragma once

#include <IHttpHandler.hpp>
#include <IRequest.hpp>
#include <IResponse.hpp>
#include "ports/input/ISessionRegistry.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <memory>
#include <regex>

namespace registry::adapters::primary {

/**
 * @brief GET /api/v1/sessions/{token}/status
 *
 * 200 с фазой на момент запроса, 400 для токена неверной формы, 404 для неизвестного.
 */
class SessionStatusHandler : public IHttpHandler {
public:
    explicit SessionStatusHandler(std::shared_ptr<ports::input::ISessionRegistry> registry)
        : registry_(std::move(registry))
    {
        std::cout << "[SessionStatusHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override {
        using proximity::domain::Timestamp;

        static const std::regex pathRegex(R"(^/api/v1/sessions/([^/?]+)/status(\?.*)?$)");

        std::string path = req.getPath();
        std::smatch matches;
        if (!std::regex_match(path, matches, pathRegex)) {
            sendError(res, 404, "Not found");
            return;
        }

        auto token = proximity::domain::SessionToken::tryParse(matches[1].str());
        if (!token) {
            sendError(res, 400, "Malformed session token");
            return;
        }

        try {
            auto report = registry_->getSessionStatus(*token);
            if (!report) {
                sendError(res, 404, "Unknown session");
                return;
            }

            nlohmann::json response;
            response["session_token"] = report->token.value();
            response["org_id"] = report->orgId;
            response["title"] = report->title;
            response["phase"] = proximity::domain::toString(report->phase);
            response["starts_at"] = Timestamp::format(report->startsAt);
            response["ends_at"] = Timestamp::format(report->endsAt);
            response["stopped_at"] = report->stoppedAt
                ? nlohmann::json(Timestamp::format(*report->stoppedAt))
                : nlohmann::json(nullptr);
            response["time_remaining_seconds"] = report->timeRemainingSeconds;
            response["attendee_count"] = report->attendeeCount;
            res.setResult(200, "application/json", response.dump());

        } catch (const std::exception& e) {
            std::cerr << "[SessionStatusHandler] Error: " << e.what() << std::endl;
            sendError(res, 500, "Internal server error");
        }
    }

private:
    std::shared_ptr<ports::input::ISessionRegistry> registry_;

    static void sendError(IResponse& res, int status, const std::string& message) {
        nlohmann::json error;
        error["error"] = message;
        res.setResult(status, "application/json", error.dump());
    }
};

} // namespace registry::adapters::primary
