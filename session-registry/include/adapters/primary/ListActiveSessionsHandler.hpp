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
 * @brief GET /api/v1/organizations/{orgId}/sessions/active
 *
 * Response 200:
 * ```json
 * {"sessions": [{"session_token": "K7M2QXPR9TAB", "org_id": "org-nhs-lincoln",
 *   "title": "Chapter Meeting", "starts_at": "...", "ends_at": "...", "attendee_count": 12}]}
 * ```
 * Неизвестная организация даёт пустой список.
 */
class ListActiveSessionsHandler : public IHttpHandler {
public:
    explicit ListActiveSessionsHandler(std::shared_ptr<ports::input::ISessionRegistry> registry)
        : registry_(std::move(registry))
    {
        std::cout << "[ListActiveSessionsHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override {
        static const std::regex pathRegex(R"(^/api/v1/organizations/([^/?]+)/sessions/active(\?.*)?$)");

        std::string path = req.getPath();
        std::smatch matches;
        if (!std::regex_match(path, matches, pathRegex)) {
            sendError(res, 404, "Not found");
            return;
        }

        try {
            auto sessions = registry_->listActiveSessions(matches[1].str());

            nlohmann::json items = nlohmann::json::array();
            for (const auto& s : sessions) {
                items.push_back({
                    {"session_token", s.token.value()},
                    {"org_id", s.orgId},
                    {"title", s.title},
                    {"starts_at", proximity::domain::Timestamp::format(s.startsAt)},
                    {"ends_at", proximity::domain::Timestamp::format(s.endsAt)},
                    {"attendee_count", s.attendeeCount}
                });
            }

            nlohmann::json response;
            response["sessions"] = items;
            res.setResult(200, "application/json", response.dump());

        } catch (const std::exception& e) {
            std::cerr << "[ListActiveSessionsHandler] Error: " << e.what() << std::endl;
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
