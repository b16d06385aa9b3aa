#pragma once

#include <IHttpHandler.hpp>
#include <IRequest.hpp>
#include <IResponse.hpp>
#include "ports/input/ISessionRegistry.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <memory>

namespace registry::adapters::primary {

/**
 * @brief POST /api/v1/attendance
 *
 * Request: {"session_token": "K7M2QXPR9TAB", "member_id": "m-1"}
 *
 * | status           | HTTP |
 * |------------------|------|
 * | success          | 201  |
 * | already_recorded | 409  |
 * | session_expired  | 410  |
 * | invalid_token    | 400  |
 */
class SubmitAttendanceHandler : public IHttpHandler {
public:
    explicit SubmitAttendanceHandler(std::shared_ptr<ports::input::ISessionRegistry> registry)
        : registry_(std::move(registry))
    {
        std::cout << "[SubmitAttendanceHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override {
        using proximity::domain::SubmitStatus;

        try {
            auto body = nlohmann::json::parse(req.getBody());

            std::string rawToken = body.value("session_token", "");
            std::string memberId = body.value("member_id", "");

            auto token = proximity::domain::SessionToken::tryParse(rawToken);
            if (!token || memberId.empty()) {
                sendStatus(res, SubmitStatus::INVALID_TOKEN);
                return;
            }

            sendStatus(res, registry_->submitAttendance(*token, memberId));

        } catch (const nlohmann::json::exception& e) {
            sendError(res, 400, std::string("Invalid JSON: ") + e.what());
        } catch (const std::exception& e) {
            std::cerr << "[SubmitAttendanceHandler] Error: " << e.what() << std::endl;
            sendError(res, 500, "Internal server error");
        }
    }

private:
    std::shared_ptr<ports::input::ISessionRegistry> registry_;

    static int httpStatusFor(proximity::domain::SubmitStatus status) {
        switch (status) {
            case proximity::domain::SubmitStatus::SUCCESS: return 201;
            case proximity::domain::SubmitStatus::ALREADY_RECORDED: return 409;
            case proximity::domain::SubmitStatus::SESSION_EXPIRED: return 410;
            case proximity::domain::SubmitStatus::INVALID_TOKEN: return 400;
        }
        return 500;
    }

    static void sendStatus(IResponse& res, proximity::domain::SubmitStatus status) {
        nlohmann::json response;
        response["status"] = proximity::domain::toString(status);
        res.setResult(httpStatusFor(status), "application/json", response.dump());
    }

    static void sendError(IResponse& res, int status, const std::string& message) {
        nlohmann::json error;
        error["error"] = message;
        res.setResult(status, "application/json", error.dump());
    }
};

} // namespace registry::adapters::primary
