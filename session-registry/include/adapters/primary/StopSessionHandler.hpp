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
 * @brief POST /api/v1/sessions/{token}/stop
 *
 * Идемпотентен: повторная остановка и остановка истёкшей сессии дают 200.
 * 404, если токен неизвестен или не является токеном.
 */
class StopSessionHandler : public IHttpHandler {
public:
    explicit StopSessionHandler(std::shared_ptr<ports::input::ISessionRegistry> registry)
        : registry_(std::move(registry))
    {
        std::cout << "[StopSessionHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override {
        using proximity::domain::StopStatus;

        static const std::regex pathRegex(R"(^/api/v1/sessions/([^/?]+)/stop(\?.*)?$)");

        std::string path = req.getPath();
        std::smatch matches;
        if (!std::regex_match(path, matches, pathRegex)) {
            sendError(res, 404, "Not found");
            return;
        }

        auto token = proximity::domain::SessionToken::tryParse(matches[1].str());
        if (!token) {
            sendStatus(res, 404, StopStatus::NOT_FOUND, "Unknown session");
            return;
        }

        try {
            auto status = registry_->stopSession(*token);
            if (status == StopStatus::STOPPED) {
                nlohmann::json response;
                response["status"] = proximity::domain::toString(status);
                response["session_token"] = token->value();
                res.setResult(200, "application/json", response.dump());
            } else {
                sendStatus(res, 404, status, "Unknown session");
            }
        } catch (const std::exception& e) {
            std::cerr << "[StopSessionHandler] Error: " << e.what() << std::endl;
            sendError(res, 500, "Internal server error");
        }
    }

private:
    std::shared_ptr<ports::input::ISessionRegistry> registry_;

    static void sendStatus(IResponse& res, int httpStatus,
                           proximity::domain::StopStatus status, const std::string& message) {
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
