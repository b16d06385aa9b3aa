#pragma once

#include "ports/output/ISessionRegistry.hpp"
#include "settings/IRegistryClientSettings.hpp"
#include <IHttpClient.hpp>
#include <SimpleRequest.hpp>
#include <SimpleResponse.hpp>
#include <nlohmann/json.hpp>
#include <iostream>
#include <memory>

namespace proximity::adapters::secondary {

/**
 * @brief HTTP клиент к session-registry
 *
 * Реализует ISessionRegistry через JSON API реестра.
 * Штатные ответы реестра (400/404/409/410) превращаются в закрытые enum'ы,
 * всё остальное (нет ответа, 5xx, битый JSON) - в RegistryUnavailableError.
 */
class HttpSessionRegistryClient : public ports::output::ISessionRegistry {
public:
    HttpSessionRegistryClient(
        std::shared_ptr<IHttpClient> httpClient,
        std::shared_ptr<settings::IRegistryClientSettings> settings
    ) : httpClient_(std::move(httpClient))
      , settings_(std::move(settings))
    {
        std::cout << "[HttpSessionRegistryClient] Created, target: "
                  << settings_->getHost() << ":" << settings_->getPort() << std::endl;
    }

    // ============================================
    // СЕССИИ
    // ============================================

    ports::output::CreateSessionResult createSession(
        const std::string& orgId,
        const std::string& title,
        std::optional<domain::TimePoint> startsAt,
        int64_t durationSeconds
    ) override {
        nlohmann::json requestBody = {
            {"org_id", orgId},
            {"title", title},
            {"duration_seconds", durationSeconds}
        };
        // Без starts_at начало окна ставит реестр по своим часам
        if (startsAt) {
            requestBody["starts_at"] = domain::Timestamp::format(*startsAt);
        }

        auto response = doRequest("POST", "/api/v1/sessions", requestBody.dump());
        int status = response.getStatus();

        ports::output::CreateSessionResult result;
        if (status == 201) {
            auto json = parseBody(response, "createSession");
            try {
                result.token = domain::SessionToken(json.at("session_token").get<std::string>());
            } catch (const std::exception& e) {
                throw ports::output::RegistryUnavailableError(
                    std::string("Registry issued a malformed token: ") + e.what());
            }
            result.orgSlug = json.value("org_slug", "");
            result.startsAt = parseTime(json, "starts_at");
            result.endsAt = parseTime(json, "ends_at");
            result.registryNow = parseTime(json, "server_time");
            result.status = domain::CreateSessionStatus::CREATED;
            return result;
        }

        if (status == 400 || status == 404 || status == 503) {
            auto json = parseBody(response, "createSession");
            result.status = parseWireStatus(json, domain::parseCreateSessionStatus, "createSession");
            result.message = json.value("error", "");
            return result;
        }

        throw unexpected("createSession", status);
    }

    std::vector<domain::ActiveSession> listActiveSessions(const std::string& orgId) override {
        auto response = doRequest("GET", "/api/v1/organizations/" + orgId + "/sessions/active", "");
        if (response.getStatus() != 200) {
            throw unexpected("listActiveSessions", response.getStatus());
        }

        auto json = parseBody(response, "listActiveSessions");
        std::vector<domain::ActiveSession> result;
        try {
            for (const auto& s : json.at("sessions")) {
                domain::ActiveSession session{
                    domain::SessionToken(s.at("session_token").get<std::string>()),
                    s.value("org_id", orgId),
                    s.value("title", ""),
                    parseTime(s, "starts_at"),
                    parseTime(s, "ends_at"),
                    s.value("attendee_count", 0)
                };
                result.push_back(std::move(session));
            }
        } catch (const nlohmann::json::exception& e) {
            throw ports::output::RegistryUnavailableError(
                std::string("Malformed active session list: ") + e.what());
        } catch (const std::invalid_argument& e) {
            throw ports::output::RegistryUnavailableError(
                std::string("Malformed active session list: ") + e.what());
        }
        return result;
    }

    domain::StopStatus stopSession(const domain::SessionToken& token) override {
        auto response = doRequest("POST", "/api/v1/sessions/" + token.value() + "/stop", "");
        int status = response.getStatus();
        if (status == 200) {
            return domain::StopStatus::STOPPED;
        }
        if (status == 404) {
            return domain::StopStatus::NOT_FOUND;
        }
        throw unexpected("stopSession", status);
    }

    std::optional<domain::SessionStatusReport> getSessionStatus(const domain::SessionToken& token) override {
        auto response = doRequest("GET", "/api/v1/sessions/" + token.value() + "/status", "");
        int status = response.getStatus();
        if (status == 404 || status == 400) {
            return std::nullopt;
        }
        if (status != 200) {
            throw unexpected("getSessionStatus", status);
        }

        auto json = parseBody(response, "getSessionStatus");
        try {
            domain::SessionStatusReport report{
                token,
                json.value("org_id", ""),
                json.value("title", ""),
                domain::parseSessionPhase(json.at("phase").get<std::string>()),
                parseTime(json, "starts_at"),
                parseTime(json, "ends_at"),
                std::nullopt,
                json.value("time_remaining_seconds", static_cast<int64_t>(0)),
                json.value("attendee_count", 0)
            };
            if (json.contains("stopped_at") && !json["stopped_at"].is_null()) {
                report.stoppedAt = parseTime(json, "stopped_at");
            }
            return report;
        } catch (const nlohmann::json::exception& e) {
            throw ports::output::RegistryUnavailableError(
                std::string("Malformed session status: ") + e.what());
        } catch (const std::invalid_argument& e) {
            throw ports::output::RegistryUnavailableError(
                std::string("Malformed session status: ") + e.what());
        }
    }

    // ============================================
    // ПОСЕЩЕНИЯ
    // ============================================

    domain::SubmitStatus submitAttendance(
        const domain::SessionToken& token,
        const std::string& memberId
    ) override {
        nlohmann::json requestBody = {
            {"session_token", token.value()},
            {"member_id", memberId}
        };

        auto response = doRequest("POST", "/api/v1/attendance", requestBody.dump());
        int status = response.getStatus();
        if (status != 201 && status != 400 && status != 409 && status != 410) {
            throw unexpected("submitAttendance", status);
        }

        auto json = parseBody(response, "submitAttendance");
        return parseWireStatus(json, domain::parseSubmitStatus, "submitAttendance");
    }

private:
    std::shared_ptr<IHttpClient> httpClient_;
    std::shared_ptr<settings::IRegistryClientSettings> settings_;

    SimpleResponse doRequest(const std::string& method, const std::string& path, const std::string& body) {
        SimpleRequest request(
            method,
            path,
            body,
            settings_->getHost(),
            settings_->getPort(),
            {{"Content-Type", "application/json"}}
        );

        SimpleResponse response;
        bool sent = false;
        try {
            sent = httpClient_->send(request, response);
        } catch (const std::exception& e) {
            std::cerr << "[HttpSessionRegistryClient] " << method << " " << path
                      << " failed: " << e.what() << std::endl;
            throw ports::output::RegistryUnavailableError(
                std::string("Registry request failed: ") + e.what());
        }

        if (!sent) {
            std::cerr << "[HttpSessionRegistryClient] " << method << " " << path
                      << ": no response" << std::endl;
            throw ports::output::RegistryUnavailableError("Registry did not respond to " + method + " " + path);
        }
        return response;
    }

    static nlohmann::json parseBody(const SimpleResponse& response, const std::string& operation) {
        try {
            return nlohmann::json::parse(response.getBody());
        } catch (const nlohmann::json::exception& e) {
            throw ports::output::RegistryUnavailableError(
                operation + ": malformed registry response: " + e.what());
        }
    }

    template <typename Parser>
    static auto parseWireStatus(const nlohmann::json& json, Parser parser, const std::string& operation)
        -> decltype(parser(std::string())) {
        try {
            return parser(json.at("status").get<std::string>());
        } catch (const nlohmann::json::exception& e) {
            throw ports::output::RegistryUnavailableError(operation + ": missing status: " + e.what());
        } catch (const std::invalid_argument& e) {
            throw ports::output::RegistryUnavailableError(operation + ": " + e.what());
        }
    }

    static domain::TimePoint parseTime(const nlohmann::json& json, const std::string& field) {
        auto parsed = domain::Timestamp::parse(json.value(field, ""));
        if (!parsed) {
            throw ports::output::RegistryUnavailableError("Malformed timestamp in field " + field);
        }
        return *parsed;
    }

    static ports::output::RegistryUnavailableError unexpected(const std::string& operation, int status) {
        std::cerr << "[HttpSessionRegistryClient] " << operation
                  << " unexpected status " << status << std::endl;
        return ports::output::RegistryUnavailableError(
            operation + ": registry returned " + std::to_string(status));
    }
};

} // namespace proximity::adapters::secondary
