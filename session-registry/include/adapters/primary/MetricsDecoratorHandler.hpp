#pragma once

#include <IHttpHandler.hpp>
#include <IRequest.hpp>
#include <IResponse.hpp>
#include "ports/input/IMetricsService.hpp"

#include <memory>
#include <regex>

namespace registry::adapters::primary {

/**
 * @brief Декоратор для подсчёта HTTP запросов
 *
 * Метрика: http_requests_total{method="...",path="..."}
 *
 * Path нормализуется: токен сессии и orgId в пути заменяются на '*',
 * чтобы каждый токен не порождал отдельный ключ метрики.
 */
class MetricsDecoratorHandler : public IHttpHandler {
public:
    MetricsDecoratorHandler(
        std::shared_ptr<IHttpHandler> inner,
        std::shared_ptr<ports::input::IMetricsService> metrics
    ) : inner_(std::move(inner))
      , metrics_(std::move(metrics))
    {}

    void handle(IRequest& req, IResponse& res) override {
        metrics_->increment("http_requests_total", {
            {"method", req.getMethod()},
            {"path", normalizePath(req.getPath())}
        });

        inner_->handle(req, res);
    }

    // /api/v1/sessions/K7M2QXPR9TAB/stop            -> /api/v1/sessions/*/stop
    // /api/v1/organizations/org-1/sessions/active  -> /api/v1/organizations/*/sessions/active
    static std::string normalizePath(const std::string& path) {
        std::string cleanPath = path;
        size_t queryPos = cleanPath.find('?');
        if (queryPos != std::string::npos) {
            cleanPath = cleanPath.substr(0, queryPos);
        }

        static const std::regex sessionAction(R"(^/api/v1/sessions/[^/]+/(stop|status)$)");
        static const std::regex orgSessions(R"(^/api/v1/organizations/[^/]+/sessions/active$)");

        std::smatch matches;
        if (std::regex_match(cleanPath, matches, sessionAction)) {
            return "/api/v1/sessions/*/" + matches[1].str();
        }
        if (std::regex_match(cleanPath, orgSessions)) {
            return "/api/v1/organizations/*/sessions/active";
        }
        return cleanPath;
    }

private:
    std::shared_ptr<IHttpHandler> inner_;
    std::shared_ptr<ports::input::IMetricsService> metrics_;
};

} // namespace registry::adapters::primary
