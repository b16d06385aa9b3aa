#pragma once

#include <BoostBeastApplication.hpp>
#include <boost/di.hpp>

// Settings
#include "settings/DbSettings.hpp"
#include "settings/MetricsSettings.hpp"
#include "settings/RegistrySettings.hpp"

// Ports
#include "ports/input/IMetricsService.hpp"
#include "ports/input/ISessionRegistry.hpp"
#include "ports/output/IAttendanceRepository.hpp"
#include "ports/output/IOrganizationRepository.hpp"
#include "ports/output/ISessionRepository.hpp"

// Application
#include "application/MetricsService.hpp"
#include "application/SessionRegistryService.hpp"

// Secondary Adapters
#include "adapters/secondary/PostgresAttendanceRepository.hpp"
#include "adapters/secondary/PostgresOrganizationRepository.hpp"
#include "adapters/secondary/PostgresSessionRepository.hpp"
#include "adapters/secondary/SystemClock.hpp"
#include "adapters/secondary/SystemRandomSource.hpp"

// Primary Adapters
#include "adapters/primary/CreateSessionHandler.hpp"
#include "adapters/primary/HealthHandler.hpp"
#include "adapters/primary/ListActiveSessionsHandler.hpp"
#include "adapters/primary/MetricsDecoratorHandler.hpp"
#include "adapters/primary/MetricsHandler.hpp"
#include "adapters/primary/SessionStatusHandler.hpp"
#include "adapters/primary/StopSessionHandler.hpp"
#include "adapters/primary/SubmitAttendanceHandler.hpp"

#include <iostream>
#include <memory>

namespace di = boost::di;

namespace registry {

/**
 * @brief Session Registry Application
 *
 * Авторитетный реестр сессий посещаемости.
 * Настраивает Boost.DI контейнер и регистрирует HTTP handlers.
 */
class RegistryApp : public BoostBeastApplication {
public:
    RegistryApp() {
        std::cout << "[RegistryApp] Initializing..." << std::endl;
    }

    ~RegistryApp() override = default;

protected:
    void loadEnvironment(int argc, char* argv[]) override {
        BoostBeastApplication::loadEnvironment(argc, argv);
        std::cout << "[RegistryApp] Environment loaded" << std::endl;
    }

    void configureInjection() override {
        std::cout << "[RegistryApp] Configuring Boost.DI injection..." << std::endl;

        auto registrySettings = std::make_shared<settings::RegistrySettings>();

        // Генератор общий с устройствами, порог энтропии задаёт реестр
        auto tokenGenerator = std::make_shared<proximity::application::TokenGenerator>(
            std::make_shared<proximity::adapters::secondary::SystemRandomSource>(),
            registrySettings->getMinTokenEntropyBits());

        // ====================================================================
        // Boost.DI Injector Configuration
        // ====================================================================

        auto injector = di::make_injector(

            // ================================================================
            // Layer 1: Settings & Infrastructure
            // ================================================================
            di::bind<settings::DbSettings>()
                .to(std::make_shared<settings::DbSettings>()),

            di::bind<settings::RegistrySettings>()
                .to(registrySettings),

            di::bind<settings::IMetricsSettings>()
                .to<settings::MetricsSettings>()
                .in(di::singleton),

            di::bind<proximity::ports::output::IClock>()
                .to<proximity::adapters::secondary::SystemClock>()
                .in(di::singleton),

            di::bind<proximity::application::TokenGenerator>()
                .to(tokenGenerator),

            // ================================================================
            // Layer 2: Secondary Adapters (Output Ports implementations)
            // ================================================================

            di::bind<ports::output::ISessionRepository>()
                .to<adapters::secondary::PostgresSessionRepository>()
                .in(di::singleton),

            di::bind<ports::output::IAttendanceRepository>()
                .to<adapters::secondary::PostgresAttendanceRepository>()
                .in(di::singleton),

            di::bind<ports::output::IOrganizationRepository>()
                .to<adapters::secondary::PostgresOrganizationRepository>()
                .in(di::singleton),

            // ================================================================
            // Layer 3: Application Services (Input Ports implementations)
            // ================================================================

            di::bind<ports::input::IMetricsService>()
                .to<application::MetricsService>()
                .in(di::singleton),

            di::bind<ports::input::ISessionRegistry>()
                .to<application::SessionRegistryService>()
                .in(di::singleton)
        );

        std::cout << "[RegistryApp] DI Injector configured:" << std::endl;
        std::cout << "  ✓ Secondary Adapters (3 bindings)" << std::endl;
        std::cout << "  ✓ Application Services (2 bindings)" << std::endl;

        // ====================================================================
        // Layer 4: Primary Adapters (HTTP Handlers)
        // ====================================================================

        std::cout << "[RegistryApp] Registering HTTP Handlers via DI..." << std::endl;

        auto metrics = injector.create<std::shared_ptr<ports::input::IMetricsService>>();
        auto withMetrics = [&metrics](std::shared_ptr<IHttpHandler> handler) {
            return std::make_shared<adapters::primary::MetricsDecoratorHandler>(std::move(handler), metrics);
        };

        // Health & Metrics
        {
            auto handler = injector.create<std::shared_ptr<adapters::primary::HealthHandler>>();
            registerEndpoint("GET", "/health", withMetrics(handler));
            std::cout << "  ✓ HealthHandler: GET /health" << std::endl;
        }

        {
            auto handler = injector.create<std::shared_ptr<adapters::primary::MetricsHandler>>();
            registerEndpoint("GET", "/metrics", withMetrics(handler));
            std::cout << "  ✓ MetricsHandler: GET /metrics" << std::endl;
        }

        // Session Handlers
        {
            auto handler = injector.create<std::shared_ptr<adapters::primary::CreateSessionHandler>>();
            registerEndpoint("POST", "/api/v1/sessions", withMetrics(handler));
            std::cout << "  ✓ CreateSessionHandler: POST /api/v1/sessions" << std::endl;
        }

        {
            auto handler = injector.create<std::shared_ptr<adapters::primary::StopSessionHandler>>();
            registerEndpoint("POST", "/api/v1/sessions/*/stop", withMetrics(handler));
            std::cout << "  ✓ StopSessionHandler: POST /api/v1/sessions/*/stop" << std::endl;
        }

        {
            auto handler = injector.create<std::shared_ptr<adapters::primary::SessionStatusHandler>>();
            registerEndpoint("GET", "/api/v1/sessions/*/status", withMetrics(handler));
            std::cout << "  ✓ SessionStatusHandler: GET /api/v1/sessions/*/status" << std::endl;
        }

        {
            auto handler = injector.create<std::shared_ptr<adapters::primary::ListActiveSessionsHandler>>();
            registerEndpoint("GET", "/api/v1/organizations/*/sessions/active", withMetrics(handler));
            std::cout << "  ✓ ListActiveSessionsHandler: GET /api/v1/organizations/*/sessions/active" << std::endl;
        }

        // Attendance Handler
        {
            auto handler = injector.create<std::shared_ptr<adapters::primary::SubmitAttendanceHandler>>();
            registerEndpoint("POST", "/api/v1/attendance", withMetrics(handler));
            std::cout << "  ✓ SubmitAttendanceHandler: POST /api/v1/attendance" << std::endl;
        }

        std::cout << "[RegistryApp] Configuration complete! 7 handlers registered." << std::endl;
    }
};

} // namespace registry
