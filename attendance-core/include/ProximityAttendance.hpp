#pragma once

#include <IHttpClient.hpp>
#include <boost/di.hpp>

// Settings
#include "settings/ProximitySettings.hpp"
#include "settings/RegistryClientSettings.hpp"
#include "settings/SnapshotCacheSettings.hpp"

// Ports
#include "ports/input/IAttendanceRecorder.hpp"
#include "ports/input/IBroadcaster.hpp"
#include "ports/input/IScanner.hpp"
#include "ports/output/IBeaconReceiver.hpp"
#include "ports/output/IBeaconTransmitter.hpp"
#include "ports/output/IClock.hpp"
#include "ports/output/ISessionRegistry.hpp"

// Application
#include "application/AttendanceRecorder.hpp"
#include "application/Broadcaster.hpp"
#include "application/OrganizationDirectory.hpp"
#include "application/ResolutionEngine.hpp"
#include "application/Scanner.hpp"
#include "application/SecurityValidator.hpp"
#include "application/TokenCodec.hpp"

// Secondary Adapters
#include "adapters/secondary/CachedSessionRegistry.hpp"
#include "adapters/secondary/HttpSessionRegistryClient.hpp"
#include "adapters/secondary/SystemClock.hpp"

#include <iostream>
#include <memory>

namespace di = boost::di;

namespace proximity {

/**
 * @brief Точка сборки протокола посещаемости на устройстве
 *
 * Хост-приложение передаёт платформенные адаптеры радио и HTTP клиент,
 * всё остальное собирается Boost.DI из ENV-настроек.
 *
 * @example
 *   auto attendance = std::make_shared<proximity::ProximityAttendance>(
 *       transmitter, receiver, std::make_shared<HttpClient>());
 *   attendance->broadcaster()->start(officer, "Chapter Meeting", 3600);
 */
class ProximityAttendance {
public:
    ProximityAttendance(
        std::shared_ptr<ports::output::IBeaconTransmitter> transmitter,
        std::shared_ptr<ports::output::IBeaconReceiver> receiver,
        std::shared_ptr<IHttpClient> httpClient
    ) {
        std::cout << "[ProximityAttendance] Configuring DI..." << std::endl;

        auto proximitySettings = std::make_shared<settings::ProximitySettings>();
        auto directory = std::make_shared<application::OrganizationDirectory>(
            proximitySettings->getOrganizationCodes());

        auto injector = di::make_injector(
            // Settings
            di::bind<settings::IProximitySettings>().to(proximitySettings),
            di::bind<settings::IRegistryClientSettings>().to<settings::RegistryClientSettings>().in(di::singleton),
            di::bind<settings::SnapshotCacheSettings>().in(di::singleton),

            // Платформа хоста
            di::bind<ports::output::IBeaconTransmitter>().to(transmitter),
            di::bind<ports::output::IBeaconReceiver>().to(receiver),
            di::bind<IHttpClient>().to(httpClient),
            di::bind<ports::output::IClock>().to<adapters::secondary::SystemClock>().in(di::singleton),

            // Реестр: HTTP + снимки активных сессий
            di::bind<adapters::secondary::HttpSessionRegistryClient>().in(di::singleton),
            di::bind<ports::output::ISessionRegistry>().to<adapters::secondary::CachedSessionRegistry>().in(di::singleton),

            // Application
            di::bind<application::OrganizationDirectory>().to(directory),
            di::bind<application::TokenCodec>().in(di::singleton),
            di::bind<application::SecurityValidator>().in(di::singleton),
            di::bind<application::ResolutionEngine>().in(di::singleton),
            di::bind<ports::input::IBroadcaster>().to<application::Broadcaster>().in(di::singleton),
            di::bind<ports::input::IScanner>().to<application::Scanner>().in(di::singleton),
            di::bind<ports::input::IAttendanceRecorder>().to<application::AttendanceRecorder>().in(di::singleton));

        registry_ = injector.create<std::shared_ptr<ports::output::ISessionRegistry>>();
        validator_ = injector.create<std::shared_ptr<application::SecurityValidator>>();
        engine_ = injector.create<std::shared_ptr<application::ResolutionEngine>>();
        broadcaster_ = injector.create<std::shared_ptr<ports::input::IBroadcaster>>();
        scanner_ = injector.create<std::shared_ptr<ports::input::IScanner>>();
        recorder_ = injector.create<std::shared_ptr<ports::input::IAttendanceRecorder>>();

        std::cout << "[ProximityAttendance] Ready, " << directory->size() << " organizations" << std::endl;
    }

    std::shared_ptr<ports::input::IBroadcaster> broadcaster() const { return broadcaster_; }
    std::shared_ptr<ports::input::IScanner> scanner() const { return scanner_; }
    std::shared_ptr<ports::input::IAttendanceRecorder> recorder() const { return recorder_; }
    std::shared_ptr<ports::output::ISessionRegistry> registry() const { return registry_; }
    std::shared_ptr<application::SecurityValidator> securityValidator() const { return validator_; }
    std::shared_ptr<application::ResolutionEngine> resolutionEngine() const { return engine_; }

private:
    std::shared_ptr<ports::output::ISessionRegistry> registry_;
    std::shared_ptr<application::SecurityValidator> validator_;
    std::shared_ptr<application::ResolutionEngine> engine_;
    std::shared_ptr<ports::input::IBroadcaster> broadcaster_;
    std::shared_ptr<ports::input::IScanner> scanner_;
    std::shared_ptr<ports::input::IAttendanceRecorder> recorder_;
};

} // namespace proximity
