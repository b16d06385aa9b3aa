#pragma once

#include "settings/IRegistryClientSettings.hpp"
#include <cstdlib>
#include <string>

namespace proximity::settings {

/**
 * @brief Настройки подключения к Session Registry
 *
 * Читает из ENV:
 * - REGISTRY_SERVICE_HOST (default: "session-registry")
 * - REGISTRY_SERVICE_PORT (default: 8080)
 */
class RegistryClientSettings : public IRegistryClientSettings {
public:
    RegistryClientSettings() {
        if (const char* host = std::getenv("REGISTRY_SERVICE_HOST")) {
            host_ = host;
        }
        if (const char* port = std::getenv("REGISTRY_SERVICE_PORT")) {
            port_ = std::stoi(port);
        }
    }

    std::string getHost() const override { return host_; }
    int getPort() const override { return port_; }

private:
    std::string host_ = "session-registry";
    int port_ = 8080;
};

} // namespace proximity::settings
