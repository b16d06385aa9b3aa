#pragma once

#include <cstdlib>
#include <stdexcept>
#include <string>

namespace registry::settings {

/**
 * @brief Подключение реестра к PostgreSQL
 *
 * - REGISTRY_DB_HOST (default: localhost)
 * - REGISTRY_DB_PORT (default: 5432)
 * - REGISTRY_DB_NAME (default: registry_db)
 * - REGISTRY_DB_USER (default: registry_user)
 * - REGISTRY_DB_PASSWORD (обязателен)
 * - REGISTRY_DB_CONNECT_TIMEOUT_SECONDS (default: 5)
 */
class DbSettings {
public:
    DbSettings()
        : host_(env("REGISTRY_DB_HOST", "localhost"))
        , port_(std::stoi(env("REGISTRY_DB_PORT", "5432")))
        , database_(env("REGISTRY_DB_NAME", "registry_db"))
        , user_(env("REGISTRY_DB_USER", "registry_user"))
        , password_(requiredEnv("REGISTRY_DB_PASSWORD"))
        , connectTimeoutSeconds_(std::stoi(env("REGISTRY_DB_CONNECT_TIMEOUT_SECONDS", "5")))
    {
        if (port_ <= 0 || port_ > 65535) {
            throw std::invalid_argument("REGISTRY_DB_PORT out of range: " + std::to_string(port_));
        }
    }

    const std::string& getHost() const { return host_; }
    int getPort() const { return port_; }
    const std::string& getDatabase() const { return database_; }

    /// libpq conninfo
    std::string getConnectionString() const {
        return describe() + " password=" + password_ +
               " connect_timeout=" + std::to_string(connectTimeoutSeconds_);
    }

    /// Для логов, без пароля
    std::string describe() const {
        return "host=" + host_ + " port=" + std::to_string(port_) +
               " dbname=" + database_ + " user=" + user_;
    }

private:
    std::string host_;
    int port_;
    std::string database_;
    std::string user_;
    std::string password_;
    int connectTimeoutSeconds_;

    static std::string env(const char* name, const char* fallback) {
        const char* value = std::getenv(name);
        return (value && *value) ? value : fallback;
    }

    static std::string requiredEnv(const char* name) {
        const char* value = std::getenv(name);
        if (!value || !*value) {
            throw std::runtime_error(std::string("Required env variable not set: ") + name);
        }
        return value;
    }
};

} // namespace registry::settings
