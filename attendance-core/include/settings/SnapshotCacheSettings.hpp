#pragma once

#include <cstdlib>
#include <string>

namespace proximity::settings {

/**
 * @brief Настройки кэша снимков активных сессий
 *
 * Читает из ENV:
 * - SNAPSHOT_CACHE_SIZE (default: 64) - число организаций
 * - SNAPSHOT_CACHE_TTL_SECONDS (default: 5) - период обновления снимка
 */
class SnapshotCacheSettings {
public:
    SnapshotCacheSettings() {
        if (const char* val = std::getenv("SNAPSHOT_CACHE_SIZE")) {
            cacheSize_ = static_cast<size_t>(std::stoi(val));
        }
        if (const char* val = std::getenv("SNAPSHOT_CACHE_TTL_SECONDS")) {
            ttlSeconds_ = std::stoi(val);
        }
    }

    size_t getCacheSize() const { return cacheSize_; }
    int getTtlSeconds() const { return ttlSeconds_; }

private:
    size_t cacheSize_ = 64;
    int ttlSeconds_ = 5;
};

} // namespace proximity::settings
