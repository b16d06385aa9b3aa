#pragma once

#include "adapters/secondary/HttpSessionRegistryClient.hpp"
#include "ports/output/ISessionRegistry.hpp"
#include "settings/SnapshotCacheSettings.hpp"
#include <cache/ICache.hpp>
#include <cache/Cache.hpp>
#include <cache/eviction/LRUPolicy.hpp>
#include <cache/expiration/GlobalTTL.hpp>
#include <cache/concurrency/ThreadSafeCache.hpp>
#include <iostream>
#include <iterator>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace proximity::adapters::secondary {

/**
 * @brief Декоратор ISessionRegistry со снимками активных сессий
 *
 * Кэш: orgId -> неизменяемый снимок списка активных сессий.
 * Снимок никогда не меняется на месте, по истечении TTL его заменяет новый.
 * Так сканер не ходит в реестр на каждое обнаружение.
 *
 * НЕ кэширует (всегда идут в реестр):
 * - submitAttendance
 * - getSessionStatus
 *
 * createSession и stopSession сбрасывают снимки: остановленная сессия
 * не должна оставаться видимой в кэше этого устройства.
 *
 * Сессию, остановленную на другом устройстве, сканер видит не дольше
 * SNAPSHOT_CACHE_TTL_SECONDS. Ответ SESSION_EXPIRED на отметку сбрасывает
 * снимок организации этой сессии сразу, не дожидаясь TTL.
 */
class CachedSessionRegistry : public ports::output::ISessionRegistry {
public:
    using Snapshot = std::shared_ptr<const std::vector<domain::ActiveSession>>;

    CachedSessionRegistry(
        std::shared_ptr<HttpSessionRegistryClient> delegate,
        std::shared_ptr<settings::SnapshotCacheSettings> cacheSettings
    ) : delegate_(std::move(delegate))
      , cacheSettings_(std::move(cacheSettings))
    {
        initCache();
    }

    // ============================================
    // АКТИВНЫЕ СЕССИИ (кэшируются)
    // ============================================

    std::vector<domain::ActiveSession> listActiveSessions(const std::string& orgId) override {
        auto cached = snapshotCache_->get(orgId);
        if (cached) {
            return **cached;
        }

        // Ошибка реестра пробрасывается как есть, пустой снимок не кэшируется вместо неё
        Snapshot snapshot = std::make_shared<const std::vector<domain::ActiveSession>>(
            delegate_->listActiveSessions(orgId));
        snapshotCache_->put(orgId, snapshot);
        indexSnapshot(orgId, *snapshot);
        return *snapshot;
    }

    // ============================================
    // ЗАПИСЬ (без кэширования)
    // ============================================

    ports::output::CreateSessionResult createSession(
        const std::string& orgId,
        const std::string& title,
        std::optional<domain::TimePoint> startsAt,
        int64_t durationSeconds
    ) override {
        auto result = delegate_->createSession(orgId, title, startsAt, durationSeconds);
        if (result.created()) {
            clearSnapshots();
        }
        return result;
    }

    domain::StopStatus stopSession(const domain::SessionToken& token) override {
        auto status = delegate_->stopSession(token);
        clearSnapshots();
        return status;
    }

    domain::SubmitStatus submitAttendance(
        const domain::SessionToken& token,
        const std::string& memberId
    ) override {
        auto status = delegate_->submitAttendance(token, memberId);
        if (status == domain::SubmitStatus::SESSION_EXPIRED) {
            dropSnapshotFor(token);
        }
        return status;
    }

    std::optional<domain::SessionStatusReport> getSessionStatus(const domain::SessionToken& token) override {
        return delegate_->getSessionStatus(token);
    }

    // ============================================
    // УПРАВЛЕНИЕ КЭШЕМ
    // ============================================

    void clearSnapshots() {
        snapshotCache_->clear();
        std::lock_guard<std::mutex> lock(indexMutex_);
        tokenOrg_.clear();
    }

    size_t snapshotCount() const {
        return snapshotCache_->size();
    }

private:
    std::shared_ptr<HttpSessionRegistryClient> delegate_;
    std::shared_ptr<settings::SnapshotCacheSettings> cacheSettings_;
    std::unique_ptr<ThreadSafeCache<std::string, Snapshot>> snapshotCache_;

    // token -> orgId для сессий из загруженных снимков
    std::mutex indexMutex_;
    std::unordered_map<std::string, std::string> tokenOrg_;

    void indexSnapshot(const std::string& orgId, const std::vector<domain::ActiveSession>& sessions) {
        std::lock_guard<std::mutex> lock(indexMutex_);
        for (auto it = tokenOrg_.begin(); it != tokenOrg_.end();) {
            it = (it->second == orgId) ? tokenOrg_.erase(it) : std::next(it);
        }
        for (const auto& session : sessions) {
            tokenOrg_[session.token.value()] = orgId;
        }
    }

    void dropSnapshotFor(const domain::SessionToken& token) {
        std::string orgId;
        {
            std::lock_guard<std::mutex> lock(indexMutex_);
            auto it = tokenOrg_.find(token.value());
            if (it == tokenOrg_.end()) {
                return;
            }
            orgId = it->second;
        }
        snapshotCache_->remove(orgId);
        std::cout << "[CachedSessionRegistry] Session " << token.value()
                  << " is over, dropped snapshot of " << orgId << std::endl;
    }

    void initCache() {
        size_t cacheSize = cacheSettings_->getCacheSize();
        int ttlSeconds = cacheSettings_->getTtlSeconds();

        auto base = std::make_unique<Cache<std::string, Snapshot>>(
            cacheSize,
            std::make_unique<LRUPolicy<std::string>>(),
            std::make_unique<GlobalTTL<std::string>>(std::chrono::seconds(ttlSeconds))
        );
        snapshotCache_ = std::make_unique<ThreadSafeCache<std::string, Snapshot>>(std::move(base));

        std::cout << "[CachedSessionRegistry] Created with snapshotCache="
                  << cacheSize << "/" << ttlSeconds << "s" << std::endl;
    }
};

} // namespace proximity::adapters::secondary
