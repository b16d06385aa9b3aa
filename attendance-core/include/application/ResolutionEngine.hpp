#pragma once

#include "application/TokenCodec.hpp"
#include "domain/Membership.hpp"
#include "domain/ResolutionResult.hpp"
#include "ports/output/ISessionRegistry.hpp"
#include "settings/IProximitySettings.hpp"

#include <algorithm>
#include <atomic>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace proximity::application {

/**
 * @brief Счётчики разрешения (диагностика сканера)
 */
struct ResolutionStats {
    uint64_t detections = 0;
    uint64_t resolved = 0;
    uint64_t ambiguous = 0;
    uint64_t misses = 0;
    uint64_t fetchFailures = 0;
    uint64_t foreign = 0;
};

/**
 * @brief Разрешение (OrganizationCode, TokenHash) в кандидатов-сессии
 *
 * Хэш необратим: кандидатов ищем пересчётом encodeHash по активным сессиям
 * организации из реестра. Несколько совпадений возвращаются все, без угадывания.
 */
class ResolutionEngine {
public:
    ResolutionEngine(
        std::shared_ptr<ports::output::ISessionRegistry> registry,
        std::shared_ptr<TokenCodec> codec,
        std::shared_ptr<settings::IProximitySettings> settings
    ) : registry_(std::move(registry))
      , codec_(std::move(codec))
      , settings_(std::move(settings))
    {}

    domain::ResolutionResult resolve(
        const domain::MemberContext& member,
        const domain::BeaconDetection& detection
    ) {
        ++detections_;

        domain::ResolutionResult result;
        result.detection = detection;

        if (detection.namespaceId != settings_->getBeaconNamespace()) {
            return foreign(std::move(result), "Beacon from another namespace");
        }

        auto slug = codec_->orgSlug(detection.major);
        if (!slug) {
            return foreign(std::move(result),
                "Unknown organization code " + std::to_string(detection.major));
        }

        auto membership = findMembership(member, *slug);
        if (!membership) {
            return foreign(std::move(result), "Not a member of " + *slug);
        }
        result.orgId = membership->orgId;
        result.orgSlug = *slug;

        std::vector<domain::ActiveSession> sessions;
        try {
            sessions = registry_->listActiveSessions(membership->orgId);
        } catch (const ports::output::RegistryUnavailableError& e) {
            ++fetchFailures_;
            std::cerr << "[ResolutionEngine] listActiveSessions failed for "
                      << membership->orgId << ": " << e.what() << std::endl;
            result.status = domain::ResolutionStatus::FETCH_FAILED;
            result.message = "Could not reach the session registry";
            return result;
        }

        result.candidates = matchCandidates(sessions, detection.minor);

        if (result.candidates.empty()) {
            ++misses_;
            result.status = domain::ResolutionStatus::NO_ACTIVE_SESSION;
            result.message = "No active session matches this beacon";
        } else if (result.candidates.size() == 1) {
            ++resolved_;
            result.status = domain::ResolutionStatus::RESOLVED;
        } else {
            ++ambiguous_;
            result.status = domain::ResolutionStatus::AMBIGUOUS;
            result.message = std::to_string(result.candidates.size()) + " sessions share this beacon";
            std::cout << "[ResolutionEngine] Hash " << detection.minor << " is ambiguous for "
                      << *slug << ": " << result.candidates.size() << " candidates" << std::endl;
        }
        return result;
    }

    /**
     * @brief Отбор сессий по хэшу
     *
     * Порядок: startsAt DESC, затем title, затем токен.
     * RSSI не участвует: все кандидаты пришли из одного и того же обнаружения.
     */
    static std::vector<domain::ActiveSession> matchCandidates(
        const std::vector<domain::ActiveSession>& sessions,
        domain::TokenHash hash
    ) {
        std::vector<domain::ActiveSession> matches;
        for (const auto& session : sessions) {
            if (TokenCodec::encodeHash(session.token) == hash) {
                matches.push_back(session);
            }
        }

        std::sort(matches.begin(), matches.end(),
            [](const domain::ActiveSession& a, const domain::ActiveSession& b) {
                if (a.startsAt != b.startsAt) return a.startsAt > b.startsAt;
                if (a.title != b.title) return a.title < b.title;
                return a.token < b.token;
            });
        return matches;
    }

    ResolutionStats stats() const {
        ResolutionStats s;
        s.detections = detections_.load();
        s.resolved = resolved_.load();
        s.ambiguous = ambiguous_.load();
        s.misses = misses_.load();
        s.fetchFailures = fetchFailures_.load();
        s.foreign = foreign_.load();
        return s;
    }

private:
    std::shared_ptr<ports::output::ISessionRegistry> registry_;
    std::shared_ptr<TokenCodec> codec_;
    std::shared_ptr<settings::IProximitySettings> settings_;

    std::atomic<uint64_t> detections_{0};
    std::atomic<uint64_t> resolved_{0};
    std::atomic<uint64_t> ambiguous_{0};
    std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> fetchFailures_{0};
    std::atomic<uint64_t> foreign_{0};

    static std::optional<domain::OrganizationMembership> findMembership(
        const domain::MemberContext& member,
        const std::string& slug
    ) {
        for (const auto& m : member.memberships) {
            if (OrganizationDirectory::normalizeSlug(m.orgSlug) == slug) {
                return m;
            }
        }
        return std::nullopt;
    }

    domain::ResolutionResult foreign(domain::ResolutionResult result, const std::string& message) {
        ++foreign_;
        result.status = domain::ResolutionStatus::FOREIGN_BEACON;
        result.message = message;
        return result;
    }
};

} // namespace proximity::application
