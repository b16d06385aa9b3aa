#pragma once

#include "ports/input/IMetricsService.hpp"
#include "ports/input/ISessionRegistry.hpp"
#include "ports/output/IAttendanceRepository.hpp"
#include "ports/output/IOrganizationRepository.hpp"
#include "ports/output/ISessionRepository.hpp"
#include "settings/RegistrySettings.hpp"

#include "application/TokenGenerator.hpp"
#include "ports/output/IClock.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <memory>

namespace registry::application {

namespace pdomain = proximity::domain;

/**
 * @brief Авторитетный реестр сессий
 *
 * Единственный владелец Session и AttendanceRecord. Активность сессии
 * всегда вычисляется по часам реестра, часы устройств не учитываются.
 * Уникальность токена и пары (токен, участник) обеспечивается атомарной
 * вставкой в хранилище, без предварительной проверки.
 */
class SessionRegistryService : public ports::input::ISessionRegistry {
public:
    SessionRegistryService(
        std::shared_ptr<ports::output::ISessionRepository> sessionRepo,
        std::shared_ptr<ports::output::IAttendanceRepository> attendanceRepo,
        std::shared_ptr<ports::output::IOrganizationRepository> orgRepo,
        std::shared_ptr<proximity::application::TokenGenerator> tokenGenerator,
        std::shared_ptr<proximity::ports::output::IClock> clock,
        std::shared_ptr<settings::RegistrySettings> settings,
        std::shared_ptr<ports::input::IMetricsService> metrics
    ) : sessionRepo_(std::move(sessionRepo))
      , attendanceRepo_(std::move(attendanceRepo))
      , orgRepo_(std::move(orgRepo))
      , tokenGenerator_(std::move(tokenGenerator))
      , clock_(std::move(clock))
      , settings_(std::move(settings))
      , metrics_(std::move(metrics))
    {
        std::cout << "[SessionRegistryService] Created, max duration "
                  << settings_->getMaxSessionSeconds() << "s" << std::endl;
    }

    // ============================================
    // СЕССИИ
    // ============================================

    ports::input::CreateSessionResult createSession(
        const std::string& orgId,
        const std::string& title,
        std::optional<pdomain::TimePoint> requestedStart,
        int64_t durationSeconds
    ) override {
        ports::input::CreateSessionResult result;

        std::string cleanTitle = trim(title);
        if (orgId.empty()) {
            return reject(result, pdomain::CreateSessionStatus::VALIDATION_ERROR, "org_id is required");
        }
        if (cleanTitle.empty()) {
            return reject(result, pdomain::CreateSessionStatus::VALIDATION_ERROR, "Title must not be empty");
        }
        if (durationSeconds <= 0 || durationSeconds > settings_->getMaxSessionSeconds()) {
            return reject(result, pdomain::CreateSessionStatus::VALIDATION_ERROR,
                "duration_seconds must be between 1 and " + std::to_string(settings_->getMaxSessionSeconds()));
        }
        auto organization = orgRepo_->findById(orgId);
        if (!organization) {
            return reject(result, pdomain::CreateSessionStatus::UNKNOWN_ORGANIZATION,
                "Unknown organization: " + orgId);
        }

        // Окно хранится с точностью до секунды, сравнение должно совпадать с хранилищем
        auto now = clock_->now();
        auto startsAt = pdomain::Timestamp::wholeSeconds(requestedStart.value_or(now));
        auto endsAt = startsAt + std::chrono::seconds(durationSeconds);

        for (int attempt = 0; attempt < settings_->getTokenRetries(); ++attempt) {
            std::optional<proximity::application::GeneratedToken> generated;
            try {
                generated = tokenGenerator_->generate();
            } catch (const std::runtime_error& e) {
                std::cerr << "[SessionRegistryService] Token generation failed: " << e.what() << std::endl;
                return reject(result, pdomain::CreateSessionStatus::TOKEN_GENERATION_FAILED, e.what());
            }

            domain::SessionRecord record{
                generated->token, orgId, cleanTitle, startsAt, endsAt, std::nullopt, now
            };

            if (!sessionRepo_->insertIfAbsent(record)) {
                metrics_->increment("token_collisions_total");
                std::cout << "[SessionRegistryService] Token collision on attempt "
                          << (attempt + 1) << ", regenerating" << std::endl;
                continue;
            }

            metrics_->increment("sessions_created_total");
            std::cout << "[SessionRegistryService] Session " << generated->token.value()
                      << " created for " << orgId << ": '" << cleanTitle << "' "
                      << pdomain::Timestamp::format(startsAt) << " .. "
                      << pdomain::Timestamp::format(endsAt)
                      << (generated->degraded ? " (degraded random source)" : "") << std::endl;

            result.status = pdomain::CreateSessionStatus::CREATED;
            result.token = generated->token;
            result.orgSlug = organization->slug;
            result.startsAt = startsAt;
            result.endsAt = endsAt;
            result.registryNow = now;
            return result;
        }

        std::cerr << "[SessionRegistryService] No free token after "
                  << settings_->getTokenRetries() << " attempts" << std::endl;
        return reject(result, pdomain::CreateSessionStatus::TOKEN_GENERATION_FAILED,
            "Could not allocate a unique session token");
    }

    std::vector<pdomain::ActiveSession> listActiveSessions(const std::string& orgId) override {
        auto records = sessionRepo_->findActiveByOrg(orgId, clock_->now());

        std::vector<pdomain::ActiveSession> result;
        result.reserve(records.size());
        for (const auto& r : records) {
            result.push_back(pdomain::ActiveSession{
                r.token, r.orgId, r.title, r.startsAt, r.endsAt,
                attendanceRepo_->countBySession(r.token)
            });
        }
        return result;
    }

    pdomain::StopStatus stopSession(const pdomain::SessionToken& token) override {
        if (!sessionRepo_->markStopped(token, pdomain::Timestamp::wholeSeconds(clock_->now()))) {
            std::cout << "[SessionRegistryService] Stop for unknown session " << token.value() << std::endl;
            return pdomain::StopStatus::NOT_FOUND;
        }
        metrics_->increment("sessions_stopped_total");
        std::cout << "[SessionRegistryService] Session " << token.value() << " stopped" << std::endl;
        return pdomain::StopStatus::STOPPED;
    }

    std::optional<pdomain::SessionStatusReport> getSessionStatus(const pdomain::SessionToken& token) override {
        auto record = sessionRepo_->findByToken(token);
        if (!record) {
            return std::nullopt;
        }

        auto now = clock_->now();
        auto phase = record->phaseAt(now);

        pdomain::SessionStatusReport report{
            record->token,
            record->orgId,
            record->title,
            phase,
            record->startsAt,
            record->endsAt,
            record->stoppedAt,
            phase == pdomain::SessionPhase::ACTIVE
                ? pdomain::Timestamp::secondsUntil(now, record->endsAt) : 0,
            attendanceRepo_->countBySession(record->token)
        };
        return report;
    }

    // ============================================
    // ПОСЕЩЕНИЯ
    // ============================================

    pdomain::SubmitStatus submitAttendance(
        const pdomain::SessionToken& token,
        const std::string& memberId
    ) override {
        auto status = decideSubmission(token, memberId);
        metrics_->increment("attendance_submissions_total", {{"status", pdomain::toString(status)}});
        return status;
    }

private:
    std::shared_ptr<ports::output::ISessionRepository> sessionRepo_;
    std::shared_ptr<ports::output::IAttendanceRepository> attendanceRepo_;
    std::shared_ptr<ports::output::IOrganizationRepository> orgRepo_;
    std::shared_ptr<proximity::application::TokenGenerator> tokenGenerator_;
    std::shared_ptr<proximity::ports::output::IClock> clock_;
    std::shared_ptr<settings::RegistrySettings> settings_;
    std::shared_ptr<ports::input::IMetricsService> metrics_;

    pdomain::SubmitStatus decideSubmission(const pdomain::SessionToken& token, const std::string& memberId) {
        if (trim(memberId).empty()) {
            return pdomain::SubmitStatus::INVALID_TOKEN;
        }

        auto record = sessionRepo_->findByToken(token);
        if (!record) {
            return pdomain::SubmitStatus::INVALID_TOKEN;
        }

        auto now = clock_->now();
        if (!record->isActiveAt(now)) {
            std::cout << "[SessionRegistryService] " << memberId << " -> " << token.value()
                      << ": session " << pdomain::toString(record->phaseAt(now)) << std::endl;
            return pdomain::SubmitStatus::SESSION_EXPIRED;
        }

        domain::AttendanceRecord attendance{token, memberId, record->orgId, now};
        if (!attendanceRepo_->insertIfAbsent(attendance)) {
            return pdomain::SubmitStatus::ALREADY_RECORDED;
        }

        std::cout << "[SessionRegistryService] " << memberId << " checked in to "
                  << token.value() << std::endl;
        return pdomain::SubmitStatus::SUCCESS;
    }

    static ports::input::CreateSessionResult& reject(
        ports::input::CreateSessionResult& result,
        pdomain::CreateSessionStatus status,
        const std::string& message
    ) {
        result.status = status;
        result.message = message;
        std::cout << "[SessionRegistryService] createSession rejected: " << message << std::endl;
        return result;
    }

    static std::string trim(const std::string& s) {
        auto begin = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
        auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
        return begin < end ? std::string(begin, end) : std::string();
    }
};

} // namespace registry::application
