#pragma once

#include "application/SecurityValidator.hpp"
#include "ports/input/IAttendanceRecorder.hpp"
#include "ports/output/ISessionRegistry.hpp"

#include <iostream>
#include <memory>

namespace proximity::application {

/**
 * @brief Отметка посещения выбранной сессии
 *
 * Порядок: проверка токена → локальный кэш повторов → реестр.
 * Окончательное решение (окно сессии, уникальность) всегда за реестром.
 */
class AttendanceRecorder : public ports::input::IAttendanceRecorder {
public:
    AttendanceRecorder(
        std::shared_ptr<ports::output::ISessionRegistry> registry,
        std::shared_ptr<SecurityValidator> validator
    ) : registry_(std::move(registry))
      , validator_(std::move(validator))
    {}

    ports::input::RecordResult submit(const std::string& rawToken, const std::string& memberId) override {
        ports::input::RecordResult result;

        if (memberId.empty()) {
            result.status = domain::RecordStatus::INVALID_TOKEN;
            result.message = "Member id is required";
            return result;
        }

        auto check = validator_->check(rawToken, memberId);
        result.token = check.validation.token;

        if (check.status == SecurityCheckStatus::MALFORMED) {
            result.status = domain::RecordStatus::INVALID_TOKEN;
            result.message = check.validation.error;
            return result;
        }
        if (check.status == SecurityCheckStatus::RECENTLY_SUBMITTED) {
            result.status = domain::RecordStatus::ALREADY_RECORDED;
            result.suppressedLocally = true;
            result.message = "Already checked in";
            return result;
        }

        const auto& token = *check.validation.token;
        domain::SubmitStatus submitStatus;
        try {
            submitStatus = registry_->submitAttendance(token, memberId);
        } catch (const ports::output::RegistryUnavailableError& e) {
            std::cerr << "[AttendanceRecorder] submitAttendance failed: " << e.what() << std::endl;
            result.status = domain::RecordStatus::REGISTRY_UNAVAILABLE;
            result.message = "Could not reach the session registry, try again";
            return result;
        }

        result.status = domain::fromSubmitStatus(submitStatus);
        switch (submitStatus) {
            case domain::SubmitStatus::SUCCESS:
                validator_->markSubmitted(token, memberId);
                result.message = "Checked in";
                break;
            case domain::SubmitStatus::ALREADY_RECORDED:
                validator_->markSubmitted(token, memberId);
                result.message = "Already checked in";
                break;
            case domain::SubmitStatus::SESSION_EXPIRED:
                result.message = "Session is no longer open";
                break;
            case domain::SubmitStatus::INVALID_TOKEN:
                result.message = "Unknown session code";
                break;
        }

        std::cout << "[AttendanceRecorder] " << memberId << " -> " << token.value()
                  << ": " << domain::toString(result.status) << std::endl;
        return result;
    }

private:
    std::shared_ptr<ports::output::ISessionRegistry> registry_;
    std::shared_ptr<SecurityValidator> validator_;
};

} // namespace proximity::application
