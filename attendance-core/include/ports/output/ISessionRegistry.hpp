#pragma once

#include "domain/ActiveSession.hpp"
#include "domain/SessionStatusReport.hpp"
#include "domain/SessionToken.hpp"
#include "domain/Timestamp.hpp"
#include "domain/enums/CreateSessionStatus.hpp"
#include "domain/enums/StopStatus.hpp"
#include "domain/enums/SubmitStatus.hpp"
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace proximity::ports::output {

/**
 * @brief Реестр недоступен (сеть, 5xx, повреждённый ответ)
 *
 * Отличается от любого штатного ответа реестра: вызывающий обязан
 * показать "повторите", а не "ничего не найдено".
 */
class RegistryUnavailableError : public std::runtime_error {
public:
    explicit RegistryUnavailableError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Результат создания сессии
 */
struct CreateSessionResult {
    domain::CreateSessionStatus status = domain::CreateSessionStatus::VALIDATION_ERROR;
    std::optional<domain::SessionToken> token;
    std::string orgSlug;            ///< Slug организации по данным реестра
    domain::TimePoint startsAt;
    domain::TimePoint endsAt;
    domain::TimePoint registryNow;  ///< Часы реестра в момент создания
    std::string message;

    bool created() const { return status == domain::CreateSessionStatus::CREATED && token.has_value(); }
};

/**
 * @brief Контракт авторитетного реестра сессий
 *
 * Реестр единственный, кто изменяет Session и AttendanceRecord.
 * Все операции записи атомарны на стороне реестра.
 * Транспортные сбои сигнализируются RegistryUnavailableError.
 */
class ISessionRegistry {
public:
    virtual ~ISessionRegistry() = default;

    /**
     * @brief Создать сессию
     * @param orgId Организация
     * @param title Заголовок (не пустой)
     * @param startsAt Начало окна; std::nullopt - "сейчас" по часам реестра
     * @param durationSeconds Длительность, 1..максимум реестра
     */
    virtual CreateSessionResult createSession(
        const std::string& orgId,
        const std::string& title,
        std::optional<domain::TimePoint> startsAt,
        int64_t durationSeconds
    ) = 0;

    /**
     * @brief Сессии организации, окно которых включает "сейчас" и которые не остановлены
     * @return Упорядочены по startsAt DESC
     */
    virtual std::vector<domain::ActiveSession> listActiveSessions(const std::string& orgId) = 0;

    /**
     * @brief Отметить посещение (проверка окна и уникальности на стороне реестра)
     */
    virtual domain::SubmitStatus submitAttendance(
        const domain::SessionToken& token,
        const std::string& memberId
    ) = 0;

    /**
     * @brief Остановить сессию досрочно (идемпотентно)
     */
    virtual domain::StopStatus stopSession(const domain::SessionToken& token) = 0;

    /**
     * @brief Текущее состояние сессии
     * @return std::nullopt если токен неизвестен
     */
    virtual std::optional<domain::SessionStatusReport> getSessionStatus(
        const domain::SessionToken& token
    ) = 0;
};

} // namespace proximity::ports::output
