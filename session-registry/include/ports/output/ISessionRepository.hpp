#pragma once

#include "domain/SessionRecord.hpp"
#include <optional>
#include <string>
#include <vector>

namespace registry::ports::output {

/**
 * @brief Хранилище сессий
 *
 * Ошибки хранилища пробрасываются исключениями, пустой результат
 * всегда означает "ничего не найдено".
 */
class ISessionRepository {
public:
    virtual ~ISessionRepository() = default;

    /**
     * @brief Вставить сессию, если токен свободен
     * @return false, если сессия с таким токеном уже существует
     */
    virtual bool insertIfAbsent(const domain::SessionRecord& session) = 0;

    virtual std::optional<domain::SessionRecord> findByToken(const domain::SessionToken& token) = 0;

    /**
     * @brief Активные на момент now сессии организации
     * @return Упорядочены по startsAt DESC, затем title, затем токен
     */
    virtual std::vector<domain::SessionRecord> findActiveByOrg(
        const std::string& orgId,
        domain::TimePoint now
    ) = 0;

    /**
     * @brief Проставить stoppedAt, если он ещё не установлен
     * @return false, если сессии нет
     */
    virtual bool markStopped(const domain::SessionToken& token, domain::TimePoint stoppedAt) = 0;
};

} // namespace registry::ports::output
