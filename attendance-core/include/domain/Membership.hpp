#pragma once

#include <string>
#include <vector>

namespace proximity::domain {

/**
 * @brief Организация, к которой принадлежит пользователь
 */
struct OrganizationMembership {
    std::string orgId;      ///< Идентификатор в реестре
    std::string orgSlug;    ///< Ключ для OrganizationCode
};

/**
 * @brief Контекст офицера, запускающего сессию
 */
struct OfficerContext {
    std::string officerId;
    OrganizationMembership organization;
};

/**
 * @brief Контекст участника, сканирующего маяки
 *
 * Маяки организаций вне memberships отбрасываются.
 */
struct MemberContext {
    std::string memberId;
    std::vector<OrganizationMembership> memberships;
};

} // namespace proximity::domain
