#pragma once

#include "application/OrganizationDirectory.hpp"
#include "domain/BeaconPayload.hpp"
#include "domain/SessionToken.hpp"
#include <memory>
#include <optional>
#include <string>

namespace proximity::application {

/**
 * @brief Детерминированное сжатие токена и организации в поля маяка
 *
 * encodeHash - чистая функция символов нормализованного токена:
 *   h = 0; для каждого символа c: h = ((h << 5) - h + c) & 0xFFFF
 * Необратима, коллизии ожидаемы (≈1/65536 на пару).
 *
 * Одна и та же реализация используется вещателем и сканером.
 */
class TokenCodec {
public:
    explicit TokenCodec(std::shared_ptr<OrganizationDirectory> directory)
        : directory_(std::move(directory))
    {}

    static domain::TokenHash encodeHash(const domain::SessionToken& token) {
        uint32_t hash = 0;
        for (unsigned char c : token.value()) {
            hash = ((hash << 5) - hash + c) & 0xFFFF;
        }
        return static_cast<domain::TokenHash>(hash);
    }

    /**
     * @brief Нормализовать и захэшировать сырую строку
     * @throws std::invalid_argument если строка не является токеном
     */
    static domain::TokenHash encodeHash(const std::string& rawToken) {
        return encodeHash(domain::SessionToken(rawToken));
    }

    std::optional<domain::OrganizationCode> orgCode(const std::string& orgSlug) const {
        return directory_->orgCode(orgSlug);
    }

    std::optional<std::string> orgSlug(domain::OrganizationCode code) const {
        return directory_->orgSlug(code);
    }

private:
    std::shared_ptr<OrganizationDirectory> directory_;
};

} // namespace proximity::application
