#pragma once

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>

namespace proximity::domain {

/// Алфавит токена: 32 символа без 0/O и 1/I/L-путаницы
inline constexpr const char* TOKEN_ALPHABET = "ABCDEFGHJKLMNPQRSTUVWXYZ23456789";
inline constexpr size_t TOKEN_ALPHABET_SIZE = 32;
inline constexpr size_t TOKEN_LENGTH = 12;

/**
 * @brief Идентификатор сессии посещаемости
 *
 * Ровно 12 символов из TOKEN_ALPHABET (≈60 бит энтропии).
 * Всегда хранится в нормализованном виде: без пробелов, в верхнем регистре.
 * Нормализация одинакова на стороне вещателя и сканера, иначе хэши разойдутся.
 */
class SessionToken {
public:
    /**
     * @brief Создать токен из сырой строки
     * @throws std::invalid_argument если после нормализации строка не токен
     */
    explicit SessionToken(const std::string& raw)
        : value_(normalize(raw))
    {
        if (!isWellFormed(value_)) {
            throw std::invalid_argument("Malformed session token: '" + raw + "'");
        }
    }

    /**
     * @brief Разобрать токен без исключений
     */
    static std::optional<SessionToken> tryParse(const std::string& raw) {
        std::string normalized = normalize(raw);
        if (!isWellFormed(normalized)) {
            return std::nullopt;
        }
        return SessionToken(normalized);
    }

    /**
     * @brief trim + удаление внутренних пробелов + toupper
     */
    static std::string normalize(const std::string& raw) {
        std::string result;
        result.reserve(raw.size());
        for (unsigned char c : raw) {
            if (std::isspace(c)) {
                continue;
            }
            result.push_back(static_cast<char>(std::toupper(c)));
        }
        return result;
    }

    static bool isAlphabetSymbol(char c) {
        const std::string alphabet(TOKEN_ALPHABET);
        return alphabet.find(c) != std::string::npos;
    }

    /**
     * @brief Проверка формы уже нормализованной строки
     */
    static bool isWellFormed(const std::string& normalized) {
        return normalized.size() == TOKEN_LENGTH &&
               std::all_of(normalized.begin(), normalized.end(), isAlphabetSymbol);
    }

    const std::string& value() const { return value_; }

    bool operator==(const SessionToken& other) const { return value_ == other.value_; }
    bool operator!=(const SessionToken& other) const { return value_ != other.value_; }
    bool operator<(const SessionToken& other) const { return value_ < other.value_; }

private:
    std::string value_;
};

} // namespace proximity::domain

namespace std {

template <>
struct hash<proximity::domain::SessionToken> {
    size_t operator()(const proximity::domain::SessionToken& token) const {
        return hash<string>()(token.value());
    }
};

} // namespace std
