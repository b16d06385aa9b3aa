#pragma once

#include "domain/SessionToken.hpp"
#include "ports/output/IRandomSource.hpp"
#include <deque>
#include <mutex>
#include <stdexcept>
#include <string>

namespace proximity::tests {

/**
 * @brief Детерминированный источник случайности
 *
 * pushToken("K7M2QXPR9TAB") кладёт байты, из которых генератор
 * (byte % 32) соберёт ровно этот токен.
 */
class SequenceRandomSource : public ports::output::IRandomSource {
public:
    explicit SequenceRandomSource(bool secure = true) : secure_(secure) {}

    bool isSecure() const override { return secure_; }

    void fill(uint8_t* buffer, size_t size) override {
        std::lock_guard<std::mutex> lock(mutex_);
        for (size_t i = 0; i < size; ++i) {
            if (bytes_.empty()) {
                throw std::runtime_error("SequenceRandomSource exhausted");
            }
            buffer[i] = bytes_.front();
            bytes_.pop_front();
        }
    }

    void pushToken(const std::string& token) {
        const std::string alphabet(domain::TOKEN_ALPHABET);
        std::lock_guard<std::mutex> lock(mutex_);
        for (char c : token) {
            auto index = alphabet.find(c);
            if (index == std::string::npos) {
                throw std::invalid_argument(std::string("Not an alphabet symbol: ") + c);
            }
            // +32 проверяет, что берётся остаток, а не сам байт
            bytes_.push_back(static_cast<uint8_t>(index + 32));
        }
    }

    size_t remaining() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return bytes_.size();
    }

private:
    bool secure_;
    mutable std::mutex mutex_;
    std::deque<uint8_t> bytes_;
};

} // namespace proximity::tests
