#pragma once

#include <array>
#include <cctype>
#include <cstdint>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>

namespace proximity::domain {

/**
 * @brief 128-битный идентификатор пространства имён маяков
 *
 * Текстовая форма: 8-4-4-4-12 hex, вывод в верхнем регистре.
 */
class BeaconUuid {
public:
    using Bytes = std::array<uint8_t, 16>;

    BeaconUuid() : bytes_{} {}

    explicit BeaconUuid(const Bytes& bytes) : bytes_(bytes) {}

    static std::optional<BeaconUuid> parse(const std::string& text) {
        std::string hex;
        for (size_t i = 0; i < text.size(); ++i) {
            char c = text[i];
            if (c == '-') {
                if (i != 8 && i != 13 && i != 18 && i != 23) {
                    return std::nullopt;
                }
                continue;
            }
            if (!std::isxdigit(static_cast<unsigned char>(c))) {
                return std::nullopt;
            }
            hex.push_back(c);
        }
        if (hex.size() != 32) {
            return std::nullopt;
        }

        Bytes bytes{};
        for (size_t i = 0; i < bytes.size(); ++i) {
            bytes[i] = static_cast<uint8_t>(std::stoul(hex.substr(i * 2, 2), nullptr, 16));
        }
        return BeaconUuid(bytes);
    }

    std::string toString() const {
        std::ostringstream ss;
        ss << std::uppercase << std::hex << std::setfill('0');
        for (size_t i = 0; i < bytes_.size(); ++i) {
            if (i == 4 || i == 6 || i == 8 || i == 10) {
                ss << '-';
            }
            ss << std::setw(2) << static_cast<int>(bytes_[i]);
        }
        return ss.str();
    }

    bool isNil() const {
        for (auto b : bytes_) {
            if (b != 0) return false;
        }
        return true;
    }

    const Bytes& bytes() const { return bytes_; }

    bool operator==(const BeaconUuid& other) const { return bytes_ == other.bytes_; }
    bool operator!=(const BeaconUuid& other) const { return bytes_ != other.bytes_; }

private:
    Bytes bytes_;
};

} // namespace proximity::domain
