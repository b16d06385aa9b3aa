#pragma once

#include "domain/BeaconPayload.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>

namespace proximity::application {

/**
 * @brief Фиксированная таблица slug организации ↔ OrganizationCode
 *
 * Инварианты проверяются при создании:
 * - код в диапазоне 1..65535 (0 означает "нет организации")
 * - разные организации не делят код
 * - slug уникален без учёта регистра
 */
class OrganizationDirectory {
public:
    /**
     * @throws std::invalid_argument при нарушении инвариантов
     */
    explicit OrganizationDirectory(const std::map<std::string, uint16_t>& codes) {
        for (const auto& [rawSlug, code] : codes) {
            std::string slug = normalizeSlug(rawSlug);
            if (slug.empty()) {
                throw std::invalid_argument("Organization slug must not be empty");
            }
            if (code == 0) {
                throw std::invalid_argument("Organization code 0 is reserved: " + slug);
            }
            if (!bySlug_.emplace(slug, code).second) {
                throw std::invalid_argument("Duplicate organization slug: " + slug);
            }
            if (!byCode_.emplace(code, slug).second) {
                throw std::invalid_argument(
                    "Organization code " + std::to_string(code) + " shared by " +
                    byCode_[code] + " and " + slug);
            }
        }
        std::cout << "[OrganizationDirectory] Loaded " << bySlug_.size() << " organizations" << std::endl;
    }

    /**
     * @return std::nullopt для неизвестного slug (никогда не код по умолчанию)
     */
    std::optional<domain::OrganizationCode> orgCode(const std::string& slug) const {
        auto it = bySlug_.find(normalizeSlug(slug));
        if (it == bySlug_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::optional<std::string> orgSlug(domain::OrganizationCode code) const {
        auto it = byCode_.find(code);
        if (it == byCode_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    size_t size() const { return bySlug_.size(); }

    static std::string normalizeSlug(const std::string& slug) {
        auto begin = std::find_if_not(slug.begin(), slug.end(),
            [](unsigned char c) { return std::isspace(c); });
        auto end = std::find_if_not(slug.rbegin(), slug.rend(),
            [](unsigned char c) { return std::isspace(c); }).base();

        std::string result;
        for (auto it = begin; it < end; ++it) {
            result.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(*it))));
        }
        return result;
    }

private:
    std::unordered_map<std::string, domain::OrganizationCode> bySlug_;
    std::unordered_map<domain::OrganizationCode, std::string> byCode_;
};

} // namespace proximity::application
