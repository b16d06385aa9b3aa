#pragma once

#include "ports/output/IOrganizationRepository.hpp"
#include <map>
#include <mutex>

namespace registry::tests::mocks {

/**
 * @brief In-Memory реализация справочника организаций
 *
 * По умолчанию содержит те же организации, что и sql/schema.sql.
 */
class InMemoryOrganizationRepository : public ports::output::IOrganizationRepository {
public:
    InMemoryOrganizationRepository() {
        add({"org-nhs-lincoln", "nhs", "National Honor Society, Lincoln High"});
        add({"org-nhsa-lincoln", "nhsa", "National Honor Society of the Arts, Lincoln High"});
    }

    std::optional<domain::Organization> findById(const std::string& orgId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = organizations_.find(orgId);
        if (it == organizations_.end()) return std::nullopt;
        return it->second;
    }

    // Test helpers
    void add(const domain::Organization& organization) {
        std::lock_guard<std::mutex> lock(mutex_);
        organizations_[organization.orgId] = organization;
    }

private:
    std::mutex mutex_;
    std::map<std::string, domain::Organization> organizations_;
};

} // namespace registry::tests::mocks
