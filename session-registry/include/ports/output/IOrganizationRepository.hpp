#pragma once

#include "domain/Organization.hpp"
#include <optional>
#include <string>

namespace registry::ports::output {

class IOrganizationRepository {
public:
    virtual ~IOrganizationRepository() = default;

    virtual std::optional<domain::Organization> findById(const std::string& orgId) = 0;
};

} // namespace registry::ports::output
