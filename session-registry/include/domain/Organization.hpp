#pragma once

#include <string>

namespace registry::domain {

struct Organization {
    std::string orgId;
    std::string slug;   ///< Ключ OrganizationCode на устройствах
    std::string name;
};

} // namespace registry::domain
