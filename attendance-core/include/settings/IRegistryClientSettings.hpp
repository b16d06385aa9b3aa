#pragma once

#include <string>

namespace proximity::settings {

class IRegistryClientSettings {
public:
    virtual ~IRegistryClientSettings() = default;
    virtual std::string getHost() const = 0;
    virtual int getPort() const = 0;
};

} // namespace proximity::settings
