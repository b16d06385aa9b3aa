#pragma once

#include <IHttpClient.hpp>
#include <gmock/gmock.h>

namespace proximity::tests {

class MockHttpClient : public IHttpClient {
public:
    MOCK_METHOD(bool, send, (const IRequest& req, IResponse& res), (override));
};

} // namespace proximity::tests
