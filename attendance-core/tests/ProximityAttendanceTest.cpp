#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "ProximityAttendance.hpp"
#include "mocks/FakeBeaconReceiver.hpp"
#include "mocks/FakeBeaconTransmitter.hpp"
#include "mocks/MockHttpClient.hpp"
#include <SimpleResponse.hpp>
#include <nlohmann/json.hpp>

using namespace proximity;
using namespace proximity::tests;
using ::testing::_;

// ============================================================================
// Test Fixture
// ============================================================================

/**
 * @brief Сборка через Boost.DI: радио и HTTP подменены, настройки по умолчанию
 */
class ProximityAttendanceTest : public ::testing::Test {
protected:
    void SetUp() override {
        transmitter_ = std::make_shared<FakeBeaconTransmitter>();
        receiver_ = std::make_shared<FakeBeaconReceiver>();
        httpClient_ = std::make_shared<MockHttpClient>();
        attendance_ = std::make_shared<ProximityAttendance>(transmitter_, receiver_, httpClient_);
    }

    std::shared_ptr<FakeBeaconTransmitter> transmitter_;
    std::shared_ptr<FakeBeaconReceiver> receiver_;
    std::shared_ptr<MockHttpClient> httpClient_;
    std::shared_ptr<ProximityAttendance> attendance_;
};

// ============================================================================
// ТЕСТЫ: сборка
// ============================================================================

TEST_F(ProximityAttendanceTest, Construct_AllServicesWired) {
    EXPECT_NE(attendance_->broadcaster(), nullptr);
    EXPECT_NE(attendance_->scanner(), nullptr);
    EXPECT_NE(attendance_->recorder(), nullptr);
    EXPECT_NE(attendance_->registry(), nullptr);
    EXPECT_NE(attendance_->securityValidator(), nullptr);
    EXPECT_NE(attendance_->resolutionEngine(), nullptr);
}

TEST_F(ProximityAttendanceTest, Construct_NoRadioOrNetworkActivity) {
    EXPECT_CALL(*httpClient_, send(_, _)).Times(0);

    EXPECT_EQ(transmitter_->advertiseCount(), 0u);
    EXPECT_FALSE(transmitter_->isTransmitting());
}

// ============================================================================
// ТЕСТЫ: отметка через HTTP реестр
// ============================================================================

TEST_F(ProximityAttendanceTest, Recorder_SubmitsOverHttp_RepeatSuppressedLocally) {
    EXPECT_CALL(*httpClient_, send(_, _))
        .WillOnce([](const IRequest& req, IResponse& res) {
            EXPECT_EQ(req.getMethod(), "POST");
            EXPECT_EQ(req.getPath(), "/api/v1/attendance");
            auto body = nlohmann::json::parse(req.getBody());
            EXPECT_EQ(body["session_token"], "K7M2QXPR9TAB");
            EXPECT_EQ(body["member_id"], "member-42");

            auto& simpleRes = dynamic_cast<SimpleResponse&>(res);
            simpleRes.setStatus(201);
            simpleRes.setBody(R"({"status":"success"})");
            return true;
        });

    auto first = attendance_->recorder()->submit("k7m2 qxpr 9tab", "member-42");
    EXPECT_EQ(first.status, domain::RecordStatus::SUCCESS);

    // Второе нажатие в пределах окна не уходит в сеть
    auto second = attendance_->recorder()->submit("K7M2QXPR9TAB", "member-42");
    EXPECT_EQ(second.status, domain::RecordStatus::ALREADY_RECORDED);
    EXPECT_TRUE(second.suppressedLocally);
}

TEST_F(ProximityAttendanceTest, Recorder_RegistryDown_Retryable) {
    EXPECT_CALL(*httpClient_, send(_, _)).WillOnce(::testing::Return(false));

    auto result = attendance_->recorder()->submit("K7M2QXPR9TAB", "member-42");

    EXPECT_EQ(result.status, domain::RecordStatus::REGISTRY_UNAVAILABLE);
}
