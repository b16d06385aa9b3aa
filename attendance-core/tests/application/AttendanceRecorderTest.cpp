#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "application/AttendanceRecorder.hpp"
#include "mocks/ManualClock.hpp"
#include "mocks/MockProximitySettings.hpp"
#include "mocks/MockSessionRegistry.hpp"

using namespace proximity;
using namespace proximity::application;
using namespace proximity::tests;
using ::testing::_;
using ::testing::Return;
using ::testing::Throw;

// ============================================================================
// Test Fixture
// ============================================================================

class AttendanceRecorderTest : public ::testing::Test {
protected:
    void SetUp() override {
        registry_ = std::make_shared<MockSessionRegistry>();
        clock_ = std::make_shared<ManualClock>();
        validator_ = std::make_shared<SecurityValidator>(std::make_shared<MockProximitySettings>(), clock_);
        recorder_ = std::make_shared<AttendanceRecorder>(registry_, validator_);
    }

    std::shared_ptr<MockSessionRegistry> registry_;
    std::shared_ptr<ManualClock> clock_;
    std::shared_ptr<SecurityValidator> validator_;
    std::shared_ptr<AttendanceRecorder> recorder_;
    const domain::SessionToken token_{"K7M2QXPR9TAB"};
};

// ============================================================================
// ТЕСТЫ: успешные отметки
// ============================================================================

TEST_F(AttendanceRecorderTest, Submit_Success) {
    EXPECT_CALL(*registry_, submitAttendance(token_, "member-42"))
        .WillOnce(Return(domain::SubmitStatus::SUCCESS));

    auto result = recorder_->submit("K7M2QXPR9TAB", "member-42");

    EXPECT_EQ(result.status, domain::RecordStatus::SUCCESS);
    EXPECT_EQ(result.token, token_);
    EXPECT_FALSE(result.suppressedLocally);
}

TEST_F(AttendanceRecorderTest, Submit_NormalizesTokenBeforeRegistry) {
    EXPECT_CALL(*registry_, submitAttendance(token_, "member-42"))
        .WillOnce(Return(domain::SubmitStatus::SUCCESS));

    EXPECT_EQ(recorder_->submit("  k7m2 qxpr 9tab ", "member-42").status,
              domain::RecordStatus::SUCCESS);
}

// ============================================================================
// ТЕСТЫ: повторы
// ============================================================================

TEST_F(AttendanceRecorderTest, Submit_RepeatWithinWindow_SuppressedWithoutNetwork) {
    EXPECT_CALL(*registry_, submitAttendance(_, _))
        .Times(1)
        .WillOnce(Return(domain::SubmitStatus::SUCCESS));

    recorder_->submit("K7M2QXPR9TAB", "member-42");
    clock_->advance(std::chrono::seconds(10));
    auto second = recorder_->submit("K7M2QXPR9TAB", "member-42");

    EXPECT_EQ(second.status, domain::RecordStatus::ALREADY_RECORDED);
    EXPECT_TRUE(second.suppressedLocally);
}

TEST_F(AttendanceRecorderTest, Submit_RepeatAfterWindow_AsksRegistry) {
    EXPECT_CALL(*registry_, submitAttendance(_, _))
        .WillOnce(Return(domain::SubmitStatus::SUCCESS))
        .WillOnce(Return(domain::SubmitStatus::ALREADY_RECORDED));

    recorder_->submit("K7M2QXPR9TAB", "member-42");
    clock_->advance(std::chrono::seconds(31));
    auto second = recorder_->submit("K7M2QXPR9TAB", "member-42");

    EXPECT_EQ(second.status, domain::RecordStatus::ALREADY_RECORDED);
    EXPECT_FALSE(second.suppressedLocally);
}

TEST_F(AttendanceRecorderTest, Submit_OtherMember_NotSuppressed) {
    EXPECT_CALL(*registry_, submitAttendance(_, _))
        .Times(2)
        .WillRepeatedly(Return(domain::SubmitStatus::SUCCESS));

    recorder_->submit("K7M2QXPR9TAB", "member-42");
    EXPECT_EQ(recorder_->submit("K7M2QXPR9TAB", "member-43").status,
              domain::RecordStatus::SUCCESS);
}

TEST_F(AttendanceRecorderTest, Submit_AlreadyRecordedByRegistry_AlsoSuppressesLocally) {
    EXPECT_CALL(*registry_, submitAttendance(_, _))
        .Times(1)
        .WillOnce(Return(domain::SubmitStatus::ALREADY_RECORDED));

    recorder_->submit("K7M2QXPR9TAB", "member-42");
    EXPECT_TRUE(recorder_->submit("K7M2QXPR9TAB", "member-42").suppressedLocally);
}

TEST_F(AttendanceRecorderTest, Submit_ManyMembersThenNextDay_RepeatCacheStaysBounded) {
    EXPECT_CALL(*registry_, submitAttendance(_, _))
        .WillRepeatedly(Return(domain::SubmitStatus::SUCCESS));

    for (int i = 0; i < 500; ++i) {
        recorder_->submit("K7M2QXPR9TAB", "member-" + std::to_string(i));
    }
    EXPECT_EQ(validator_->metrics().trackedSubmissions, 500u);

    clock_->advance(std::chrono::hours(24));
    recorder_->submit("ABCDEFGHJKLM", "member-0");

    EXPECT_LE(validator_->metrics().trackedSubmissions, 1u);
}

// ============================================================================
// ТЕСТЫ: отказы
// ============================================================================

TEST_F(AttendanceRecorderTest, Submit_MalformedToken_NoRegistryCall) {
    EXPECT_CALL(*registry_, submitAttendance(_, _)).Times(0);

    EXPECT_EQ(recorder_->submit("K7M2QX", "member-42").status, domain::RecordStatus::INVALID_TOKEN);
    EXPECT_EQ(recorder_->submit("K7M2QXPR9TA0", "member-42").status, domain::RecordStatus::INVALID_TOKEN);
}

TEST_F(AttendanceRecorderTest, Submit_LowEntropyToken_NoRegistryCall) {
    EXPECT_CALL(*registry_, submitAttendance(_, _)).Times(0);

    EXPECT_EQ(recorder_->submit("AAAAAAAAAAAA", "member-42").status, domain::RecordStatus::INVALID_TOKEN);
}

TEST_F(AttendanceRecorderTest, Submit_EmptyMember_Rejected) {
    EXPECT_CALL(*registry_, submitAttendance(_, _)).Times(0);

    EXPECT_EQ(recorder_->submit("K7M2QXPR9TAB", "").status, domain::RecordStatus::INVALID_TOKEN);
}

TEST_F(AttendanceRecorderTest, Submit_SessionExpired_NotCachedLocally) {
    EXPECT_CALL(*registry_, submitAttendance(_, _))
        .Times(2)
        .WillRepeatedly(Return(domain::SubmitStatus::SESSION_EXPIRED));

    EXPECT_EQ(recorder_->submit("K7M2QXPR9TAB", "member-42").status, domain::RecordStatus::SESSION_EXPIRED);
    EXPECT_EQ(recorder_->submit("K7M2QXPR9TAB", "member-42").status, domain::RecordStatus::SESSION_EXPIRED);
}

TEST_F(AttendanceRecorderTest, Submit_UnknownToken_InvalidToken) {
    EXPECT_CALL(*registry_, submitAttendance(_, _))
        .WillOnce(Return(domain::SubmitStatus::INVALID_TOKEN));

    EXPECT_EQ(recorder_->submit("K7M2QXPR9TAB", "member-42").status, domain::RecordStatus::INVALID_TOKEN);
}

TEST_F(AttendanceRecorderTest, Submit_RegistryUnavailable_Retryable) {
    EXPECT_CALL(*registry_, submitAttendance(_, _))
        .WillOnce(Throw(ports::output::RegistryUnavailableError("no route to host")))
        .WillOnce(Return(domain::SubmitStatus::SUCCESS));

    EXPECT_EQ(recorder_->submit("K7M2QXPR9TAB", "member-42").status,
              domain::RecordStatus::REGISTRY_UNAVAILABLE);
    EXPECT_EQ(recorder_->submit("K7M2QXPR9TAB", "member-42").status,
              domain::RecordStatus::SUCCESS);
}
