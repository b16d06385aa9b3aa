#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "adapters/secondary/HttpSessionRegistryClient.hpp"
#include "mocks/MockHttpClient.hpp"
#include <SimpleResponse.hpp>
#include <nlohmann/json.hpp>

using namespace proximity;
using namespace proximity::adapters::secondary;
using namespace proximity::tests;
using ::testing::_;
using ::testing::Return;

// ============================================================================
// Mocks
// ============================================================================

class MockRegistryClientSettings : public settings::IRegistryClientSettings {
public:
    std::string getHost() const override { return "session-registry"; }
    int getPort() const override { return 8080; }
};

// ============================================================================
// Test Fixture
// ============================================================================

class HttpSessionRegistryClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        mockHttpClient_ = std::make_shared<MockHttpClient>();
        client_ = std::make_shared<HttpSessionRegistryClient>(
            mockHttpClient_, std::make_shared<MockRegistryClientSettings>());
    }

    // Хелпер для настройки mock ответа
    void expectRequest(const std::string& method, const std::string& expectedPath,
                       int status, const std::string& body) {
        EXPECT_CALL(*mockHttpClient_, send(_, _))
            .WillOnce([method, expectedPath, status, body](const IRequest& req, IResponse& res) {
                EXPECT_EQ(req.getMethod(), method);
                EXPECT_EQ(req.getPath(), expectedPath);

                auto& simpleRes = dynamic_cast<SimpleResponse&>(res);
                simpleRes.setStatus(status);
                simpleRes.setBody(body);
                return true;
            });
    }

    std::shared_ptr<MockHttpClient> mockHttpClient_;
    std::shared_ptr<HttpSessionRegistryClient> client_;
    const domain::SessionToken token_{"K7M2QXPR9TAB"};
    const domain::TimePoint startsAt_ = domain::Timestamp::fromEpochSeconds(1736935200);
};

// ============================================================================
// ТЕСТЫ: createSession
// ============================================================================

TEST_F(HttpSessionRegistryClientTest, CreateSession_Created_ParsesTokenAndWindow) {
    EXPECT_CALL(*mockHttpClient_, send(_, _))
        .WillOnce([](const IRequest& req, IResponse& res) {
            EXPECT_EQ(req.getMethod(), "POST");
            EXPECT_EQ(req.getPath(), "/api/v1/sessions");

            auto body = nlohmann::json::parse(req.getBody());
            EXPECT_EQ(body["org_id"], "org-nhs-lincoln");
            EXPECT_EQ(body["title"], "Chapter Meeting");
            EXPECT_EQ(body["starts_at"], "2025-01-15T10:00:00Z");
            EXPECT_EQ(body["duration_seconds"], 3600);

            auto& simpleRes = dynamic_cast<SimpleResponse&>(res);
            simpleRes.setStatus(201);
            simpleRes.setBody(R"({
                "session_token": "K7M2QXPR9TAB",
                "org_slug": "nhs",
                "starts_at": "2025-01-15T10:00:00Z",
                "ends_at": "2025-01-15T11:00:00Z",
                "server_time": "2025-01-15T09:59:00Z"
            })");
            return true;
        });

    auto result = client_->createSession("org-nhs-lincoln", "Chapter Meeting", startsAt_, 3600);

    ASSERT_TRUE(result.created());
    EXPECT_EQ(*result.token, token_);
    EXPECT_EQ(result.orgSlug, "nhs");
    EXPECT_EQ(result.startsAt, startsAt_);
    EXPECT_EQ(result.endsAt, startsAt_ + std::chrono::seconds(3600));
    EXPECT_EQ(result.registryNow, startsAt_ - std::chrono::seconds(60));
}

TEST_F(HttpSessionRegistryClientTest, CreateSession_NoStart_LeavesStartToRegistryClock) {
    EXPECT_CALL(*mockHttpClient_, send(_, _))
        .WillOnce([](const IRequest& req, IResponse& res) {
            auto body = nlohmann::json::parse(req.getBody());
            EXPECT_FALSE(body.contains("starts_at"));
            EXPECT_EQ(body["duration_seconds"], 3600);

            auto& simpleRes = dynamic_cast<SimpleResponse&>(res);
            simpleRes.setStatus(201);
            simpleRes.setBody(R"({
                "session_token": "K7M2QXPR9TAB",
                "org_slug": "nhs",
                "starts_at": "2025-01-15T10:00:00Z",
                "ends_at": "2025-01-15T11:00:00Z",
                "server_time": "2025-01-15T10:00:00Z"
            })");
            return true;
        });

    auto result = client_->createSession("org-nhs-lincoln", "Chapter Meeting", std::nullopt, 3600);

    ASSERT_TRUE(result.created());
    EXPECT_EQ(result.registryNow, startsAt_);
}

TEST_F(HttpSessionRegistryClientTest, CreateSession_CreatedWithoutServerTime_Throws) {
    expectRequest("POST", "/api/v1/sessions", 201,
        R"({"session_token":"K7M2QXPR9TAB","org_slug":"nhs","starts_at":"2025-01-15T10:00:00Z","ends_at":"2025-01-15T11:00:00Z"})");

    EXPECT_THROW(client_->createSession("org-nhs-lincoln", "Chapter Meeting", std::nullopt, 3600),
                 ports::output::RegistryUnavailableError);
}

TEST_F(HttpSessionRegistryClientTest, CreateSession_UnknownOrganization_ParsesStatus) {
    expectRequest("POST", "/api/v1/sessions", 404,
        R"({"status":"unknown_organization","error":"Organization not found"})");

    auto result = client_->createSession("org-missing", "Chapter Meeting", startsAt_, 3600);

    EXPECT_FALSE(result.created());
    EXPECT_EQ(result.status, domain::CreateSessionStatus::UNKNOWN_ORGANIZATION);
    EXPECT_EQ(result.message, "Organization not found");
}

TEST_F(HttpSessionRegistryClientTest, CreateSession_TokenGenerationFailed_ParsesStatus) {
    expectRequest("POST", "/api/v1/sessions", 503,
        R"({"status":"token_generation_failed","error":"Could not allocate a unique token"})");

    auto result = client_->createSession("org-nhs-lincoln", "Chapter Meeting", startsAt_, 3600);

    EXPECT_EQ(result.status, domain::CreateSessionStatus::TOKEN_GENERATION_FAILED);
}

TEST_F(HttpSessionRegistryClientTest, CreateSession_ServerError_Throws) {
    expectRequest("POST", "/api/v1/sessions", 500, "Internal Server Error");

    EXPECT_THROW(client_->createSession("org-nhs-lincoln", "Chapter Meeting", startsAt_, 3600),
                 ports::output::RegistryUnavailableError);
}

TEST_F(HttpSessionRegistryClientTest, CreateSession_MalformedIssuedToken_Throws) {
    expectRequest("POST", "/api/v1/sessions", 201,
        R"({"session_token":"SHORT","starts_at":"2025-01-15T10:00:00Z","ends_at":"2025-01-15T11:00:00Z"})");

    EXPECT_THROW(client_->createSession("org-nhs-lincoln", "Chapter Meeting", startsAt_, 3600),
                 ports::output::RegistryUnavailableError);
}

TEST_F(HttpSessionRegistryClientTest, CreateSession_NoResponse_Throws) {
    EXPECT_CALL(*mockHttpClient_, send(_, _)).WillOnce(Return(false));

    EXPECT_THROW(client_->createSession("org-nhs-lincoln", "Chapter Meeting", startsAt_, 3600),
                 ports::output::RegistryUnavailableError);
}

TEST_F(HttpSessionRegistryClientTest, CreateSession_TransportThrows_WrappedAsUnavailable) {
    EXPECT_CALL(*mockHttpClient_, send(_, _))
        .WillOnce([](const IRequest&, IResponse&) -> bool {
            throw std::runtime_error("Connection refused");
        });

    EXPECT_THROW(client_->createSession("org-nhs-lincoln", "Chapter Meeting", startsAt_, 3600),
                 ports::output::RegistryUnavailableError);
}

// ============================================================================
// ТЕСТЫ: listActiveSessions
// ============================================================================

TEST_F(HttpSessionRegistryClientTest, ListActiveSessions_ParsesSessions) {
    expectRequest("GET", "/api/v1/organizations/org-nhs-lincoln/sessions/active", 200, R"({
        "sessions": [
            {"session_token":"K7M2QXPR9TAB","org_id":"org-nhs-lincoln","title":"Chapter Meeting",
             "starts_at":"2025-01-15T10:00:00Z","ends_at":"2025-01-15T11:00:00Z","attendee_count":12},
            {"session_token":"ABCDEFGHJKLM","org_id":"org-nhs-lincoln","title":"Officer Sync",
             "starts_at":"2025-01-15T09:30:00Z","ends_at":"2025-01-15T10:30:00Z","attendee_count":0}
        ]
    })");

    auto sessions = client_->listActiveSessions("org-nhs-lincoln");

    ASSERT_EQ(sessions.size(), 2u);
    EXPECT_EQ(sessions[0].token, token_);
    EXPECT_EQ(sessions[0].title, "Chapter Meeting");
    EXPECT_EQ(sessions[0].attendeeCount, 12);
    EXPECT_EQ(sessions[1].startsAt, startsAt_ - std::chrono::seconds(1800));
}

TEST_F(HttpSessionRegistryClientTest, ListActiveSessions_Empty) {
    expectRequest("GET", "/api/v1/organizations/org-nhs-lincoln/sessions/active", 200, R"({"sessions":[]})");

    EXPECT_TRUE(client_->listActiveSessions("org-nhs-lincoln").empty());
}

TEST_F(HttpSessionRegistryClientTest, ListActiveSessions_Error503_ThrowsNotEmpty) {
    expectRequest("GET", "/api/v1/organizations/org-nhs-lincoln/sessions/active", 503, "");

    EXPECT_THROW(client_->listActiveSessions("org-nhs-lincoln"), ports::output::RegistryUnavailableError);
}

TEST_F(HttpSessionRegistryClientTest, ListActiveSessions_MalformedJson_Throws) {
    expectRequest("GET", "/api/v1/organizations/org-nhs-lincoln/sessions/active", 200, "{not json");

    EXPECT_THROW(client_->listActiveSessions("org-nhs-lincoln"), ports::output::RegistryUnavailableError);
}

// ============================================================================
// ТЕСТЫ: stopSession / getSessionStatus
// ============================================================================

TEST_F(HttpSessionRegistryClientTest, StopSession_Ok) {
    expectRequest("POST", "/api/v1/sessions/K7M2QXPR9TAB/stop", 200, R"({"status":"stopped"})");

    EXPECT_EQ(client_->stopSession(token_), domain::StopStatus::STOPPED);
}

TEST_F(HttpSessionRegistryClientTest, StopSession_NotFound) {
    expectRequest("POST", "/api/v1/sessions/K7M2QXPR9TAB/stop", 404, R"({"status":"not_found"})");

    EXPECT_EQ(client_->stopSession(token_), domain::StopStatus::NOT_FOUND);
}

TEST_F(HttpSessionRegistryClientTest, GetSessionStatus_Stopped_ParsesReport) {
    expectRequest("GET", "/api/v1/sessions/K7M2QXPR9TAB/status", 200, R"({
        "session_token":"K7M2QXPR9TAB","org_id":"org-nhs-lincoln","title":"Chapter Meeting",
        "phase":"stopped","starts_at":"2025-01-15T10:00:00Z","ends_at":"2025-01-15T11:00:00Z",
        "stopped_at":"2025-01-15T10:20:00Z","time_remaining_seconds":0,"attendee_count":7
    })");

    auto report = client_->getSessionStatus(token_);

    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report->phase, domain::SessionPhase::STOPPED);
    ASSERT_TRUE(report->stoppedAt.has_value());
    EXPECT_EQ(*report->stoppedAt, startsAt_ + std::chrono::seconds(1200));
    EXPECT_EQ(report->attendeeCount, 7);
}

TEST_F(HttpSessionRegistryClientTest, GetSessionStatus_Active_NullStoppedAt) {
    expectRequest("GET", "/api/v1/sessions/K7M2QXPR9TAB/status", 200, R"({
        "org_id":"org-nhs-lincoln","title":"Chapter Meeting","phase":"active",
        "starts_at":"2025-01-15T10:00:00Z","ends_at":"2025-01-15T11:00:00Z",
        "stopped_at":null,"time_remaining_seconds":1800,"attendee_count":3
    })");

    auto report = client_->getSessionStatus(token_);

    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report->phase, domain::SessionPhase::ACTIVE);
    EXPECT_FALSE(report->stoppedAt.has_value());
    EXPECT_EQ(report->timeRemainingSeconds, 1800);
}

TEST_F(HttpSessionRegistryClientTest, GetSessionStatus_NotFound_ReturnsNullopt) {
    expectRequest("GET", "/api/v1/sessions/K7M2QXPR9TAB/status", 404, R"({"error":"Session not found"})");

    EXPECT_FALSE(client_->getSessionStatus(token_).has_value());
}

// ============================================================================
// ТЕСТЫ: submitAttendance
// ============================================================================

TEST_F(HttpSessionRegistryClientTest, SubmitAttendance_Success) {
    EXPECT_CALL(*mockHttpClient_, send(_, _))
        .WillOnce([](const IRequest& req, IResponse& res) {
            EXPECT_EQ(req.getPath(), "/api/v1/attendance");
            auto body = nlohmann::json::parse(req.getBody());
            EXPECT_EQ(body["session_token"], "K7M2QXPR9TAB");
            EXPECT_EQ(body["member_id"], "member-42");

            auto& simpleRes = dynamic_cast<SimpleResponse&>(res);
            simpleRes.setStatus(201);
            simpleRes.setBody(R"({"status":"success"})");
            return true;
        });

    EXPECT_EQ(client_->submitAttendance(token_, "member-42"), domain::SubmitStatus::SUCCESS);
}

TEST_F(HttpSessionRegistryClientTest, SubmitAttendance_Conflict_AlreadyRecorded) {
    expectRequest("POST", "/api/v1/attendance", 409, R"({"status":"already_recorded"})");

    EXPECT_EQ(client_->submitAttendance(token_, "member-42"), domain::SubmitStatus::ALREADY_RECORDED);
}

TEST_F(HttpSessionRegistryClientTest, SubmitAttendance_Gone_SessionExpired) {
    expectRequest("POST", "/api/v1/attendance", 410, R"({"status":"session_expired"})");

    EXPECT_EQ(client_->submitAttendance(token_, "member-42"), domain::SubmitStatus::SESSION_EXPIRED);
}

TEST_F(HttpSessionRegistryClientTest, SubmitAttendance_UnknownWireStatus_Throws) {
    expectRequest("POST", "/api/v1/attendance", 400, R"({"status":"banana"})");

    EXPECT_THROW(client_->submitAttendance(token_, "member-42"), ports::output::RegistryUnavailableError);
}

TEST_F(HttpSessionRegistryClientTest, SubmitAttendance_BadGateway_Throws) {
    expectRequest("POST", "/api/v1/attendance", 502, "");

    EXPECT_THROW(client_->submitAttendance(token_, "member-42"), ports::output::RegistryUnavailableError);
}
