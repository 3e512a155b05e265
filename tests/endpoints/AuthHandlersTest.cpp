/**
 * @file AuthHandlersTest.cpp
 * @brief Unit-тесты для обработчиков /auth/login и /auth/2fa/*
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "adapters/primary/LoginHandler.hpp"
#include "adapters/primary/VerifyTwoFactorHandler.hpp"
#include "adapters/primary/EnableTwoFactorHandler.hpp"
#include "adapters/primary/DisableTwoFactorHandler.hpp"
#include "adapters/primary/HealthHandler.hpp"
#include "mocks/MockServices.hpp"

#include <SimpleRequest.hpp>
#include <SimpleResponse.hpp>
#include <nlohmann/json.hpp>

using namespace iam;
using namespace iam::adapters::primary;
using iam::tests::mocks::MockAuthService;
using ::testing::_;
using ::testing::Field;
using ::testing::Return;
using ::testing::Throw;

// ============================================================================
// Test Fixture
// ============================================================================

class AuthHandlersTest : public ::testing::Test {
protected:
    void SetUp() override {
        authService_ = std::make_shared<MockAuthService>();
    }

    SimpleRequest createRequest(const std::string& path, const std::string& body) {
        SimpleRequest req;
        req.setMethod("POST");
        req.setPath(path);
        req.setBody(body);
        return req;
    }

    /// Атрибуты, которые проставил бы BearerAuthMiddleware
    static void authenticate(SimpleRequest& req, const std::string& userId) {
        req.setAttribute("userId", userId);
        req.setAttribute("email", "alice@bank.test");
        req.setAttribute("roles", "Employee");
    }

    static ports::input::LoginResult tokenResult() {
        ports::input::LoginResult r;
        r.success = true;
        r.userId = "usr-alice";
        r.accessToken = "eyJ.token.sig";
        r.expiresAt = domain::Timestamp::fromUnixSeconds(1767268800);  // 2026-01-01T12:00:00Z
        return r;
    }

    nlohmann::json parseJson(const std::string& body) {
        return nlohmann::json::parse(body);
    }

    std::shared_ptr<MockAuthService> authService_;
};

// ============================================================================
// POST /auth/login
// ============================================================================

TEST_F(AuthHandlersTest, Login_Success_ReturnsToken) {
    EXPECT_CALL(*authService_, login("alice@bank.test", "P@ss1234")).WillOnce(Return(tokenResult()));
    LoginHandler handler(authService_);

    auto req = createRequest("/auth/login", R"({"email":"alice@bank.test","password":"P@ss1234"})");
    SimpleResponse res;
    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
    auto json = parseJson(res.getBody());
    EXPECT_FALSE(json["requiresTwoFactor"].get<bool>());
    EXPECT_EQ(json["userId"], "usr-alice");
    EXPECT_EQ(json["accessToken"], "eyJ.token.sig");
    EXPECT_EQ(json["expiresAt"], "2026-01-01T12:00:00Z");
}

TEST_F(AuthHandlersTest, Login_TwoFactor_ReturnsNullToken) {
    ports::input::LoginResult pending;
    pending.success = true;
    pending.requiresTwoFactor = true;
    pending.userId = "usr-alice";
    EXPECT_CALL(*authService_, login(_, _)).WillOnce(Return(pending));
    LoginHandler handler(authService_);

    auto req = createRequest("/auth/login", R"({"email":"alice@bank.test","password":"P@ss1234"})");
    SimpleResponse res;
    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
    auto json = parseJson(res.getBody());
    EXPECT_TRUE(json["requiresTwoFactor"].get<bool>());
    EXPECT_EQ(json["userId"], "usr-alice");
    EXPECT_TRUE(json["accessToken"].is_null());
    EXPECT_FALSE(json.contains("expiresAt"));
}

TEST_F(AuthHandlersTest, Login_LockedAndWrongPassword_LookTheSame) {
    EXPECT_CALL(*authService_, login("locked@bank.test", _))
        .WillOnce(Return(ports::input::LoginResult::fail(domain::AuthError::ACCOUNT_LOCKED)));
    EXPECT_CALL(*authService_, login("alice@bank.test", _))
        .WillOnce(Return(ports::input::LoginResult::fail(domain::AuthError::INVALID_CREDENTIALS)));
    LoginHandler handler(authService_);

    auto lockedReq = createRequest("/auth/login", R"({"email":"locked@bank.test","password":"x"})");
    SimpleResponse lockedRes;
    handler.handle(lockedReq, lockedRes);

    auto wrongReq = createRequest("/auth/login", R"({"email":"alice@bank.test","password":"x"})");
    SimpleResponse wrongRes;
    handler.handle(wrongReq, wrongRes);

    EXPECT_EQ(lockedRes.getStatus(), 401);
    EXPECT_EQ(wrongRes.getStatus(), 401);
    EXPECT_EQ(lockedRes.getBody(), wrongRes.getBody());
}

TEST_F(AuthHandlersTest, Login_MissingFields_Returns400) {
    EXPECT_CALL(*authService_, login(_, _)).Times(0);
    LoginHandler handler(authService_);

    auto req = createRequest("/auth/login", R"({"email":"alice@bank.test"})");
    SimpleResponse res;
    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 400);
}

TEST_F(AuthHandlersTest, Login_InvalidJson_Returns400) {
    LoginHandler handler(authService_);

    auto req = createRequest("/auth/login", "{not json");
    SimpleResponse res;
    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 400);
    EXPECT_EQ(parseJson(res.getBody())["error"], "Invalid JSON");
}

TEST_F(AuthHandlersTest, Login_ServiceThrows_Returns500) {
    EXPECT_CALL(*authService_, login(_, _)).WillOnce(Throw(std::runtime_error("db down")));
    LoginHandler handler(authService_);

    auto req = createRequest("/auth/login", R"({"email":"alice@bank.test","password":"P@ss1234"})");
    SimpleResponse res;
    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 500);
    EXPECT_EQ(res.getBody().find("db down"), std::string::npos);
}

// ============================================================================
// POST /auth/2fa/verify
// ============================================================================

TEST_F(AuthHandlersTest, VerifyTwoFactor_Success_ReturnsToken) {
    EXPECT_CALL(*authService_, verifyTwoFactor("usr-alice", "123456")).WillOnce(Return(tokenResult()));
    VerifyTwoFactorHandler handler(authService_);

    auto req = createRequest("/auth/2fa/verify", R"({"userId":"usr-alice","code":"123456"})");
    SimpleResponse res;
    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
    auto json = parseJson(res.getBody());
    EXPECT_FALSE(json["requiresTwoFactor"].get<bool>());
    EXPECT_EQ(json["accessToken"], "eyJ.token.sig");
}

TEST_F(AuthHandlersTest, VerifyTwoFactor_BadCode_Returns400) {
    EXPECT_CALL(*authService_, verifyTwoFactor(_, _))
        .WillOnce(Return(ports::input::LoginResult::fail(domain::AuthError::INVALID_OR_EXPIRED_CODE)));
    VerifyTwoFactorHandler handler(authService_);

    auto req = createRequest("/auth/2fa/verify", R"({"userId":"usr-alice","code":"000000"})");
    SimpleResponse res;
    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 400);
    EXPECT_EQ(parseJson(res.getBody())["error"], "Invalid or expired code");
}

// ============================================================================
// POST /auth/2fa/enable, /auth/2fa/disable
// ============================================================================

TEST_F(AuthHandlersTest, EnableTwoFactor_PassesCallerFromAttributes) {
    EXPECT_CALL(*authService_, enableTwoFactor(Field(&domain::CallerContext::userId, "usr-alice"), "P@ss1234"))
        .WillOnce(Return(ports::input::OperationResult::ok()));
    EnableTwoFactorHandler handler(authService_);

    auto req = createRequest("/auth/2fa/enable", R"({"currentPassword":"P@ss1234"})");
    authenticate(req, "usr-alice");
    SimpleResponse res;
    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 204);
}

TEST_F(AuthHandlersTest, EnableTwoFactor_WrongPassword_Returns400) {
    EXPECT_CALL(*authService_, enableTwoFactor(_, _))
        .WillOnce(Return(ports::input::OperationResult::fail(domain::AuthError::INVALID_CURRENT_PASSWORD)));
    EnableTwoFactorHandler handler(authService_);

    auto req = createRequest("/auth/2fa/enable", R"({"currentPassword":"wrong"})");
    authenticate(req, "usr-alice");
    SimpleResponse res;
    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 400);
    EXPECT_EQ(parseJson(res.getBody())["error"], "Current password is incorrect");
}

TEST_F(AuthHandlersTest, DisableTwoFactor_Success_Returns204) {
    EXPECT_CALL(*authService_, disableTwoFactor(_, "P@ss1234"))
        .WillOnce(Return(ports::input::OperationResult::ok()));
    DisableTwoFactorHandler handler(authService_);

    auto req = createRequest("/auth/2fa/disable", R"({"currentPassword":"P@ss1234"})");
    authenticate(req, "usr-alice");
    SimpleResponse res;
    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 204);
}

TEST_F(AuthHandlersTest, DisableTwoFactor_MissingPassword_Returns400) {
    EXPECT_CALL(*authService_, disableTwoFactor(_, _)).Times(0);
    DisableTwoFactorHandler handler(authService_);

    auto req = createRequest("/auth/2fa/disable", "{}");
    authenticate(req, "usr-alice");
    SimpleResponse res;
    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 400);
}

// ============================================================================
// GET /health
// ============================================================================

TEST_F(AuthHandlersTest, Health_ReturnsHealthy) {
    HealthHandler handler;

    SimpleRequest req;
    req.setMethod("GET");
    req.setPath("/health");
    SimpleResponse res;
    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
    auto json = parseJson(res.getBody());
    EXPECT_EQ(json["status"], "healthy");
    EXPECT_EQ(json["service"], "iam-service");
}
