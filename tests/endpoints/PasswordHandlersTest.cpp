/**
 * @file PasswordHandlersTest.cpp
 * @brief Unit-тесты для обработчиков пароля и подтверждения email
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "adapters/primary/ChangePasswordHandler.hpp"
#include "adapters/primary/ForgotPasswordHandler.hpp"
#include "adapters/primary/ResetPasswordHandler.hpp"
#include "adapters/primary/ConfirmEmailHandler.hpp"
#include "adapters/primary/ResendConfirmationHandler.hpp"
#include "mocks/MockServices.hpp"

#include <SimpleRequest.hpp>
#include <SimpleResponse.hpp>
#include <nlohmann/json.hpp>

using namespace iam;
using namespace iam::adapters::primary;
using iam::tests::mocks::MockPasswordService;
using ::testing::_;
using ::testing::Field;
using ::testing::Return;
using ::testing::Throw;

class PasswordHandlersTest : public ::testing::Test {
protected:
    void SetUp() override {
        passwordService_ = std::make_shared<MockPasswordService>();
    }

    SimpleRequest createRequest(const std::string& method,
                                const std::string& path,
                                const std::string& body = "") {
        SimpleRequest req;
        req.setMethod(method);
        req.setPath(path);
        if (!body.empty()) {
            req.setBody(body);
        }
        return req;
    }

    nlohmann::json parseJson(const std::string& body) {
        return nlohmann::json::parse(body);
    }

    std::shared_ptr<MockPasswordService> passwordService_;
};

// ============================================================================
// POST /auth/forgot-password
// ============================================================================

TEST_F(PasswordHandlersTest, ForgotPassword_AlwaysReportsSent) {
    EXPECT_CALL(*passwordService_, forgotPassword("alice@bank.test")).Times(1);
    EXPECT_CALL(*passwordService_, forgotPassword("nobody@bank.test")).Times(1);
    ForgotPasswordHandler handler(passwordService_);

    auto knownReq = createRequest("POST", "/auth/forgot-password", R"({"email":"alice@bank.test"})");
    SimpleResponse knownRes;
    handler.handle(knownReq, knownRes);

    auto unknownReq = createRequest("POST", "/auth/forgot-password", R"({"email":"nobody@bank.test"})");
    SimpleResponse unknownRes;
    handler.handle(unknownReq, unknownRes);

    EXPECT_EQ(knownRes.getStatus(), 200);
    EXPECT_EQ(unknownRes.getStatus(), 200);
    EXPECT_EQ(knownRes.getBody(), unknownRes.getBody());
    EXPECT_TRUE(parseJson(knownRes.getBody())["sent"].get<bool>());
}

TEST_F(PasswordHandlersTest, ForgotPassword_MissingEmail_Returns400) {
    EXPECT_CALL(*passwordService_, forgotPassword(_)).Times(0);
    ForgotPasswordHandler handler(passwordService_);

    auto req = createRequest("POST", "/auth/forgot-password", "{}");
    SimpleResponse res;
    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 400);
}

// ============================================================================
// POST /auth/reset-password
// ============================================================================

TEST_F(PasswordHandlersTest, ResetPassword_Success_Returns204) {
    EXPECT_CALL(*passwordService_, resetPassword("alice@bank.test", "tok", "N3w!Passw"))
        .WillOnce(Return(ports::input::OperationResult::ok()));
    ResetPasswordHandler handler(passwordService_);

    auto req = createRequest("POST", "/auth/reset-password",
        R"({"email":"alice@bank.test","token":"tok","newPassword":"N3w!Passw"})");
    SimpleResponse res;
    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 204);
}

TEST_F(PasswordHandlersTest, ResetPassword_BadToken_Returns400) {
    EXPECT_CALL(*passwordService_, resetPassword(_, _, _))
        .WillOnce(Return(ports::input::OperationResult::fail(domain::AuthError::INVALID_OR_EXPIRED_RESET_LINK)));
    ResetPasswordHandler handler(passwordService_);

    auto req = createRequest("POST", "/auth/reset-password",
        R"({"email":"alice@bank.test","token":"used","newPassword":"N3w!Passw"})");
    SimpleResponse res;
    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 400);
    EXPECT_EQ(parseJson(res.getBody())["error"], "Invalid or expired reset link");
}

TEST_F(PasswordHandlersTest, ResetPassword_WeakPassword_ReturnsPolicyMessage) {
    EXPECT_CALL(*passwordService_, resetPassword(_, _, "short"))
        .WillOnce(Return(ports::input::OperationResult::fail(
            domain::AuthError::VALIDATION_ERROR, "Password must be at least 8 characters")));
    ResetPasswordHandler handler(passwordService_);

    auto req = createRequest("POST", "/auth/reset-password",
        R"({"email":"alice@bank.test","token":"tok","newPassword":"short"})");
    SimpleResponse res;
    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 400);
    EXPECT_EQ(parseJson(res.getBody())["error"], "Password must be at least 8 characters");
}

// ============================================================================
// POST /auth/change-password
// ============================================================================

TEST_F(PasswordHandlersTest, ChangePassword_Success_Returns204) {
    EXPECT_CALL(*passwordService_,
                changePassword(Field(&domain::CallerContext::userId, "usr-alice"), "Old!Pass1", "N3w!Passw"))
        .WillOnce(Return(ports::input::OperationResult::ok()));
    ChangePasswordHandler handler(passwordService_);

    auto req = createRequest("POST", "/auth/change-password",
        R"({"currentPassword":"Old!Pass1","newPassword":"N3w!Passw"})");
    req.setAttribute("userId", "usr-alice");
    req.setAttribute("roles", "Employee");
    SimpleResponse res;
    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 204);
}

TEST_F(PasswordHandlersTest, ChangePassword_WrongCurrent_Returns400) {
    EXPECT_CALL(*passwordService_, changePassword(_, _, _))
        .WillOnce(Return(ports::input::OperationResult::fail(domain::AuthError::INVALID_CURRENT_PASSWORD)));
    ChangePasswordHandler handler(passwordService_);

    auto req = createRequest("POST", "/auth/change-password",
        R"({"currentPassword":"bad","newPassword":"N3w!Passw"})");
    req.setAttribute("userId", "usr-alice");
    SimpleResponse res;
    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 400);
}

TEST_F(PasswordHandlersTest, ChangePassword_ServiceThrows_Returns500) {
    EXPECT_CALL(*passwordService_, changePassword(_, _, _))
        .WillOnce(Throw(std::runtime_error("connection lost")));
    ChangePasswordHandler handler(passwordService_);

    auto req = createRequest("POST", "/auth/change-password",
        R"({"currentPassword":"Old!Pass1","newPassword":"N3w!Passw"})");
    req.setAttribute("userId", "usr-alice");
    SimpleResponse res;
    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 500);
}

// ============================================================================
// GET /auth/confirm-email, POST /auth/resend-confirmation
// ============================================================================

TEST_F(PasswordHandlersTest, ConfirmEmail_Success_Returns204) {
    EXPECT_CALL(*passwordService_, confirmEmail("usr-carol", "abc"))
        .WillOnce(Return(ports::input::OperationResult::ok()));
    ConfirmEmailHandler handler(passwordService_);

    auto req = createRequest("GET", "/auth/confirm-email");
    req.setQueryParam("userId", "usr-carol");
    req.setQueryParam("token", "abc");
    SimpleResponse res;
    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 204);
}

TEST_F(PasswordHandlersTest, ConfirmEmail_InvalidLink_Returns400) {
    EXPECT_CALL(*passwordService_, confirmEmail(_, _))
        .WillOnce(Return(ports::input::OperationResult::fail(domain::AuthError::INVALID_CONFIRMATION_LINK)));
    ConfirmEmailHandler handler(passwordService_);

    auto req = createRequest("GET", "/auth/confirm-email");
    req.setQueryParam("userId", "usr-carol");
    req.setQueryParam("token", "used");
    SimpleResponse res;
    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 400);
}

TEST_F(PasswordHandlersTest, ConfirmEmail_MissingToken_Returns400) {
    EXPECT_CALL(*passwordService_, confirmEmail(_, _)).Times(0);
    ConfirmEmailHandler handler(passwordService_);

    auto req = createRequest("GET", "/auth/confirm-email");
    req.setQueryParam("userId", "usr-carol");
    SimpleResponse res;
    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 400);
}

TEST_F(PasswordHandlersTest, ResendConfirmation_ReportsSent) {
    EXPECT_CALL(*passwordService_, resendConfirmation("carol@bank.test")).Times(1);
    ResendConfirmationHandler handler(passwordService_);

    auto req = createRequest("POST", "/auth/resend-confirmation", R"({"email":"carol@bank.test"})");
    SimpleResponse res;
    handler.handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
    EXPECT_TRUE(parseJson(res.getBody())["sent"].get<bool>());
}
