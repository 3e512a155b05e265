#pragma once

#include <gmock/gmock.h>

#include "ports/input/IAuthService.hpp"
#include "ports/input/IPasswordService.hpp"
#include "ports/input/IEmployeeService.hpp"
#include "ports/output/ITokenProvider.hpp"

namespace iam::tests::mocks {

class MockAuthService : public ports::input::IAuthService {
public:
    MOCK_METHOD(ports::input::LoginResult, login,
                (const std::string& email, const std::string& password), (override));
    MOCK_METHOD(ports::input::LoginResult, verifyTwoFactor,
                (const std::string& userId, const std::string& code), (override));
    MOCK_METHOD(ports::input::OperationResult, enableTwoFactor,
                (const domain::CallerContext& caller, const std::string& currentPassword), (override));
    MOCK_METHOD(ports::input::OperationResult, disableTwoFactor,
                (const domain::CallerContext& caller, const std::string& currentPassword), (override));
};

class MockPasswordService : public ports::input::IPasswordService {
public:
    MOCK_METHOD(ports::input::OperationResult, changePassword,
                (const domain::CallerContext& caller, const std::string& currentPassword,
                 const std::string& newPassword), (override));
    MOCK_METHOD(void, forgotPassword, (const std::string& email), (override));
    MOCK_METHOD(ports::input::OperationResult, resetPassword,
                (const std::string& email, const std::string& token,
                 const std::string& newPassword), (override));
    MOCK_METHOD(ports::input::OperationResult, confirmEmail,
                (const std::string& userId, const std::string& token), (override));
    MOCK_METHOD(void, resendConfirmation, (const std::string& email), (override));
};

class MockEmployeeService : public ports::input::IEmployeeService {
public:
    MOCK_METHOD(ports::input::EmployeePageResult, list,
                (const domain::CallerContext& caller, const domain::IdentityQuery& query), (override));
    MOCK_METHOD(ports::input::EmployeeDetailsResult, getDetails,
                (const domain::CallerContext& caller, const std::string& id), (override));
    MOCK_METHOD(ports::input::CreateEmployeeResult, create,
                (const domain::CallerContext& caller,
                 const ports::input::CreateEmployeeRequest& request), (override));
    MOCK_METHOD(ports::input::OperationResult, update,
                (const domain::CallerContext& caller, const std::string& id,
                 const ports::input::UpdateEmployeeRequest& request), (override));
    MOCK_METHOD(ports::input::OperationResult, activate,
                (const domain::CallerContext& caller, const std::string& id), (override));
    MOCK_METHOD(ports::input::OperationResult, deactivate,
                (const domain::CallerContext& caller, const std::string& id), (override));
};

class MockTokenProvider : public ports::output::ITokenProvider {
public:
    MOCK_METHOD(domain::IssuedToken, issue, (const domain::Identity& identity), (override));
    MOCK_METHOD(std::optional<domain::AccessTokenClaims>, verify, (const std::string& token), (override));
};

} // namespace iam::tests::mocks
