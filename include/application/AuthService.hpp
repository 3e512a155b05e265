#pragma once

#include "ports/input/IAuthService.hpp"
#include "ports/output/IIdentityRepository.hpp"
#include "ports/output/IPasswordHasher.hpp"
#include "ports/output/ITokenProvider.hpp"
#include "application/OneTimeCodeService.hpp"
#include "settings/LockoutSettings.hpp"
#include <memory>
#include <iostream>

namespace iam::application {

/**
 * @brief Сервис аутентификации
 *
 * Все отказы login, которые могли бы раскрыть существование email или
 * состояние учётной записи, наружу выглядят как INVALID_CREDENTIALS
 * (ACCOUNT_LOCKED отдаётся тем же сообщением и статусом).
 */
class AuthService : public ports::input::IAuthService {
public:
    AuthService(
        std::shared_ptr<settings::LockoutSettings> lockout,
        std::shared_ptr<ports::output::IIdentityRepository> identityRepo,
        std::shared_ptr<ports::output::IPasswordHasher> hasher,
        std::shared_ptr<ports::output::ITokenProvider> tokenProvider,
        std::shared_ptr<OneTimeCodeService> codes
    ) : lockout_(std::move(lockout))
      , identityRepo_(std::move(identityRepo))
      , hasher_(std::move(hasher))
      , tokenProvider_(std::move(tokenProvider))
      , codes_(std::move(codes))
    {
        // Для неизвестного email проверяем пароль против этого хэша,
        // чтобы время ответа не отличалось от существующего аккаунта
        dummyHash_ = hasher_->hash("iam-dummy-password");
        std::cout << "[AuthService] Created" << std::endl;
    }

    ports::input::LoginResult login(
        const std::string& email,
        const std::string& password
    ) override {
        if (email.empty() || password.empty()) {
            return ports::input::LoginResult::fail(domain::AuthError::INVALID_CREDENTIALS);
        }

        auto now = domain::Timestamp::now();
        auto identityOpt = identityRepo_->findByEmail(email);

        if (!identityOpt) {
            hasher_->verify(password, dummyHash_);
            return ports::input::LoginResult::fail(domain::AuthError::INVALID_CREDENTIALS);
        }

        auto& identity = *identityOpt;

        if (!identity.isActive) {
            hasher_->verify(password, dummyHash_);
            return ports::input::LoginResult::fail(domain::AuthError::INVALID_CREDENTIALS);
        }

        if (!identity.emailConfirmed) {
            hasher_->verify(password, dummyHash_);
            return ports::input::LoginResult::fail(domain::AuthError::EMAIL_NOT_CONFIRMED);
        }

        if (identity.isLockedOut(now)) {
            hasher_->verify(password, dummyHash_);
            return ports::input::LoginResult::fail(domain::AuthError::ACCOUNT_LOCKED);
        }

        if (!hasher_->verify(password, identity.passwordHash)) {
            registerFailure(identity.id, now);
            return ports::input::LoginResult::fail(domain::AuthError::INVALID_CREDENTIALS);
        }

        if (identity.twoFactorEnabled) {
            identityRepo_->resetFailedAccess(identity.id);
            codes_->issueAndSend(identity, domain::OneTimeCodePurpose::TWO_FACTOR);
            std::cout << "[AuthService] Two-factor code issued for " << identity.id << std::endl;

            ports::input::LoginResult result;
            result.success = true;
            result.requiresTwoFactor = true;
            result.userId = identity.id;
            return result;
        }

        return completeLogin(identity, now);
    }

    ports::input::LoginResult verifyTwoFactor(
        const std::string& userId,
        const std::string& code
    ) override {
        if (userId.empty()) {
            return ports::input::LoginResult::fail(domain::AuthError::INVALID_TWO_FACTOR_REQUEST);
        }

        auto identityOpt = identityRepo_->findById(userId);
        if (!identityOpt || !identityOpt->isActive || !identityOpt->emailConfirmed
                || !identityOpt->twoFactorEnabled) {
            return ports::input::LoginResult::fail(domain::AuthError::INVALID_TWO_FACTOR_REQUEST);
        }

        auto& identity = *identityOpt;
        auto now = domain::Timestamp::now();

        if (identity.isLockedOut(now)) {
            return ports::input::LoginResult::fail(domain::AuthError::INVALID_OR_EXPIRED_CODE);
        }

        if (!codes_->validate(identity, domain::OneTimeCodePurpose::TWO_FACTOR, code)) {
            if (lockout_->countsTwoFactorFailures()) {
                registerFailure(identity.id, now);
            }
            return ports::input::LoginResult::fail(domain::AuthError::INVALID_OR_EXPIRED_CODE);
        }

        return completeLogin(identity, now);
    }

    ports::input::OperationResult enableTwoFactor(
        const domain::CallerContext& caller,
        const std::string& currentPassword
    ) override {
        return setTwoFactor(caller, currentPassword, true);
    }

    ports::input::OperationResult disableTwoFactor(
        const domain::CallerContext& caller,
        const std::string& currentPassword
    ) override {
        return setTwoFactor(caller, currentPassword, false);
    }

private:
    std::shared_ptr<settings::LockoutSettings> lockout_;
    std::shared_ptr<ports::output::IIdentityRepository> identityRepo_;
    std::shared_ptr<ports::output::IPasswordHasher> hasher_;
    std::shared_ptr<ports::output::ITokenProvider> tokenProvider_;
    std::shared_ptr<OneTimeCodeService> codes_;
    std::string dummyHash_;

    void registerFailure(const std::string& identityId, const domain::Timestamp& now) {
        auto outcome = identityRepo_->recordFailedAccess(
            identityId,
            lockout_->getMaxAttempts(),
            now.addMinutes(lockout_->getLockoutMinutes()));

        if (outcome.lockedOut) {
            std::cout << "[AuthService] Identity locked out: " << identityId
                      << " for " << lockout_->getLockoutMinutes() << " minutes" << std::endl;
        }
    }

    ports::input::LoginResult completeLogin(const domain::Identity& identity, const domain::Timestamp& now) {
        identityRepo_->recordSuccessfulLogin(identity.id, now);
        auto issued = tokenProvider_->issue(identity);

        std::cout << "[AuthService] Login succeeded: " << identity.id << std::endl;

        ports::input::LoginResult result;
        result.success = true;
        result.userId = identity.id;
        result.accessToken = issued.token;
        result.expiresAt = issued.expiresAt;
        return result;
    }

    ports::input::OperationResult setTwoFactor(
        const domain::CallerContext& caller,
        const std::string& currentPassword,
        bool enabled
    ) {
        if (!caller.isAuthenticated()) {
            return ports::input::OperationResult::fail(domain::AuthError::UNAUTHENTICATED);
        }

        auto identityOpt = identityRepo_->findById(caller.userId);
        if (!identityOpt || !identityOpt->isActive) {
            return ports::input::OperationResult::fail(domain::AuthError::UNAUTHENTICATED);
        }

        if (currentPassword.empty() || !hasher_->verify(currentPassword, identityOpt->passwordHash)) {
            return ports::input::OperationResult::fail(domain::AuthError::INVALID_CURRENT_PASSWORD);
        }

        if (identityOpt->twoFactorEnabled == enabled) {
            return ports::input::OperationResult::ok();
        }

        if (!identityRepo_->setTwoFactorEnabled(caller.userId, enabled)) {
            return ports::input::OperationResult::fail(domain::AuthError::UNAUTHENTICATED);
        }

        std::cout << "[AuthService] Two-factor " << (enabled ? "enabled" : "disabled")
                  << " for " << caller.userId << std::endl;
        return ports::input::OperationResult::ok();
    }
};

} // namespace iam::application
