#pragma once

#include "ports/input/IPasswordService.hpp"
#include "ports/output/IIdentityRepository.hpp"
#include "ports/output/IPasswordHasher.hpp"
#include "ports/output/IBackgroundExecutor.hpp"
#include "application/OneTimeCodeService.hpp"
#include "application/PasswordPolicy.hpp"
#include <memory>
#include <iostream>

namespace iam::application {

/**
 * @brief Сервис жизненного цикла пароля и подтверждения email
 *
 * forgotPassword и resendConfirmation только ставят задачу в фоновый
 * исполнитель: поиск identity и выпуск ссылки идут вне потока запроса,
 * поэтому время ответа и его исход не зависят от того, существует ли email.
 */
class PasswordService : public ports::input::IPasswordService {
public:
    PasswordService(
        std::shared_ptr<ports::output::IIdentityRepository> identityRepo,
        std::shared_ptr<ports::output::IPasswordHasher> hasher,
        std::shared_ptr<OneTimeCodeService> codes,
        std::shared_ptr<PasswordPolicy> policy,
        std::shared_ptr<ports::output::IBackgroundExecutor> executor
    ) : identityRepo_(std::move(identityRepo))
      , hasher_(std::move(hasher))
      , codes_(std::move(codes))
      , policy_(std::move(policy))
      , executor_(std::move(executor))
    {
        std::cout << "[PasswordService] Created" << std::endl;
    }

    ports::input::OperationResult changePassword(
        const domain::CallerContext& caller,
        const std::string& currentPassword,
        const std::string& newPassword
    ) override {
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

        if (auto violation = policy_->validate(newPassword)) {
            return ports::input::OperationResult::fail(domain::AuthError::VALIDATION_ERROR, *violation);
        }

        if (!replacePassword(*identityOpt, newPassword)) {
            return ports::input::OperationResult::fail(domain::AuthError::UNAUTHENTICATED);
        }
        std::cout << "[PasswordService] Password changed: " << identityOpt->id << std::endl;
        return ports::input::OperationResult::ok();
    }

    void forgotPassword(const std::string& email) override {
        if (email.empty()) {
            return;
        }

        executor_->post([identityRepo = identityRepo_, codes = codes_, email]() {
            try {
                auto identityOpt = identityRepo->findByEmail(email);
                if (!identityOpt || !identityOpt->isActive || !identityOpt->emailConfirmed) {
                    return;
                }

                codes->issueAndSend(*identityOpt, domain::OneTimeCodePurpose::PASSWORD_RESET);
                std::cout << "[PasswordService] Reset link issued for " << identityOpt->id << std::endl;

            } catch (const std::exception& e) {
                std::cerr << "[PasswordService] forgotPassword() failed: " << e.what() << std::endl;
            }
        });
    }

    ports::input::OperationResult resetPassword(
        const std::string& email,
        const std::string& token,
        const std::string& newPassword
    ) override {
        if (email.empty() || token.empty()) {
            return ports::input::OperationResult::fail(domain::AuthError::INVALID_OR_EXPIRED_RESET_LINK);
        }

        // Политика проверяется до погашения кода: слабый пароль не сжигает ссылку
        if (auto violation = policy_->validate(newPassword)) {
            return ports::input::OperationResult::fail(domain::AuthError::VALIDATION_ERROR, *violation);
        }

        auto identityOpt = identityRepo_->findByEmail(email);
        if (!identityOpt || !identityOpt->isActive) {
            return ports::input::OperationResult::fail(domain::AuthError::INVALID_OR_EXPIRED_RESET_LINK);
        }

        if (!codes_->validate(*identityOpt, domain::OneTimeCodePurpose::PASSWORD_RESET, token)) {
            return ports::input::OperationResult::fail(domain::AuthError::INVALID_OR_EXPIRED_RESET_LINK);
        }

        if (!replacePassword(*identityOpt, newPassword)) {
            return ports::input::OperationResult::fail(domain::AuthError::INVALID_OR_EXPIRED_RESET_LINK);
        }
        std::cout << "[PasswordService] Password reset: " << identityOpt->id << std::endl;
        return ports::input::OperationResult::ok();
    }

    ports::input::OperationResult confirmEmail(const std::string& userId, const std::string& token) override {
        if (userId.empty() || token.empty()) {
            return ports::input::OperationResult::fail(domain::AuthError::INVALID_CONFIRMATION_LINK);
        }

        auto identityOpt = identityRepo_->findById(userId);
        if (!identityOpt) {
            return ports::input::OperationResult::fail(domain::AuthError::INVALID_CONFIRMATION_LINK);
        }

        if (!codes_->validate(*identityOpt, domain::OneTimeCodePurpose::EMAIL_CONFIRMATION, token)) {
            return ports::input::OperationResult::fail(domain::AuthError::INVALID_CONFIRMATION_LINK);
        }

        if (!identityOpt->emailConfirmed) {
            if (!identityRepo_->markEmailConfirmed(identityOpt->id)) {
                return ports::input::OperationResult::fail(domain::AuthError::INVALID_CONFIRMATION_LINK);
            }
            std::cout << "[PasswordService] Email confirmed: " << identityOpt->id << std::endl;
        }
        return ports::input::OperationResult::ok();
    }

    void resendConfirmation(const std::string& email) override {
        if (email.empty()) {
            return;
        }

        executor_->post([identityRepo = identityRepo_, codes = codes_, email]() {
            try {
                auto identityOpt = identityRepo->findByEmail(email);
                if (!identityOpt || !identityOpt->isActive || identityOpt->emailConfirmed) {
                    return;
                }

                codes->issueAndSend(*identityOpt, domain::OneTimeCodePurpose::EMAIL_CONFIRMATION);
                std::cout << "[PasswordService] Confirmation link re-issued for " << identityOpt->id << std::endl;

            } catch (const std::exception& e) {
                std::cerr << "[PasswordService] resendConfirmation() failed: " << e.what() << std::endl;
            }
        });
    }

private:
    std::shared_ptr<ports::output::IIdentityRepository> identityRepo_;
    std::shared_ptr<ports::output::IPasswordHasher> hasher_;
    std::shared_ptr<OneTimeCodeService> codes_;
    std::shared_ptr<PasswordPolicy> policy_;
    std::shared_ptr<ports::output::IBackgroundExecutor> executor_;

    bool replacePassword(const domain::Identity& identity, const std::string& newPassword) {
        return identityRepo_->updatePasswordHash(identity.id, hasher_->hash(newPassword));
    }
};

} // namespace iam::application
