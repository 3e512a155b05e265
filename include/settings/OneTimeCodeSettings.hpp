#pragma once

#include "Env.hpp"
#include "domain/enums/OneTimeCodePurpose.hpp"
#include <string>

namespace iam::settings {

/**
 * @brief Сроки жизни одноразовых кодов и базовые URL ссылок в письмах
 *
 * Читает из ENV:
 * - IAM_CODE_2FA_MINUTES (default: 10)
 * - IAM_CODE_EMAIL_CONFIRMATION_MINUTES (default: 1440)
 * - IAM_CODE_PASSWORD_RESET_MINUTES (default: 60)
 * - IAM_CONFIRM_EMAIL_URL, IAM_RESET_PASSWORD_URL
 */
class OneTimeCodeSettings {
public:
    OneTimeCodeSettings() {
        twoFactorMinutes_ = env::getIntOrDefault("IAM_CODE_2FA_MINUTES", 10);
        emailConfirmationMinutes_ = env::getIntOrDefault("IAM_CODE_EMAIL_CONFIRMATION_MINUTES", 1440);
        passwordResetMinutes_ = env::getIntOrDefault("IAM_CODE_PASSWORD_RESET_MINUTES", 60);
        confirmEmailUrl_ = env::getOrDefault("IAM_CONFIRM_EMAIL_URL", "http://localhost:3000/confirm-email");
        resetPasswordUrl_ = env::getOrDefault("IAM_RESET_PASSWORD_URL", "http://localhost:3000/reset-password");
    }

    int getLifetimeMinutes(domain::OneTimeCodePurpose purpose) const {
        switch (purpose) {
            case domain::OneTimeCodePurpose::TWO_FACTOR: return twoFactorMinutes_;
            case domain::OneTimeCodePurpose::EMAIL_CONFIRMATION: return emailConfirmationMinutes_;
            case domain::OneTimeCodePurpose::PASSWORD_RESET: return passwordResetMinutes_;
        }
        return twoFactorMinutes_;
    }

    void setLifetimeMinutes(domain::OneTimeCodePurpose purpose, int minutes) {
        switch (purpose) {
            case domain::OneTimeCodePurpose::TWO_FACTOR: twoFactorMinutes_ = minutes; break;
            case domain::OneTimeCodePurpose::EMAIL_CONFIRMATION: emailConfirmationMinutes_ = minutes; break;
            case domain::OneTimeCodePurpose::PASSWORD_RESET: passwordResetMinutes_ = minutes; break;
        }
    }

    const std::string& getConfirmEmailUrl() const { return confirmEmailUrl_; }
    const std::string& getResetPasswordUrl() const { return resetPasswordUrl_; }

private:
    int twoFactorMinutes_;
    int emailConfirmationMinutes_;
    int passwordResetMinutes_;
    std::string confirmEmailUrl_;
    std::string resetPasswordUrl_;
};

} // namespace iam::settings
