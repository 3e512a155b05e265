#pragma once

#include "Env.hpp"

namespace iam::settings {

/**
 * @brief Политика блокировки учётной записи
 *
 * Читает из ENV:
 * - IAM_LOCKOUT_MAX_ATTEMPTS (default: 5)
 * - IAM_LOCKOUT_MINUTES (default: 15)
 * - IAM_LOCKOUT_COUNT_2FA_FAILURES (default: true): неверные коды 2FA
 *   увеличивают тот же счётчик, что и неверные пароли
 */
class LockoutSettings {
public:
    LockoutSettings()
        : LockoutSettings(
              env::getIntOrDefault("IAM_LOCKOUT_MAX_ATTEMPTS", 5),
              env::getIntOrDefault("IAM_LOCKOUT_MINUTES", 15),
              env::getBoolOrDefault("IAM_LOCKOUT_COUNT_2FA_FAILURES", true))
    {}

    LockoutSettings(int maxAttempts, int lockoutMinutes, bool countTwoFactorFailures)
        : maxAttempts_(maxAttempts)
        , lockoutMinutes_(lockoutMinutes)
        , countTwoFactorFailures_(countTwoFactorFailures)
    {}

    int getMaxAttempts() const { return maxAttempts_; }
    int getLockoutMinutes() const { return lockoutMinutes_; }
    bool countsTwoFactorFailures() const { return countTwoFactorFailures_; }

private:
    int maxAttempts_;
    int lockoutMinutes_;
    bool countTwoFactorFailures_;
};

} // namespace iam::settings
