#pragma once

#include "Env.hpp"

namespace iam::settings {

/**
 * @brief Политика паролей и стоимость хэширования
 *
 * Читает из ENV:
 * - IAM_PASSWORD_MIN_LENGTH (default: 8)
 * - IAM_PASSWORD_PBKDF2_ITERATIONS (default: 100000)
 */
class PasswordSettings {
public:
    PasswordSettings()
        : PasswordSettings(
              env::getIntOrDefault("IAM_PASSWORD_MIN_LENGTH", 8),
              env::getIntOrDefault("IAM_PASSWORD_PBKDF2_ITERATIONS", 100000))
    {}

    PasswordSettings(int minLength, int pbkdf2Iterations)
        : minLength_(minLength)
        , pbkdf2Iterations_(pbkdf2Iterations)
    {}

    int getMinLength() const { return minLength_; }
    int getPbkdf2Iterations() const { return pbkdf2Iterations_; }

private:
    int minLength_;
    int pbkdf2Iterations_;
};

} // namespace iam::settings
