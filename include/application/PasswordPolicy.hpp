#pragma once

#include "settings/PasswordSettings.hpp"
#include <string>
#include <optional>
#include <memory>
#include <cctype>

namespace iam::application {

/**
 * @brief Требования к новому паролю
 *
 * Минимальная длина, заглавная и строчная буква, цифра, спецсимвол.
 */
class PasswordPolicy {
public:
    explicit PasswordPolicy(std::shared_ptr<settings::PasswordSettings> settings)
        : settings_(std::move(settings)) {}

    /**
     * @return Описание нарушения или nullopt если пароль подходит
     */
    std::optional<std::string> validate(const std::string& password) const {
        if (static_cast<int>(password.size()) < settings_->getMinLength()) {
            return "Password must be at least " + std::to_string(settings_->getMinLength()) + " characters";
        }

        bool hasUpper = false, hasLower = false, hasDigit = false, hasSpecial = false;
        for (unsigned char c : password) {
            if (std::isupper(c)) hasUpper = true;
            else if (std::islower(c)) hasLower = true;
            else if (std::isdigit(c)) hasDigit = true;
            else hasSpecial = true;
        }

        if (!hasUpper) return "Password must contain an upper-case letter";
        if (!hasLower) return "Password must contain a lower-case letter";
        if (!hasDigit) return "Password must contain a digit";
        if (!hasSpecial) return "Password must contain a non-alphanumeric character";
        return std::nullopt;
    }

private:
    std::shared_ptr<settings::PasswordSettings> settings_;
};

} // namespace iam::application
