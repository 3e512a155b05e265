#pragma once

#include "Timestamp.hpp"
#include <string>
#include <optional>
#include <set>
#include <algorithm>
#include <cctype>

namespace iam::domain {

/**
 * @brief Сотрудник банка, который может проходить аутентификацию
 *
 * Никогда не удаляется физически, только деактивируется.
 * Неактивная identity не может войти ни при каких условиях.
 */
struct Identity {
    std::string id;                         ///< Формат: "usr-<hex>"
    std::string email;                      ///< Email в исходном регистре
    std::string normalizedEmail;            ///< Email в нижнем регистре (уникальный)
    std::string passwordHash;               ///< pbkdf2_sha256$iter$salt$hash
    std::string fullName;
    std::optional<std::string> phoneNumber;
    bool emailConfirmed = false;
    bool isActive = true;
    bool twoFactorEnabled = false;
    std::optional<Timestamp> lockoutUntil;
    int failedAccessCount = 0;
    std::set<std::string> roles;
    std::optional<Timestamp> lastLoginAt;
    Timestamp createdAt;
    Timestamp updatedAt;

    Identity() = default;

    Identity(const std::string& id,
             const std::string& email,
             const std::string& passwordHash,
             const std::string& fullName)
        : id(id)
        , email(email)
        , normalizedEmail(normalizeEmail(email))
        , passwordHash(passwordHash)
        , fullName(fullName)
    {}

    /**
     * @brief Заблокирована ли учётная запись на момент now
     */
    bool isLockedOut(const Timestamp& now) const {
        return lockoutUntil.has_value() && *lockoutUntil > now;
    }

    bool hasRole(const std::string& role) const {
        return roles.count(role) > 0;
    }

    static std::string normalizeEmail(const std::string& email) {
        std::string result = email;
        std::transform(result.begin(), result.end(), result.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return result;
    }
};

} // namespace iam::domain
