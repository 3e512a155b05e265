#pragma once

#include "Timestamp.hpp"
#include "enums/OneTimeCodePurpose.hpp"
#include <string>
#include <optional>

namespace iam::domain {

/**
 * @brief Одноразовый код (2FA, подтверждение email, сброс пароля)
 *
 * Хранится только SHA-256 хэш значения. Код одноразовый: после
 * consumedAt или expiresAt он больше никогда не проходит проверку.
 */
struct OneTimeCode {
    std::string id;                 ///< Формат: "otc-<hex>"
    std::string identityId;
    OneTimeCodePurpose purpose = OneTimeCodePurpose::TWO_FACTOR;
    std::string codeHash;           ///< hex(SHA-256(value))
    Timestamp createdAt;
    Timestamp expiresAt;
    std::optional<Timestamp> consumedAt;

    bool isUsable(const Timestamp& now) const {
        return !consumedAt.has_value() && expiresAt > now;
    }
};

} // namespace iam::domain
