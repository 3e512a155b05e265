#pragma once

#include <string>
#include <optional>

namespace iam::domain {

/**
 * @brief Назначение одноразового кода
 *
 * Код действителен только для своего назначения: код подтверждения email
 * нельзя предъявить как код 2FA и наоборот.
 */
enum class OneTimeCodePurpose {
    TWO_FACTOR,
    EMAIL_CONFIRMATION,
    PASSWORD_RESET
};

inline std::string toString(OneTimeCodePurpose purpose) {
    switch (purpose) {
        case OneTimeCodePurpose::TWO_FACTOR: return "TWO_FACTOR";
        case OneTimeCodePurpose::EMAIL_CONFIRMATION: return "EMAIL_CONFIRMATION";
        case OneTimeCodePurpose::PASSWORD_RESET: return "PASSWORD_RESET";
    }
    return "UNKNOWN";
}

inline std::optional<OneTimeCodePurpose> parseOneTimeCodePurpose(const std::string& str) {
    if (str == "TWO_FACTOR") return OneTimeCodePurpose::TWO_FACTOR;
    if (str == "EMAIL_CONFIRMATION") return OneTimeCodePurpose::EMAIL_CONFIRMATION;
    if (str == "PASSWORD_RESET") return OneTimeCodePurpose::PASSWORD_RESET;
    return std::nullopt;
}

} // namespace iam::domain
