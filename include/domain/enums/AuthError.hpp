#pragma once

#include <string>

namespace iam::domain {

/**
 * @brief Категория ожидаемой ошибки
 *
 * Ошибки по учётным данным и кодам намеренно сведены к минимуму категорий,
 * чтобы по ответу нельзя было понять, существует ли пользователь.
 */
enum class AuthError {
    NONE,
    INVALID_CREDENTIALS,
    ACCOUNT_LOCKED,
    EMAIL_NOT_CONFIRMED,
    INVALID_TWO_FACTOR_REQUEST,
    INVALID_OR_EXPIRED_CODE,
    INVALID_OR_EXPIRED_RESET_LINK,
    INVALID_CONFIRMATION_LINK,
    INVALID_CURRENT_PASSWORD,
    UNAUTHENTICATED,
    FORBIDDEN,
    NOT_FOUND,
    VALIDATION_ERROR,
    CONFLICT
};

inline std::string toString(AuthError error) {
    switch (error) {
        case AuthError::NONE:                          return "NONE";
        case AuthError::INVALID_CREDENTIALS:           return "INVALID_CREDENTIALS";
        case AuthError::ACCOUNT_LOCKED:                return "ACCOUNT_LOCKED";
        case AuthError::EMAIL_NOT_CONFIRMED:           return "EMAIL_NOT_CONFIRMED";
        case AuthError::INVALID_TWO_FACTOR_REQUEST:    return "INVALID_TWO_FACTOR_REQUEST";
        case AuthError::INVALID_OR_EXPIRED_CODE:       return "INVALID_OR_EXPIRED_CODE";
        case AuthError::INVALID_OR_EXPIRED_RESET_LINK: return "INVALID_OR_EXPIRED_RESET_LINK";
        case AuthError::INVALID_CONFIRMATION_LINK:     return "INVALID_CONFIRMATION_LINK";
        case AuthError::INVALID_CURRENT_PASSWORD:      return "INVALID_CURRENT_PASSWORD";
        case AuthError::UNAUTHENTICATED:               return "UNAUTHENTICATED";
        case AuthError::FORBIDDEN:                     return "FORBIDDEN";
        case AuthError::NOT_FOUND:                     return "NOT_FOUND";
        case AuthError::VALIDATION_ERROR:              return "VALIDATION_ERROR";
        case AuthError::CONFLICT:                      return "CONFLICT";
        default: return "UNKNOWN";
    }
}

/**
 * @brief HTTP статус для категории ошибки
 */
inline int toHttpStatus(AuthError error) {
    switch (error) {
        case AuthError::NONE:
            return 200;
        case AuthError::INVALID_CREDENTIALS:
        case AuthError::ACCOUNT_LOCKED:
        case AuthError::EMAIL_NOT_CONFIRMED:
        case AuthError::UNAUTHENTICATED:
            return 401;
        case AuthError::FORBIDDEN:
            return 403;
        case AuthError::NOT_FOUND:
            return 404;
        case AuthError::CONFLICT:
            return 409;
        default:
            return 400;
    }
}

/**
 * @brief Сообщение для клиента
 *
 * Блокировка и неподтверждённый email отдаются тем же текстом, что и
 * неверный пароль.
 */
inline std::string publicMessage(AuthError error) {
    switch (error) {
        case AuthError::INVALID_CREDENTIALS:
        case AuthError::ACCOUNT_LOCKED:
        case AuthError::EMAIL_NOT_CONFIRMED:
            return "Invalid email or password";
        case AuthError::INVALID_TWO_FACTOR_REQUEST:
        case AuthError::INVALID_OR_EXPIRED_CODE:
            return "Invalid or expired code";
        case AuthError::INVALID_OR_EXPIRED_RESET_LINK:
            return "Invalid or expired reset link";
        case AuthError::INVALID_CONFIRMATION_LINK:
            return "Invalid or expired confirmation link";
        case AuthError::INVALID_CURRENT_PASSWORD:
            return "Current password is incorrect";
        case AuthError::UNAUTHENTICATED:
            return "Authorization required";
        case AuthError::FORBIDDEN:
            return "Forbidden";
        case AuthError::NOT_FOUND:
            return "Not found";
        case AuthError::VALIDATION_ERROR:
            return "Validation failed";
        case AuthError::CONFLICT:
            return "Conflict";
        default:
            return "";
    }
}

} // namespace iam::domain
