#pragma once

#include "OperationResult.hpp"
#include "domain/CallerContext.hpp"
#include "domain/Timestamp.hpp"
#include <string>
#include <optional>

namespace iam::ports::input {

/**
 * @brief Результат логина и проверки 2FA
 *
 * Оба пути возвращают одинаковую форму: при requiresTwoFactor=true
 * токена нет, есть только userId.
 */
struct LoginResult {
    bool success = false;
    domain::AuthError error = domain::AuthError::NONE;
    bool requiresTwoFactor = false;
    std::string userId;
    std::string accessToken;
    std::optional<domain::Timestamp> expiresAt;
    std::string message;

    static LoginResult fail(domain::AuthError error) {
        LoginResult r;
        r.error = error;
        r.message = domain::publicMessage(error);
        return r;
    }
};

/**
 * @brief Интерфейс аутентификации
 *
 * Пароль → (блокировка) → опциональный второй фактор → токен.
 */
class IAuthService {
public:
    virtual ~IAuthService() = default;

    /**
     * @brief Проверить email и пароль
     */
    virtual LoginResult login(const std::string& email, const std::string& password) = 0;

    /**
     * @brief Проверить код второго фактора и выпустить токен
     */
    virtual LoginResult verifyTwoFactor(const std::string& userId, const std::string& code) = 0;

    /**
     * @brief Включить 2FA (требует текущий пароль)
     */
    virtual OperationResult enableTwoFactor(
        const domain::CallerContext& caller,
        const std::string& currentPassword
    ) = 0;

    /**
     * @brief Выключить 2FA (требует текущий пароль)
     */
    virtual OperationResult disableTwoFactor(
        const domain::CallerContext& caller,
        const std::string& currentPassword
    ) = 0;
};

} // namespace iam::ports::input
