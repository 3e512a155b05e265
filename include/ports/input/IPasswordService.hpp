#pragma once

#include "OperationResult.hpp"
#include "domain/CallerContext.hpp"
#include <string>

namespace iam::ports::input {

/**
 * @brief Интерфейс жизненного цикла пароля и email
 *
 * forgotPassword и resendConfirmation ничего не возвращают: ответ
 * клиенту всегда одинаков, существует email или нет.
 */
class IPasswordService {
public:
    virtual ~IPasswordService() = default;

    virtual OperationResult changePassword(
        const domain::CallerContext& caller,
        const std::string& currentPassword,
        const std::string& newPassword
    ) = 0;

    virtual void forgotPassword(const std::string& email) = 0;

    virtual OperationResult resetPassword(
        const std::string& email,
        const std::string& token,
        const std::string& newPassword
    ) = 0;

    virtual OperationResult confirmEmail(const std::string& userId, const std::string& token) = 0;

    virtual void resendConfirmation(const std::string& email) = 0;
};

} // namespace iam::ports::input
