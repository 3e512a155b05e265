#pragma once

#include "domain/enums/AuthError.hpp"
#include <string>

namespace iam::ports::input {

/**
 * @brief Результат операции без полезной нагрузки
 *
 * Ожидаемые отказы (неверный пароль, истёкший код) возвращаются
 * здесь, а не исключениями.
 */
struct OperationResult {
    bool success = false;
    domain::AuthError error = domain::AuthError::NONE;
    std::string message;

    static OperationResult ok() {
        return {true, domain::AuthError::NONE, ""};
    }

    static OperationResult fail(domain::AuthError error, const std::string& message = "") {
        return {false, error, message.empty() ? domain::publicMessage(error) : message};
    }
};

} // namespace iam::ports::input
