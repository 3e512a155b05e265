#pragma once

#include "domain/Roles.hpp"
#include <string>
#include <vector>
#include <algorithm>

namespace iam::application {

/**
 * @brief Ролевая проверка доступа к административным операциям
 *
 * Чистая функция от ролей из проверенного токена. В хранилище не ходит.
 */
class AuthorizationPolicy {
public:
    /**
     * @brief Разрешено ли действие
     *
     * Достаточно любой из requiredRoles. Пустой список означает доступ для
     * любого аутентифицированного вызывающего.
     */
    static bool allow(const std::vector<std::string>& callerRoles,
                      const std::vector<std::string>& requiredRoles) {
        if (requiredRoles.empty()) {
            return true;
        }
        return std::any_of(requiredRoles.begin(), requiredRoles.end(),
            [&callerRoles](const std::string& required) {
                return std::find(callerRoles.begin(), callerRoles.end(), required) != callerRoles.end();
            });
    }

    /// Просмотр сотрудников
    static std::vector<std::string> employeeRead() {
        return {domain::roles::ADMIN, domain::roles::MANAGER};
    }

    /// Создание, изменение, активация и деактивация сотрудников
    static std::vector<std::string> employeeWrite() {
        return {domain::roles::ADMIN};
    }
};

} // namespace iam::application
