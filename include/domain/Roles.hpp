#pragma once

#include <string>
#include <vector>

namespace iam::domain::roles {

inline const std::string ADMIN = "Admin";
inline const std::string MANAGER = "Manager";
inline const std::string EMPLOYEE = "Employee";

/**
 * @brief Роли, создаваемые миграцией
 */
inline std::vector<std::string> seeded() {
    return {ADMIN, MANAGER, EMPLOYEE};
}

} // namespace iam::domain::roles
