#pragma once

#include "Identity.hpp"
#include <string>
#include <vector>
#include <optional>

namespace iam::domain {

/**
 * @brief Параметры выборки сотрудников
 */
struct IdentityQuery {
    int pageNumber = 1;
    int pageSize = 20;
    std::optional<std::string> search;  ///< Подстрока email или имени, без учёта регистра
    bool includeInactive = false;
};

/**
 * @brief Страница результатов из хранилища
 */
struct IdentitySlice {
    std::vector<Identity> items;
    int64_t totalCount = 0;
};

/**
 * @brief Краткие сведения о сотруднике для списка
 */
struct EmployeeSummary {
    std::string id;
    std::string email;
    std::string fullName;
    bool emailConfirmed = false;
    bool isActive = false;
    bool twoFactorEnabled = false;
    std::vector<std::string> roles;

    static EmployeeSummary from(const Identity& identity) {
        EmployeeSummary s;
        s.id = identity.id;
        s.email = identity.email;
        s.fullName = identity.fullName;
        s.emailConfirmed = identity.emailConfirmed;
        s.isActive = identity.isActive;
        s.twoFactorEnabled = identity.twoFactorEnabled;
        s.roles.assign(identity.roles.begin(), identity.roles.end());
        return s;
    }
};

/**
 * @brief Самоописывающая страница списка сотрудников
 */
struct EmployeePage {
    std::vector<EmployeeSummary> items;
    int pageNumber = 1;
    int pageSize = 20;
    int64_t totalCount = 0;
    int64_t totalPages = 0;
    bool hasNext = false;
    bool hasPrevious = false;
};

} // namespace iam::domain
