#pragma once

#include "OperationResult.hpp"
#include "domain/CallerContext.hpp"
#include "domain/EmployeePage.hpp"
#include "domain/Identity.hpp"
#include <string>
#include <optional>
#include <vector>

namespace iam::ports::input {

/**
 * @brief Запрос на создание сотрудника
 */
struct CreateEmployeeRequest {
    std::string email;
    std::string fullName;
    std::optional<std::string> phoneNumber;
    std::string password;
    std::vector<std::string> roles;
};

/**
 * @brief Частичное обновление профиля
 *
 * Пустые optional не меняются. roles заменяет набор ролей целиком.
 */
struct UpdateEmployeeRequest {
    std::optional<std::string> fullName;
    std::optional<std::string> phoneNumber;
    std::vector<std::string> roles;
};

struct EmployeePageResult {
    OperationResult status;
    domain::EmployeePage page;
};

struct EmployeeDetailsResult {
    OperationResult status;
    std::optional<domain::Identity> employee;
};

struct CreateEmployeeResult {
    OperationResult status;
    std::string id;
};

/**
 * @brief Интерфейс администрирования сотрудников
 *
 * Каждая операция сначала проверяет роли вызывающего.
 */
class IEmployeeService {
public:
    virtual ~IEmployeeService() = default;

    virtual EmployeePageResult list(
        const domain::CallerContext& caller,
        const domain::IdentityQuery& query
    ) = 0;

    virtual EmployeeDetailsResult getDetails(
        const domain::CallerContext& caller,
        const std::string& id
    ) = 0;

    virtual CreateEmployeeResult create(
        const domain::CallerContext& caller,
        const CreateEmployeeRequest& request
    ) = 0;

    virtual OperationResult update(
        const domain::CallerContext& caller,
        const std::string& id,
        const UpdateEmployeeRequest& request
    ) = 0;

    virtual OperationResult activate(const domain::CallerContext& caller, const std::string& id) = 0;

    virtual OperationResult deactivate(const domain::CallerContext& caller, const std::string& id) = 0;
};

} // namespace iam::ports::input
