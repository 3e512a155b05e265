#pragma once

#include <IHttpHandler.hpp>
#include "adapters/primary/HttpSupport.hpp"
#include "ports/input/IEmployeeService.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace iam::adapters::primary {

/**
 * @brief GET /admin/employees/{id}: карточка сотрудника
 *
 * Хэш пароля и счётчики в ответ не попадают, кроме состояния блокировки.
 */
class GetEmployeeHandler : public IHttpHandler {
public:
    explicit GetEmployeeHandler(std::shared_ptr<ports::input::IEmployeeService> employeeService)
        : employeeService_(std::move(employeeService)) {}

    void handle(IRequest& req, IResponse& res) override {
        try {
            std::string id = req.getPathParam(0).value_or("");
            if (id.empty()) {
                http::sendError(res, 400, "Employee ID is required");
                return;
            }

            auto result = employeeService_->getDetails(http::callerFromRequest(req), id);
            if (!result.status.success) {
                http::sendFailure(res, result.status);
                return;
            }

            http::sendJson(res, 200, detailsToJson(*result.employee));

        } catch (const std::exception& e) {
            std::cerr << "[GetEmployeeHandler] Error: " << e.what() << std::endl;
            http::sendError(res, 500, "Internal server error");
        }
    }

private:
    std::shared_ptr<ports::input::IEmployeeService> employeeService_;

    static nlohmann::json detailsToJson(const domain::Identity& identity) {
        nlohmann::json j;
        j["id"] = identity.id;
        j["email"] = identity.email;
        j["fullName"] = identity.fullName;
        j["phoneNumber"] = identity.phoneNumber ? nlohmann::json(*identity.phoneNumber) : nlohmann::json(nullptr);
        j["emailConfirmed"] = identity.emailConfirmed;
        j["isActive"] = identity.isActive;
        j["twoFactorEnabled"] = identity.twoFactorEnabled;
        j["lockoutUntil"] = identity.lockoutUntil
            ? nlohmann::json(identity.lockoutUntil->toString()) : nlohmann::json(nullptr);
        j["roles"] = std::vector<std::string>(identity.roles.begin(), identity.roles.end());
        j["lastLoginAt"] = identity.lastLoginAt
            ? nlohmann::json(identity.lastLoginAt->toString()) : nlohmann::json(nullptr);
        j["createdAt"] = identity.createdAt.toString();
        j["updatedAt"] = identity.updatedAt.toString();
        return j;
    }
};

} // namespace iam::adapters::primary
