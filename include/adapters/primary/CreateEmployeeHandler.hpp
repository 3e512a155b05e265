#pragma once

#include <IHttpHandler.hpp>
#include "adapters/primary/HttpSupport.hpp"
#include "ports/input/IEmployeeService.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace iam::adapters::primary {

/**
 * @brief Создание сотрудника администратором
 *
 * POST /admin/employees
 * {
 *   "email": "carol@bank.test",
 *   "fullName": "Carol Smith",
 *   "phoneNumber": "+100200300",
 *   "password": "Init!al1",
 *   "roles": ["Employee"]
 * }
 *
 * Response: 201 { "id": "usr-..." }. На email уходит ссылка подтверждения.
 */
class CreateEmployeeHandler : public IHttpHandler {
public:
    explicit CreateEmployeeHandler(std::shared_ptr<ports::input::IEmployeeService> employeeService)
        : employeeService_(std::move(employeeService)) {}

    void handle(IRequest& req, IResponse& res) override {
        try {
            auto body = nlohmann::json::parse(req.getBody());

            ports::input::CreateEmployeeRequest request;
            request.email = body.value("email", "");
            request.fullName = body.value("fullName", "");
            request.password = body.value("password", "");
            if (body.contains("phoneNumber") && !body["phoneNumber"].is_null()) {
                request.phoneNumber = body["phoneNumber"].get<std::string>();
            }
            if (body.contains("roles")) {
                request.roles = body["roles"].get<std::vector<std::string>>();
            }

            if (request.email.empty() || request.fullName.empty() || request.password.empty()) {
                http::sendError(res, 400, "email, fullName and password are required");
                return;
            }

            auto result = employeeService_->create(http::callerFromRequest(req), request);
            if (!result.status.success) {
                http::sendFailure(res, result.status);
                return;
            }

            nlohmann::json response;
            response["id"] = result.id;
            http::sendJson(res, 201, response);

        } catch (const nlohmann::json::exception&) {
            http::sendError(res, 400, "Invalid JSON");
        } catch (const std::exception& e) {
            std::cerr << "[CreateEmployeeHandler] Error: " << e.what() << std::endl;
            http::sendError(res, 500, "Internal server error");
        }
    }

private:
    std::shared_ptr<ports::input::IEmployeeService> employeeService_;
};

} // namespace iam::adapters::primary
