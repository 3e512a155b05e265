#pragma once

#include <IHttpHandler.hpp>
#include "adapters/primary/HttpSupport.hpp"
#include "ports/input/IEmployeeService.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace iam::adapters::primary {

/**
 * @brief PUT /admin/employees/{id}
 *
 * { "fullName"?: "...", "phoneNumber"?: "...", "roles": ["Manager"] }
 *
 * roles обязателен и заменяет набор ролей целиком.
 */
class UpdateEmployeeHandler : public IHttpHandler {
public:
    explicit UpdateEmployeeHandler(std::shared_ptr<ports::input::IEmployeeService> employeeService)
        : employeeService_(std::move(employeeService)) {}

    void handle(IRequest& req, IResponse& res) override {
        try {
            std::string id = req.getPathParam(0).value_or("");
            if (id.empty()) {
                http::sendError(res, 400, "Employee ID is required");
                return;
            }

            auto body = nlohmann::json::parse(req.getBody());

            if (!body.contains("roles") || !body["roles"].is_array()) {
                http::sendError(res, 400, "roles array is required");
                return;
            }

            ports::input::UpdateEmployeeRequest request;
            request.roles = body["roles"].get<std::vector<std::string>>();
            if (body.contains("fullName") && !body["fullName"].is_null()) {
                request.fullName = body["fullName"].get<std::string>();
            }
            if (body.contains("phoneNumber")) {
                // null и "" одинаково очищают телефон
                request.phoneNumber = body["phoneNumber"].is_null()
                    ? std::string() : body["phoneNumber"].get<std::string>();
            }

            auto result = employeeService_->update(http::callerFromRequest(req), id, request);
            if (!result.success) {
                http::sendFailure(res, result);
                return;
            }

            http::sendNoContent(res);

        } catch (const nlohmann::json::exception&) {
            http::sendError(res, 400, "Invalid JSON");
        } catch (const std::exception& e) {
            std::cerr << "[UpdateEmployeeHandler] Error: " << e.what() << std::endl;
            http::sendError(res, 500, "Internal server error");
        }
    }

private:
    std::shared_ptr<ports::input::IEmployeeService> employeeService_;
};

} // namespace iam::adapters::primary
