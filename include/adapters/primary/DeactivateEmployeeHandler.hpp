#pragma once

#include <IHttpHandler.hpp>
#include "adapters/primary/HttpSupport.hpp"
#include "ports/input/IEmployeeService.hpp"
#include <memory>
#include <iostream>

namespace iam::adapters::primary {

/**
 * @brief POST /admin/employees/{id}/deactivate → 204
 *
 * Свою собственную учётную запись деактивировать нельзя (400).
 */
class DeactivateEmployeeHandler : public IHttpHandler {
public:
    explicit DeactivateEmployeeHandler(std::shared_ptr<ports::input::IEmployeeService> employeeService)
        : employeeService_(std::move(employeeService)) {}

    void handle(IRequest& req, IResponse& res) override {
        try {
            std::string id = req.getPathParam(0).value_or("");
            if (id.empty()) {
                http::sendError(res, 400, "Employee ID is required");
                return;
            }

            auto result = employeeService_->deactivate(http::callerFromRequest(req), id);
            if (!result.success) {
                http::sendFailure(res, result);
                return;
            }

            http::sendNoContent(res);

        } catch (const std::exception& e) {
            std::cerr << "[DeactivateEmployeeHandler] Error: " << e.what() << std::endl;
            http::sendError(res, 500, "Internal server error");
        }
    }

private:
    std::shared_ptr<ports::input::IEmployeeService> employeeService_;
};

} // namespace iam::adapters::primary
