#pragma once

#include <IHttpHandler.hpp>
#include "adapters/primary/HttpSupport.hpp"
#include "ports/input/IEmployeeService.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <optional>
#include <stdexcept>
#include <iostream>

namespace iam::adapters::primary {

/**
 * @brief GET /admin/employees: страница сотрудников
 *
 * Query: pageNumber (1), pageSize (20), search, includeInactive (false)
 *
 * Response:
 * {
 *   "items": [ { "id", "email", "fullName", "emailConfirmed", "isActive",
 *                "twoFactorEnabled", "roles" } ],
 *   "pageNumber": 1, "pageSize": 20, "totalCount": 3,
 *   "totalPages": 1, "hasNext": false, "hasPrevious": false
 * }
 */
class ListEmployeesHandler : public IHttpHandler {
public:
    explicit ListEmployeesHandler(std::shared_ptr<ports::input::IEmployeeService> employeeService)
        : employeeService_(std::move(employeeService)) {}

    void handle(IRequest& req, IResponse& res) override {
        try {
            domain::IdentityQuery query;

            auto pageNumber = parseInt(req.getQueryParam("pageNumber"), query.pageNumber);
            auto pageSize = parseInt(req.getQueryParam("pageSize"), query.pageSize);
            if (!pageNumber || !pageSize) {
                http::sendError(res, 400, "pageNumber and pageSize must be integers");
                return;
            }
            query.pageNumber = *pageNumber;
            query.pageSize = *pageSize;

            auto search = req.getQueryParam("search").value_or("");
            if (!search.empty()) {
                query.search = search;
            }

            auto includeInactive = req.getQueryParam("includeInactive").value_or("false");
            query.includeInactive = (includeInactive == "true" || includeInactive == "1");

            auto result = employeeService_->list(http::callerFromRequest(req), query);
            if (!result.status.success) {
                http::sendFailure(res, result.status);
                return;
            }

            const auto& page = result.page;
            nlohmann::json response;
            response["items"] = nlohmann::json::array();
            for (const auto& item : page.items) {
                response["items"].push_back(summaryToJson(item));
            }
            response["pageNumber"] = page.pageNumber;
            response["pageSize"] = page.pageSize;
            response["totalCount"] = page.totalCount;
            response["totalPages"] = page.totalPages;
            response["hasNext"] = page.hasNext;
            response["hasPrevious"] = page.hasPrevious;

            http::sendJson(res, 200, response);

        } catch (const std::exception& e) {
            std::cerr << "[ListEmployeesHandler] Error: " << e.what() << std::endl;
            http::sendError(res, 500, "Internal server error");
        }
    }

private:
    std::shared_ptr<ports::input::IEmployeeService> employeeService_;

    static std::optional<int> parseInt(const std::optional<std::string>& raw, int defaultValue) {
        if (!raw || raw->empty()) {
            return defaultValue;
        }
        try {
            size_t pos = 0;
            int value = std::stoi(*raw, &pos);
            if (pos != raw->size()) {
                return std::nullopt;
            }
            return value;
        } catch (const std::logic_error&) {
            return std::nullopt;
        }
    }

    static nlohmann::json summaryToJson(const domain::EmployeeSummary& s) {
        nlohmann::json j;
        j["id"] = s.id;
        j["email"] = s.email;
        j["fullName"] = s.fullName;
        j["emailConfirmed"] = s.emailConfirmed;
        j["isActive"] = s.isActive;
        j["twoFactorEnabled"] = s.twoFactorEnabled;
        j["roles"] = s.roles;
        return j;
    }
};

} // namespace iam::adapters::primary
