#pragma once

#include <IHttpHandler.hpp>
#include "adapters/primary/HttpSupport.hpp"
#include "ports/input/IPasswordService.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace iam::adapters::primary {

/**
 * @brief POST /auth/change-password
 *
 * Требует Bearer token. Повторная проверка 2FA не нужна.
 */
class ChangePasswordHandler : public IHttpHandler {
public:
    explicit ChangePasswordHandler(std::shared_ptr<ports::input::IPasswordService> passwordService)
        : passwordService_(std::move(passwordService)) {}

    void handle(IRequest& req, IResponse& res) override {
        try {
            auto body = nlohmann::json::parse(req.getBody());

            std::string currentPassword = body.value("currentPassword", "");
            std::string newPassword = body.value("newPassword", "");

            if (currentPassword.empty() || newPassword.empty()) {
                http::sendError(res, 400, "currentPassword and newPassword are required");
                return;
            }

            auto result = passwordService_->changePassword(
                http::callerFromRequest(req), currentPassword, newPassword);
            if (!result.success) {
                http::sendFailure(res, result);
                return;
            }

            http::sendNoContent(res);

        } catch (const nlohmann::json::exception&) {
            http::sendError(res, 400, "Invalid JSON");
        } catch (const std::exception& e) {
            std::cerr << "[ChangePasswordHandler] Error: " << e.what() << std::endl;
            http::sendError(res, 500, "Internal server error");
        }
    }

private:
    std::shared_ptr<ports::input::IPasswordService> passwordService_;
};

} // namespace iam::adapters::primary
