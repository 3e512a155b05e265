#pragma once

#include <IHttpHandler.hpp>
#include "adapters/primary/HttpSupport.hpp"
#include "ports/input/IPasswordService.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace iam::adapters::primary {

/**
 * @brief Установка нового пароля по ссылке из письма
 *
 * POST /auth/reset-password
 * {
 *   "email": "alice@bank.test",
 *   "token": "...",
 *   "newPassword": "N3w!Passw0rd"
 * }
 */
class ResetPasswordHandler : public IHttpHandler {
public:
    explicit ResetPasswordHandler(std::shared_ptr<ports::input::IPasswordService> passwordService)
        : passwordService_(std::move(passwordService)) {}

    void handle(IRequest& req, IResponse& res) override {
        try {
            auto body = nlohmann::json::parse(req.getBody());

            std::string email = body.value("email", "");
            std::string token = body.value("token", "");
            std::string newPassword = body.value("newPassword", "");

            if (email.empty() || token.empty() || newPassword.empty()) {
                http::sendError(res, 400, "email, token and newPassword are required");
                return;
            }

            auto result = passwordService_->resetPassword(email, token, newPassword);
            if (!result.success) {
                http::sendFailure(res, result);
                return;
            }

            http::sendNoContent(res);

        } catch (const nlohmann::json::exception&) {
            http::sendError(res, 400, "Invalid JSON");
        } catch (const std::exception& e) {
            std::cerr << "[ResetPasswordHandler] Error: " << e.what() << std::endl;
            http::sendError(res, 500, "Internal server error");
        }
    }

private:
    std::shared_ptr<ports::input::IPasswordService> passwordService_;
};

} // namespace iam::adapters::primary
