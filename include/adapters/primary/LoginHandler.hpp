#pragma once

#include <IHttpHandler.hpp>
#include "adapters/primary/HttpSupport.hpp"
#include "ports/input/IAuthService.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace iam::adapters::primary {

/**
 * @brief Вход по email и паролю
 *
 * POST /auth/login
 * {
 *   "email": "alice@bank.test",
 *   "password": "P@ss1234"
 * }
 *
 * Response (без 2FA):
 * {
 *   "requiresTwoFactor": false,
 *   "userId": "usr-...",
 *   "accessToken": "eyJ...",
 *   "expiresAt": "2026-01-01T12:00:00Z"
 * }
 *
 * Response (2FA): requiresTwoFactor=true, userId, accessToken=null.
 */
class LoginHandler : public IHttpHandler {
public:
    explicit LoginHandler(std::shared_ptr<ports::input::IAuthService> authService)
        : authService_(std::move(authService)) {}

    void handle(IRequest& req, IResponse& res) override {
        try {
            auto body = nlohmann::json::parse(req.getBody());

            std::string email = body.value("email", "");
            std::string password = body.value("password", "");

            if (email.empty() || password.empty()) {
                http::sendError(res, 400, "email and password are required");
                return;
            }

            auto result = authService_->login(email, password);
            if (!result.success) {
                http::sendError(res, domain::toHttpStatus(result.error), result.message);
                return;
            }

            http::sendJson(res, 200, http::loginResultToJson(result));

        } catch (const nlohmann::json::exception&) {
            http::sendError(res, 400, "Invalid JSON");
        } catch (const std::exception& e) {
            std::cerr << "[LoginHandler] Error: " << e.what() << std::endl;
            http::sendError(res, 500, "Internal server error");
        }
    }

private:
    std::shared_ptr<ports::input::IAuthService> authService_;
};

} // namespace iam::adapters::primary
