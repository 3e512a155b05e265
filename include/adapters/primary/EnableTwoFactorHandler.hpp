#pragma once

#include <IHttpHandler.hpp>
#include "adapters/primary/HttpSupport.hpp"
#include "ports/input/IAuthService.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace iam::adapters::primary {

/**
 * @brief POST /auth/2fa/enable, требует Bearer token и текущий пароль
 *
 * { "currentPassword": "..." } → 204
 */
class EnableTwoFactorHandler : public IHttpHandler {
public:
    explicit EnableTwoFactorHandler(std::shared_ptr<ports::input::IAuthService> authService)
        : authService_(std::move(authService)) {}

    void handle(IRequest& req, IResponse& res) override {
        try {
            auto body = nlohmann::json::parse(req.getBody());
            std::string currentPassword = body.value("currentPassword", "");

            if (currentPassword.empty()) {
                http::sendError(res, 400, "currentPassword is required");
                return;
            }

            auto result = authService_->enableTwoFactor(http::callerFromRequest(req), currentPassword);
            if (!result.success) {
                http::sendFailure(res, result);
                return;
            }

            http::sendNoContent(res);

        } catch (const nlohmann::json::exception&) {
            http::sendError(res, 400, "Invalid JSON");
        } catch (const std::exception& e) {
            std::cerr << "[EnableTwoFactorHandler] Error: " << e.what() << std::endl;
            http::sendError(res, 500, "Internal server error");
        }
    }

private:
    std::shared_ptr<ports::input::IAuthService> authService_;
};

} // namespace iam::adapters::primary
