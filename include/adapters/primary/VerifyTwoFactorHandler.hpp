#pragma once

#include <IHttpHandler.hpp>
#include "adapters/primary/HttpSupport.hpp"
#include "ports/input/IAuthService.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace iam::adapters::primary {

/**
 * @brief Второй шаг входа: код из письма
 *
 * POST /auth/2fa/verify
 * {
 *   "userId": "usr-...",
 *   "code": "123456"
 * }
 *
 * Ответ в той же форме, что и у /auth/login, requiresTwoFactor=false.
 */
class VerifyTwoFactorHandler : public IHttpHandler {
public:
    explicit VerifyTwoFactorHandler(std::shared_ptr<ports::input::IAuthService> authService)
        : authService_(std::move(authService)) {}

    void handle(IRequest& req, IResponse& res) override {
        try {
            auto body = nlohmann::json::parse(req.getBody());

            std::string userId = body.value("userId", "");
            std::string code = body.value("code", "");

            if (userId.empty() || code.empty()) {
                http::sendError(res, 400, "userId and code are required");
                return;
            }

            auto result = authService_->verifyTwoFactor(userId, code);
            if (!result.success) {
                http::sendError(res, domain::toHttpStatus(result.error), result.message);
                return;
            }

            http::sendJson(res, 200, http::loginResultToJson(result));

        } catch (const nlohmann::json::exception&) {
            http::sendError(res, 400, "Invalid JSON");
        } catch (const std::exception& e) {
            std::cerr << "[VerifyTwoFactorHandler] Error: " << e.what() << std::endl;
            http::sendError(res, 500, "Internal server error");
        }
    }

private:
    std::shared_ptr<ports::input::IAuthService> authService_;
};

} // namespace iam::adapters::primary
