#pragma once

#include <IHttpHandler.hpp>
#include "adapters/primary/HttpSupport.hpp"
#include "ports/input/IPasswordService.hpp"
#include <memory>
#include <iostream>

namespace iam::adapters::primary {

/**
 * @brief Переход по ссылке из письма подтверждения
 *
 * GET /auth/confirm-email?userId=usr-...&token=... → 204
 */
class ConfirmEmailHandler : public IHttpHandler {
public:
    explicit ConfirmEmailHandler(std::shared_ptr<ports::input::IPasswordService> passwordService)
        : passwordService_(std::move(passwordService)) {}

    void handle(IRequest& req, IResponse& res) override {
        try {
            auto userId = req.getQueryParam("userId").value_or("");
            auto token = req.getQueryParam("token").value_or("");

            if (userId.empty() || token.empty()) {
                http::sendError(res, 400, "userId and token are required");
                return;
            }

            auto result = passwordService_->confirmEmail(userId, token);
            if (!result.success) {
                http::sendFailure(res, result);
                return;
            }

            http::sendNoContent(res);

        } catch (const std::exception& e) {
            std::cerr << "[ConfirmEmailHandler] Error: " << e.what() << std::endl;
            http::sendError(res, 500, "Internal server error");
        }
    }

private:
    std::shared_ptr<ports::input::IPasswordService> passwordService_;
};

} // namespace iam::adapters::primary
