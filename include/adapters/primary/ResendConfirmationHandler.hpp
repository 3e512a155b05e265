#pragma once

#include <IHttpHandler.hpp>
#include "adapters/primary/HttpSupport.hpp"
#include "ports/input/IPasswordService.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace iam::adapters::primary {

/**
 * @brief Повторная отправка письма подтверждения
 *
 * POST /auth/resend-confirmation
 * { "email": "alice@bank.test" }
 *
 * Response: { "sent": true }, даже если email уже подтверждён или не найден.
 */
class ResendConfirmationHandler : public IHttpHandler {
public:
    explicit ResendConfirmationHandler(std::shared_ptr<ports::input::IPasswordService> passwordService)
        : passwordService_(std::move(passwordService)) {}

    void handle(IRequest& req, IResponse& res) override {
        try {
            auto body = nlohmann::json::parse(req.getBody());
            std::string email = body.value("email", "");

            if (email.empty()) {
                http::sendError(res, 400, "email is required");
                return;
            }

            passwordService_->resendConfirmation(email);

            nlohmann::json response;
            response["sent"] = true;
            http::sendJson(res, 200, response);

        } catch (const nlohmann::json::exception&) {
            http::sendError(res, 400, "Invalid JSON");
        } catch (const std::exception& e) {
            std::cerr << "[ResendConfirmationHandler] Error: " << e.what() << std::endl;
            http::sendError(res, 500, "Internal server error");
        }
    }

private:
    std::shared_ptr<ports::input::IPasswordService> passwordService_;
};

} // namespace iam::adapters::primary
