#pragma once

#include <IHttpHandler.hpp>
#include "adapters/primary/HttpSupport.hpp"
#include "ports/output/ITokenProvider.hpp"
#include <memory>
#include <iostream>

namespace iam::adapters::primary {

/**
 * @brief Проверка access token перед защищёнными обработчиками
 *
 * При успехе кладёт userId, email и roles (через запятую) в атрибуты
 * запроса и оставляет статус 0, чтобы ChainHandler продолжил.
 */
class BearerAuthMiddleware : public IHttpHandler {
public:
    explicit BearerAuthMiddleware(std::shared_ptr<ports::output::ITokenProvider> tokenProvider)
        : tokenProvider_(std::move(tokenProvider))
    {
        std::cout << "[BearerAuthMiddleware] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override {
        std::string token = req.getBearerToken().value_or("");
        if (token.empty()) {
            http::sendError(res, 401, domain::publicMessage(domain::AuthError::UNAUTHENTICATED));
            return;
        }

        auto claims = tokenProvider_->verify(token);
        if (!claims) {
            http::sendError(res, 401, domain::publicMessage(domain::AuthError::UNAUTHENTICATED));
            return;
        }

        domain::CallerContext caller;
        caller.roles = claims->roles;

        req.setAttribute(http::ATTR_USER_ID, claims->userId);
        req.setAttribute(http::ATTR_EMAIL, claims->email);
        req.setAttribute(http::ATTR_ROLES, caller.joinRoles());
        res.setStatus(0);
    }

private:
    std::shared_ptr<ports::output::ITokenProvider> tokenProvider_;
};

} // namespace iam::adapters::primary
