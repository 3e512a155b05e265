#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/OperationResult.hpp"
#include "ports/input/IAuthService.hpp"
#include "domain/CallerContext.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace iam::adapters::primary::http {

/// Имена атрибутов запроса, которые заполняет BearerAuthMiddleware
inline const std::string ATTR_USER_ID = "userId";
inline const std::string ATTR_EMAIL = "email";
inline const std::string ATTR_ROLES = "roles";

inline void sendJson(IResponse& res, int status, const nlohmann::json& body) {
    res.setResult(status, "application/json", body.dump());
}

inline void sendError(IResponse& res, int status, const std::string& message) {
    nlohmann::json error;
    error["error"] = message;
    res.setResult(status, "application/json", error.dump());
}

/**
 * @brief Ответ для неуспешного результата сервиса
 *
 * Статус берётся из AuthError, текст берётся из обобщённого сообщения сервиса.
 */
inline void sendFailure(IResponse& res, const ports::input::OperationResult& result) {
    sendError(res, domain::toHttpStatus(result.error), result.message);
}

inline void sendNoContent(IResponse& res) {
    res.setStatus(204);
}

/**
 * @brief Вызывающий из атрибутов, проставленных middleware
 */
inline domain::CallerContext callerFromRequest(IRequest& req) {
    domain::CallerContext caller;
    caller.userId = req.getAttribute(ATTR_USER_ID).value_or("");
    caller.email = req.getAttribute(ATTR_EMAIL).value_or("");
    caller.roles = domain::CallerContext::splitRoles(req.getAttribute(ATTR_ROLES).value_or(""));
    return caller;
}

/**
 * @brief Общая форма ответа login и проверки 2FA
 */
inline nlohmann::json loginResultToJson(const ports::input::LoginResult& result) {
    nlohmann::json response;
    response["requiresTwoFactor"] = result.requiresTwoFactor;
    response["userId"] = result.userId;
    if (result.requiresTwoFactor) {
        response["accessToken"] = nullptr;
        return response;
    }
    response["accessToken"] = result.accessToken;
    if (result.expiresAt) {
        response["expiresAt"] = result.expiresAt->toString();
    }
    return response;
}

} // namespace iam::adapters::primary::http
