#pragma once

#include "ports/output/ITokenProvider.hpp"
#include "settings/JwtSettings.hpp"
#include "utils/Crypto.hpp"
#include "utils/IdGenerator.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace iam::adapters::secondary {

/**
 * @brief JWT провайдер на HMAC-SHA256 (HS256)
 *
 * Payload: sub, email, name, roles[], iss, aud, iat, exp, jti.
 * Без состояния: отзыв токенов не поддерживается, токен живёт до exp.
 */
class HmacJwtProvider : public ports::output::ITokenProvider {
public:
    explicit HmacJwtProvider(std::shared_ptr<settings::JwtSettings> settings)
        : settings_(std::move(settings))
    {
        std::cout << "[HmacJwtProvider] Created, issuer=" << settings_->getIssuer()
                  << " audience=" << settings_->getAudience()
                  << " lifetime=" << settings_->getLifetimeMinutes() << "min" << std::endl;
    }

    domain::IssuedToken issue(const domain::Identity& identity) override {
        auto now = domain::Timestamp::now();
        auto expiresAt = now.addMinutes(settings_->getLifetimeMinutes());

        nlohmann::json header;
        header["alg"] = "HS256";
        header["typ"] = "JWT";

        nlohmann::json payload;
        payload["sub"] = identity.id;
        payload["email"] = identity.email;
        payload["name"] = identity.fullName;
        payload["roles"] = nlohmann::json::array();
        for (const auto& role : identity.roles) {
            payload["roles"].push_back(role);
        }
        payload["iss"] = settings_->getIssuer();
        payload["aud"] = settings_->getAudience();
        payload["iat"] = now.toUnixSeconds();
        payload["exp"] = expiresAt.toUnixSeconds();
        payload["jti"] = utils::IdGenerator::generateWithPrefix("jti");

        std::string signingInput = utils::crypto::base64UrlEncode(header.dump()) + "." +
                                   utils::crypto::base64UrlEncode(payload.dump());

        return {signingInput + "." + sign(signingInput), expiresAt};
    }

    std::optional<domain::AccessTokenClaims> verify(const std::string& token) override {
        size_t first = token.find('.');
        size_t last = token.rfind('.');
        if (first == std::string::npos || first == last) {
            return std::nullopt;
        }
        if (token.find('.', first + 1) != last) {
            return std::nullopt;
        }

        std::string signingInput = token.substr(0, last);
        std::string signature = token.substr(last + 1);

        if (!utils::crypto::constantTimeEquals(sign(signingInput), signature)) {
            return std::nullopt;
        }

        try {
            auto header = nlohmann::json::parse(
                utils::crypto::base64UrlDecode(token.substr(0, first)));
            if (header.value("alg", "") != "HS256") {
                return std::nullopt;
            }

            auto payload = nlohmann::json::parse(
                utils::crypto::base64UrlDecode(token.substr(first + 1, last - first - 1)));

            domain::AccessTokenClaims claims;
            claims.userId = payload.value("sub", "");
            claims.email = payload.value("email", "");
            claims.fullName = payload.value("name", "");
            claims.issuer = payload.value("iss", "");
            claims.audience = payload.value("aud", "");
            claims.tokenId = payload.value("jti", "");
            claims.issuedAt = payload.value("iat", int64_t{0});
            claims.expiresAt = payload.value("exp", int64_t{0});
            if (payload.contains("roles") && payload["roles"].is_array()) {
                for (const auto& role : payload["roles"]) {
                    claims.roles.push_back(role.get<std::string>());
                }
            }

            if (claims.userId.empty() ||
                claims.issuer != settings_->getIssuer() ||
                claims.audience != settings_->getAudience() ||
                claims.isExpired()) {
                return std::nullopt;
            }

            return claims;

        } catch (const nlohmann::json::exception&) {
            return std::nullopt;
        } catch (const std::invalid_argument&) {
            return std::nullopt;
        }
    }

private:
    std::shared_ptr<settings::JwtSettings> settings_;

    std::string sign(const std::string& signingInput) const {
        return utils::crypto::base64UrlEncode(
            utils::crypto::hmacSha256(settings_->getSecret(), signingInput));
    }
};

} // namespace iam::adapters::secondary
