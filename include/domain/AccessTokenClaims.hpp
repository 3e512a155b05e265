#pragma once

#include "Timestamp.hpp"
#include <string>
#include <vector>
#include <cstdint>

namespace iam::domain {

/**
 * @brief Claims из access token
 */
struct AccessTokenClaims {
    std::string userId;             ///< sub
    std::string email;
    std::string fullName;           ///< name
    std::vector<std::string> roles;
    std::string issuer;             ///< iss
    std::string audience;           ///< aud
    std::string tokenId;            ///< jti
    int64_t issuedAt = 0;           ///< iat (unix seconds)
    int64_t expiresAt = 0;          ///< exp (unix seconds)

    bool isExpired() const {
        return Timestamp::now().toUnixSeconds() >= expiresAt;
    }
};

/**
 * @brief Подписанный токен и момент его истечения
 */
struct IssuedToken {
    std::string token;
    Timestamp expiresAt;
};

} // namespace iam::domain
