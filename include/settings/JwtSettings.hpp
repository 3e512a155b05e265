#pragma once

#include "Env.hpp"
#include <string>
#include <stdexcept>

namespace iam::settings {

/**
 * @brief Настройки выпуска access token
 *
 * Читает из ENV:
 * - IAM_JWT_ISSUER (default: "bank-iam")
 * - IAM_JWT_AUDIENCE (default: "bank-api")
 * - IAM_JWT_SECRET (обязательно, не короче 32 байт)
 * - IAM_JWT_LIFETIME_MINUTES (default: 60)
 *
 * Неверный ключ приводит к ошибке при старте.
 */
class JwtSettings {
public:
    static constexpr size_t MIN_SECRET_LENGTH = 32;

    JwtSettings()
        : JwtSettings(
              env::getOrDefault("IAM_JWT_ISSUER", "bank-iam"),
              env::getOrDefault("IAM_JWT_AUDIENCE", "bank-api"),
              env::getOrThrow("IAM_JWT_SECRET"),
              env::getIntOrDefault("IAM_JWT_LIFETIME_MINUTES", 60))
    {}

    JwtSettings(std::string issuer, std::string audience, std::string secret, int lifetimeMinutes)
        : issuer_(std::move(issuer))
        , audience_(std::move(audience))
        , secret_(std::move(secret))
        , lifetimeMinutes_(lifetimeMinutes)
    {
        if (secret_.size() < MIN_SECRET_LENGTH) {
            throw std::invalid_argument("JWT signing secret must be at least 32 bytes");
        }
        if (lifetimeMinutes_ <= 0) {
            throw std::invalid_argument("JWT lifetime must be positive");
        }
    }

    const std::string& getIssuer() const { return issuer_; }
    const std::string& getAudience() const { return audience_; }
    const std::string& getSecret() const { return secret_; }
    int getLifetimeMinutes() const { return lifetimeMinutes_; }

private:
    std::string issuer_;
    std::string audience_;
    std::string secret_;
    int lifetimeMinutes_;
};

} // namespace iam::settings
