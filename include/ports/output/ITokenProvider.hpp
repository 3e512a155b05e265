#pragma once

#include "domain/Identity.hpp"
#include "domain/AccessTokenClaims.hpp"
#include <string>
#include <optional>

namespace iam::ports::output {

/**
 * @brief Интерфейс выпуска и проверки access token
 *
 * Без состояния, кроме ключа подписи. В хранилище не пишет.
 */
class ITokenProvider {
public:
    virtual ~ITokenProvider() = default;

    /**
     * @brief Выпустить подписанный токен для identity
     * @param identity id, email, имя и текущий набор ролей
     */
    virtual domain::IssuedToken issue(const domain::Identity& identity) = 0;

    /**
     * @brief Проверить подпись, issuer, audience и срок действия
     * @return claims или nullopt если токен недействителен
     */
    virtual std::optional<domain::AccessTokenClaims> verify(const std::string& token) = 0;
};

} // namespace iam::ports::output
