#pragma once

#include <string>

namespace iam::ports::output {

/**
 * @brief Интерфейс хэширования паролей
 */
class IPasswordHasher {
public:
    virtual ~IPasswordHasher() = default;

    virtual std::string hash(const std::string& password) = 0;

    /**
     * @brief Сравнить пароль с хэшем за постоянное время
     */
    virtual bool verify(const std::string& password, const std::string& passwordHash) = 0;
};

} // namespace iam::ports::output
