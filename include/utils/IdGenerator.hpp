#pragma once

#include "Crypto.hpp"
#include <string>

namespace iam::utils {

/**
 * @brief Генератор идентификаторов
 *
 * ID непредсказуемы: userId клиент предъявляет при проверке 2FA.
 */
class IdGenerator {
public:
    /**
     * @brief ID с префиксом
     *
     * @param prefix Префикс (например, "usr", "otc")
     * @return ID в формате "prefix-<32 hex>"
     */
    static std::string generateWithPrefix(const std::string& prefix) {
        return prefix + "-" + crypto::toHex(crypto::randomBytes(16));
    }
};

} // namespace iam::utils
