#pragma once

#include <string>
#include <vector>
#include <sstream>

namespace iam::domain {

/**
 * @brief Вызывающий пользователь, извлечённый из проверенного access token
 *
 * Передаётся в сервисы явно, глобального "текущего пользователя" нет.
 */
struct CallerContext {
    std::string userId;
    std::string email;
    std::vector<std::string> roles;

    bool isAuthenticated() const { return !userId.empty(); }

    std::string joinRoles() const {
        std::string result;
        for (const auto& role : roles) {
            if (!result.empty()) result += ",";
            result += role;
        }
        return result;
    }

    static std::vector<std::string> splitRoles(const std::string& joined) {
        std::vector<std::string> result;
        std::istringstream ss(joined);
        std::string item;
        while (std::getline(ss, item, ',')) {
            if (!item.empty()) result.push_back(item);
        }
        return result;
    }
};

} // namespace iam::domain
