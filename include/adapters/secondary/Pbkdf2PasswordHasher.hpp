#pragma once

#include "ports/output/IPasswordHasher.hpp"
#include "settings/PasswordSettings.hpp"
#include "utils/Crypto.hpp"
#include <openssl/evp.h>
#include <memory>
#include <sstream>
#include <vector>

namespace iam::adapters::secondary {

/**
 * @brief PBKDF2-HMAC-SHA256 с солью на каждый пароль
 *
 * Формат хэша: pbkdf2_sha256$<iterations>$<salt hex>$<hash hex>.
 * Число итераций хранится в хэше, поэтому смена настройки не ломает
 * старые пароли.
 */
class Pbkdf2PasswordHasher : public ports::output::IPasswordHasher {
public:
    static constexpr const char* SCHEME = "pbkdf2_sha256";
    static constexpr size_t SALT_BYTES = 16;
    static constexpr size_t HASH_BYTES = 32;

    explicit Pbkdf2PasswordHasher(std::shared_ptr<settings::PasswordSettings> settings)
        : settings_(std::move(settings)) {}

    std::string hash(const std::string& password) override {
        auto salt = utils::crypto::randomBytes(SALT_BYTES);
        int iterations = settings_->getPbkdf2Iterations();
        auto derived = derive(password, salt, iterations);

        std::ostringstream oss;
        oss << SCHEME << "$" << iterations << "$"
            << utils::crypto::toHex(salt) << "$" << utils::crypto::toHex(derived);
        return oss.str();
    }

    bool verify(const std::string& password, const std::string& passwordHash) override {
        std::vector<std::string> parts;
        std::istringstream ss(passwordHash);
        std::string part;
        while (std::getline(ss, part, '$')) {
            parts.push_back(part);
        }
        if (parts.size() != 4 || parts[0] != SCHEME) {
            return false;
        }

        int iterations = 0;
        try {
            iterations = std::stoi(parts[1]);
        } catch (const std::exception&) {
            return false;
        }
        if (iterations <= 0) {
            return false;
        }

        std::vector<unsigned char> salt;
        if (!utils::crypto::fromHex(parts[2], salt)) {
            return false;
        }

        auto computed = utils::crypto::toHex(derive(password, salt, iterations));
        return utils::crypto::constantTimeEquals(computed, parts[3]);
    }

private:
    std::shared_ptr<settings::PasswordSettings> settings_;

    static std::vector<unsigned char> derive(const std::string& password,
                                             const std::vector<unsigned char>& salt,
                                             int iterations) {
        std::vector<unsigned char> output(HASH_BYTES);
        if (PKCS5_PBKDF2_HMAC(password.c_str(), static_cast<int>(password.size()),
                              salt.data(), static_cast<int>(salt.size()),
                              iterations, EVP_sha256(),
                              static_cast<int>(output.size()), output.data()) != 1) {
            throw std::runtime_error("PKCS5_PBKDF2_HMAC failed");
        }
        return output;
    }
};

} // namespace iam::adapters::secondary
