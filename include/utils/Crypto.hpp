#pragma once

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>
#include <openssl/sha.h>

#include <string>
#include <vector>
#include <sstream>
#include <iomanip>
#include <stdexcept>
#include <cstdint>

namespace iam::utils::crypto {

/**
 * @brief Криптографически стойкие случайные байты
 * @throws std::runtime_error если RAND_bytes не смог сгенерировать
 */
inline std::vector<unsigned char> randomBytes(size_t count) {
    std::vector<unsigned char> buffer(count);
    if (RAND_bytes(buffer.data(), static_cast<int>(buffer.size())) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
    return buffer;
}

inline std::string toHex(const unsigned char* data, size_t len) {
    std::ostringstream oss;
    for (size_t i = 0; i < len; ++i) {
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
    }
    return oss.str();
}

inline std::string toHex(const std::vector<unsigned char>& data) {
    return toHex(data.data(), data.size());
}

inline bool fromHex(const std::string& hex, std::vector<unsigned char>& out) {
    if (hex.size() % 2 != 0) {
        return false;
    }
    out.clear();
    out.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        unsigned int byte;
        std::istringstream iss(hex.substr(i, 2));
        iss >> std::hex >> byte;
        if (iss.fail()) {
            return false;
        }
        out.push_back(static_cast<unsigned char>(byte));
    }
    return true;
}

inline std::string sha256Hex(const std::string& input) {
    unsigned char digest[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(input.data()), input.size(), digest);
    return toHex(digest, SHA256_DIGEST_LENGTH);
}

/**
 * @brief HMAC-SHA256, сырые байты
 */
inline std::string hmacSha256(const std::string& key, const std::string& data) {
    unsigned char mac[EVP_MAX_MD_SIZE];
    unsigned int macLen = 0;
    if (!HMAC(EVP_sha256(),
              key.data(), static_cast<int>(key.size()),
              reinterpret_cast<const unsigned char*>(data.data()), data.size(),
              mac, &macLen)) {
        throw std::runtime_error("HMAC-SHA256 failed");
    }
    return std::string(reinterpret_cast<const char*>(mac), macLen);
}

/**
 * @brief Сравнение секретов за постоянное время
 */
inline bool constantTimeEquals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) {
        return false;
    }
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

inline std::string base64UrlEncode(const std::string& input) {
    static const char* chars =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";
    std::string result;
    unsigned int val = 0;
    int valb = -6;
    for (unsigned char c : input) {
        val = (val << 8) + c;
        valb += 8;
        while (valb >= 0) {
            result.push_back(chars[(val >> valb) & 0x3F]);
            valb -= 6;
        }
    }
    if (valb > -6) {
        result.push_back(chars[((val << 8) >> (valb + 8)) & 0x3F]);
    }
    return result;
}

/**
 * @brief Декодировать base64url без паддинга
 * @throws std::invalid_argument на символе вне алфавита
 */
inline std::string base64UrlDecode(const std::string& input) {
    std::string result;
    unsigned int val = 0;
    int valb = -8;
    for (unsigned char c : input) {
        int digit;
        if (c >= 'A' && c <= 'Z') digit = c - 'A';
        else if (c >= 'a' && c <= 'z') digit = c - 'a' + 26;
        else if (c >= '0' && c <= '9') digit = c - '0' + 52;
        else if (c == '-') digit = 62;
        else if (c == '_') digit = 63;
        else throw std::invalid_argument("Invalid base64url character");

        val = (val << 6) + static_cast<unsigned int>(digit);
        valb += 6;
        if (valb >= 0) {
            result.push_back(char((val >> valb) & 0xFF));
            valb -= 8;
        }
    }
    return result;
}

/**
 * @brief Случайная строка из count десятичных цифр (равномерно)
 */
inline std::string randomDigits(size_t count) {
    std::string result;
    result.reserve(count);
    while (result.size() < count) {
        for (unsigned char b : randomBytes(count)) {
            // 250 = 25 * 10: отбрасываем хвост, чтобы не было смещения
            if (b < 250 && result.size() < count) {
                result.push_back(static_cast<char>('0' + (b % 10)));
            }
        }
    }
    return result;
}

/**
 * @brief Случайный токен: count байт в base64url
 */
inline std::string randomToken(size_t count) {
    auto bytes = randomBytes(count);
    return base64UrlEncode(std::string(bytes.begin(), bytes.end()));
}

} // namespace iam::utils::crypto
