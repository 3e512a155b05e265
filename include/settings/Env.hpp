#pragma once

#include <string>
#include <cstdlib>
#include <stdexcept>
#include <algorithm>
#include <cctype>

namespace iam::settings::env {

inline std::string getOrDefault(const char* name, const std::string& defaultValue) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : defaultValue;
}

inline std::string getOrThrow(const char* name) {
    const char* value = std::getenv(name);
    if (!value) {
        throw std::runtime_error(std::string("Required env variable not set: ") + name);
    }
    return value;
}

inline int getIntOrDefault(const char* name, int defaultValue) {
    const char* value = std::getenv(name);
    if (!value) return defaultValue;
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        throw std::runtime_error(std::string("Env variable is not an integer: ") + name);
    }
}

inline bool getBoolOrDefault(const char* name, bool defaultValue) {
    const char* value = std::getenv(name);
    if (!value) return defaultValue;
    std::string str(value);
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str == "1" || str == "true" || str == "yes";
}

} // namespace iam::settings::env
