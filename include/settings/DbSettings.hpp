#pragma once

#include "Env.hpp"
#include <string>

namespace iam::settings {

/**
 * @brief Настройки подключения к PostgreSQL из ENV
 */
class DbSettings {
public:
    DbSettings() {
        host_ = env::getOrDefault("IAM_DB_HOST", "localhost");
        port_ = env::getIntOrDefault("IAM_DB_PORT", 5432);
        name_ = env::getOrDefault("IAM_DB_NAME", "iam_db");
        user_ = env::getOrDefault("IAM_DB_USER", "iam_user");
        password_ = env::getOrThrow("IAM_DB_PASSWORD");
        migrate_ = env::getBoolOrDefault("IAM_DB_MIGRATE", true);
    }

    std::string getHost() const { return host_; }
    int getPort() const { return port_; }
    std::string getName() const { return name_; }
    std::string getUser() const { return user_; }
    bool shouldMigrate() const { return migrate_; }

    std::string getConnectionString() const {
        return "host=" + host_ +
               " port=" + std::to_string(port_) +
               " dbname=" + name_ +
               " user=" + user_ +
               " password=" + password_;
    }

private:
    std::string host_;
    int port_;
    std::string name_;
    std::string user_;
    std::string password_;
    bool migrate_;
};

} // namespace iam::settings
