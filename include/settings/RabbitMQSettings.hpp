#pragma once

#include "Env.hpp"
#include <string>
#include <stdexcept>

namespace iam::settings {

/**
 * @brief Настройки RabbitMQ для исходящих уведомлений
 *
 * Читает из ENV:
 * - RABBITMQ_HOST (default: "rabbitmq")
 * - RABBITMQ_PORT (default: 5672)
 * - RABBITMQ_USER (default: "guest")
 * - RABBITMQ_PASSWORD (default: "guest")
 * - IAM_NOTIFICATIONS_EXCHANGE (default: "iam.notifications")
 * - RABBITMQ_RECONNECT_SECONDS (default: 5)
 */
class RabbitMQSettings {
public:
    RabbitMQSettings()
        : RabbitMQSettings(
              env::getOrDefault("RABBITMQ_HOST", "rabbitmq"),
              env::getIntOrDefault("RABBITMQ_PORT", 5672),
              env::getOrDefault("RABBITMQ_USER", "guest"),
              env::getOrDefault("RABBITMQ_PASSWORD", "guest"),
              env::getOrDefault("IAM_NOTIFICATIONS_EXCHANGE", "iam.notifications"),
              env::getIntOrDefault("RABBITMQ_RECONNECT_SECONDS", 5))
    {}

    RabbitMQSettings(std::string host, int port, std::string user, std::string password,
                     std::string exchange, int reconnectDelaySeconds)
        : host_(std::move(host))
        , port_(port)
        , user_(std::move(user))
        , password_(std::move(password))
        , exchange_(std::move(exchange))
        , reconnectDelaySeconds_(reconnectDelaySeconds)
    {
        if (reconnectDelaySeconds_ <= 0) {
            throw std::invalid_argument("RabbitMQ reconnect delay must be positive");
        }
    }

    std::string getHost() const { return host_; }
    int getPort() const { return port_; }
    std::string getUser() const { return user_; }
    std::string getPassword() const { return password_; }
    std::string getExchange() const { return exchange_; }
    int getReconnectDelaySeconds() const { return reconnectDelaySeconds_; }

    std::string getConnectionString() const {
        return "amqp://" + user_ + ":" + password_ + "@" + host_ + ":" + std::to_string(port_) + "/";
    }

private:
    std::string host_;
    int port_;
    std::string user_;
    std::string password_;
    std::string exchange_;
    int reconnectDelaySeconds_;
};

} // namespace iam::settings
