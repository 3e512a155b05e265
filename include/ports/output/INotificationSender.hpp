#pragma once

#include <string>

namespace iam::ports::output {

/**
 * @brief Канал доставки сообщений (email)
 *
 * Доставка может быть асинхронной. Реализация не должна бросать
 * исключения из-за сбоя доставки: сбой логируется.
 */
class INotificationSender {
public:
    virtual ~INotificationSender() = default;

    virtual void send(
        const std::string& toAddress,
        const std::string& subject,
        const std::string& body
    ) = 0;
};

} // namespace iam::ports::output
