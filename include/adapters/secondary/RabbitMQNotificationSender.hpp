#pragma once

#include "ports/output/INotificationSender.hpp"
#include "settings/RabbitMQSettings.hpp"
#include <amqpcpp.h>
#include <amqpcpp/libboostasio.h>
#include <boost/asio.hpp>
#include <boost/asio/steady_timer.hpp>
#include <nlohmann/json.hpp>
#include <chrono>
#include <deque>
#include <future>
#include <memory>
#include <thread>
#include <iostream>

namespace iam::adapters::secondary {

/**
 * @brief Отправка уведомлений через RabbitMQ
 *
 * Публикует {to, subject, body} в topic exchange (iam.notifications)
 * с routing key "notification.email". Письма отправляет внешний
 * mail-сервис, подписанный на exchange.
 *
 * send() только ставит публикацию в очередь I/O потока и сразу
 * возвращается: HTTP ответ не ждёт доставки. Пока соединения нет,
 * сообщения копятся в ограниченном буфере и уходят после
 * переподключения. Сбой доставки логируется.
 *
 * Всё состояние AMQP живёт только в I/O потоке.
 */
class RabbitMQNotificationSender : public ports::output::INotificationSender {
public:
    static constexpr const char* ROUTING_KEY = "notification.email";
    static constexpr std::size_t MAX_PENDING = 1000;
    static constexpr int CLOSE_TIMEOUT_SECONDS = 2;

    explicit RabbitMQNotificationSender(std::shared_ptr<settings::RabbitMQSettings> settings)
        : settings_(std::move(settings))
        , ioContext_()
        , workGuard_(boost::asio::make_work_guard(ioContext_))
        , handler_(ioContext_)
        , reconnectTimer_(ioContext_)
    {
        exchangeName_ = settings_->getExchange();
        std::cout << "[RabbitMQNotificationSender] Created for "
                  << settings_->getHost() << ":" << settings_->getPort()
                  << " exchange=" << exchangeName_ << std::endl;
        start();
    }

    ~RabbitMQNotificationSender() override {
        stop();
    }

    void send(const std::string& toAddress,
              const std::string& subject,
              const std::string& body) override {
        nlohmann::json message;
        message["to"] = toAddress;
        message["subject"] = subject;
        message["body"] = body;

        boost::asio::post(ioContext_, [this, toAddress, payload = message.dump()]() {
            if (!ready_) {
                enqueue(toAddress, payload);
                return;
            }
            publish(toAddress, payload);
        });
    }

    /**
     * @brief Закрыть соединение и остановить I/O поток
     *
     * Connection.Close успевает уйти брокеру: поток завершается сам,
     * когда в io_context не остаётся работы. Если брокер не ответил
     * за CLOSE_TIMEOUT_SECONDS, io_context останавливается принудительно.
     */
    void stop() {
        if (!workerThread_.joinable()) return;

        boost::asio::post(ioContext_, [this]() {
            stopping_ = true;
            ready_ = false;
            reconnectTimer_.cancel();
            if (!pending_.empty()) {
                std::cerr << "[RabbitMQNotificationSender] Dropping " << pending_.size()
                          << " undelivered notification(s) on shutdown" << std::endl;
                pending_.clear();
            }
            if (connection_) connection_->close();
        });
        workGuard_.reset();

        if (workerFinished_.wait_for(std::chrono::seconds(CLOSE_TIMEOUT_SECONDS))
                != std::future_status::ready) {
            std::cerr << "[RabbitMQNotificationSender] Close timed out, stopping I/O" << std::endl;
            ioContext_.stop();
        }
        workerThread_.join();

        channel_.reset();
        connection_.reset();

        std::cout << "[RabbitMQNotificationSender] Stopped" << std::endl;
    }

private:
    struct PendingMessage {
        std::string toAddress;
        std::string payload;
    };

    void start() {
        workerFinished_ = workerDone_.get_future();
        workerThread_ = std::thread([this]() {
            try {
                connect();
                ioContext_.run();
            } catch (const std::exception& e) {
                std::cerr << "[RabbitMQNotificationSender] Worker error: " << e.what() << std::endl;
            }
            workerDone_.set_value();
        });
    }

    void connect() {
        connection_ = std::make_unique<AMQP::TcpConnection>(
            &handler_, AMQP::Address(settings_->getConnectionString()));
        channel_ = std::make_unique<AMQP::TcpChannel>(connection_.get());

        // Сюда же приходят ошибки соединения: брокер недоступен или разорвал связь
        channel_->onError([this](const char* msg) {
            ready_ = false;
            std::cerr << "[RabbitMQNotificationSender] Channel error: " << msg << std::endl;
            scheduleReconnect();
        });

        channel_->declareExchange(exchangeName_, AMQP::topic, AMQP::durable)
            .onSuccess([this]() {
                ready_ = true;
                std::cout << "[RabbitMQNotificationSender] Exchange declared: " << exchangeName_ << std::endl;
                flushPending();
            })
            .onError([](const char* msg) {
                std::cerr << "[RabbitMQNotificationSender] Exchange error: " << msg << std::endl;
            });
    }

    void scheduleReconnect() {
        if (stopping_ || reconnectPending_) return;
        reconnectPending_ = true;

        reconnectTimer_.expires_after(std::chrono::seconds(settings_->getReconnectDelaySeconds()));
        reconnectTimer_.async_wait([this](const boost::system::error_code& ec) {
            reconnectPending_ = false;
            if (ec || stopping_) return;

            std::cout << "[RabbitMQNotificationSender] Reconnecting to "
                      << settings_->getHost() << ":" << settings_->getPort() << std::endl;
            channel_.reset();
            connection_.reset();
            connect();
        });
    }

    void enqueue(const std::string& toAddress, const std::string& payload) {
        if (pending_.size() >= MAX_PENDING) {
            std::cerr << "[RabbitMQNotificationSender] Delivery failed to " << pending_.front().toAddress
                      << ": buffer full while broker is unavailable" << std::endl;
            pending_.pop_front();
        }
        pending_.push_back({toAddress, payload});
    }

    void flushPending() {
        while (ready_ && !pending_.empty()) {
            auto message = std::move(pending_.front());
            pending_.pop_front();
            publish(message.toAddress, message.payload);
        }
    }

    void publish(const std::string& toAddress, const std::string& payload) {
        if (!channel_->publish(exchangeName_, ROUTING_KEY, payload)) {
            std::cerr << "[RabbitMQNotificationSender] Delivery failed to " << toAddress
                      << ": publish rejected" << std::endl;
            return;
        }
        std::cout << "[RabbitMQNotificationSender] Queued notification to " << toAddress << std::endl;
    }

    std::shared_ptr<settings::RabbitMQSettings> settings_;
    std::string exchangeName_;

    boost::asio::io_context ioContext_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> workGuard_;
    AMQP::LibBoostAsioHandler handler_;
    boost::asio::steady_timer reconnectTimer_;

    bool ready_ = false;
    bool stopping_ = false;
    bool reconnectPending_ = false;
    std::deque<PendingMessage> pending_;

    std::unique_ptr<AMQP::TcpConnection> connection_;
    std::unique_ptr<AMQP::TcpChannel> channel_;

    std::promise<void> workerDone_;
    std::future<void> workerFinished_;
    std::thread workerThread_;
};

} // namespace iam::adapters::secondary
