#pragma once

#include "ports/output/INotificationSender.hpp"
#include <string>
#include <vector>
#include <regex>
#include <mutex>
#include <stdexcept>

namespace iam::tests::mocks {

/**
 * @brief Запоминает отправленные письма, чтобы тесты могли достать код
 */
class RecordingNotificationSender : public ports::output::INotificationSender {
public:
    struct Message {
        std::string to;
        std::string subject;
        std::string body;
    };

    void send(const std::string& toAddress,
              const std::string& subject,
              const std::string& body) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (failing_) {
            throw std::runtime_error("notification transport unavailable");
        }
        messages_.push_back({toAddress, subject, body});
    }

    // Test helpers
    void setFailing(bool failing) {
        std::lock_guard<std::mutex> lock(mutex_);
        failing_ = failing;
    }

    size_t count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return messages_.size();
    }

    Message last() const {
        std::lock_guard<std::mutex> lock(mutex_);
        if (messages_.empty()) {
            throw std::logic_error("no messages sent");
        }
        return messages_.back();
    }

    /// Шестизначный код из последнего письма
    std::string lastDigitCode() const {
        return extract(std::regex("code is ([0-9]{6})"));
    }

    /// Значение token=... из ссылки в последнем письме
    std::string lastLinkToken() const {
        return extract(std::regex("token=([A-Za-z0-9_-]+)"));
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        messages_.clear();
    }

private:
    mutable std::mutex mutex_;
    std::vector<Message> messages_;
    bool failing_ = false;

    std::string extract(const std::regex& pattern) const {
        auto body = last().body;
        std::smatch match;
        if (!std::regex_search(body, match, pattern)) {
            throw std::logic_error("pattern not found in: " + body);
        }
        return match[1].str();
    }
};

} // namespace iam::tests::mocks
