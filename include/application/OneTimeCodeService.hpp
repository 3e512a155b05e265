#pragma once

#include "ports/output/IOneTimeCodeRepository.hpp"
#include "ports/output/INotificationSender.hpp"
#include "settings/OneTimeCodeSettings.hpp"
#include "domain/Identity.hpp"
#include "utils/Crypto.hpp"
#include "utils/IdGenerator.hpp"
#include <memory>
#include <sstream>
#include <iomanip>
#include <iostream>

namespace iam::application {

/**
 * @brief Выпуск и проверка одноразовых кодов
 *
 * - TWO_FACTOR: 6 цифр
 * - EMAIL_CONFIRMATION, PASSWORD_RESET: 32 случайных байта в base64url
 *
 * Новый код гасит все предыдущие коды того же назначения. Значение
 * кода не хранится и не логируется, только его SHA-256.
 */
class OneTimeCodeService {
public:
    static constexpr size_t TWO_FACTOR_DIGITS = 6;
    static constexpr size_t LINK_TOKEN_BYTES = 32;

    OneTimeCodeService(
        std::shared_ptr<settings::OneTimeCodeSettings> settings,
        std::shared_ptr<ports::output::IOneTimeCodeRepository> codeRepo,
        std::shared_ptr<ports::output::INotificationSender> notifier
    ) : settings_(std::move(settings))
      , codeRepo_(std::move(codeRepo))
      , notifier_(std::move(notifier))
    {
        std::cout << "[OneTimeCodeService] Created" << std::endl;
    }

    /**
     * @brief Выпустить новый код
     * @return Значение кода (единственный раз, когда оно известно)
     */
    std::string issue(const domain::Identity& identity, domain::OneTimeCodePurpose purpose) {
        auto now = domain::Timestamp::now();

        std::string value = purpose == domain::OneTimeCodePurpose::TWO_FACTOR
            ? utils::crypto::randomDigits(TWO_FACTOR_DIGITS)
            : utils::crypto::randomToken(LINK_TOKEN_BYTES);

        domain::OneTimeCode code;
        code.id = utils::IdGenerator::generateWithPrefix("otc");
        code.identityId = identity.id;
        code.purpose = purpose;
        code.codeHash = utils::crypto::sha256Hex(value);
        code.createdAt = now;
        code.expiresAt = now.addMinutes(settings_->getLifetimeMinutes(purpose));
        codeRepo_->replace(code);

        return value;
    }

    /**
     * @brief Проверить и погасить код
     *
     * Неверный, истёкший, уже использованный и никогда не выпущенный
     * код неразличимы: во всех случаях false.
     */
    bool validate(const domain::Identity& identity,
                  domain::OneTimeCodePurpose purpose,
                  const std::string& value) {
        if (value.empty()) {
            return false;
        }
        return codeRepo_->consume(identity.id, purpose, utils::crypto::sha256Hex(value),
                                  domain::Timestamp::now());
    }

    /**
     * @brief Выпустить код и отправить его на email identity
     *
     * Сбой отправки не прерывает операцию, но логируется: пользователь
     * без кода 2FA фактически заблокирован.
     */
    void issueAndSend(const domain::Identity& identity, domain::OneTimeCodePurpose purpose) {
        std::string value = issue(identity, purpose);

        std::string subject;
        std::string body;
        int minutes = settings_->getLifetimeMinutes(purpose);

        switch (purpose) {
            case domain::OneTimeCodePurpose::TWO_FACTOR:
                subject = "Your sign-in code";
                body = "Your verification code is " + value +
                       ". It expires in " + std::to_string(minutes) + " minutes.";
                break;
            case domain::OneTimeCodePurpose::EMAIL_CONFIRMATION:
                subject = "Confirm your email";
                body = "Confirm your email address: " + settings_->getConfirmEmailUrl() +
                       "?userId=" + urlEncode(identity.id) + "&token=" + urlEncode(value) +
                       "\nThe link expires in " + std::to_string(minutes) + " minutes.";
                break;
            case domain::OneTimeCodePurpose::PASSWORD_RESET:
                subject = "Reset your password";
                body = "Reset your password: " + settings_->getResetPasswordUrl() +
                       "?email=" + urlEncode(identity.email) + "&token=" + urlEncode(value) +
                       "\nThe link expires in " + std::to_string(minutes) +
                       " minutes. If you did not request this, ignore this email.";
                break;
        }

        try {
            notifier_->send(identity.email, subject, body);
        } catch (const std::exception& e) {
            std::cerr << "[OneTimeCodeService] Failed to dispatch " << domain::toString(purpose)
                      << " code for " << identity.id << ": " << e.what() << std::endl;
        }
    }

private:
    std::shared_ptr<settings::OneTimeCodeSettings> settings_;
    std::shared_ptr<ports::output::IOneTimeCodeRepository> codeRepo_;
    std::shared_ptr<ports::output::INotificationSender> notifier_;

    static std::string urlEncode(const std::string& value) {
        std::ostringstream oss;
        oss << std::hex << std::uppercase;
        for (unsigned char c : value) {
            if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
                oss << c;
            } else {
                oss << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
            }
        }
        return oss.str();
    }
};

} // namespace iam::application
