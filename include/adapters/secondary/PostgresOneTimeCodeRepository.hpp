#pragma once

#include "ports/output/IOneTimeCodeRepository.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <mutex>
#include <iostream>

namespace iam::adapters::secondary {

/**
 * @brief PostgreSQL хранилище одноразовых кодов
 *
 * Погашенные и истёкшие коды удаляются при выпуске следующего кода
 * того же назначения, так что таблица не растёт с каждым входом.
 */
class PostgresOneTimeCodeRepository : public ports::output::IOneTimeCodeRepository {
public:
    explicit PostgresOneTimeCodeRepository(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        std::cout << "[PostgresOneTimeCodeRepository] Connecting to " << settings_->getHost() << std::endl;
        try {
            connection_ = std::make_unique<pqxx::connection>(settings_->getConnectionString());
        } catch (const std::exception& e) {
            std::cerr << "[PostgresOneTimeCodeRepository] Connection failed: " << e.what() << std::endl;
            throw;
        }
    }

    ~PostgresOneTimeCodeRepository() override {
        if (connection_ && connection_->is_open()) {
            connection_->close();
        }
    }

    void replace(const domain::OneTimeCode& code) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);
            txn.exec_params(
                "DELETE FROM one_time_codes WHERE identity_id = $1 AND purpose = $2",
                code.identityId, domain::toString(code.purpose));
            txn.exec_params(
                R"(
                    INSERT INTO one_time_codes (id, identity_id, purpose, code_hash, created_at, expires_at)
                    VALUES ($1, $2, $3, $4, to_timestamp($5), to_timestamp($6))
                )",
                code.id,
                code.identityId,
                domain::toString(code.purpose),
                code.codeHash,
                code.createdAt.toUnixSeconds(),
                code.expiresAt.toUnixSeconds()
            );
            txn.commit();

        } catch (const std::exception& e) {
            std::cerr << "[PostgresOneTimeCodeRepository] replace() failed: " << e.what() << std::endl;
            throw;
        }
    }

    bool consume(
        const std::string& identityId,
        domain::OneTimeCodePurpose purpose,
        const std::string& codeHash,
        const domain::Timestamp& now
    ) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);

            // Условный UPDATE: из двух конкурентных предъявлений пройдёт одно
            auto result = txn.exec_params(
                R"(
                    UPDATE one_time_codes SET consumed_at = to_timestamp($4)
                    WHERE identity_id = $1
                      AND purpose = $2
                      AND code_hash = $3
                      AND consumed_at IS NULL
                      AND expires_at > to_timestamp($4)
                    RETURNING id
                )",
                identityId, domain::toString(purpose), codeHash, now.toUnixSeconds());

            txn.commit();
            return !result.empty();

        } catch (const std::exception& e) {
            std::cerr << "[PostgresOneTimeCodeRepository] consume() failed: " << e.what() << std::endl;
            throw;
        }
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;
    std::unique_ptr<pqxx::connection> connection_;
    mutable std::mutex mutex_;
};

} // namespace iam::adapters::secondary
