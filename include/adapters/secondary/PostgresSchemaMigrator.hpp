#pragma once

#include "settings/DbSettings.hpp"
#include "domain/Roles.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <string>
#include <vector>
#include <iostream>

namespace iam::adapters::secondary {

/**
 * @brief Версионные миграции схемы IAM
 *
 * Применённые версии записываются в schema_migrations. Каждая миграция
 * выполняется в своей транзакции; повторный запуск ничего не меняет.
 */
class PostgresSchemaMigrator {
public:
    struct Migration {
        int version;
        std::string description;
        std::vector<std::string> statements;
    };

    explicit PostgresSchemaMigrator(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings)) {}

    /**
     * @brief Применить недостающие миграции
     * @return Количество применённых миграций
     */
    int migrate() {
        pqxx::connection connection(settings_->getConnectionString());
        std::cout << "[PostgresSchemaMigrator] Connected to " << settings_->getName() << std::endl;

        {
            pqxx::work txn(connection);
            txn.exec(
                "CREATE TABLE IF NOT EXISTS schema_migrations ("
                "  version INT PRIMARY KEY,"
                "  description TEXT NOT NULL,"
                "  applied_at TIMESTAMPTZ NOT NULL DEFAULT NOW()"
                ")"
            );
            txn.commit();
        }

        int applied = 0;
        for (const auto& migration : migrations()) {
            pqxx::work txn(connection);

            auto existing = txn.exec_params(
                "SELECT 1 FROM schema_migrations WHERE version = $1", migration.version);
            if (!existing.empty()) {
                continue;
            }

            std::cout << "[PostgresSchemaMigrator] Applying V" << migration.version
                      << ": " << migration.description << std::endl;

            for (const auto& statement : migration.statements) {
                txn.exec(statement);
            }
            txn.exec_params(
                "INSERT INTO schema_migrations (version, description) VALUES ($1, $2)",
                migration.version, migration.description);
            txn.commit();
            ++applied;
        }

        std::cout << "[PostgresSchemaMigrator] Up to date, applied " << applied << " migration(s)" << std::endl;
        return applied;
    }

    static std::vector<Migration> migrations() {
        std::string seedRoles = "INSERT INTO roles (name) VALUES ";
        auto seeded = domain::roles::seeded();
        for (size_t i = 0; i < seeded.size(); ++i) {
            if (i > 0) seedRoles += ", ";
            seedRoles += "('" + seeded[i] + "')";
        }
        seedRoles += " ON CONFLICT (name) DO NOTHING";

        return {
            {1, "identities and roles", {
                R"(
                    CREATE TABLE identities (
                        id                  VARCHAR(64) PRIMARY KEY,
                        email               VARCHAR(320) NOT NULL,
                        normalized_email    VARCHAR(320) NOT NULL UNIQUE,
                        password_hash       TEXT NOT NULL,
                        full_name           VARCHAR(256) NOT NULL,
                        phone_number        VARCHAR(32),
                        email_confirmed     BOOLEAN NOT NULL DEFAULT FALSE,
                        is_active           BOOLEAN NOT NULL DEFAULT TRUE,
                        two_factor_enabled  BOOLEAN NOT NULL DEFAULT FALSE,
                        lockout_until       TIMESTAMPTZ,
                        failed_access_count INT NOT NULL DEFAULT 0,
                        last_login_at       TIMESTAMPTZ,
                        created_at          TIMESTAMPTZ NOT NULL DEFAULT NOW(),
                        updated_at          TIMESTAMPTZ NOT NULL DEFAULT NOW()
                    )
                )",
                "CREATE INDEX idx_identities_full_name_lower ON identities (LOWER(full_name))",
                "CREATE TABLE roles (name VARCHAR(64) PRIMARY KEY)",
                R"(
                    CREATE TABLE identity_roles (
                        identity_id VARCHAR(64) NOT NULL REFERENCES identities(id),
                        role_name   VARCHAR(64) NOT NULL REFERENCES roles(name),
                        PRIMARY KEY (identity_id, role_name)
                    )
                )"
            }},
            {2, "one-time codes", {
                R"(
                    CREATE TABLE one_time_codes (
                        id          VARCHAR(64) PRIMARY KEY,
                        identity_id VARCHAR(64) NOT NULL REFERENCES identities(id),
                        purpose     VARCHAR(32) NOT NULL,
                        code_hash   CHAR(64) NOT NULL,
                        created_at  TIMESTAMPTZ NOT NULL,
                        expires_at  TIMESTAMPTZ NOT NULL,
                        consumed_at TIMESTAMPTZ
                    )
                )",
                R"(
                    CREATE INDEX idx_one_time_codes_active
                        ON one_time_codes (identity_id, purpose)
                        WHERE consumed_at IS NULL
                )"
            }},
            {3, "seed roles", {seedRoles}},
            {4, "one-time codes kept per identity and purpose", {
                "DELETE FROM one_time_codes WHERE consumed_at IS NOT NULL OR expires_at < NOW()",
                "DROP INDEX IF EXISTS idx_one_time_codes_active",
                "CREATE INDEX idx_one_time_codes_owner ON one_time_codes (identity_id, purpose)"
            }}
        };
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;
};

} // namespace iam::adapters::secondary
