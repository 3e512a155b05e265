#pragma once

#include "ports/output/IIdentityRepository.hpp"
#include "settings/DbSettings.hpp"
#include "domain/CallerContext.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <mutex>
#include <iostream>

namespace iam::adapters::secondary {

/**
 * @brief PostgreSQL хранилище identity
 *
 * Временные метки передаются как unix seconds (to_timestamp / EXTRACT(EPOCH)).
 * Счётчик неудачных попыток меняется одним UPDATE под блокировкой строки.
 * Каждая операция записи трогает только свои столбцы.
 */
class PostgresIdentityRepository : public ports::output::IIdentityRepository {
public:
    explicit PostgresIdentityRepository(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        std::cout << "[PostgresIdentityRepository] Connecting to " << settings_->getHost() << std::endl;
        try {
            connection_ = std::make_unique<pqxx::connection>(settings_->getConnectionString());
            std::cout << "[PostgresIdentityRepository] Connected successfully" << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresIdentityRepository] Connection failed: " << e.what() << std::endl;
            throw;
        }
    }

    ~PostgresIdentityRepository() override {
        if (connection_ && connection_->is_open()) {
            connection_->close();
        }
    }

    bool create(const domain::Identity& identity) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);

            txn.exec_params(
                R"(
                    INSERT INTO identities (
                        id, email, normalized_email, password_hash, full_name, phone_number,
                        email_confirmed, is_active, two_factor_enabled, lockout_until,
                        failed_access_count, last_login_at, created_at, updated_at
                    ) VALUES (
                        $1, $2, $3, $4, $5, $6, $7, $8, $9, to_timestamp($10),
                        $11, to_timestamp($12), to_timestamp($13), to_timestamp($14)
                    )
                )",
                identity.id,
                identity.email,
                identity.normalizedEmail,
                identity.passwordHash,
                identity.fullName,
                identity.phoneNumber,
                identity.emailConfirmed,
                identity.isActive,
                identity.twoFactorEnabled,
                toEpoch(identity.lockoutUntil),
                identity.failedAccessCount,
                toEpoch(identity.lastLoginAt),
                identity.createdAt.toUnixSeconds(),
                identity.updatedAt.toUnixSeconds()
            );

            for (const auto& role : identity.roles) {
                txn.exec_params(
                    "INSERT INTO identity_roles (identity_id, role_name) VALUES ($1, $2)",
                    identity.id, role);
            }

            txn.commit();
            return true;

        } catch (const pqxx::unique_violation&) {
            return false;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresIdentityRepository] create() failed: " << e.what() << std::endl;
            throw;
        }
    }

    bool updateProfile(
        const domain::Identity& identity,
        const std::set<std::string>& rolesToAdd,
        const std::set<std::string>& rolesToRemove
    ) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);

            auto result = txn.exec_params(
                R"(
                    UPDATE identities SET
                        full_name = $2,
                        phone_number = $3,
                        updated_at = NOW()
                    WHERE id = $1
                )",
                identity.id,
                identity.fullName,
                identity.phoneNumber
            );
            if (result.affected_rows() == 0) {
                return false;
            }

            for (const auto& role : rolesToAdd) {
                txn.exec_params(
                    "INSERT INTO identity_roles (identity_id, role_name) VALUES ($1, $2) "
                    "ON CONFLICT DO NOTHING",
                    identity.id, role);
            }
            for (const auto& role : rolesToRemove) {
                txn.exec_params(
                    "DELETE FROM identity_roles WHERE identity_id = $1 AND role_name = $2",
                    identity.id, role);
            }

            txn.commit();
            return true;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresIdentityRepository] updateProfile() failed: " << e.what() << std::endl;
            throw;
        }
    }

    bool updatePasswordHash(const std::string& id, const std::string& passwordHash) override {
        return updateColumns(
            "password_hash = $2", id, passwordHash, "updatePasswordHash");
    }

    bool setTwoFactorEnabled(const std::string& id, bool enabled) override {
        return updateColumns(
            "two_factor_enabled = $2", id, enabled, "setTwoFactorEnabled");
    }

    bool markEmailConfirmed(const std::string& id) override {
        return updateColumns(
            "email_confirmed = $2", id, true, "markEmailConfirmed");
    }

    bool setActive(
        const std::string& id,
        bool active,
        const std::optional<domain::Timestamp>& lockoutUntil
    ) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);

            auto result = txn.exec_params(
                R"(
                    UPDATE identities SET
                        is_active = $2,
                        lockout_until = to_timestamp($3),
                        failed_access_count = CASE WHEN $2::boolean THEN 0 ELSE failed_access_count END,
                        updated_at = NOW()
                    WHERE id = $1
                )",
                id, active, toEpoch(lockoutUntil));

            txn.commit();
            return result.affected_rows() > 0;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresIdentityRepository] setActive() failed: " << e.what() << std::endl;
            throw;
        }
    }

    std::optional<domain::Identity> findById(const std::string& id) override {
        return findOne("i.id = $1", id, "findById");
    }

    std::optional<domain::Identity> findByEmail(const std::string& email) override {
        return findOne("i.normalized_email = $1", domain::Identity::normalizeEmail(email), "findByEmail");
    }

    bool existsByEmail(const std::string& email) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);
            auto result = txn.exec_params(
                "SELECT 1 FROM identities WHERE normalized_email = $1 LIMIT 1",
                domain::Identity::normalizeEmail(email));
            txn.commit();
            return !result.empty();

        } catch (const std::exception& e) {
            std::cerr << "[PostgresIdentityRepository] existsByEmail() failed: " << e.what() << std::endl;
            throw;
        }
    }

    std::vector<std::string> findAllRoles() override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);
            auto result = txn.exec("SELECT name FROM roles ORDER BY name");
            txn.commit();

            std::vector<std::string> roles;
            for (const auto& row : result) {
                roles.push_back(row[0].as<std::string>());
            }
            return roles;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresIdentityRepository] findAllRoles() failed: " << e.what() << std::endl;
            throw;
        }
    }

    domain::IdentitySlice list(const domain::IdentityQuery& query) override {
        std::lock_guard<std::mutex> lock(mutex_);

        std::optional<std::string> pattern;
        if (query.search && !query.search->empty()) {
            pattern = "%" + escapeLike(domain::Identity::normalizeEmail(*query.search)) + "%";
        }

        const std::string filter =
            "($1 OR i.is_active) AND "
            "($2::text IS NULL OR i.normalized_email LIKE $2 ESCAPE '\\' "
            "OR LOWER(i.full_name) LIKE $2 ESCAPE '\\')";

        try {
            pqxx::work txn(*connection_);

            auto count = txn.exec_params(
                "SELECT COUNT(*) FROM identities i WHERE " + filter,
                query.includeInactive, pattern);

            auto rows = txn.exec_params(
                selectSql() + " WHERE " + filter +
                " GROUP BY i.id ORDER BY i.normalized_email, i.id LIMIT $3 OFFSET $4",
                query.includeInactive,
                pattern,
                query.pageSize,
                static_cast<int64_t>(query.pageNumber - 1) * query.pageSize);

            txn.commit();

            domain::IdentitySlice slice;
            slice.totalCount = count[0][0].as<int64_t>();
            for (const auto& row : rows) {
                slice.items.push_back(rowToIdentity(row));
            }
            return slice;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresIdentityRepository] list() failed: " << e.what() << std::endl;
            throw;
        }
    }

    ports::output::FailedAccessOutcome recordFailedAccess(
        const std::string& id,
        int maxAttempts,
        const domain::Timestamp& lockoutUntil
    ) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);

            // После блокировки счётчик обнуляется, поэтому 0 в RETURNING
            // означает, что именно эта попытка заблокировала запись.
            auto result = txn.exec_params(
                R"(
                    UPDATE identities SET
                        failed_access_count = CASE
                            WHEN failed_access_count + 1 >= $2 THEN 0
                            ELSE failed_access_count + 1 END,
                        lockout_until = CASE
                            WHEN failed_access_count + 1 >= $2 THEN to_timestamp($3)
                            ELSE lockout_until END,
                        updated_at = NOW()
                    WHERE id = $1 AND is_active
                    RETURNING failed_access_count
                )",
                id, maxAttempts, lockoutUntil.toUnixSeconds());

            txn.commit();

            ports::output::FailedAccessOutcome outcome;
            if (!result.empty()) {
                outcome.failedAccessCount = result[0][0].as<int>();
                outcome.lockedOut = outcome.failedAccessCount == 0;
            }
            return outcome;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresIdentityRepository] recordFailedAccess() failed: " << e.what() << std::endl;
            throw;
        }
    }

    void resetFailedAccess(const std::string& id) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);
            txn.exec_params(
                "UPDATE identities SET failed_access_count = 0 WHERE id = $1", id);
            txn.commit();

        } catch (const std::exception& e) {
            std::cerr << "[PostgresIdentityRepository] resetFailedAccess() failed: " << e.what() << std::endl;
            throw;
        }
    }

    void recordSuccessfulLogin(const std::string& id, const domain::Timestamp& at) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);
            txn.exec_params(
                "UPDATE identities SET failed_access_count = 0, last_login_at = to_timestamp($2) "
                "WHERE id = $1",
                id, at.toUnixSeconds());
            txn.commit();

        } catch (const std::exception& e) {
            std::cerr << "[PostgresIdentityRepository] recordSuccessfulLogin() failed: " << e.what() << std::endl;
            throw;
        }
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;
    std::unique_ptr<pqxx::connection> connection_;
    mutable std::mutex mutex_;

    template <typename Value>
    bool updateColumns(const std::string& assignment,
                       const std::string& id,
                       const Value& value,
                       const char* operation) {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);
            auto result = txn.exec_params(
                "UPDATE identities SET " + assignment + ", updated_at = NOW() WHERE id = $1",
                id, value);
            txn.commit();
            return result.affected_rows() > 0;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresIdentityRepository] " << operation << "() failed: " << e.what() << std::endl;
            throw;
        }
    }

    static std::string selectSql() {
        return R"(
            SELECT
                i.id, i.email, i.normalized_email, i.password_hash, i.full_name, i.phone_number,
                i.email_confirmed, i.is_active, i.two_factor_enabled,
                EXTRACT(EPOCH FROM i.lockout_until)::BIGINT AS lockout_until,
                i.failed_access_count,
                EXTRACT(EPOCH FROM i.last_login_at)::BIGINT AS last_login_at,
                EXTRACT(EPOCH FROM i.created_at)::BIGINT AS created_at,
                EXTRACT(EPOCH FROM i.updated_at)::BIGINT AS updated_at,
                COALESCE(string_agg(r.role_name, ',' ORDER BY r.role_name), '') AS roles
            FROM identities i
            LEFT JOIN identity_roles r ON r.identity_id = i.id
        )";
    }

    std::optional<domain::Identity> findOne(const std::string& condition,
                                            const std::string& value,
                                            const char* operation) {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);
            auto result = txn.exec_params(
                selectSql() + " WHERE " + condition + " GROUP BY i.id", value);
            txn.commit();

            if (result.empty()) return std::nullopt;
            return rowToIdentity(result[0]);

        } catch (const std::exception& e) {
            std::cerr << "[PostgresIdentityRepository] " << operation << "() failed: " << e.what() << std::endl;
            throw;
        }
    }

    static std::optional<int64_t> toEpoch(const std::optional<domain::Timestamp>& ts) {
        if (!ts) return std::nullopt;
        return ts->toUnixSeconds();
    }

    static std::optional<domain::Timestamp> fromEpoch(const pqxx::field& field) {
        if (field.is_null()) return std::nullopt;
        return domain::Timestamp::fromUnixSeconds(field.as<int64_t>());
    }

    static std::string escapeLike(const std::string& value) {
        std::string result;
        for (char c : value) {
            if (c == '%' || c == '_' || c == '\\') result.push_back('\\');
            result.push_back(c);
        }
        return result;
    }

    static domain::Identity rowToIdentity(const pqxx::row& row) {
        domain::Identity identity;
        identity.id = row["id"].as<std::string>();
        identity.email = row["email"].as<std::string>();
        identity.normalizedEmail = row["normalized_email"].as<std::string>();
        identity.passwordHash = row["password_hash"].as<std::string>();
        identity.fullName = row["full_name"].as<std::string>();
        if (!row["phone_number"].is_null()) {
            identity.phoneNumber = row["phone_number"].as<std::string>();
        }
        identity.emailConfirmed = row["email_confirmed"].as<bool>();
        identity.isActive = row["is_active"].as<bool>();
        identity.twoFactorEnabled = row["two_factor_enabled"].as<bool>();
        identity.lockoutUntil = fromEpoch(row["lockout_until"]);
        identity.failedAccessCount = row["failed_access_count"].as<int>();
        identity.lastLoginAt = fromEpoch(row["last_login_at"]);
        identity.createdAt = domain::Timestamp::fromUnixSeconds(row["created_at"].as<int64_t>());
        identity.updatedAt = domain::Timestamp::fromUnixSeconds(row["updated_at"].as<int64_t>());
        for (const auto& role : domain::CallerContext::splitRoles(row["roles"].as<std::string>())) {
            identity.roles.insert(role);
        }
        return identity;
    }
};

} // namespace iam::adapters::secondary
