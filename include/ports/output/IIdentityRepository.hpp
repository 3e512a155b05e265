#pragma once

#include "domain/Identity.hpp"
#include "domain/EmployeePage.hpp"
#include <string>
#include <optional>
#include <set>
#include <vector>

namespace iam::ports::output {

/**
 * @brief Итог атомарной регистрации неудачной попытки входа
 */
struct FailedAccessOutcome {
    int failedAccessCount = 0;  ///< Значение счётчика после операции
    bool lockedOut = false;     ///< Попытка привела к блокировке
};

/**
 * @brief Интерфейс хранилища identity
 *
 * Output Port. Единственный разделяемый изменяемый ресурс сервиса.
 * Поиск по email всегда выполняется без учёта регистра.
 */
class IIdentityRepository {
public:
    virtual ~IIdentityRepository() = default;

    /**
     * @brief Создать identity вместе с ролями
     * @return false если email уже занят
     */
    virtual bool create(const domain::Identity& identity) = 0;

    /**
     * @brief Записать профиль и изменения ролей одной транзакцией
     *
     * Пишет только fullName и phoneNumber. Флаги, хэш пароля, счётчик
     * неудач и блокировка меняются отдельными точечными операциями,
     * чтобы параллельные запросы не перетирали чужие поля.
     * @return false если identity не найдена
     */
    virtual bool updateProfile(
        const domain::Identity& identity,
        const std::set<std::string>& rolesToAdd,
        const std::set<std::string>& rolesToRemove
    ) = 0;

    virtual bool updatePasswordHash(const std::string& id, const std::string& passwordHash) = 0;

    virtual bool setTwoFactorEnabled(const std::string& id, bool enabled) = 0;

    virtual bool markEmailConfirmed(const std::string& id) = 0;

    /**
     * @brief Включить или выключить учётную запись
     *
     * При включении заодно обнуляет счётчик неудачных попыток.
     * @param lockoutUntil новое значение блокировки (nullopt снимает её)
     * @return false если identity не найдена
     */
    virtual bool setActive(
        const std::string& id,
        bool active,
        const std::optional<domain::Timestamp>& lockoutUntil
    ) = 0;

    virtual std::optional<domain::Identity> findById(const std::string& id) = 0;

    virtual std::optional<domain::Identity> findByEmail(const std::string& email) = 0;

    virtual bool existsByEmail(const std::string& email) = 0;

    /**
     * @brief Все известные роли
     */
    virtual std::vector<std::string> findAllRoles() = 0;

    /**
     * @brief Страница identity, упорядоченная по email
     */
    virtual domain::IdentitySlice list(const domain::IdentityQuery& query) = 0;

    /**
     * @brief Атомарно увеличить счётчик неудач
     *
     * Если счётчик достигает maxAttempts, выставляет lockoutUntil
     * и сбрасывает счётчик в 0. Операция не теряет инкременты при
     * конкурентных попытках.
     */
    virtual FailedAccessOutcome recordFailedAccess(
        const std::string& id,
        int maxAttempts,
        const domain::Timestamp& lockoutUntil
    ) = 0;

    /**
     * @brief Сбросить счётчик неудач
     */
    virtual void resetFailedAccess(const std::string& id) = 0;

    /**
     * @brief Сбросить счётчик неудач и записать время входа
     */
    virtual void recordSuccessfulLogin(const std::string& id, const domain::Timestamp& at) = 0;
};

} // namespace iam::ports::output
