#pragma once

#include "ports/input/IEmployeeService.hpp"
#include "ports/output/IIdentityRepository.hpp"
#include "ports/output/IPasswordHasher.hpp"
#include "application/AuthorizationPolicy.hpp"
#include "application/OneTimeCodeService.hpp"
#include "application/PasswordPolicy.hpp"
#include "utils/IdGenerator.hpp"
#include <memory>
#include <algorithm>
#include <iterator>
#include <set>
#include <iostream>

namespace iam::application {

/**
 * @brief Администрирование учётных записей сотрудников
 *
 * Чтение: Admin или Manager. Запись: только Admin.
 */
class EmployeeService : public ports::input::IEmployeeService {
public:
    static constexpr int MAX_PAGE_SIZE = 100;

    EmployeeService(
        std::shared_ptr<ports::output::IIdentityRepository> identityRepo,
        std::shared_ptr<ports::output::IPasswordHasher> hasher,
        std::shared_ptr<OneTimeCodeService> codes,
        std::shared_ptr<PasswordPolicy> passwordPolicy
    ) : identityRepo_(std::move(identityRepo))
      , hasher_(std::move(hasher))
      , codes_(std::move(codes))
      , passwordPolicy_(std::move(passwordPolicy))
    {
        std::cout << "[EmployeeService] Created" << std::endl;
    }

    ports::input::EmployeePageResult list(
        const domain::CallerContext& caller,
        const domain::IdentityQuery& query
    ) override {
        ports::input::EmployeePageResult result;
        result.status = authorize(caller, AuthorizationPolicy::employeeRead());
        if (!result.status.success) {
            return result;
        }

        if (query.pageNumber < 1) {
            result.status = ports::input::OperationResult::fail(
                domain::AuthError::VALIDATION_ERROR, "pageNumber must be at least 1");
            return result;
        }
        if (query.pageSize < 1 || query.pageSize > MAX_PAGE_SIZE) {
            result.status = ports::input::OperationResult::fail(
                domain::AuthError::VALIDATION_ERROR,
                "pageSize must be between 1 and " + std::to_string(MAX_PAGE_SIZE));
            return result;
        }

        auto slice = identityRepo_->list(query);

        auto& page = result.page;
        page.pageNumber = query.pageNumber;
        page.pageSize = query.pageSize;
        page.totalCount = slice.totalCount;
        page.totalPages = (slice.totalCount + query.pageSize - 1) / query.pageSize;
        page.hasPrevious = query.pageNumber > 1;
        page.hasNext = query.pageNumber < page.totalPages;

        page.items.reserve(slice.items.size());
        for (const auto& identity : slice.items) {
            page.items.push_back(domain::EmployeeSummary::from(identity));
        }
        return result;
    }

    ports::input::EmployeeDetailsResult getDetails(
        const domain::CallerContext& caller,
        const std::string& id
    ) override {
        ports::input::EmployeeDetailsResult result;
        result.status = authorize(caller, AuthorizationPolicy::employeeRead());
        if (!result.status.success) {
            return result;
        }

        result.employee = identityRepo_->findById(id);
        if (!result.employee) {
            result.status = ports::input::OperationResult::fail(domain::AuthError::NOT_FOUND);
        }
        return result;
    }

    ports::input::CreateEmployeeResult create(
        const domain::CallerContext& caller,
        const ports::input::CreateEmployeeRequest& request
    ) override {
        ports::input::CreateEmployeeResult result;
        result.status = authorize(caller, AuthorizationPolicy::employeeWrite());
        if (!result.status.success) {
            return result;
        }

        if (!isValidEmail(request.email)) {
            result.status = ports::input::OperationResult::fail(
                domain::AuthError::VALIDATION_ERROR, "Invalid email address");
            return result;
        }
        if (request.fullName.empty()) {
            result.status = ports::input::OperationResult::fail(
                domain::AuthError::VALIDATION_ERROR, "fullName is required");
            return result;
        }
        if (auto violation = passwordPolicy_->validate(request.password)) {
            result.status = ports::input::OperationResult::fail(domain::AuthError::VALIDATION_ERROR, *violation);
            return result;
        }
        result.status = validateRoles(request.roles);
        if (!result.status.success) {
            return result;
        }

        if (identityRepo_->existsByEmail(request.email)) {
            result.status = ports::input::OperationResult::fail(
                domain::AuthError::CONFLICT, "Email already exists");
            return result;
        }

        domain::Identity identity(
            utils::IdGenerator::generateWithPrefix("usr"),
            request.email,
            hasher_->hash(request.password),
            request.fullName);
        identity.phoneNumber = request.phoneNumber;
        identity.roles.insert(request.roles.begin(), request.roles.end());
        identity.createdAt = domain::Timestamp::now();
        identity.updatedAt = identity.createdAt;

        // Гонка двух create с одним email решается уникальным индексом
        if (!identityRepo_->create(identity)) {
            result.status = ports::input::OperationResult::fail(
                domain::AuthError::CONFLICT, "Email already exists");
            return result;
        }

        codes_->issueAndSend(identity, domain::OneTimeCodePurpose::EMAIL_CONFIRMATION);

        std::cout << "[EmployeeService] Employee created: " << identity.id
                  << " by " << caller.userId << std::endl;

        result.id = identity.id;
        return result;
    }

    ports::input::OperationResult update(
        const domain::CallerContext& caller,
        const std::string& id,
        const ports::input::UpdateEmployeeRequest& request
    ) override {
        auto status = authorize(caller, AuthorizationPolicy::employeeWrite());
        if (!status.success) {
            return status;
        }

        if (request.fullName && request.fullName->empty()) {
            return ports::input::OperationResult::fail(
                domain::AuthError::VALIDATION_ERROR, "fullName must not be empty");
        }
        status = validateRoles(request.roles);
        if (!status.success) {
            return status;
        }

        auto identityOpt = identityRepo_->findById(id);
        if (!identityOpt) {
            return ports::input::OperationResult::fail(domain::AuthError::NOT_FOUND);
        }

        auto& identity = *identityOpt;
        if (request.fullName) {
            identity.fullName = *request.fullName;
        }
        if (request.phoneNumber) {
            // Пустая строка очищает телефон
            if (request.phoneNumber->empty()) {
                identity.phoneNumber.reset();
            } else {
                identity.phoneNumber = request.phoneNumber;
            }
        }

        std::set<std::string> target(request.roles.begin(), request.roles.end());
        std::set<std::string> toAdd;
        std::set<std::string> toRemove;
        std::set_difference(target.begin(), target.end(),
                            identity.roles.begin(), identity.roles.end(),
                            std::inserter(toAdd, toAdd.end()));
        std::set_difference(identity.roles.begin(), identity.roles.end(),
                            target.begin(), target.end(),
                            std::inserter(toRemove, toRemove.end()));

        if (!identityRepo_->updateProfile(identity, toAdd, toRemove)) {
            return ports::input::OperationResult::fail(domain::AuthError::NOT_FOUND);
        }

        std::cout << "[EmployeeService] Employee updated: " << id
                  << " (+" << toAdd.size() << " -" << toRemove.size() << " roles)" << std::endl;
        return ports::input::OperationResult::ok();
    }

    ports::input::OperationResult activate(const domain::CallerContext& caller, const std::string& id) override {
        auto status = authorize(caller, AuthorizationPolicy::employeeWrite());
        if (!status.success) {
            return status;
        }

        auto identityOpt = identityRepo_->findById(id);
        if (!identityOpt) {
            return ports::input::OperationResult::fail(domain::AuthError::NOT_FOUND);
        }
        if (identityOpt->isActive) {
            return ports::input::OperationResult::ok();
        }

        if (!identityRepo_->setActive(id, true, std::nullopt)) {
            return ports::input::OperationResult::fail(domain::AuthError::NOT_FOUND);
        }

        std::cout << "[EmployeeService] Employee activated: " << id << " by " << caller.userId << std::endl;
        return ports::input::OperationResult::ok();
    }

    ports::input::OperationResult deactivate(const domain::CallerContext& caller, const std::string& id) override {
        auto status = authorize(caller, AuthorizationPolicy::employeeWrite());
        if (!status.success) {
            return status;
        }

        if (id == caller.userId) {
            return ports::input::OperationResult::fail(
                domain::AuthError::VALIDATION_ERROR, "Cannot deactivate your own account");
        }

        auto identityOpt = identityRepo_->findById(id);
        if (!identityOpt) {
            return ports::input::OperationResult::fail(domain::AuthError::NOT_FOUND);
        }
        if (!identityOpt->isActive) {
            return ports::input::OperationResult::ok();
        }

        if (!identityRepo_->setActive(id, false, domain::Timestamp::farFuture())) {
            return ports::input::OperationResult::fail(domain::AuthError::NOT_FOUND);
        }

        std::cout << "[EmployeeService] Employee deactivated: " << id << " by " << caller.userId << std::endl;
        return ports::input::OperationResult::ok();
    }

private:
    std::shared_ptr<ports::output::IIdentityRepository> identityRepo_;
    std::shared_ptr<ports::output::IPasswordHasher> hasher_;
    std::shared_ptr<OneTimeCodeService> codes_;
    std::shared_ptr<PasswordPolicy> passwordPolicy_;

    static ports::input::OperationResult authorize(
        const domain::CallerContext& caller,
        const std::vector<std::string>& requiredRoles
    ) {
        if (!caller.isAuthenticated()) {
            return ports::input::OperationResult::fail(domain::AuthError::UNAUTHENTICATED);
        }
        if (!AuthorizationPolicy::allow(caller.roles, requiredRoles)) {
            return ports::input::OperationResult::fail(domain::AuthError::FORBIDDEN);
        }
        return ports::input::OperationResult::ok();
    }

    ports::input::OperationResult validateRoles(const std::vector<std::string>& roles) {
        if (roles.empty()) {
            return ports::input::OperationResult::ok();
        }
        auto known = identityRepo_->findAllRoles();
        for (const auto& role : roles) {
            if (std::find(known.begin(), known.end(), role) == known.end()) {
                return ports::input::OperationResult::fail(
                    domain::AuthError::VALIDATION_ERROR, "Unknown role: " + role);
            }
        }
        return ports::input::OperationResult::ok();
    }

    static bool isValidEmail(const std::string& email) {
        auto at = email.find('@');
        if (at == std::string::npos || at == 0 || email.find('@', at + 1) != std::string::npos) {
            return false;
        }
        auto dot = email.find('.', at + 2);
        return dot != std::string::npos && dot + 1 < email.size()
            && email.find(' ') == std::string::npos;
    }
};

} // namespace iam::application
