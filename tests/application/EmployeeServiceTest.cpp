#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "mocks/ServiceFixture.hpp"

using namespace iam;
using namespace iam::tests::mocks;
using ::testing::ElementsAre;
using ::testing::UnorderedElementsAre;

class EmployeeServiceTest : public ServiceFixture {
protected:
    void SetUp() override {
        ServiceFixture::SetUp();
        admin_ = seedIdentity("admin@bank.test", "Adm!n123", {domain::roles::ADMIN});
        manager_ = seedIdentity("manager@bank.test", "M@nager1", {domain::roles::MANAGER});
        employee_ = seedIdentity("erin@bank.test", "Er!n1234", {domain::roles::EMPLOYEE});
    }

    ports::input::CreateEmployeeRequest newEmployee(const std::string& email) {
        ports::input::CreateEmployeeRequest request;
        request.email = email;
        request.fullName = "New Employee";
        request.password = "Welc0me!";
        request.roles = {domain::roles::EMPLOYEE};
        return request;
    }

    domain::Identity admin_;
    domain::Identity manager_;
    domain::Identity employee_;
};

// ============================================
// LIST
// ============================================

TEST_F(EmployeeServiceTest, List_PageOfActiveIdentities) {
    auto inactive = seedIdentity("zed@bank.test", "Z3d!pass");
    employeeService_->deactivate(callerFor(admin_), inactive.id);

    domain::IdentityQuery query;
    query.pageNumber = 1;
    query.pageSize = 2;

    auto result = employeeService_->list(callerFor(admin_), query);

    ASSERT_TRUE(result.status.success);
    EXPECT_EQ(result.page.items.size(), 2u);
    EXPECT_EQ(result.page.totalCount, 3);
    EXPECT_EQ(result.page.totalPages, 2);
    EXPECT_TRUE(result.page.hasNext);
    EXPECT_FALSE(result.page.hasPrevious);
    for (const auto& item : result.page.items) {
        EXPECT_TRUE(item.isActive);
    }
}

TEST_F(EmployeeServiceTest, List_OrderedByEmail) {
    domain::IdentityQuery query;

    auto result = employeeService_->list(callerFor(manager_), query);

    ASSERT_EQ(result.page.items.size(), 3u);
    EXPECT_EQ(result.page.items[0].email, "admin@bank.test");
    EXPECT_EQ(result.page.items[1].email, "erin@bank.test");
    EXPECT_EQ(result.page.items[2].email, "manager@bank.test");
}

TEST_F(EmployeeServiceTest, List_LastPage) {
    domain::IdentityQuery query;
    query.pageNumber = 2;
    query.pageSize = 2;

    auto result = employeeService_->list(callerFor(admin_), query);

    ASSERT_EQ(result.page.items.size(), 1u);
    EXPECT_EQ(result.page.items[0].email, "manager@bank.test");
    EXPECT_FALSE(result.page.hasNext);
    EXPECT_TRUE(result.page.hasPrevious);
}

TEST_F(EmployeeServiceTest, List_IncludeInactive) {
    auto inactive = seedIdentity("zed@bank.test", "Z3d!pass");
    employeeService_->deactivate(callerFor(admin_), inactive.id);

    domain::IdentityQuery query;
    query.includeInactive = true;

    auto result = employeeService_->list(callerFor(admin_), query);

    EXPECT_EQ(result.page.totalCount, 4);
}

TEST_F(EmployeeServiceTest, List_SearchIsCaseInsensitive) {
    domain::IdentityQuery query;
    query.search = "ERIN";

    auto result = employeeService_->list(callerFor(admin_), query);

    ASSERT_EQ(result.page.items.size(), 1u);
    EXPECT_EQ(result.page.items[0].id, employee_.id);
}

TEST_F(EmployeeServiceTest, List_InvalidPaging_ValidationError) {
    domain::IdentityQuery query;
    query.pageSize = 0;
    EXPECT_EQ(employeeService_->list(callerFor(admin_), query).status.error,
              domain::AuthError::VALIDATION_ERROR);

    query.pageSize = 101;
    EXPECT_EQ(employeeService_->list(callerFor(admin_), query).status.error,
              domain::AuthError::VALIDATION_ERROR);

    query.pageSize = 20;
    query.pageNumber = 0;
    EXPECT_EQ(employeeService_->list(callerFor(admin_), query).status.error,
              domain::AuthError::VALIDATION_ERROR);
}

TEST_F(EmployeeServiceTest, List_EmployeeRole_Forbidden) {
    auto result = employeeService_->list(callerFor(employee_), domain::IdentityQuery{});

    EXPECT_EQ(result.status.error, domain::AuthError::FORBIDDEN);
    EXPECT_TRUE(result.page.items.empty());
}

TEST_F(EmployeeServiceTest, List_Anonymous_Unauthenticated) {
    auto result = employeeService_->list(domain::CallerContext{}, domain::IdentityQuery{});

    EXPECT_EQ(result.status.error, domain::AuthError::UNAUTHENTICATED);
}

// ============================================
// DETAILS
// ============================================

TEST_F(EmployeeServiceTest, GetDetails_Found) {
    auto result = employeeService_->getDetails(callerFor(manager_), employee_.id);

    ASSERT_TRUE(result.status.success);
    ASSERT_TRUE(result.employee.has_value());
    EXPECT_EQ(result.employee->email, "erin@bank.test");
}

TEST_F(EmployeeServiceTest, GetDetails_NotFound) {
    auto result = employeeService_->getDetails(callerFor(admin_), "usr-missing");

    EXPECT_EQ(result.status.error, domain::AuthError::NOT_FOUND);
    EXPECT_FALSE(result.employee.has_value());
}

// ============================================
// CREATE
// ============================================

TEST_F(EmployeeServiceTest, Create_Success) {
    auto result = employeeService_->create(callerFor(admin_), newEmployee("frank@bank.test"));

    ASSERT_TRUE(result.status.success);
    auto stored = identityRepo_->findById(result.id);
    ASSERT_TRUE(stored.has_value());
    EXPECT_TRUE(stored->isActive);
    EXPECT_FALSE(stored->emailConfirmed);
    EXPECT_FALSE(stored->twoFactorEnabled);
    EXPECT_TRUE(stored->hasRole(domain::roles::EMPLOYEE));
    EXPECT_EQ(notifier_->last().to, "frank@bank.test");
}

TEST_F(EmployeeServiceTest, Create_DuplicateEmail_Conflict) {
    auto result = employeeService_->create(callerFor(admin_), newEmployee("ERIN@bank.test"));

    EXPECT_EQ(result.status.error, domain::AuthError::CONFLICT);
}

TEST_F(EmployeeServiceTest, Create_UnknownRole_ValidationError) {
    auto request = newEmployee("frank@bank.test");
    request.roles = {"Superuser"};

    auto result = employeeService_->create(callerFor(admin_), request);

    EXPECT_EQ(result.status.error, domain::AuthError::VALIDATION_ERROR);
    EXPECT_FALSE(identityRepo_->existsByEmail("frank@bank.test"));
}

TEST_F(EmployeeServiceTest, Create_InvalidEmail_ValidationError) {
    auto result = employeeService_->create(callerFor(admin_), newEmployee("not-an-email"));

    EXPECT_EQ(result.status.error, domain::AuthError::VALIDATION_ERROR);
}

TEST_F(EmployeeServiceTest, Create_ByManager_Forbidden) {
    auto result = employeeService_->create(callerFor(manager_), newEmployee("frank@bank.test"));

    EXPECT_EQ(result.status.error, domain::AuthError::FORBIDDEN);
}

// ============================================
// UPDATE
// ============================================

TEST_F(EmployeeServiceTest, Update_RolesAreAuthoritative) {
    ports::input::UpdateEmployeeRequest request;
    request.roles = {domain::roles::MANAGER};

    ASSERT_TRUE(employeeService_->update(callerFor(admin_), employee_.id, request).success);

    auto stored = identityRepo_->findById(employee_.id);
    EXPECT_THAT(stored->roles, ElementsAre(domain::roles::MANAGER));
}

TEST_F(EmployeeServiceTest, Update_OnlyProvidedFieldsChange) {
    ports::input::UpdateEmployeeRequest request;
    request.phoneNumber = "+100200300";
    request.roles = {domain::roles::EMPLOYEE, domain::roles::MANAGER};

    ASSERT_TRUE(employeeService_->update(callerFor(admin_), employee_.id, request).success);

    auto stored = identityRepo_->findById(employee_.id);
    EXPECT_EQ(stored->fullName, employee_.fullName);
    EXPECT_EQ(stored->phoneNumber.value_or(""), "+100200300");
    EXPECT_THAT(stored->roles, UnorderedElementsAre(domain::roles::EMPLOYEE, domain::roles::MANAGER));
}

TEST_F(EmployeeServiceTest, Update_EmptyRoles_RevokesAll) {
    ports::input::UpdateEmployeeRequest request;
    request.fullName = "Erin Renamed";

    ASSERT_TRUE(employeeService_->update(callerFor(admin_), employee_.id, request).success);

    auto stored = identityRepo_->findById(employee_.id);
    EXPECT_EQ(stored->fullName, "Erin Renamed");
    EXPECT_TRUE(stored->roles.empty());
}

TEST_F(EmployeeServiceTest, Update_UnknownRole_NothingChanges) {
    ports::input::UpdateEmployeeRequest request;
    request.fullName = "Erin Renamed";
    request.roles = {"Root"};

    auto result = employeeService_->update(callerFor(admin_), employee_.id, request);

    EXPECT_EQ(result.error, domain::AuthError::VALIDATION_ERROR);
    EXPECT_EQ(identityRepo_->findById(employee_.id)->fullName, employee_.fullName);
}

TEST_F(EmployeeServiceTest, Update_DeactivatedEmployee_StaysDeactivated) {
    ASSERT_TRUE(employeeService_->deactivate(callerFor(admin_), employee_.id).success);

    ports::input::UpdateEmployeeRequest request;
    request.fullName = "Erin Renamed";
    request.roles = {domain::roles::EMPLOYEE};
    ASSERT_TRUE(employeeService_->update(callerFor(admin_), employee_.id, request).success);

    auto stored = identityRepo_->findById(employee_.id);
    EXPECT_EQ(stored->fullName, "Erin Renamed");
    EXPECT_FALSE(stored->isActive);
    ASSERT_TRUE(stored->lockoutUntil.has_value());
    EXPECT_EQ(stored->lockoutUntil->toUnixSeconds(), domain::Timestamp::farFuture().toUnixSeconds());
}

TEST_F(EmployeeServiceTest, Update_NotFound) {
    ports::input::UpdateEmployeeRequest request;

    EXPECT_EQ(employeeService_->update(callerFor(admin_), "usr-missing", request).error,
              domain::AuthError::NOT_FOUND);
}

// ============================================
// ACTIVATE / DEACTIVATE
// ============================================

TEST_F(EmployeeServiceTest, Deactivate_SetsPermanentLockout) {
    ASSERT_TRUE(employeeService_->deactivate(callerFor(admin_), employee_.id).success);

    auto stored = identityRepo_->findById(employee_.id);
    EXPECT_FALSE(stored->isActive);
    ASSERT_TRUE(stored->lockoutUntil.has_value());
    EXPECT_EQ(stored->lockoutUntil->toUnixSeconds(), domain::Timestamp::farFuture().toUnixSeconds());
}

TEST_F(EmployeeServiceTest, Deactivate_IsIdempotent) {
    ASSERT_TRUE(employeeService_->deactivate(callerFor(admin_), employee_.id).success);
    EXPECT_TRUE(employeeService_->deactivate(callerFor(admin_), employee_.id).success);
}

TEST_F(EmployeeServiceTest, Deactivate_Self_ValidationError) {
    auto result = employeeService_->deactivate(callerFor(admin_), admin_.id);

    EXPECT_EQ(result.error, domain::AuthError::VALIDATION_ERROR);
    EXPECT_TRUE(identityRepo_->findById(admin_.id)->isActive);
}

TEST_F(EmployeeServiceTest, Deactivate_ByManager_Forbidden) {
    auto result = employeeService_->deactivate(callerFor(manager_), employee_.id);

    EXPECT_EQ(result.error, domain::AuthError::FORBIDDEN);
}

TEST_F(EmployeeServiceTest, Activate_ClearsLockoutAndAllowsLogin) {
    employeeService_->deactivate(callerFor(admin_), employee_.id);

    ASSERT_TRUE(employeeService_->activate(callerFor(admin_), employee_.id).success);

    auto stored = identityRepo_->findById(employee_.id);
    EXPECT_TRUE(stored->isActive);
    EXPECT_FALSE(stored->lockoutUntil.has_value());
    EXPECT_EQ(stored->failedAccessCount, 0);
    EXPECT_TRUE(authService_->login("erin@bank.test", "Er!n1234").success);
}

TEST_F(EmployeeServiceTest, Activate_AlreadyActive_NoOp) {
    EXPECT_TRUE(employeeService_->activate(callerFor(admin_), employee_.id).success);
}

TEST_F(EmployeeServiceTest, Activate_NotFound) {
    EXPECT_EQ(employeeService_->activate(callerFor(admin_), "usr-missing").error,
              domain::AuthError::NOT_FOUND);
}
