#pragma once

#include <BoostBeastApplication.hpp>
#include <boost/di.hpp>

// Settings
#include "settings/DbSettings.hpp"
#include "settings/JwtSettings.hpp"
#include "settings/LockoutSettings.hpp"
#include "settings/OneTimeCodeSettings.hpp"
#include "settings/PasswordSettings.hpp"
#include "settings/RabbitMQSettings.hpp"

// Ports
#include "ports/input/IAuthService.hpp"
#include "ports/input/IPasswordService.hpp"
#include "ports/input/IEmployeeService.hpp"
#include "ports/output/IIdentityRepository.hpp"
#include "ports/output/IOneTimeCodeRepository.hpp"
#include "ports/output/ITokenProvider.hpp"
#include "ports/output/IPasswordHasher.hpp"
#include "ports/output/INotificationSender.hpp"
#include "ports/output/IBackgroundExecutor.hpp"

// Application
#include "application/AuthService.hpp"
#include "application/PasswordService.hpp"
#include "application/EmployeeService.hpp"
#include "application/OneTimeCodeService.hpp"
#include "application/PasswordPolicy.hpp"

// Secondary Adapters
#include "adapters/secondary/PostgresSchemaMigrator.hpp"
#include "adapters/secondary/PostgresIdentityRepository.hpp"
#include "adapters/secondary/PostgresOneTimeCodeRepository.hpp"
#include "adapters/secondary/HmacJwtProvider.hpp"
#include "adapters/secondary/Pbkdf2PasswordHasher.hpp"
#include "adapters/secondary/RabbitMQNotificationSender.hpp"
#include "adapters/secondary/AsioBackgroundExecutor.hpp"

// Primary Adapters
#include "adapters/primary/ChainHandler.hpp"
#include "adapters/primary/BearerAuthMiddleware.hpp"
#include "adapters/primary/HealthHandler.hpp"
#include "adapters/primary/LoginHandler.hpp"
#include "adapters/primary/VerifyTwoFactorHandler.hpp"
#include "adapters/primary/EnableTwoFactorHandler.hpp"
#include "adapters/primary/DisableTwoFactorHandler.hpp"
#include "adapters/primary/ConfirmEmailHandler.hpp"
#include "adapters/primary/ResendConfirmationHandler.hpp"
#include "adapters/primary/ForgotPasswordHandler.hpp"
#include "adapters/primary/ResetPasswordHandler.hpp"
#include "adapters/primary/ChangePasswordHandler.hpp"
#include "adapters/primary/ListEmployeesHandler.hpp"
#include "adapters/primary/GetEmployeeHandler.hpp"
#include "adapters/primary/CreateEmployeeHandler.hpp"
#include "adapters/primary/UpdateEmployeeHandler.hpp"
#include "adapters/primary/ActivateEmployeeHandler.hpp"
#include "adapters/primary/DeactivateEmployeeHandler.hpp"

#include <memory>
#include <iostream>

namespace di = boost::di;

namespace iam {

/**
 * @brief IAM Service Application
 *
 * Аутентификация сотрудников банка (пароль, 2FA по email, JWT),
 * жизненный цикл пароля и администрирование учётных записей.
 */
class IamApp : public BoostBeastApplication {
public:
    IamApp() {
        std::cout << "[IamApp] Initializing..." << std::endl;
    }

    ~IamApp() override {
        std::cout << "[IamApp] Shutting down..." << std::endl;
    }

protected:
    void loadEnvironment(int argc, char* argv[]) override {
        BoostBeastApplication::loadEnvironment(argc, argv);
        std::cout << "[IamApp] Environment loaded" << std::endl;
    }

    void configureInjection() override {
        std::cout << "[IamApp] Configuring Boost.DI injection..." << std::endl;

        // Ошибки конфигурации (нет секрета, короткий ключ) выбрасываются здесь,
        // до регистрации первого endpoint
        auto dbSettings = std::make_shared<settings::DbSettings>();
        auto jwtSettings = std::make_shared<settings::JwtSettings>();

        if (dbSettings->shouldMigrate()) {
            adapters::secondary::PostgresSchemaMigrator migrator(dbSettings);
            int applied = migrator.migrate();
            std::cout << "[IamApp] Migrations applied: " << applied << std::endl;
        }

        auto injector = di::make_injector(

            // ================================================================
            // Layer 1: Settings
            // ================================================================
            di::bind<settings::DbSettings>().to(dbSettings),
            di::bind<settings::JwtSettings>().to(jwtSettings),
            di::bind<settings::LockoutSettings>()
                .to(std::make_shared<settings::LockoutSettings>()),
            di::bind<settings::OneTimeCodeSettings>()
                .to(std::make_shared<settings::OneTimeCodeSettings>()),
            di::bind<settings::PasswordSettings>()
                .to(std::make_shared<settings::PasswordSettings>()),
            di::bind<settings::RabbitMQSettings>()
                .to(std::make_shared<settings::RabbitMQSettings>()),

            // ================================================================
            // Layer 2: Secondary Adapters (Output Ports implementations)
            // ================================================================
            di::bind<ports::output::IIdentityRepository>()
                .to<adapters::secondary::PostgresIdentityRepository>()
                .in(di::singleton),

            di::bind<ports::output::IOneTimeCodeRepository>()
                .to<adapters::secondary::PostgresOneTimeCodeRepository>()
                .in(di::singleton),

            di::bind<ports::output::ITokenProvider>()
                .to<adapters::secondary::HmacJwtProvider>()
                .in(di::singleton),

            di::bind<ports::output::IPasswordHasher>()
                .to<adapters::secondary::Pbkdf2PasswordHasher>()
                .in(di::singleton),

            di::bind<ports::output::INotificationSender>()
                .to<adapters::secondary::RabbitMQNotificationSender>()
                .in(di::singleton),

            di::bind<ports::output::IBackgroundExecutor>()
                .to<adapters::secondary::AsioBackgroundExecutor>()
                .in(di::singleton),

            // ================================================================
            // Layer 3: Application Services
            // ================================================================
            di::bind<application::OneTimeCodeService>().in(di::singleton),
            di::bind<application::PasswordPolicy>().in(di::singleton),

            di::bind<ports::input::IAuthService>()
                .to<application::AuthService>()
                .in(di::singleton),

            di::bind<ports::input::IPasswordService>()
                .to<application::PasswordService>()
                .in(di::singleton),

            di::bind<ports::input::IEmployeeService>()
                .to<application::EmployeeService>()
                .in(di::singleton)
        );

        std::cout << "[IamApp] DI Injector configured" << std::endl;

        // ====================================================================
        // Layer 4: Primary Adapters (HTTP Handlers)
        // ====================================================================
        using namespace adapters::primary;

        auto bearerAuth = injector.create<std::shared_ptr<BearerAuthMiddleware>>();

        // Обработчик за проверкой Bearer token
        auto secured = [&bearerAuth](std::shared_ptr<IHttpHandler> handler) {
            return std::make_shared<ChainHandler>(bearerAuth, std::move(handler));
        };

        registerEndpoint("GET", "/health", injector.create<std::shared_ptr<HealthHandler>>());

        // Anonymous
        registerEndpoint("POST", "/auth/login",
            injector.create<std::shared_ptr<LoginHandler>>());
        registerEndpoint("POST", "/auth/2fa/verify",
            injector.create<std::shared_ptr<VerifyTwoFactorHandler>>());
        registerEndpoint("GET", "/auth/confirm-email",
            injector.create<std::shared_ptr<ConfirmEmailHandler>>());
        registerEndpoint("POST", "/auth/resend-confirmation",
            injector.create<std::shared_ptr<ResendConfirmationHandler>>());
        registerEndpoint("POST", "/auth/forgot-password",
            injector.create<std::shared_ptr<ForgotPasswordHandler>>());
        registerEndpoint("POST", "/auth/reset-password",
            injector.create<std::shared_ptr<ResetPasswordHandler>>());

        // Authenticated
        registerEndpoint("POST", "/auth/2fa/enable",
            secured(injector.create<std::shared_ptr<EnableTwoFactorHandler>>()));
        registerEndpoint("POST", "/auth/2fa/disable",
            secured(injector.create<std::shared_ptr<DisableTwoFactorHandler>>()));
        registerEndpoint("POST", "/auth/change-password",
            secured(injector.create<std::shared_ptr<ChangePasswordHandler>>()));

        // Administration (роли проверяет EmployeeService)
        registerEndpoint("GET", "/admin/employees",
            secured(injector.create<std::shared_ptr<ListEmployeesHandler>>()));
        registerEndpoint("POST", "/admin/employees",
            secured(injector.create<std::shared_ptr<CreateEmployeeHandler>>()));
        registerEndpoint("GET", "/admin/employees/*",
            secured(injector.create<std::shared_ptr<GetEmployeeHandler>>()));
        registerEndpoint("PUT", "/admin/employees/*",
            secured(injector.create<std::shared_ptr<UpdateEmployeeHandler>>()));
        registerEndpoint("POST", "/admin/employees/*/activate",
            secured(injector.create<std::shared_ptr<ActivateEmployeeHandler>>()));
        registerEndpoint("POST", "/admin/employees/*/deactivate",
            secured(injector.create<std::shared_ptr<DeactivateEmployeeHandler>>()));

        std::cout << "[IamApp] Configuration complete! 16 handlers registered." << std::endl;
    }
};

} // namespace iam
