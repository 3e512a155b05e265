#include "IamApp.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <csignal>
#include <iostream>
#include <stdexcept>
#include <thread>
#include <unistd.h>

namespace {

constexpr int EXIT_CONFIG_ERROR = 2;

/**
 * @brief Ждёт SIGINT/SIGTERM в отдельном потоке и останавливает приложение
 *
 * app.stop() вызывается из обычного потока, а не из обработчика сигнала.
 */
class ShutdownWatcher {
public:
    explicit ShutdownWatcher(iam::IamApp& app)
        : signals_(io_, SIGINT, SIGTERM)
    {
        signals_.async_wait([this, &app](const boost::system::error_code& ec, int signal) {
            if (ec) return;
            std::cout << "[main] Signal " << signal << " received, draining requests" << std::endl;
            app.stop();
        });
        thread_ = std::thread([this]() { io_.run(); });
    }

    ~ShutdownWatcher() {
        io_.stop();
        thread_.join();
    }

private:
    boost::asio::io_context io_;
    boost::asio::signal_set signals_;
    std::thread thread_;
};

} // namespace

int main(int argc, char* argv[]) {
    try {
        iam::IamApp app;
        ShutdownWatcher watcher(app);

        std::cout << "[main] iam-service 1.0.0 (pid " << ::getpid() << ")" << std::endl;

        app.run(argc, argv);

        std::cout << "[main] iam-service exited cleanly" << std::endl;
        return 0;

    } catch (const std::invalid_argument& e) {
        std::cerr << "[main] Configuration error: " << e.what() << std::endl;
        return EXIT_CONFIG_ERROR;
    } catch (const std::exception& e) {
        std::cerr << "[main] Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
