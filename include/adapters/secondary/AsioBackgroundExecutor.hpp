#pragma once

#include "ports/output/IBackgroundExecutor.hpp"
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <iostream>

namespace iam::adapters::secondary {

/**
 * @brief Фоновые задачи на boost::asio::thread_pool
 *
 * Деструктор дожидается уже поставленных задач.
 */
class AsioBackgroundExecutor : public ports::output::IBackgroundExecutor {
public:
    static constexpr std::size_t THREADS = 2;

    AsioBackgroundExecutor() : pool_(THREADS) {
        std::cout << "[AsioBackgroundExecutor] Started with " << THREADS << " threads" << std::endl;
    }

    ~AsioBackgroundExecutor() override {
        pool_.join();
        std::cout << "[AsioBackgroundExecutor] Stopped" << std::endl;
    }

    void post(std::function<void()> task) override {
        boost::asio::post(pool_, [task = std::move(task)]() {
            try {
                task();
            } catch (const std::exception& e) {
                std::cerr << "[AsioBackgroundExecutor] Task failed: " << e.what() << std::endl;
            }
        });
    }

private:
    boost::asio::thread_pool pool_;
};

} // namespace iam::adapters::secondary
