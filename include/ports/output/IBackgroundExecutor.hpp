#pragma once

#include <functional>

namespace iam::ports::output {

/**
 * @brief Исполнитель фоновых задач
 *
 * Output Port. Задача выполняется вне потока HTTP запроса;
 * исключения из задачи наружу не выходят.
 */
class IBackgroundExecutor {
public:
    virtual ~IBackgroundExecutor() = default;

    virtual void post(std::function<void()> task) = 0;
};

} // namespace iam::ports::output
