#pragma once

#include <IHttpHandler.hpp>
#include "adapters/primary/HttpSupport.hpp"
#include <memory>
#include <vector>
#include <iostream>

namespace iam::adapters::primary {

/**
 * @brief Последовательность обработчиков: middleware → handler
 *
 * Middleware, пропускающий запрос дальше, оставляет статус 0.
 * Первый ненулевой статус завершает цепочку.
 */
class ChainHandler : public IHttpHandler {
public:
    template <typename... Handlers>
    explicit ChainHandler(Handlers&&... handlers) {
        (handlers_.push_back(std::forward<Handlers>(handlers)), ...);
    }

    void handle(IRequest& req, IResponse& res) override {
        for (auto& h : handlers_) {
            h->handle(req, res);
            if (res.getStatus() != 0) {
                return;
            }
        }

        std::cerr << "[ChainHandler] Error: chain finished with zero status" << std::endl;
        http::sendError(res, 500, "Internal server error");
    }

private:
    std::vector<std::shared_ptr<IHttpHandler>> handlers_;
};

} // namespace iam::adapters::primary
