#pragma once

#include <IHttpHandler.hpp>
#include "domain/Timestamp.hpp"
#include <nlohmann/json.hpp>

namespace iam::adapters::primary {

/**
 * @brief GET /health
 *
 * Не требует токена и не обращается к БД.
 */
class HealthHandler : public IHttpHandler {
public:
    void handle(IRequest&, IResponse& res) override {
        nlohmann::json response;
        response["status"] = "healthy";
        response["service"] = "iam-service";
        response["version"] = "1.0.0";
        response["time"] = domain::Timestamp::now().toString();

        res.setResult(200, "application/json", response.dump());
    }
};

} // namespace iam::adapters::primary
