#pragma once

#include "domain/OneTimeCode.hpp"
#include <string>

namespace iam::ports::output {

/**
 * @brief Интерфейс хранилища одноразовых кодов
 */
class IOneTimeCodeRepository {
public:
    virtual ~IOneTimeCodeRepository() = default;

    /**
     * @brief Сохранить новый код вместо всех прежних
     *
     * Одной транзакцией удаляет все коды identity с тем же назначением
     * (действующие, погашенные и истёкшие) и вставляет новый. На пару
     * (identity, purpose) в хранилище остаётся не больше одной записи.
     */
    virtual void replace(const domain::OneTimeCode& code) = 0;

    /**
     * @brief Атомарно погасить код, если он действителен
     * @return true если ровно этот вызов погасил код
     */
    virtual bool consume(
        const std::string& identityId,
        domain::OneTimeCodePurpose purpose,
        const std::string& codeHash,
        const domain::Timestamp& now
    ) = 0;
};

} // namespace iam::ports::output
