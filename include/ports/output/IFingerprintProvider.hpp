#pragma once

#include "domain/RequestMetadata.hpp"
#include <string>

namespace session::ports::output {

/**
 * @brief Вычисление отпечатка запроса
 *
 * Отпечаток - сигнал для обнаружения аномалий, а не фактор аутентификации.
 */
class IFingerprintProvider {
public:
    virtual ~IFingerprintProvider() = default;

    /**
     * @brief Детерминированно вычислить отпечаток
     * @return Отпечаток фиксированной длины или пустая строка, если выключено
     */
    virtual std::string compute(const domain::RequestMetadata& metadata) const = 0;
};

} // namespace session::ports::output
