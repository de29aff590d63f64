#pragma once

#include <string>

namespace session::ports::output {

/**
 * @brief Генератор session-токенов
 */
class ITokenGenerator {
public:
    virtual ~ITokenGenerator() = default;

    /**
     * @brief Сгенерировать новый непредсказуемый токен
     * @return Токен или пустая строка при отказе источника энтропии
     */
    virtual std::string generate() = 0;
};

} // namespace session::ports::output
