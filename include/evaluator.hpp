#pragma once

#include <cstdint>
#include <vector>

#include "token.hpp"

namespace intcalc {

// Стековая машина для вычисления постфиксной записи.
// Вход: результат Converter::toPostfix.
class PostfixEvaluator {
public:
    PostfixEvaluator() = default;

    // Выбрасывает EvaluationError при делении на ноль, 0^0 и переполнении.
    // Некорректная последовательность токенов: std::logic_error.
    std::int64_t evaluate(const std::vector<Token>& postfix) const;
};

// Целочисленная арифметика с проверкой переполнения
std::int64_t applyOperator(char op, std::int64_t left, std::int64_t right);
std::int64_t negate(std::int64_t value);

} // namespace intcalc
