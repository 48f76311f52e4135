#include "evaluator.hpp"

#include <limits>
#include <stdexcept>
#include <string>

#include "errors.hpp"
#include "operator_table.hpp"
#include "stack.hpp"

namespace intcalc {

namespace {
constexpr std::int64_t kMax = std::numeric_limits<std::int64_t>::max();
constexpr std::int64_t kMin = std::numeric_limits<std::int64_t>::min();

const char* const kDivisionByZero = "Cannot evaluate expression, division by zero.";
const char* const kZeroPowerZero = "Cannot evaluate expression, 0^0 is undefined.";
const char* const kOverflow = "Cannot evaluate expression, integer overflow.";

std::int64_t add(std::int64_t left, std::int64_t right) {
    if ((right > 0 && left > kMax - right) || (right < 0 && left < kMin - right)) {
        throw EvaluationError(kOverflow);
    }
    return left + right;
}

std::int64_t subtract(std::int64_t left, std::int64_t right) {
    if ((right < 0 && left > kMax + right) || (right > 0 && left < kMin + right)) {
        throw EvaluationError(kOverflow);
    }
    return left - right;
}

std::int64_t multiply(std::int64_t left, std::int64_t right) {
    if (left == 0 || right == 0) {
        return 0;
    }
    bool overflow;
    if (left > 0) {
        overflow = right > 0 ? left > kMax / right : right < kMin / left;
    } else {
        overflow = right > 0 ? left < kMin / right : right < kMax / left;
    }
    if (overflow) {
        throw EvaluationError(kOverflow);
    }
    return left * right;
}

// Деление в C++ отбрасывает дробную часть (округление к нулю)
std::int64_t divide(std::int64_t left, std::int64_t right) {
    if (right == 0) {
        throw EvaluationError(kDivisionByZero);
    }
    if (left == kMin && right == -1) {
        throw EvaluationError(kOverflow);
    }
    return left / right;
}

// Остаток согласован с делением: знак совпадает со знаком делимого
std::int64_t modulo(std::int64_t left, std::int64_t right) {
    if (right == 0) {
        throw EvaluationError(kDivisionByZero);
    }
    if (right == -1) {
        return 0; // kMin % -1 не определён в C++
    }
    return left % right;
}

// Возведение в степень быстрым умножением.
// Отрицательная степень даёт точный результат, округлённый к нулю.
std::int64_t power(std::int64_t base, std::int64_t exponent) {
    if (base == 0 && exponent == 0) {
        throw EvaluationError(kZeroPowerZero);
    }
    if (exponent < 0) {
        if (base == 0) {
            throw EvaluationError(kDivisionByZero);
        }
        if (base == 1) {
            return 1;
        }
        if (base == -1) {
            return exponent % 2 == 0 ? 1 : -1;
        }
        return 0;
    }

    std::int64_t result = 1;
    while (exponent > 0) {
        if (exponent & 1) {
            result = multiply(result, base);
        }
        exponent >>= 1;
        if (exponent > 0) {
            base = multiply(base, base);
        }
    }
    return result;
}
}

std::int64_t negate(std::int64_t value) {
    if (value == kMin) {
        throw EvaluationError(kOverflow);
    }
    return -value;
}

std::int64_t applyOperator(char op, std::int64_t left, std::int64_t right) {
    switch (op) {
    case '+':
        return add(left, right);
    case '-':
        return subtract(left, right);
    case 'x':
        return multiply(left, right);
    case '/':
        return divide(left, right);
    case '%':
        return modulo(left, right);
    case '^':
        return power(left, right);
    default:
        throw std::logic_error(std::string("Unknown binary operator '") + op + "'");
    }
}

std::int64_t PostfixEvaluator::evaluate(const std::vector<Token>& postfix) const {
    Stack<std::int64_t> values;

    for (const Token& token : postfix) {
        if (token.type == TokenType::Number) {
            values.push(token.numericValue);
        } else if (token.type == TokenType::Operator && isUnaryOperator(token.symbol())) {
            values.push(negate(values.pop()));
        } else if (token.type == TokenType::Operator) {
            // Последнее помещённое значение является правым операндом
            std::int64_t right = values.pop();
            std::int64_t left = values.pop();
            values.push(applyOperator(token.symbol(), left, right));
        } else {
            throw std::logic_error("Parenthesis in postfix expression");
        }
    }

    std::int64_t result = values.pop();
    if (!values.isEmpty()) {
        throw std::logic_error("Malformed postfix expression");
    }
    return result;
}

} // namespace intcalc
