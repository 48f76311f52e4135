#include "expression.hpp"

#include <cctype>
#include <utility>

#include "operator_table.hpp"

namespace intcalc {

Expression::Expression(std::string text) : originalText(std::move(text)) {
    normalize();
}

bool Expression::isValidSymbol(char symbol) {
    return std::isdigit(static_cast<unsigned char>(symbol)) || isBinaryOperator(symbol) ||
           symbol == '(' || symbol == ')';
}

bool Expression::isWhitespace(char symbol) {
    return symbol == ' ' || symbol == '\t' || symbol == '\n' || symbol == '\r';
}

// Один проход слева направо. Минус, стоящий там, где ожидается операнд
// (в начале, после "(" или после другого оператора), становится унарным.
// Проверяется только допустимость отдельных символов; структура выражения
// проверяется позже в Validator.
void Expression::normalize() {
    normalizedText.reserve(originalText.size());
    bool operandExpected = true;

    for (std::size_t i = 0; i < originalText.size(); ++i) {
        char symbol = originalText[i];
        if (isWhitespace(symbol)) {
            normalizedText.push_back(symbol);
            continue;
        }

        // Запоминаем только первую ошибку, но строку дочитываем до конца
        if (!isValidSymbol(symbol) && !error) {
            error = unexpectedSymbol(originalText, i);
        }

        if (symbol == '-' && operandExpected) {
            normalizedText.push_back(kUnaryMinus);
        } else {
            normalizedText.push_back(symbol);
        }
        operandExpected = symbol == '(' || isOperator(symbol);
    }
}

} // namespace intcalc
