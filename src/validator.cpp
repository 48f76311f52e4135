#include "validator.hpp"

#include <utility>

#include "operator_table.hpp"
#include "stack.hpp"

namespace intcalc {

Validator::Validator(const std::vector<Token>& tokens, std::size_t length)
    : tokens(tokens), length(length) {}

bool Validator::fail(Diagnostic diagnostic) {
    error = std::move(diagnostic);
    return false;
}

// Состояние "ожидается операнд" истинно в начале, после "(" и после любого
// оператора. Законченный операнд (число или закрытая группа) сбрасывает его.
// Первая же найденная ошибка прерывает проверку.
bool Validator::validate() {
    error.reset();
    Stack<std::size_t> openParens; // Позиции незакрытых "("
    bool operandExpected = true;

    for (const Token& token : tokens) {
        switch (token.type) {
        case TokenType::Number:
            if (!operandExpected) {
                return fail(expectedOperator(token.position));
            }
            if (token.overflow) {
                return fail(literalOutOfRange(token.text, token.position));
            }
            operandExpected = false;
            break;

        case TokenType::LParen:
            if (!operandExpected) {
                return fail(expectedOperatorFound(token.symbol(), token.position));
            }
            openParens.push(token.position);
            break;

        case TokenType::RParen:
            if (operandExpected) {
                return fail(expectedOperand(token.symbol(), token.position));
            }
            if (openParens.isEmpty()) {
                return fail(unmatchedClosing(token.position));
            }
            openParens.pop();
            break;

        case TokenType::Operator:
            if (isUnaryOperator(token.symbol())) {
                if (!operandExpected) {
                    return fail(expectedOperatorFound(token.symbol(), token.position));
                }
            } else {
                if (operandExpected) {
                    return fail(expectedOperand(token.symbol(), token.position));
                }
                operandExpected = true;
            }
            break;
        }
    }

    if (operandExpected) {
        return fail(missingOperand(length));
    }
    // Сообщаем о самой внутренней незакрытой скобке
    if (!openParens.isEmpty()) {
        return fail(unmatchedOpening(openParens.peek()));
    }
    return true;
}

} // namespace intcalc
