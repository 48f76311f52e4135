#include "converter.hpp"

#include "operator_table.hpp"
#include "stack.hpp"

namespace intcalc {

namespace {
// Нужно ли вытолкнуть оператор с вершины стека перед помещением incoming.
// Для правоассоциативных операторов сравнение строгое.
bool shouldPop(const Token& top, char incoming) {
    if (top.type != TokenType::Operator) {
        return false; // "(" останавливает выталкивание
    }
    int topPrecedence = precedence(top.symbol());
    int incomingPrecedence = precedence(incoming);
    if (isRightAssociative(incoming)) {
        return topPrecedence > incomingPrecedence;
    }
    return topPrecedence >= incomingPrecedence;
}
}

std::vector<Token> Converter::toPostfix(const std::vector<Token>& infix) const {
    std::vector<Token> output;
    output.reserve(infix.size());
    Stack<Token> operators;

    for (const Token& token : infix) {
        switch (token.type) {
        case TokenType::Number:
            output.push_back(token);
            break;

        case TokenType::LParen:
            operators.push(token);
            break;

        case TokenType::RParen:
            while (operators.peek().type != TokenType::LParen) {
                output.push_back(operators.pop());
            }
            operators.pop(); // Сама "(" в результат не попадает
            break;

        case TokenType::Operator:
            // Унарный минус всегда стоит непосредственно перед своим операндом,
            // поэтому кладётся в стек без сравнения приоритетов
            if (!isUnaryOperator(token.symbol())) {
                while (!operators.isEmpty() && shouldPop(operators.peek(), token.symbol())) {
                    output.push_back(operators.pop());
                }
            }
            operators.push(token);
            break;
        }
    }

    while (!operators.isEmpty()) {
        output.push_back(operators.pop());
    }
    return output;
}

std::string toString(const std::vector<Token>& postfix) {
    std::string result;
    for (const Token& token : postfix) {
        if (!result.empty()) {
            result.push_back(' ');
        }
        result.append(token.text);
    }
    return result;
}

} // namespace intcalc
