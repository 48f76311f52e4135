#include "diagnostic.hpp"

namespace intcalc {

namespace {
// Позиция для пользователя отсчитывается с единицы
std::string at(std::size_t column) {
    return " at position " + std::to_string(column + 1) + ".";
}

std::string quoted(char symbol) {
    return std::string("'") + symbol + "'";
}

std::string quoted(const std::string& symbol) {
    return "'" + symbol + "'";
}

// Символ, начинающийся с байта column: ведущий байт UTF-8 и следующие за ним
// байты продолжения (10xxxxxx)
std::string symbolAt(const std::string& text, std::size_t column) {
    std::size_t end = column + 1;
    if (static_cast<unsigned char>(text[column]) >= 0x80) {
        while (end < text.size() && (static_cast<unsigned char>(text[end]) & 0xC0) == 0x80) {
            ++end;
        }
    }
    return text.substr(column, end - column);
}
}

std::string caretLine(std::size_t position) {
    return std::string(position, ' ') + "^ ";
}

std::string render(const Diagnostic& diagnostic, const std::string& expression) {
    return expression + "\n" + caretLine(diagnostic.position) + diagnostic.message;
}

Diagnostic unexpectedSymbol(const std::string& text, std::size_t column) {
    return {"Unexpected symbol " + quoted(symbolAt(text, column)) + " found" + at(column), column};
}

// Два операнда подряд: указатель ставится на границу перед вторым операндом,
// а в сообщении указывается позиция самого второго операнда.
Diagnostic expectedOperator(std::size_t operandColumn) {
    std::size_t boundary = operandColumn > 0 ? operandColumn - 1 : 0;
    return {"Expected operator" + at(operandColumn), boundary};
}

Diagnostic expectedOperand(char symbol, std::size_t column) {
    return {"Expected operand, but found " + quoted(symbol) + at(column), column};
}

Diagnostic expectedOperatorFound(char symbol, std::size_t column) {
    return {"Expected operator, but found " + quoted(symbol) + at(column), column};
}

Diagnostic literalOutOfRange(const std::string& digits, std::size_t column) {
    return {"Integer literal '" + digits + "' is out of range" + at(column), column};
}

Diagnostic unmatchedClosing(std::size_t column) {
    return {"Unmatched ')' found" + at(column), column};
}

Diagnostic unmatchedOpening(std::size_t column) {
    return {"Unmatched '(' found" + at(column), column};
}

Diagnostic missingOperand(std::size_t length) {
    return {"Missing operand" + at(length), length};
}

} // namespace intcalc
