#pragma once

#include <cstddef>
#include <string>

namespace intcalc {

// Сообщение об ошибке, привязанное к позиции в исходном выражении.
// position отсчитывается с нуля и указывает, под каким символом ставится "^".
struct Diagnostic {
    std::string message;
    std::size_t position = 0;
};

// Строка из пробелов и символа "^", указывающего на ошибочную позицию
std::string caretLine(std::size_t position);

// Две строки: исходное выражение и указатель с сообщением под ним
std::string render(const Diagnostic& diagnostic, const std::string& expression);

// Фабрики стандартных сообщений. column отсчитывается с нуля.
// Символ берётся из text по байтовой позиции column; многобайтовый символ
// UTF-8 цитируется целиком.
Diagnostic unexpectedSymbol(const std::string& text, std::size_t column);
Diagnostic expectedOperator(std::size_t operandColumn);
Diagnostic expectedOperand(char symbol, std::size_t column);
Diagnostic expectedOperatorFound(char symbol, std::size_t column);
Diagnostic literalOutOfRange(const std::string& digits, std::size_t column);
Diagnostic unmatchedClosing(std::size_t column);
Diagnostic unmatchedOpening(std::size_t column);
Diagnostic missingOperand(std::size_t length);

} // namespace intcalc
