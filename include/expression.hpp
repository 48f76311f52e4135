#pragma once

#include <optional>
#include <string>

#include "diagnostic.hpp"

namespace intcalc {

// Выражение в двух формах: исходной (как ввёл пользователь) и нормализованной,
// в которой каждый унарный минус заменён маркером '~'. Обе строки имеют
// одинаковую длину, поэтому позиции ошибок совпадают в обеих формах.
// Объект неизменяем после создания.
class Expression {
public:
    explicit Expression(std::string text);

    const std::string& original() const { return originalText; }
    const std::string& normalized() const { return normalizedText; }

    // Первая найденная ошибка: недопустимый символ
    const std::optional<Diagnostic>& diagnostic() const { return error; }

    bool isValid() const { return !error.has_value(); }

    // Допустимые символы выражения: цифры, операторы, скобки
    static bool isValidSymbol(char symbol);
    static bool isWhitespace(char symbol);

private:
    std::string originalText;
    std::string normalizedText;
    std::optional<Diagnostic> error;

    void normalize();
};

} // namespace intcalc
