#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace intcalc {

// Типы токенов
enum class TokenType {
    Number,   // Целочисленный литерал
    Operator, // Бинарный оператор или маркер унарного минуса
    LParen,   // (
    RParen    // )
};

// Лексема выражения. Одна и та же последовательность токенов используется
// проверкой, преобразованием в постфиксную форму и вычислением.
struct Token {
    TokenType type;
    std::int64_t numericValue = 0; // Значение (только для Number)
    std::string text;              // Исходный текст токена
    std::size_t position = 0;      // Позиция первого символа (с нуля)
    bool overflow = false;         // Литерал не помещается в std::int64_t

    // Символ оператора или скобки
    char symbol() const { return text.empty() ? '\0' : text.front(); }
};

} // namespace intcalc
