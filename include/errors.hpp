#pragma once

#include <stdexcept>
#include <string>
#include <utility>

#include "diagnostic.hpp"

namespace intcalc {

// Синтаксическая ошибка: некорректный символ или нарушение структуры выражения.
// Хранит исходный текст, чтобы можно было вывести указатель на позицию ошибки.
class SyntaxError : public std::runtime_error {
public:
    SyntaxError(std::string expression, Diagnostic diagnostic)
        : std::runtime_error(diagnostic.message),
          expressionText(std::move(expression)),
          info(std::move(diagnostic)) {}

    const Diagnostic& diagnostic() const { return info; }
    const std::string& expression() const { return expressionText; }

    // Исходное выражение и строка с указателем "^" и сообщением
    std::string render() const { return intcalc::render(info, expressionText); }

private:
    std::string expressionText;
    Diagnostic info;
};

// Ошибка вычисления: деление на ноль, 0^0, переполнение
class EvaluationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace intcalc
