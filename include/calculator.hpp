#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "token.hpp"

namespace intcalc {

// Класс-фасад для вычисления целочисленных выражений.
// Объединяет этапы нормализации, токенизации, проверки, перевода в
// постфиксную запись и вычисления. Не хранит состояния, поэтому один объект
// можно использовать из нескольких потоков.
class Calculator {
public:
    Calculator() = default;

    // Этапы 1-4: возвращает выражение в постфиксной записи.
    // Выбрасывает SyntaxError с позицией первой ошибки.
    std::vector<Token> compile(const std::string& expression) const;

    // Этап 5: вычисление постфиксной записи. Выбрасывает EvaluationError.
    std::int64_t evaluate(const std::vector<Token>& postfix) const;

    // Полный цикл. Пример: "(2 x 3) ^ 2" -> 36
    std::int64_t evaluate(const std::string& expression) const;
};

} // namespace intcalc
