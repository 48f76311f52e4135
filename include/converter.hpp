#pragma once

#include <string>
#include <vector>

#include "token.hpp"

namespace intcalc {

// Перевод инфиксной записи в постфиксную (алгоритм сортировочной станции).
// Вход должен пройти проверку Validator.
class Converter {
public:
    // Возвращает токены в порядке вычисления: только числа и операторы
    std::vector<Token> toPostfix(const std::vector<Token>& infix) const;
};

// Текстовое представление постфиксной записи: токены через один пробел
std::string toString(const std::vector<Token>& postfix);

} // namespace intcalc
