#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include "diagnostic.hpp"
#include "token.hpp"

namespace intcalc {

// Проверка корректности структуры выражения за один проход по токенам:
// чередование операндов и операторов, парность скобок.
// Предполагается, что каждый символ по отдельности уже допустим.
class Validator {
public:
    // length: длина исходной строки, нужна для сообщения о пропущенном операнде
    Validator(const std::vector<Token>& tokens, std::size_t length);

    // true, если выражение корректно. Иначе diagnostic() содержит первую ошибку.
    bool validate();

    const std::optional<Diagnostic>& diagnostic() const { return error; }

private:
    const std::vector<Token>& tokens;
    std::size_t length;
    std::optional<Diagnostic> error;

    bool fail(Diagnostic diagnostic);
};

} // namespace intcalc
