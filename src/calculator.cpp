#include "calculator.hpp"

#include "converter.hpp"
#include "errors.hpp"
#include "evaluator.hpp"
#include "expression.hpp"
#include "tokenizer.hpp"
#include "validator.hpp"

namespace intcalc {

// Полный цикл обработки выражения до постфиксной записи:
// 1. Нормализация (Expression) -> унарные минусы заменены на '~'
// 2. Токенизация (Tokenizer)
// 3. Проверка структуры (Validator)
// 4. Перевод в постфиксную запись (Converter)
std::vector<Token> Calculator::compile(const std::string& text) const {
    // Этап 1: ошибки отдельных символов
    Expression expression(text);
    if (const auto& diagnostic = expression.diagnostic()) {
        throw SyntaxError(expression.original(), *diagnostic);
    }

    // Этап 2: лексический анализ нормализованной строки
    Tokenizer tokenizer(expression.normalized());
    auto tokens = tokenizer.tokenize();

    // Этап 3: структура выражения
    Validator validator(tokens, expression.normalized().size());
    if (!validator.validate()) {
        throw SyntaxError(expression.original(), *validator.diagnostic());
    }

    // Этап 4: сортировочная станция
    Converter converter;
    return converter.toPostfix(tokens);
}

std::int64_t Calculator::evaluate(const std::vector<Token>& postfix) const {
    PostfixEvaluator evaluator;
    return evaluator.evaluate(postfix);
}

std::int64_t Calculator::evaluate(const std::string& expression) const {
    return evaluate(compile(expression));
}

} // namespace intcalc
