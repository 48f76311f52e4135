#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <vector>

#include "expression.hpp"
#include "tokenizer.hpp"
#include "validator.hpp"

namespace {

// Прогон нормализации, токенизации и проверки. Пустой результат: выражение корректно.
std::optional<intcalc::Diagnostic> validate(const std::string& text) {
    intcalc::Expression expression(text);
    std::vector<intcalc::Token> tokens = intcalc::Tokenizer(expression.normalized()).tokenize();
    intcalc::Validator validator(tokens, expression.normalized().size());
    bool valid = validator.validate();
    EXPECT_EQ(valid, !validator.diagnostic().has_value());
    return validator.diagnostic();
}

void expectError(const std::string& text, const std::string& message, std::size_t position) {
    auto diagnostic = validate(text);
    ASSERT_TRUE(diagnostic.has_value()) << text;
    EXPECT_EQ(diagnostic->message, message) << text;
    EXPECT_EQ(diagnostic->position, position) << text;
}

} // namespace

TEST(ValidatorTest, AcceptsWellFormedExpressions) {
    const std::vector<std::string> inputs = {
        "1", "(2 x 3) ^ 2", "-5 + 3", "--5", "2 - - 3", "-(-(2))",
        "((1 + 2) x (3 - 4)) / 5 % 6", "2^3^2", "  42  "};
    for (const auto& input : inputs) {
        EXPECT_FALSE(validate(input).has_value()) << input;
    }
}

TEST(ValidatorTest, TwoOperandsWithoutOperator) {
    expectError("2 3", "Expected operator at position 3.", 1);
    expectError("(1)2", "Expected operator at position 4.", 2);
    expectError("12 345", "Expected operator at position 4.", 2);
}

TEST(ValidatorTest, OperatorWhereOperandExpected) {
    expectError("+ 2", "Expected operand, but found '+' at position 1.", 0);
    expectError("2 + x 3", "Expected operand, but found 'x' at position 5.", 4);
    expectError("(^1)", "Expected operand, but found '^' at position 2.", 1);
}

TEST(ValidatorTest, ClosingParenWhereOperandExpected) {
    expectError("()", "Expected operand, but found ')' at position 2.", 1);
    expectError("(1 + )", "Expected operand, but found ')' at position 6.", 5);
}

TEST(ValidatorTest, OpenParenWhereOperatorExpected) {
    expectError("2 (3)", "Expected operator, but found '(' at position 3.", 2);
}

TEST(ValidatorTest, UnmatchedClosingParen) {
    expectError("2 + 3)", "Unmatched ')' found at position 6.", 5);
    expectError("(1)) + 2", "Unmatched ')' found at position 4.", 3);
}

TEST(ValidatorTest, MissingOperandAtEnd) {
    expectError("2 +", "Missing operand at position 4.", 3);
    expectError("", "Missing operand at position 1.", 0);
    expectError("-", "Missing operand at position 2.", 1);
    expectError("(", "Missing operand at position 2.", 1);
}

TEST(ValidatorTest, UnmatchedOpeningParenReportsInnermost) {
    expectError("(1 + 2", "Unmatched '(' found at position 1.", 0);
    expectError("1 + (2", "Unmatched '(' found at position 5.", 4);
    expectError("((1 + 2) x (3", "Unmatched '(' found at position 12.", 11);
    expectError("((1 + 2) x 3", "Unmatched '(' found at position 1.", 0);
}

TEST(ValidatorTest, SingleUnmatchedParenAtAnyOperandColumn) {
    const std::string base = "1 + 22 x 3";
    for (std::size_t column : {0u, 4u, 9u}) {
        std::string text = base;
        text.insert(column, "(");
        expectError(text, "Unmatched '(' found at position " + std::to_string(column + 1) + ".",
                    column);
    }
}

TEST(ValidatorTest, LiteralOutOfRange) {
    expectError("99999999999999999999 + 1",
                "Integer literal '99999999999999999999' is out of range at position 1.", 0);
}

TEST(ValidatorTest, FirstViolationWins) {
    // Дальше есть и пропущенный операнд, и незакрытая скобка
    expectError("(2 3 +", "Expected operator at position 4.", 2);
    expectError(") (", "Expected operand, but found ')' at position 1.", 0);
}
