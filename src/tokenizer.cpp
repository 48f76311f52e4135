#include "tokenizer.hpp"

#include <cctype>
#include <charconv>
#include <system_error>
#include <utility>

#include "errors.hpp"
#include "operator_table.hpp"

namespace intcalc {

Tokenizer::Tokenizer(std::string sourceText) : source(std::move(sourceText)) {}

// Основной цикл разбора: проходит по строке и выделяет токены
std::vector<Token> Tokenizer::tokenize() {
    std::vector<Token> tokens;
    while (!isAtEnd()) {
        skipWhitespace();
        if (isAtEnd()) {
            break;
        }

        char ch = peek();
        if (std::isdigit(static_cast<unsigned char>(ch))) {
            tokens.push_back(makeNumber());
        } else if (ch == '(') {
            tokens.push_back({TokenType::LParen, 0, "(", index});
            advance();
        } else if (ch == ')') {
            tokens.push_back({TokenType::RParen, 0, ")", index});
            advance();
        } else if (isOperator(ch)) {
            tokens.push_back({TokenType::Operator, 0, std::string(1, ch), index});
            advance();
        } else {
            throw SyntaxError(source, unexpectedSymbol(source, index));
        }
    }
    return tokens;
}

bool Tokenizer::isAtEnd() const {
    return index >= source.size();
}

char Tokenizer::peek() const {
    return source[index];
}

char Tokenizer::advance() {
    return source[index++];
}

void Tokenizer::skipWhitespace() {
    while (!isAtEnd() && std::isspace(static_cast<unsigned char>(peek()))) {
        advance();
    }
}

// Разбор целочисленного литерала: вся последовательность цифр дает один токен
Token Tokenizer::makeNumber() {
    std::size_t start = index;
    while (!isAtEnd() && std::isdigit(static_cast<unsigned char>(peek()))) {
        advance();
    }

    Token token{TokenType::Number, 0, source.substr(start, index - start), start};
    const char* first = token.text.data();
    const char* last = first + token.text.size();
    auto result = std::from_chars(first, last, token.numericValue);
    if (result.ec == std::errc::result_out_of_range) {
        token.numericValue = 0;
        token.overflow = true;
    }
    return token;
}

} // namespace intcalc
