#pragma once

#include <string>
#include <vector>

#include "token.hpp"

namespace intcalc {

// Класс лексического анализатора (лексера)
// Преобразует нормализованную строку выражения в последовательность токенов.
// Игнорирует пробельные символы.
class Tokenizer {
public:
    // Конструктор принимает нормализованную строку выражения
    explicit Tokenizer(std::string sourceText);

    // Основной метод запуска токенизации
    // Выбрасывает SyntaxError при обнаружении неизвестных символов
    std::vector<Token> tokenize();

private:
    const std::string source; // Исходная строка
    std::size_t index = 0;    // Текущая позиция чтения

    // Проверка достижения конца строки
    bool isAtEnd() const;

    // Возвращает текущий символ без продвижения вперед
    char peek() const;

    // Возвращает текущий символ и сдвигает указатель вперед
    char advance();

    // Пропускает пробелы, табуляции и переводы строк
    void skipWhitespace();

    // Считывает целое число. Переполнение отмечается в токене, а не выбрасывается,
    // чтобы ошибка была сообщена в порядке просмотра выражения.
    Token makeNumber();
};

} // namespace intcalc
