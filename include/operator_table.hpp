#pragma once

#include <array>

namespace intcalc {

// Маркер унарного минуса во внутреннем (нормализованном) представлении
inline constexpr char kUnaryMinus = '~';

enum class Associativity { Left, Right };

enum class Arity { Unary, Binary };

// Описание оператора: символ, приоритет, ассоциативность и арность
struct OperatorInfo {
    char symbol;
    int precedence;
    Associativity associativity;
    Arity arity;
};

// Таблица операторов. Чем выше приоритет, тем раньше выполняется операция.
inline constexpr std::array<OperatorInfo, 7> kOperators = {{
    {kUnaryMinus, 4, Associativity::Right, Arity::Unary},
    {'^', 3, Associativity::Right, Arity::Binary},
    {'x', 2, Associativity::Left, Arity::Binary},
    {'/', 2, Associativity::Left, Arity::Binary},
    {'%', 2, Associativity::Left, Arity::Binary},
    {'+', 1, Associativity::Left, Arity::Binary},
    {'-', 1, Associativity::Left, Arity::Binary},
}};

// Поиск оператора в таблице. Возвращает nullptr, если символ не оператор.
constexpr const OperatorInfo* findOperator(char symbol) {
    for (const auto& info : kOperators) {
        if (info.symbol == symbol) {
            return &info;
        }
    }
    return nullptr;
}

constexpr bool isOperator(char symbol) {
    return findOperator(symbol) != nullptr;
}

constexpr bool isBinaryOperator(char symbol) {
    const OperatorInfo* info = findOperator(symbol);
    return info != nullptr && info->arity == Arity::Binary;
}

constexpr bool isUnaryOperator(char symbol) {
    const OperatorInfo* info = findOperator(symbol);
    return info != nullptr && info->arity == Arity::Unary;
}

// Приоритет оператора или -1 для любого другого символа
constexpr int precedence(char symbol) {
    const OperatorInfo* info = findOperator(symbol);
    return info != nullptr ? info->precedence : -1;
}

constexpr bool isRightAssociative(char symbol) {
    const OperatorInfo* info = findOperator(symbol);
    return info != nullptr && info->associativity == Associativity::Right;
}

} // namespace intcalc
