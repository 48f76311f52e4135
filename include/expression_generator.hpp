// Генератор целочисленных выражений для тестирования.
// Поддерживает вложенные скобки, унарный минус и все бинарные операторы.
// С малой вероятностью вносит ошибки (незакрытые скобки, лишние символы).
//

#pragma once

#include <random>
#include <string>

namespace intcalc {

// Вероятность генерации ошибочного выражения (5%)
inline constexpr double kErrorProbability = 0.05;

class ExpressionGenerator {
public:
    explicit ExpressionGenerator(double errorProbability = kErrorProbability,
                                 unsigned seed = std::random_device{}())
        : gen(seed),
          errorProbability(errorProbability),
          number_dist(0, 20),
          divisor_dist(1, 9),
          exponent_dist(0, 3),
          op_dist(0, 5),
          roll_dist(0, 99),
          chance_dist(0.0, 1.0),
          error_type_dist(0, 2),
          char_dist(33, 126) {}

    // Одно выражение. depth: максимальная глубина вложенности операций.
    std::string generate(int depth) {
        std::string expression = build(depth);
        if (chance_dist(gen) < errorProbability) {
            expression = introduceError(expression);
        }
        return expression;
    }

private:
    std::mt19937 gen;
    double errorProbability;
    std::uniform_int_distribution<int> number_dist;
    std::uniform_int_distribution<int> divisor_dist;
    std::uniform_int_distribution<int> exponent_dist;
    std::uniform_int_distribution<int> op_dist;
    std::uniform_int_distribution<int> roll_dist;
    std::uniform_real_distribution<double> chance_dist;
    std::uniform_int_distribution<int> error_type_dist;
    std::uniform_int_distribution<int> char_dist;

    static constexpr char kOperations[] = {'+', '-', 'x', '/', '%', '^'};

    std::string build(int depth) {
        // На нулевой глубине или изредка (15%) просто число
        if (depth <= 0 || roll_dist(gen) < 15) {
            return maybeNegate(std::to_string(number_dist(gen)));
        }

        char op = kOperations[op_dist(gen)];
        std::string left = build(depth - 1);
        std::string right;
        if (op == '^') {
            // Маленькая неотрицательная степень, чтобы не выходить за int64
            right = std::to_string(exponent_dist(gen));
        } else if (op == '/' || op == '%') {
            // Изредка делитель равен нулю (ошибка вычисления)
            right = chance_dist(gen) < errorProbability ? "0" : std::to_string(divisor_dist(gen));
        } else {
            right = build(depth - 1);
        }

        std::string result = left + " " + op + " " + right;

        // Скобки в половине случаев, чтобы проверялись и приоритеты операторов
        if (roll_dist(gen) < 50) {
            return maybeNegate("(" + result + ")");
        }
        return result;
    }

    // Унарный минус перед операндом (10%)
    std::string maybeNegate(const std::string& operand) {
        return roll_dist(gen) < 10 ? "-" + operand : operand;
    }

    std::string introduceError(const std::string& expr) {
        std::string result = expr;
        switch (error_type_dist(gen)) {
        case 0: // Незакрытая скобка: убираем последнюю ")"
        {
            std::size_t pos = result.rfind(')');
            if (pos != std::string::npos) {
                result.erase(pos, 1);
                return result;
            }
            return "(" + result;
        }
        case 1: // Лишний символ в середине выражения
            result.insert(result.size() / 2, 1, static_cast<char>(char_dist(gen)));
            return result;
        default: // Лишняя открывающая скобка в случайном месте
        {
            std::uniform_int_distribution<std::size_t> pos_dist(0, result.size());
            result.insert(pos_dist(gen), "(");
            return result;
        }
        }
    }
};

} // namespace intcalc
