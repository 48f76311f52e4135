#pragma once

#include <iosfwd>
#include <string>

// ANSI цветовые коды для форматирования вывода в терминал
namespace Color {
    constexpr const char* RESET = "\033[0m";
    constexpr const char* BOLD = "\033[1m";
    constexpr const char* RED = "\033[31m";
    constexpr const char* GREEN = "\033[32m";
    constexpr const char* YELLOW = "\033[33m";
    constexpr const char* MAGENTA = "\033[35m";
    constexpr const char* CYAN = "\033[36m";
}

namespace intcalc {

// Вывод заголовка программы (пакетный режим и режим генерации)
void printHeader();

// "✗ Error: <message>" красным в std::cerr
void printError(const std::string& message);

// "✓ <message>" зелёным в std::cout
void printSuccess(const std::string& message);

} // namespace intcalc
