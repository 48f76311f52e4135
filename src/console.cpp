#include "console.hpp"

#include <iostream>

namespace intcalc {

void printHeader() {
    std::cout << Color::BOLD << Color::CYAN;
    std::cout << "\n╔═══════════════════════════════════════════════════════════╗\n";
    std::cout << "║          Integer expression calculator v1.0              ║\n";
    std::cout << "╚═══════════════════════════════════════════════════════════╝\n";
    std::cout << Color::RESET << "\n";
}

void printError(const std::string& message) {
    std::cerr << "\n" << Color::RED << Color::BOLD << "✗ Error: "
        << Color::RESET << Color::RED << message << Color::RESET << "\n\n";
}

void printSuccess(const std::string& message) {
    std::cout << Color::GREEN << "✓ " << message << Color::RESET << "\n";
}

} // namespace intcalc
