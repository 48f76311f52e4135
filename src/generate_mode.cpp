#include "modes.hpp"
#include "console.hpp"
#include "expression_generator.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace intcalc {

int runGenerateMode(const Options& options) {
    printHeader();

    std::cout << Color::BOLD << Color::CYAN << "Expression generation mode\n" << Color::RESET << "\n";

    const std::filesystem::path& outputPath = options.outputPath;
    std::cout << Color::BOLD << "Generating " << options.expressionCount << " expressions..."
        << Color::RESET << std::flush;
    auto start = std::chrono::steady_clock::now();

    std::ofstream output(outputPath);
    if (!output.is_open()) {
        throw std::runtime_error("Cannot create file: " + outputPath.string());
    }

    ExpressionGenerator generator;
    for (std::size_t i = 0; i < options.expressionCount; ++i) {
        // Глубина от 2 до 6
        int depth = 2 + static_cast<int>(i % 5);
        output << generator.generate(depth) << "\n";
    }

    output.close();
    if (!output) {
        throw std::runtime_error("Failed to write file: " + outputPath.string());
    }

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    std::cout << " " << Color::GREEN << "✓" << Color::RESET << " (" << duration.count() << " ms)\n\n";

    printSuccess("File created: " + outputPath.string());
    return 0;
}

} // namespace intcalc
