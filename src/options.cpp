#include "options.hpp"
#include "file_utils.hpp"

#include <cctype>
#include <stdexcept>
#include <thread>

namespace intcalc {

std::size_t parseNumber(const std::string& value) {
    std::string text = trim(value);
    if (text.empty()) {
        throw std::runtime_error("Invalid numeric value: empty string");
    }
    for (char ch : text) {
        if (!std::isdigit(static_cast<unsigned char>(ch))) {
            throw std::runtime_error("Invalid numeric value: " + value);
        }
    }
    std::size_t result = 0;
    try {
        result = std::stoul(text);
    }
    catch (const std::out_of_range&) {
        throw std::runtime_error("Numeric value is too large: " + value);
    }
    if (result == 0) {
        throw std::runtime_error("Numeric value must be positive: " + value);
    }
    return result;
}

std::string trim(const std::string& value) {
    const char* whitespace = " \t\n\r\f\v";
    std::size_t first = value.find_first_not_of(whitespace);
    if (first == std::string::npos) {
        return {};
    }
    std::size_t last = value.find_last_not_of(whitespace);
    return value.substr(first, last - first + 1);
}

std::size_t defaultThreadCount() {
    std::size_t threads = std::thread::hardware_concurrency();
    return threads == 0 ? 2 : threads; // Резервное значение
}

std::filesystem::path defaultOutputPath(const std::filesystem::path& inputPath) {
    std::string name = inputPath.stem().string() + "_results_" + getCurrentTimeString() + ".csv";
    return inputPath.parent_path() / name;
}

std::string usage() {
    return "Usage: intcalc <expression>\n"
           "       intcalc batch <input.txt> [output.csv] [threads]\n"
           "       intcalc generate <count> [output.txt]";
}

Options parseOptions(const std::vector<std::string>& args) {
    Options options;
    if (args.empty()) {
        return options;
    }

    if (args[0] == "batch") {
        if (args.size() < 2 || args.size() > 4) {
            throw std::runtime_error("batch expects <input.txt> [output.csv] [threads]");
        }
        options.mode = Mode::Batch;
        options.inputPath = args[1];
        options.outputPath = args.size() >= 3 ? std::filesystem::path(args[2])
                                              : defaultOutputPath(options.inputPath);
        if (options.outputPath.extension() != ".csv") {
            options.outputPath.replace_extension(".csv");
        }
        options.threadCount = args.size() == 4 ? parseNumber(args[3]) : defaultThreadCount();
        return options;
    }

    if (args[0] == "generate") {
        if (args.size() < 2 || args.size() > 3) {
            throw std::runtime_error("generate expects <count> [output.txt]");
        }
        options.mode = Mode::Generate;
        options.expressionCount = parseNumber(args[1]);
        options.outputPath = args.size() == 3
            ? std::filesystem::path(args[2])
            : std::filesystem::path("generate_" + std::to_string(options.expressionCount) + ".txt");
        return options;
    }

    // Все аргументы склеиваются без разделителя и обрезаются по краям
    std::string expression;
    for (const auto& arg : args) {
        expression += arg;
    }
    options.expression = trim(expression);
    if (!options.expression.empty()) {
        options.mode = Mode::Evaluate;
    }
    return options;
}

} // namespace intcalc
