#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace intcalc {

// Режим работы программы
enum class Mode {
    Evaluate, // Одно выражение из аргументов командной строки
    Batch,    // Файл с выражениями -> CSV
    Generate, // Генерация файла со случайными выражениями
    Usage     // Нечего выполнять: вывести справку
};

// Параметры запуска, полученные из командной строки
struct Options {
    Mode mode = Mode::Usage;
    std::string expression;              // Mode::Evaluate
    std::filesystem::path inputPath;     // Mode::Batch
    std::filesystem::path outputPath;    // Mode::Batch, Mode::Generate
    std::size_t threadCount = 0;         // Mode::Batch
    std::size_t expressionCount = 0;     // Mode::Generate
};

// Разбор аргументов:
//   intcalc <expression...>
//   intcalc batch <input.txt> [output.csv] [threads]
//   intcalc generate <count> [output.txt]
// Выбрасывает std::runtime_error при некорректных параметрах.
Options parseOptions(const std::vector<std::string>& args);

// Текст справки
std::string usage();

// Безопасный парсинг положительного числа из строки
std::size_t parseNumber(const std::string& value);

// Удаление пробельных символов по краям
std::string trim(const std::string& value);

// Количество потоков по умолчанию
std::size_t defaultThreadCount();

// Имя CSV по умолчанию: <имя входного файла>_results_<время>.csv рядом с входным
std::filesystem::path defaultOutputPath(const std::filesystem::path& inputPath);

} // namespace intcalc
