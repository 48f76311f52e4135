#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

namespace intcalc {

// Быстрый подсчет количества строк в файле
// Читает файл блоками и считает символы новой строки
std::size_t countLinesInFile(const std::filesystem::path& path);

// Текущее время в формате для имени файла: YYYYmmdd_HHMMSS
std::string getCurrentTimeString();

} // namespace intcalc
