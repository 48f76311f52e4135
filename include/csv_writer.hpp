#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <vector>

namespace intcalc {

// Результат вычисления одной строки входного файла
struct EvaluationRecord {
    std::size_t lineNumber = 0;        // Номер строки в исходном файле
    std::string expression;            // Исходный текст выражения
    std::string postfix;               // Постфиксная запись (если разбор успешен)
    std::optional<std::int64_t> value; // Результат (если вычисление успешно)
    std::string status;                // success или error
    std::string message;               // Сообщение об ошибке

    bool succeeded() const { return status == "success"; }
};

// Запись результатов в формате CSV.
// Формат: line,expression,status,postfix,result,message
class CsvWriter {
public:
    // Открывает файл для записи (перезаписывая его) и пишет заголовок
    explicit CsvWriter(std::filesystem::path targetPath);

    // Записывает пакет результатов
    void write(const std::vector<EvaluationRecord>& records);

    // Записывает один результат (для потоковой записи)
    void writeRecord(const EvaluationRecord& record);

    const std::filesystem::path& target() const { return path; }

private:
    std::filesystem::path path;
    std::ofstream stream;
};

// Экранирование поля CSV: значение в кавычках, внутренние кавычки удваиваются
std::string quoteCsv(const std::string& field);

} // namespace intcalc
