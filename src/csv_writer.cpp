#include "csv_writer.hpp"

#include <stdexcept>
#include <utility>

namespace intcalc {

CsvWriter::CsvWriter(std::filesystem::path targetPath)
    : path(std::move(targetPath)), stream(path, std::ios::trunc) {
    if (!stream.is_open()) {
        throw std::runtime_error("Cannot open CSV file for writing: " + path.string());
    }
    stream << "line,expression,status,postfix,result,message\n";
}

std::string quoteCsv(const std::string& field) {
    std::string quoted;
    quoted.reserve(field.size() + 2);
    quoted.push_back('"');
    for (char ch : field) {
        if (ch == '"') {
            quoted.push_back('"');
        }
        quoted.push_back(ch);
    }
    quoted.push_back('"');
    return quoted;
}

void CsvWriter::writeRecord(const EvaluationRecord& record) {
    stream << record.lineNumber << ','
           << quoteCsv(record.expression) << ','
           << record.status << ','
           << quoteCsv(record.postfix) << ',';

    // Пустое поле, если значения нет
    if (record.value.has_value()) {
        stream << record.value.value();
    }
    stream << ',' << quoteCsv(record.message) << '\n';

    if (!stream) {
        throw std::runtime_error("Failed to write CSV file: " + path.string());
    }
}

void CsvWriter::write(const std::vector<EvaluationRecord>& records) {
    for (const auto& record : records) {
        writeRecord(record);
    }
    stream.flush();
}

} // namespace intcalc
