#pragma once

#include <iosfwd>
#include <string>

#include "options.hpp"

namespace intcalc {

// Одно выражение. На успех печатает постфиксную запись и результат в out,
// ошибки в err. Возвращает код завершения процесса (0 при успехе).
int runEvaluateMode(const std::string& expression, std::ostream& out, std::ostream& err);

// Пакетная обработка файла выражений с записью результатов в CSV
int runBatchMode(const Options& options);

// Генерация файла со случайными выражениями
int runGenerateMode(const Options& options);

} // namespace intcalc
