#pragma once

#include "calculator.hpp"
#include "csv_writer.hpp"
#include "thread_pool.hpp"

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <future>
#include <stdexcept>
#include <string>
#include <vector>

namespace intcalc {

// Вычисление одной строки входного файла.
// Исключения не выбрасываются: ошибка записывается в результат.
EvaluationRecord evaluateLine(const Calculator& calculator, std::size_t lineNumber,
                              const std::string& text);

// Потоковое чтение файла: каждая строка сразу отправляется в пул потоков.
// Результаты собираются пакетами по batchSize в порядке строк и передаются
// в processBatch, поэтому файл любого размера не загружается в память целиком.
template <typename ProcessBatch>
void processExpressionsStreaming(
    const std::filesystem::path& path,
    const Calculator& calculator,
    ThreadPool& pool,
    std::atomic<std::size_t>& completed,
    ProcessBatch&& processBatch,
    std::size_t batchSize = 1000) {

    std::ifstream input(path);
    if (!input.is_open()) {
        throw std::runtime_error("Cannot open input file: " + path.string());
    }

    std::vector<std::future<EvaluationRecord>> futures;
    futures.reserve(batchSize);

    // Futures забираются в порядке постановки, поэтому пакет уже упорядочен
    auto flush = [&]() {
        if (futures.empty()) {
            return;
        }
        std::vector<EvaluationRecord> batch;
        batch.reserve(futures.size());
        for (auto& future : futures) {
            batch.push_back(future.get());
        }
        processBatch(batch);
        futures.clear();
    };

    std::string line;
    std::size_t lineNumber = 0;
    while (std::getline(input, line)) {
        ++lineNumber;
        futures.emplace_back(pool.submit(
            [&calculator, &completed, lineNumber, text = std::move(line)]() {
                EvaluationRecord record = evaluateLine(calculator, lineNumber, text);
                completed.fetch_add(1);
                return record;
            }));

        if (futures.size() >= batchSize) {
            flush();
        }
    }
    flush();
}

} // namespace intcalc
