#include "modes.hpp"
#include "calculator.hpp"
#include "console.hpp"
#include "csv_writer.hpp"
#include "expression_processor.hpp"
#include "file_utils.hpp"
#include "progress_bar.hpp"
#include "thread_pool.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>
#include <stdexcept>
#include <thread>
#include <vector>

namespace intcalc {

namespace {
// Поток прогресс-бара останавливается и при нормальном завершении, и при ошибке
class ProgressThread {
public:
    ProgressThread(const std::atomic<std::size_t>& completed, std::size_t total)
        : worker(displayProgress, std::cref(completed), total, std::cref(stop)) {}

    ~ProgressThread() {
        stop = true;
        worker.join();
    }

private:
    std::atomic<bool> stop{false};
    std::thread worker;
};
}

int runBatchMode(const Options& options) {
    printHeader();

    if (!std::filesystem::exists(options.inputPath)) {
        throw std::runtime_error("File not found: " + options.inputPath.string());
    }

    std::cout << Color::BOLD << "Configuration:\n" << Color::RESET;
    std::cout << "  Input file:  " << Color::YELLOW << options.inputPath << Color::RESET << "\n";
    std::cout << "  Output file: " << Color::YELLOW << options.outputPath << Color::RESET << "\n";
    std::cout << "  Threads:     " << Color::CYAN << options.threadCount << Color::RESET << "\n\n";

    // Число строк нужно только прогресс-бару
    std::size_t totalLines = countLinesInFile(options.inputPath);

    // Строки вычисляются в пуле, результаты пишутся по порядку
    std::cout << Color::BOLD << "Evaluating " << totalLines << " lines:\n" << Color::RESET;
    auto startProcess = std::chrono::steady_clock::now();

    Calculator calculator;
    CsvWriter writer(options.outputPath);
    std::atomic<std::size_t> completed{0};
    std::size_t successCount = 0;
    std::size_t errorCount = 0;

    {
        ThreadPool pool(options.threadCount);
        ProgressThread progress(completed, totalLines);

        processExpressionsStreaming(options.inputPath, calculator, pool, completed,
            [&](const std::vector<EvaluationRecord>& batch) {
                for (const auto& record : batch) {
                    if (record.succeeded()) {
                        ++successCount;
                    } else {
                        ++errorCount;
                    }
                }
                writer.write(batch);
            });
    }

    auto processDuration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - startProcess);

    std::cout << "\n" << Color::BOLD << "Statistics:\n" << Color::RESET;
    std::cout << "  Succeeded: " << Color::GREEN << successCount << Color::RESET << "\n";
    std::cout << "  Failed:    " << Color::RED << errorCount << Color::RESET << "\n";
    std::cout << "  Time:      " << Color::MAGENTA << processDuration.count() << " ms"
        << Color::RESET << "\n\n";

    printSuccess("Results saved to: " + options.outputPath.string());
    return 0;
}

} // namespace intcalc
