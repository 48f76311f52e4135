#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "calculator.hpp"
#include "csv_writer.hpp"
#include "expression_processor.hpp"
#include "file_utils.hpp"
#include "thread_pool.hpp"

namespace fs = std::filesystem;

namespace {

const fs::path kSampleFile = fs::path(INTCALC_TEST_DATA_DIR) / "data" / "expressions.txt";

// Временный файл, удаляемый в деструкторе
class TempFile {
public:
    explicit TempFile(const std::string& name)
        : path(fs::temp_directory_path() / ("intcalc_" + name)) {}
    ~TempFile() {
        std::error_code ec;
        fs::remove(path, ec);
    }

    void write(const std::string& content) const {
        std::ofstream stream(path, std::ios::binary | std::ios::trunc);
        stream << content;
    }

    std::string read() const {
        std::ifstream stream(path, std::ios::binary);
        std::ostringstream buffer;
        buffer << stream.rdbuf();
        return buffer.str();
    }

    fs::path path;
};

} // namespace

TEST(EvaluateLineTest, Success) {
    intcalc::Calculator calculator;
    auto record = intcalc::evaluateLine(calculator, 3, "1 + 2 x 3");
    EXPECT_EQ(record.lineNumber, 3u);
    EXPECT_TRUE(record.succeeded());
    EXPECT_EQ(record.postfix, "1 2 3 x +");
    ASSERT_TRUE(record.value.has_value());
    EXPECT_EQ(*record.value, 7);
    EXPECT_TRUE(record.message.empty());
}

TEST(EvaluateLineTest, CarriageReturnIsIgnored) {
    intcalc::Calculator calculator;
    auto record = intcalc::evaluateLine(calculator, 1, "4 x 5\r");
    EXPECT_TRUE(record.succeeded());
    EXPECT_EQ(*record.value, 20);
    EXPECT_EQ(record.expression, "4 x 5");
}

TEST(EvaluateLineTest, Errors) {
    intcalc::Calculator calculator;

    auto empty = intcalc::evaluateLine(calculator, 1, "   ");
    EXPECT_EQ(empty.status, "error");
    EXPECT_EQ(empty.message, "Empty line");

    auto syntax = intcalc::evaluateLine(calculator, 2, "2 3");
    EXPECT_EQ(syntax.status, "error");
    EXPECT_TRUE(syntax.postfix.empty());
    EXPECT_FALSE(syntax.value.has_value());
    EXPECT_EQ(syntax.message, "Expected operator at position 3.");

    auto evaluation = intcalc::evaluateLine(calculator, 3, "1 / 0");
    EXPECT_EQ(evaluation.status, "error");
    EXPECT_EQ(evaluation.postfix, "1 0 /");
    EXPECT_EQ(evaluation.message, "Cannot evaluate expression, division by zero.");
}

TEST(EvaluateLineTest, ErrorPositionMatchesStoredExpression) {
    intcalc::Calculator calculator;
    auto record = intcalc::evaluateLine(calculator, 1, "   2 3");
    EXPECT_EQ(record.expression, "2 3");
    EXPECT_EQ(record.message, "Expected operator at position 3.");
    EXPECT_EQ(record.expression[2], '3');
}

TEST(CsvWriterTest, QuotesFields) {
    EXPECT_EQ(intcalc::quoteCsv("1 + 2"), "\"1 + 2\"");
    EXPECT_EQ(intcalc::quoteCsv("a\"b"), "\"a\"\"b\"");
}

TEST(CsvWriterTest, WritesHeaderAndRecords) {
    TempFile file("writer_test.csv");
    {
        intcalc::CsvWriter writer(file.path);
        intcalc::EvaluationRecord ok{1, "2 ^ 3", "2 3 ^", 8, "success", ""};
        intcalc::EvaluationRecord failed{2, "0 ^ 0", "0 0 ^", std::nullopt, "error",
                                         "Cannot evaluate expression, 0^0 is undefined."};
        writer.write({ok, failed});
    }
    EXPECT_EQ(file.read(),
              "line,expression,status,postfix,result,message\n"
              "1,\"2 ^ 3\",success,\"2 3 ^\",8,\"\"\n"
              "2,\"0 ^ 0\",error,\"0 0 ^\",,\"Cannot evaluate expression, 0^0 is undefined.\"\n");
}

TEST(FileUtilsTest, CountsLines) {
    TempFile file("count_test.txt");
    file.write("");
    EXPECT_EQ(intcalc::countLinesInFile(file.path), 0u);
    file.write("1\n2\n");
    EXPECT_EQ(intcalc::countLinesInFile(file.path), 2u);
    file.write("1\n2\n3");
    EXPECT_EQ(intcalc::countLinesInFile(file.path), 3u);
    EXPECT_THROW(intcalc::countLinesInFile(file.path / "missing"), std::runtime_error);
}

TEST(FileUtilsTest, TimeStringFormat) {
    std::string time = intcalc::getCurrentTimeString();
    ASSERT_EQ(time.size(), 15u);
    EXPECT_EQ(time[8], '_');
}

TEST(ThreadPoolTest, RunsAllTasks) {
    intcalc::ThreadPool pool(4);
    EXPECT_EQ(pool.threadCount(), 4u);

    std::vector<std::future<int>> futures;
    for (int i = 0; i < 100; ++i) {
        futures.push_back(pool.submit([i]() { return i * i; }));
    }
    int sum = 0;
    for (auto& future : futures) {
        sum += future.get();
    }
    EXPECT_EQ(sum, 328350);
}

TEST(ThreadPoolTest, PropagatesExceptions) {
    intcalc::ThreadPool pool(0);
    EXPECT_EQ(pool.threadCount(), 1u);
    auto future = pool.submit([]() -> int { throw std::runtime_error("boom"); });
    EXPECT_THROW(future.get(), std::runtime_error);
}

TEST(BatchProcessingTest, ProcessesSampleFileInOrder) {
    intcalc::Calculator calculator;
    intcalc::ThreadPool pool(4);
    std::atomic<std::size_t> completed{0};
    std::vector<intcalc::EvaluationRecord> records;
    std::size_t batches = 0;

    intcalc::processExpressionsStreaming(kSampleFile, calculator, pool, completed,
        [&](const std::vector<intcalc::EvaluationRecord>& batch) {
            ++batches;
            records.insert(records.end(), batch.begin(), batch.end());
        },
        3);

    ASSERT_EQ(records.size(), intcalc::countLinesInFile(kSampleFile));
    ASSERT_EQ(records.size(), 10u);
    EXPECT_EQ(completed.load(), 10u);
    EXPECT_EQ(batches, 4u);

    for (std::size_t i = 0; i < records.size(); ++i) {
        EXPECT_EQ(records[i].lineNumber, i + 1);
    }

    EXPECT_EQ(*records[0].value, 36);
    EXPECT_EQ(records[1].message, "Cannot evaluate expression, division by zero.");
    EXPECT_EQ(records[2].message, "Cannot evaluate expression, 0^0 is undefined.");
    EXPECT_EQ(records[3].postfix, "5 ~ 3 +");
    EXPECT_EQ(*records[3].value, -2);
    EXPECT_EQ(records[4].message, "Unmatched '(' found at position 1.");
    EXPECT_EQ(records[5].message, "Expected operator at position 3.");
    EXPECT_EQ(records[6].message, "Empty line");
    EXPECT_EQ(*records[7].value, 512);
    EXPECT_EQ(*records[8].value, -1);
    EXPECT_EQ(records[9].message, "Unexpected symbol '$' found at position 7.");
}

TEST(BatchProcessingTest, MissingInputThrows) {
    intcalc::Calculator calculator;
    intcalc::ThreadPool pool(1);
    std::atomic<std::size_t> completed{0};
    EXPECT_THROW(intcalc::processExpressionsStreaming(
                     "/nonexistent/intcalc_input.txt", calculator, pool, completed,
                     [](const std::vector<intcalc::EvaluationRecord>&) {}),
                 std::runtime_error);
}
