#include "file_utils.hpp"

#include <algorithm>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace intcalc {

// Последняя строка без завершающего '\n' тоже считается
std::size_t countLinesInFile(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        throw std::runtime_error("Cannot open file to count lines: " + path.string());
    }

    constexpr std::size_t bufferSize = 1024 * 1024;
    std::vector<char> buffer(bufferSize);

    std::size_t lineCount = 0;
    char lastChar = '\n';
    while (input.read(buffer.data(), bufferSize) || input.gcount() > 0) {
        auto bytesRead = static_cast<std::size_t>(input.gcount());
        lineCount += static_cast<std::size_t>(
            std::count(buffer.begin(), buffer.begin() + bytesRead, '\n'));
        lastChar = buffer[bytesRead - 1];
    }

    if (lastChar != '\n') {
        ++lineCount;
    }
    return lineCount;
}

std::string getCurrentTimeString() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::tm tm_buf;

#ifdef _WIN32
    localtime_s(&tm_buf, &time);
#else
    localtime_r(&time, &tm_buf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y%m%d_%H%M%S");
    return oss.str();
}

} // namespace intcalc
