#include "progress_bar.hpp"
#include "console.hpp"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <thread>

namespace intcalc {

namespace {
constexpr int kBarWidth = 50;

void drawBar(std::size_t current, std::size_t total, const char* color) {
    double progress = total == 0 ? 1.0 : static_cast<double>(current) / static_cast<double>(total);
    int filled = static_cast<int>(kBarWidth * progress);

    std::cout << "\r  " << color << "[";
    for (int i = 0; i < kBarWidth; ++i) {
        if (i < filled) std::cout << "█";
        else if (i == filled) std::cout << "▒";
        else std::cout << "░";
    }
    std::cout << "] " << Color::BOLD << std::setw(3) << static_cast<int>(progress * 100.0)
        << "%" << Color::RESET << " (" << current << "/" << total << ")";
    std::cout.flush();
}
}

void displayProgress(const std::atomic<std::size_t>& completed, std::size_t total,
                     const std::atomic<bool>& stop) {
    while (completed.load() < total && !stop.load()) {
        drawBar(completed.load(), total, Color::CYAN);
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    std::size_t current = completed.load();
    drawBar(current, total, current >= total ? Color::GREEN : Color::RED);
    std::cout << "\n";
}

} // namespace intcalc
