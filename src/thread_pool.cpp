#include "thread_pool.hpp"

namespace intcalc {

ThreadPool::ThreadPool(std::size_t threadCount) {
    if (threadCount == 0) {
        threadCount = 1;
    }
    workers.reserve(threadCount);
    for (std::size_t i = 0; i < threadCount; ++i) {
        workers.emplace_back([this]() { run(); });
    }
}

ThreadPool::~ThreadPool() {
    {
        std::lock_guard<std::mutex> lock(mutex);
        stopping = true;
    }
    wakeUp.notify_all();
    for (auto& worker : workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

// Следующая задача из очереди. Пустой результат означает, что пул
// остановлен и задач больше не осталось.
std::optional<std::function<void()>> ThreadPool::takeTask() {
    std::unique_lock<std::mutex> lock(mutex);
    wakeUp.wait(lock, [this]() { return stopping || !pending.empty(); });
    if (pending.empty()) {
        return std::nullopt;
    }
    std::function<void()> task = std::move(pending.front());
    pending.pop();
    return task;
}

void ThreadPool::run() {
    // Задача выполняется без блокировки
    while (auto task = takeTask()) {
        (*task)();
    }
}

} // namespace intcalc
