#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace intcalc {

// Пул потоков фиксированного размера для пакетного режима.
// Каждая строка файла вычисляется отдельной задачей; задачи не разделяют
// изменяемого состояния.
class ThreadPool {
public:
    // 0 потоков означает один поток
    explicit ThreadPool(std::size_t threadCount);

    // Дожидается выполнения уже поставленных задач и останавливает потоки
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Ставит задачу в очередь. Результат или исключение задачи
    // передаются через std::future.
    template <class Func>
    auto submit(Func&& func) -> std::future<std::invoke_result_t<Func>>;

    std::size_t threadCount() const { return workers.size(); }

private:
    std::vector<std::thread> workers;
    std::queue<std::function<void()>> pending;

    std::mutex mutex;
    std::condition_variable wakeUp;
    bool stopping = false;

    std::optional<std::function<void()>> takeTask();
    void run();
};

template <class Func>
auto ThreadPool::submit(Func&& func) -> std::future<std::invoke_result_t<Func>> {
    using Result = std::invoke_result_t<Func>;

    // std::function требует копируемого объекта, поэтому packaged_task
    // хранится через shared_ptr
    auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<Func>(func));
    std::future<Result> result = task->get_future();
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (stopping) {
            throw std::runtime_error("Thread pool is stopped");
        }
        pending.emplace([task]() { (*task)(); });
    }
    wakeUp.notify_one();
    return result;
}

} // namespace intcalc
