#pragma once

#include <atomic>
#include <cstddef>

namespace intcalc {

// Отображение прогресс-бара пакетной обработки.
// Запускается в отдельном потоке и завершается, когда completed достигнет total
// или будет выставлен флаг stop (обработка прервана ошибкой).
void displayProgress(const std::atomic<std::size_t>& completed, std::size_t total,
                     const std::atomic<bool>& stop);

} // namespace intcalc
