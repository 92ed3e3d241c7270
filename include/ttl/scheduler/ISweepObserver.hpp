#pragma once

#include <chrono>
#include <cstddef>
#include <string>

/**
 * @brief Диагностический канал ExpiryScheduler
 *
 * Вызывается из потока очистки (или из потока, вызвавшего sweepNow()).
 * Реализации не должны выбрасывать исключения и не должны
 * блокироваться надолго: это задерживает следующий тик.
 */
class ISweepObserver {
public:
    using Duration = std::chrono::steady_clock::duration;

    virtual ~ISweepObserver() = default;

    /// Очистка завершилась, removed: сколько элементов удалено
    virtual void onSweep(size_t removed, Duration elapsed) {
        (void)removed; (void)elapsed;
    }

    /// Тик пропущен: предыдущая очистка ещё выполняется
    virtual void onSweepSkipped(size_t skippedTicks) { (void)skippedTicks; }

    /// Очистка выбросила исключение (перехвачено планировщиком)
    virtual void onSweepFault(const std::string& what) { (void)what; }
};
