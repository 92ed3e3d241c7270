#pragma once

#include <chrono>
#include <utility>

/**
 * @brief Значение вместе с моментом вставки: атомарная единица истечения
 * @tparam T Тип значения
 *
 * Метка времени ставится при создании/замене элемента
 * (вставка, перезапись по ключу, запись по индексу), но не при чтении.
 */
template<typename T>
struct TimedEntry {
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using Duration = Clock::duration;

    TimePoint timestamp;
    T value;

    TimedEntry(TimePoint stamp, T v)
        : timestamp(stamp)
        , value(std::move(v))
    {}

    /// Создать элемент с меткой "сейчас"
    static TimedEntry stampNow(T v) {
        return TimedEntry(Clock::now(), std::move(v));
    }

    Duration age(TimePoint now) const {
        return now - timestamp;
    }

    /**
     * @brief Истёк ли элемент
     * @return true если age >= lifespan
     *
     * Граница включительная: при lifespan == 0 элемент
     * истекает сразу же.
     */
    bool isExpired(Duration lifespan, TimePoint now) const {
        return age(now) >= lifespan;
    }

    /**
     * @brief Оставшееся время жизни (0 если уже истёк)
     */
    Duration timeToLive(Duration lifespan, TimePoint now) const {
        Duration left = lifespan - age(now);
        return left > Duration::zero() ? left : Duration::zero();
    }
};
