#pragma once

#include <ttl/Errors.hpp>
#include <chrono>

/**
 * @brief Конфигурация истекающей коллекции
 *
 * Оба значения можно менять и после создания коллекции
 * (setInterval / setLifespan), здесь задаются начальные.
 *
 * @code
 *   ExpiryConfig config;
 *   config.interval = std::chrono::milliseconds(50);
 *   config.lifespan = std::chrono::seconds(5);
 *
 *   TTLMap<std::string, int> map(config);
 * @endcode
 */
struct ExpiryConfig {
    using Interval = std::chrono::milliseconds;
    using Lifespan = std::chrono::steady_clock::duration;

    // ========== ОСНОВНЫЕ ПАРАМЕТРЫ ==========

    /// Период фоновой очистки (должен быть > 0)
    Interval interval = std::chrono::milliseconds(1000);

    /// Время жизни элемента от момента вставки (должно быть >= 0)
    Lifespan lifespan = std::chrono::minutes(1);

    // ========== ПРЕДУСТАНОВЛЕННЫЕ КОНФИГУРАЦИИ ==========

    /// Частая очистка, короткая жизнь (тесты, кэш котировок)
    static ExpiryConfig fast() {
        ExpiryConfig config;
        config.interval = std::chrono::milliseconds(50);
        config.lifespan = std::chrono::milliseconds(500);
        return config;
    }

    /// Типичная конфигурация (кэш сессий)
    static ExpiryConfig standard() {
        ExpiryConfig config;
        config.interval = std::chrono::seconds(1);
        config.lifespan = std::chrono::minutes(30);
        return config;
    }

    // ========== ВАЛИДАЦИЯ ==========

    static void validateInterval(Interval value) {
        if (value <= Interval::zero()) {
            throw ConfigurationError("Interval must be greater than 0");
        }
    }

    static void validateLifespan(Lifespan value) {
        if (value < Lifespan::zero()) {
            throw ConfigurationError("Lifespan must not be negative");
        }
    }

    /**
     * @brief Проверить конфигурацию
     * @throws ConfigurationError если interval <= 0 или lifespan < 0
     */
    void validate() const {
        validateInterval(interval);
        validateLifespan(lifespan);
    }
};
