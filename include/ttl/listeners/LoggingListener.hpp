#pragma once

#include <ttl/listeners/ITTLListener.hpp>
#include <chrono>
#include <iostream>
#include <mutex>
#include <string>

/**
 * @brief Слушатель для логирования событий коллекции в поток
 * @tparam K Тип ключа (должен поддерживать вывод в ostream)
 * @tparam V Тип значения (должен поддерживать вывод в ostream)
 *
 * Использование:
 *   auto logger = std::make_shared<LoggingListener<std::string, int>>("sessions");
 *   map.addListener(logger);
 *
 * События приходят и из фонового потока очистки, поэтому запись
 * в поток сериализуется.
 */
template<typename K, typename V>
class LoggingListener : public ITTLListener<K, V> {
public:
    using typename ITTLListener<K, V>::Duration;

    /**
     * @brief Конструктор
     * @param prefix Префикс для всех сообщений (например, имя коллекции)
     * @param os Поток вывода (по умолчанию std::cout)
     */
    explicit LoggingListener(const std::string& prefix = "TTL",
                             std::ostream& os = std::cout)
        : prefix_(prefix)
        , os_(os)
    {}

    void onInsert(const K& key, const V& value) override {
        std::lock_guard<std::mutex> lock(mutex_);
        os_ << "[" << prefix_ << "] INSERT: " << key << " = " << value << "\n";
    }

    void onUpdate(const K& key, const V& oldValue, const V& newValue) override {
        std::lock_guard<std::mutex> lock(mutex_);
        os_ << "[" << prefix_ << "] UPDATE: " << key
            << " (" << oldValue << " -> " << newValue << ")\n";
    }

    void onRemove(const K& key, const V& value) override {
        std::lock_guard<std::mutex> lock(mutex_);
        os_ << "[" << prefix_ << "] REMOVE: " << key << " = " << value << "\n";
    }

    void onExpire(const K& key, const V& value) override {
        std::lock_guard<std::mutex> lock(mutex_);
        os_ << "[" << prefix_ << "] EXPIRE: " << key << " = " << value << "\n";
    }

    void onClear(size_t count) override {
        std::lock_guard<std::mutex> lock(mutex_);
        os_ << "[" << prefix_ << "] CLEAR: " << count << " elements\n";
    }

    void onSweep(size_t removed, Duration elapsed) override {
        if (removed == 0) return;  // пустые проходы не засоряют лог
        auto us = std::chrono::duration_cast<std::chrono::microseconds>(elapsed);
        std::lock_guard<std::mutex> lock(mutex_);
        os_ << "[" << prefix_ << "] SWEEP: " << removed << " expired in "
            << us.count() << " us\n";
    }

    void onSweepSkipped(size_t skippedTicks) override {
        std::lock_guard<std::mutex> lock(mutex_);
        os_ << "[" << prefix_ << "] SWEEP SKIPPED: " << skippedTicks << " tick(s)\n";
    }

    void onSweepFault(const std::string& what) override {
        std::lock_guard<std::mutex> lock(mutex_);
        os_ << "[" << prefix_ << "] SWEEP ERROR: " << what << "\n";
    }

private:
    std::string prefix_;
    std::ostream& os_;
    std::mutex mutex_;
};
