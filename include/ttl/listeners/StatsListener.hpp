#pragma once

#include <ttl/listeners/ITTLListener.hpp>
#include <atomic>
#include <cstdint>

/**
 * @brief Слушатель для сбора статистики коллекции
 * @tparam K Тип ключа
 * @tparam V Тип значения
 *
 * Собирает:
 * - inserts/updates/removes/clears: явные операции
 * - expirations: удаления фоновой очисткой
 * - sweeps/skippedSweeps/faults: работа планировщика
 *
 * Использование:
 *   auto stats = std::make_shared<StatsListener<std::string, int>>();
 *   map.addListener(stats);
 *   // ... работа с коллекцией ...
 *   std::cout << "Expired: " << stats->expirations() << std::endl;
 *
 * Примечание: счётчики atomic: события идут из разных потоков.
 */
template<typename K, typename V>
class StatsListener : public ITTLListener<K, V> {
public:
    using typename ITTLListener<K, V>::Duration;

    void onInsert(const K&, const V&) override { ++inserts_; }
    void onUpdate(const K&, const V&, const V&) override { ++updates_; }
    void onRemove(const K&, const V&) override { ++removes_; }
    void onExpire(const K&, const V&) override { ++expirations_; }
    void onClear(size_t) override { ++clears_; }

    void onSweep(size_t, Duration) override { ++sweeps_; }

    void onSweepSkipped(size_t skippedTicks) override {
        skippedSweeps_ += skippedTicks;
    }

    void onSweepFault(const std::string&) override { ++faults_; }

    // ==================== Геттеры ====================

    uint64_t inserts() const { return inserts_; }
    uint64_t updates() const { return updates_; }
    uint64_t removes() const { return removes_; }
    uint64_t expirations() const { return expirations_; }
    uint64_t clears() const { return clears_; }
    uint64_t sweeps() const { return sweeps_; }
    uint64_t skippedSweeps() const { return skippedSweeps_; }
    uint64_t faults() const { return faults_; }

    /**
     * @brief Сбросить все счётчики
     */
    void reset() {
        inserts_ = 0;
        updates_ = 0;
        removes_ = 0;
        expirations_ = 0;
        clears_ = 0;
        sweeps_ = 0;
        skippedSweeps_ = 0;
        faults_ = 0;
    }

private:
    std::atomic<uint64_t> inserts_{0};
    std::atomic<uint64_t> updates_{0};
    std::atomic<uint64_t> removes_{0};
    std::atomic<uint64_t> expirations_{0};
    std::atomic<uint64_t> clears_{0};
    std::atomic<uint64_t> sweeps_{0};
    std::atomic<uint64_t> skippedSweeps_{0};
    std::atomic<uint64_t> faults_{0};
};
