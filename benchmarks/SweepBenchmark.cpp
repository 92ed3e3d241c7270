#include <ttl/TTLList.hpp>
#include <ttl/TTLMap.hpp>
#include <ttl/listeners/StatsListener.hpp>

#include <atomic>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

/**
 * @brief Бенчмарк для TTL-коллекций
 *
 * Измеряем:
 * - Throughput вставки (ops/sec) с фоновой очисткой и без
 * - Стоимость одной очистки для TTLMap и TTLList
 * - Влияние конкурирующей очистки на писателей
 */

using namespace std::chrono_literals;

// ==================== Утилиты ====================

template<typename Func>
double measureMs(Func&& func) {
    auto start = std::chrono::high_resolution_clock::now();
    func();
    auto end = std::chrono::high_resolution_clock::now();

    std::chrono::duration<double, std::milli> duration = end - start;
    return duration.count();
}

void printResult(const std::string& name, double timeMs, size_t operations) {
    double opsPerSec = (operations / timeMs) * 1000.0;
    std::cout << std::left << std::setw(45) << name
              << std::right << std::setw(10) << std::fixed << std::setprecision(2)
              << timeMs << " ms"
              << std::setw(15) << std::fixed << std::setprecision(0)
              << opsPerSec << " ops/sec\n";
}

// ==================== Вставка ====================

void benchmarkMapPut(std::chrono::milliseconds interval, size_t numOperations) {
    TTLMap<int, int> map(interval, std::chrono::minutes(10));

    double timeMs = measureMs([&]() {
        for (size_t i = 0; i < numOperations; ++i) {
            map.put(static_cast<int>(i), static_cast<int>(i * 10));
        }
    });

    printResult("TTLMap put (interval=" + std::to_string(interval.count()) + "ms)",
                timeMs, numOperations);
}

void benchmarkListAdd(std::chrono::milliseconds interval, size_t numOperations) {
    TTLList<int> list(interval, std::chrono::minutes(10));

    double timeMs = measureMs([&]() {
        for (size_t i = 0; i < numOperations; ++i) {
            list.add(static_cast<int>(i));
        }
    });

    printResult("TTLList add (interval=" + std::to_string(interval.count()) + "ms)",
                timeMs, numOperations);
}

// ==================== Очистка ====================

/**
 * @brief Одна ручная очистка, в которой истекает каждый второй элемент
 */
void benchmarkMapSweep(size_t size) {
    TTLMap<int, int> map(std::chrono::hours(1), std::chrono::hours(1));
    map.stop();

    for (size_t i = 0; i < size / 2; ++i) {
        map.put(static_cast<int>(i), 0);
    }
    std::this_thread::sleep_for(50ms);
    for (size_t i = size / 2; i < size; ++i) {
        map.put(static_cast<int>(i), 0);
    }
    map.setLifespan(25ms);

    double timeMs = measureMs([&]() { map.sweepNow(); });

    printResult("TTLMap sweep (size=" + std::to_string(size) + ", half expired)",
                timeMs, size);
}

void benchmarkListSweep(size_t size) {
    TTLList<int> list(std::chrono::hours(1), std::chrono::hours(1));
    list.stop();

    for (size_t i = 0; i < size; ++i) {
        list.add(static_cast<int>(i));
        if (i == size / 2) {
            std::this_thread::sleep_for(50ms);
        }
    }
    list.setLifespan(25ms);

    double timeMs = measureMs([&]() { list.sweepNow(); });

    printResult("TTLList sweep (size=" + std::to_string(size) + ", half expired)",
                timeMs, size);
}

// ==================== Конкуренция ====================

/**
 * @brief Несколько писателей при коротком lifespan: очистка работает всё время
 */
void benchmarkConcurrentChurn(size_t numThreads, size_t opsPerThread) {
    TTLMap<int, int> map(1ms, 5ms);
    auto stats = std::make_shared<StatsListener<int, int>>();
    map.addListener(stats);

    double timeMs = measureMs([&]() {
        std::vector<std::thread> threads;
        for (size_t t = 0; t < numThreads; ++t) {
            threads.emplace_back([&map, t, opsPerThread]() {
                for (size_t i = 0; i < opsPerThread; ++i) {
                    map.put(static_cast<int>(t * opsPerThread + i), 0);
                }
            });
        }
        for (auto& th : threads) {
            th.join();
        }
    });

    printResult("TTLMap churn (" + std::to_string(numThreads) + " writers)",
                timeMs, numThreads * opsPerThread);
    std::cout << "   Expired during run: " << stats->expirations()
              << ", sweeps: " << stats->sweeps()
              << ", skipped ticks: " << stats->skippedSweeps() << "\n";
}

// ==================== Main ====================

int main() {
    const size_t NUM_OPS = 500000;
    const size_t SWEEP_SIZE = 100000;

    std::cout << "=== TTL Collections Benchmark ===\n";
    std::cout << "Operations: " << NUM_OPS << "\n\n";

    std::cout << "--- Insert throughput ---\n";
    benchmarkMapPut(std::chrono::milliseconds(1000), NUM_OPS);
    benchmarkMapPut(std::chrono::milliseconds(1), NUM_OPS);
    benchmarkListAdd(std::chrono::milliseconds(1000), NUM_OPS);
    benchmarkListAdd(std::chrono::milliseconds(1), NUM_OPS);

    std::cout << "\n--- Sweep cost ---\n";
    benchmarkMapSweep(SWEEP_SIZE);
    benchmarkListSweep(SWEEP_SIZE);

    std::cout << "\n--- Concurrent churn ---\n";
    benchmarkConcurrentChurn(4, NUM_OPS / 4);

    std::cout << "\n=== Benchmark complete ===\n";

    return 0;
}
