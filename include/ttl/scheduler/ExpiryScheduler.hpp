#pragma once

#include <ttl/ExpiryConfig.hpp>
#include <ttl/scheduler/ISweepObserver.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>

/**
 * @brief Периодический запуск очистки в фоновом потоке
 *
 * Архитектура:
 * - Один поток на экземпляр, спит на condition_variable до следующего тика
 * - Каждый тик вызывает SweepCallback под sweepMutex (try_lock)
 * - Тик, заставший очистку в процессе, пропускается: очистки одного
 *   экземпляра никогда не перекрываются
 * - Исключения из SweepCallback перехватываются здесь и уходят
 *   в ISweepObserver (или в std::cerr), следующие тики продолжаются
 *
 * Всё, чего касается поток, лежит в State под shared_ptr: поток держит
 * свою копию указателя и переживает планировщик, если тот уничтожен
 * из собственного callback'а.
 *
 * Планировщик ничего не знает о контейнере: callback сам берёт
 * блокировку контейнера и возвращает количество удалённых элементов.
 *
 * Состояния: Stopped -> Running (start), Running -> Stopped (stop).
 *
 * @code
 *   ExpiryScheduler scheduler(std::chrono::milliseconds(100), [&]() {
 *       return store.removeExpired();
 *   });
 *   scheduler.start();
 *   // ...
 *   scheduler.stop();  // после возврата callback больше не вызывается
 * @endcode
 */
class ExpiryScheduler {
public:
    using Clock = std::chrono::steady_clock;
    using Interval = std::chrono::milliseconds;
    using SweepCallback = std::function<size_t()>;

    /**
     * @brief Конструктор (поток не запускается до start())
     * @param interval Период очистки (> 0)
     * @param sweep Функция очистки, возвращает число удалённых элементов
     * @param observer Диагностический канал (не владеет, может быть nullptr)
     *
     * @throws ConfigurationError если interval <= 0
     * @throws std::invalid_argument если sweep пуст
     */
    ExpiryScheduler(Interval interval, SweepCallback sweep,
                    ISweepObserver* observer = nullptr)
        : state_(std::make_shared<State>(interval, std::move(sweep), observer))
    {
        ExpiryConfig::validateInterval(interval);
        if (!state_->sweep) {
            throw std::invalid_argument("Sweep callback cannot be empty");
        }
    }

    /**
     * Из собственного callback'а join невозможен: поток отсоединяется
     * и завершается сам после текущей очистки, без наблюдателя.
     */
    ~ExpiryScheduler() {
        if (onWorkerThread()) {
            state_->observer = nullptr;
            requestStop();
            if (worker_.joinable()) {
                worker_.detach();
            }
            return;
        }
        stop();
    }

    ExpiryScheduler(const ExpiryScheduler&) = delete;
    ExpiryScheduler& operator=(const ExpiryScheduler&) = delete;

    /**
     * @brief Запустить периодическую очистку
     *
     * Идемпотентен: повторный вызов не создаёт второй поток.
     * Первый тик через interval() после запуска.
     */
    void start() {
        std::lock_guard<std::mutex> lifecycle(lifecycleMutex_);
        if (worker_.joinable()) {
            return;
        }

        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            state_->stopRequested = false;
            state_->intervalChanged = false;
        }
        worker_ = std::thread(&ExpiryScheduler::runLoop, state_);
        running_ = true;
    }

    /**
     * @brief Остановить очистку и дождаться завершения потока
     *
     * После возврата callback гарантированно не вызывается
     * (в том числе не идёт "хвост" текущей очистки). Идемпотентен.
     *
     * @throws std::logic_error при вызове из самого callback'а
     */
    void stop() {
        // Проверка до захвата lifecycleMutex_: иначе stop() из callback'а
        // и параллельный stop() снаружи ждали бы друг друга
        if (onWorkerThread()) {
            throw std::logic_error("ExpiryScheduler::stop() called from the sweep thread");
        }

        std::lock_guard<std::mutex> lifecycle(lifecycleMutex_);
        if (!worker_.joinable()) {
            return;
        }

        requestStop();
        worker_.join();
        state_->workerId = std::thread::id();
        running_ = false;
    }

    bool isRunning() const {
        return running_;
    }

    Interval interval() const {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->interval;
    }

    /**
     * @brief Изменить период очистки
     * @param interval Новый период (> 0)
     *
     * Очистку немедленно не вызывает. Если новый период короче,
     * ожидающий тик переносится на interval от текущего момента;
     * более длинный период не откладывает уже запланированный тик.
     * Последующие тики идут с новым периодом. Можно вызывать
     * в любом состоянии.
     *
     * @throws ConfigurationError если interval <= 0
     */
    void setInterval(Interval interval) {
        ExpiryConfig::validateInterval(interval);
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            state_->interval = interval;
            state_->intervalChanged = true;
        }
        state_->condVar.notify_all();
    }

    /**
     * @brief Выполнить очистку немедленно в текущем потоке
     * @return false если очистка уже идёт (запрос пропущен)
     *
     * Проходит тот же путь, что и тик: исключение callback'а
     * перехватывается и уходит в диагностику.
     */
    bool sweepNow() {
        return runSweep(*state_);
    }

    // ==================== Счётчики ====================

    uint64_t sweepCount() const { return state_->sweeps; }
    uint64_t skippedCount() const { return state_->skipped; }
    uint64_t faultCount() const { return state_->faults; }

private:
    struct State {
        State(Interval i, SweepCallback s, ISweepObserver* o)
            : interval(i)
            , sweep(std::move(s))
            , observer(o)
        {}

        /// Охраняет interval, stopRequested и intervalChanged, на нём спит поток
        mutable std::mutex mutex;
        std::condition_variable condVar;
        Interval interval;
        bool stopRequested = false;
        bool intervalChanged = false;

        SweepCallback sweep;
        ISweepObserver* observer;
        std::atomic<std::thread::id> workerId{};

        /// Исключает перекрытие очисток (тик и sweepNow)
        std::mutex sweepMutex;

        std::atomic<uint64_t> sweeps{0};
        std::atomic<uint64_t> skipped{0};
        std::atomic<uint64_t> faults{0};
    };

    static void runLoop(std::shared_ptr<State> state) {
        state->workerId = std::this_thread::get_id();

        std::unique_lock<std::mutex> lock(state->mutex);
        Clock::time_point nextTick = Clock::now() + state->interval;

        while (true) {
            bool woken = state->condVar.wait_until(lock, nextTick, [&state] {
                return state->stopRequested || state->intervalChanged;
            });
            if (state->stopRequested) {
                break;
            }
            if (woken) {
                state->intervalChanged = false;
                nextTick = std::min(nextTick, Clock::now() + state->interval);
                continue;
            }

            lock.unlock();
            runSweep(*state);
            lock.lock();

            nextTick += state->interval;

            Clock::time_point now = Clock::now();
            if (nextTick <= now) {
                // Очистка заняла дольше интервала: пропущенные тики не копим
                auto behind = now - nextTick;
                auto missed = behind / state->interval + 1;
                nextTick += state->interval * missed;
                state->skipped += static_cast<uint64_t>(missed);
                lock.unlock();
                notifySkipped(*state, static_cast<size_t>(missed));
                lock.lock();
            }
        }
    }

    static bool runSweep(State& state) {
        std::unique_lock<std::mutex> guard(state.sweepMutex, std::try_to_lock);
        if (!guard.owns_lock()) {
            ++state.skipped;
            notifySkipped(state, 1);
            return false;
        }

        Clock::time_point started = Clock::now();
        try {
            size_t removed = state.sweep();
            ++state.sweeps;
            if (state.observer) {
                state.observer->onSweep(removed, Clock::now() - started);
            }
        } catch (const std::exception& e) {
            reportFault(state, e.what());
        } catch (...) {
            reportFault(state, "Unknown sweep error");
        }
        return true;
    }

    static void notifySkipped(State& state, size_t ticks) {
        if (!state.observer) {
            return;
        }
        try {
            state.observer->onSweepSkipped(ticks);
        } catch (const std::exception& e) {
            std::cerr << "[ExpiryScheduler] Observer error: " << e.what() << std::endl;
        } catch (...) {
            std::cerr << "[ExpiryScheduler] Observer error: unknown" << std::endl;
        }
    }

    static void reportFault(State& state, const std::string& what) {
        ++state.faults;
        if (state.observer) {
            // Сам наблюдатель тоже может бросить: поток не должен умереть
            try {
                state.observer->onSweepFault(what);
                return;
            } catch (const std::exception& e) {
                std::cerr << "[ExpiryScheduler] Observer error: " << e.what() << std::endl;
            } catch (...) {
                std::cerr << "[ExpiryScheduler] Observer error: unknown" << std::endl;
            }
        }
        std::cerr << "[ExpiryScheduler] Sweep error: " << what << std::endl;
    }

    bool onWorkerThread() const {
        return state_->workerId.load() == std::this_thread::get_id();
    }

    void requestStop() {
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            state_->stopRequested = true;
        }
        state_->condVar.notify_all();
    }

private:
    std::shared_ptr<State> state_;

    /// Сериализует start()/stop()
    std::mutex lifecycleMutex_;
    std::thread worker_;
    std::atomic<bool> running_{false};
};
