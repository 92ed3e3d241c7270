#pragma once

#include <ttl/Errors.hpp>
#include <ttl/ExpiryConfig.hpp>
#include <ttl/TimedEntry.hpp>
#include <ttl/listeners/ListenerRegistry.hpp>
#include <ttl/scheduler/ExpiryScheduler.hpp>

#include <functional>
#include <iterator>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

/**
 * @brief Упорядоченная последовательность с удалением элементов по истечении lifespan
 * @tparam T Тип элемента
 * @tparam Equal Сравнение элементов (indexOf, contains, remove)
 *
 * Архитектура:
 * - Данные: std::vector<TimedEntry<T>> под одним mutex_
 * - Дубликаты разрешены, позиция значима
 * - Фоновый ExpiryScheduler раз в interval вызывает removeExpired():
 *   один фильтрующий проход собирает выживших в новый вектор,
 *   который заменяет старый. Порядок выживших сохраняется, сдвиг
 *   индексов не может привести к пропуску истёкшего элемента.
 *
 * События слушателей адресуются индексом элемента на момент события.
 *
 * @code
 *   TTLList<std::string> recent(std::chrono::milliseconds(50),
 *                               std::chrono::seconds(1));
 *   recent.add("a");
 *   recent.add("b");
 *   recent.remove("a");   // удаляет ВСЕ совпадения
 * @endcode
 */
template<typename T, typename Equal = std::equal_to<T>>
class TTLList {
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using Interval = ExpiryConfig::Interval;
    using Lifespan = ExpiryConfig::Lifespan;
    using Entry = TimedEntry<T>;
    using ListenerPtr = std::shared_ptr<ITTLListener<size_t, T>>;

    /// Результат indexOf(), если совпадений нет
    static constexpr size_t npos = static_cast<size_t>(-1);

    /**
     * @brief Конструктор
     * @param interval Период фоновой очистки (> 0)
     * @param lifespan Время жизни элемента (>= 0)
     *
     * @throws ConfigurationError при некорректных interval/lifespan
     */
    TTLList(Interval interval, Lifespan lifespan)
        : TTLList(interval, lifespan, std::vector<T>{})
    {}

    explicit TTLList(const ExpiryConfig& config)
        : TTLList(config.interval, config.lifespan, std::vector<T>{})
    {}

    /**
     * @brief Конструктор с начальными данными (все с меткой времени создания)
     */
    TTLList(Interval interval, Lifespan lifespan, const std::vector<T>& initialData)
        : lifespan_(lifespan)
        , listeners_("TTLList")
        , scheduler_(interval, [this]() { return removeExpired(); }, &listeners_)
    {
        ExpiryConfig::validateLifespan(lifespan);

        TimePoint now = Clock::now();
        data_.reserve(initialData.size());
        for (const T& item : initialData) {
            data_.emplace_back(now, item);
        }

        scheduler_.start();
    }

    TTLList(const TTLList&) = delete;
    TTLList& operator=(const TTLList&) = delete;

    // ==================== Вставка ====================

    /**
     * @brief Добавить элемент в конец
     */
    void add(const T& item) {
        std::lock_guard<std::mutex> lock(mutex_);
        data_.push_back(Entry::stampNow(item));
        listeners_.notifyInsert(data_.size() - 1, data_.back().value);
    }

    /**
     * @brief Вставить элемент в позицию index, сдвинув последующие
     * @throws IndexOutOfRangeError если index > count
     */
    void insert(size_t index, const T& item) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (index > data_.size()) {
            throw IndexOutOfRangeError(index, data_.size());
        }
        auto it = data_.insert(data_.begin() + index, Entry::stampNow(item));
        listeners_.notifyInsert(index, it->value);
    }

    // ==================== Доступ по индексу ====================

    /**
     * @brief Значение по индексу (метку времени не обновляет)
     * @throws IndexOutOfRangeError если index >= count
     */
    T at(size_t index) const {
        std::lock_guard<std::mutex> lock(mutex_);
        checkIndex(index);
        return data_[index].value;
    }

    /**
     * @brief Перезаписать элемент по индексу
     *
     * Считается новой вставкой: метка времени обновляется.
     *
     * @throws IndexOutOfRangeError если index >= count
     */
    void setAt(size_t index, const T& item) {
        std::lock_guard<std::mutex> lock(mutex_);
        checkIndex(index);
        Entry fresh = Entry::stampNow(item);
        std::swap(data_[index], fresh);
        listeners_.notifyUpdate(index, fresh.value, data_[index].value);
    }

    // ==================== Поиск ====================

    /**
     * @brief Индекс первого совпадения (Equal) или npos
     */
    size_t indexOf(const T& item) const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (size_t i = 0; i < data_.size(); ++i) {
            if (equal_(data_[i].value, item)) {
                return i;
            }
        }
        return npos;
    }

    bool contains(const T& item) const {
        return indexOf(item) != npos;
    }

    /**
     * @brief Количество элементов, ещё не удалённых очисткой
     */
    size_t count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return data_.size();
    }

    bool empty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return data_.empty();
    }

    // ==================== Удаление ====================

    /**
     * @brief Удалить ровно один элемент в позиции index
     * @throws IndexOutOfRangeError если index >= count
     */
    void removeAt(size_t index) {
        std::lock_guard<std::mutex> lock(mutex_);
        checkIndex(index);
        T value = std::move(data_[index].value);
        data_.erase(data_.begin() + index);
        listeners_.notifyRemove(index, value);
    }

    /**
     * @brief Удалить ВСЕ элементы, равные item
     * @return true если удалён хотя бы один
     *
     * Обход с конца: удаление не сдвигает ещё не проверенные индексы.
     */
    bool remove(const T& item) {
        std::lock_guard<std::mutex> lock(mutex_);
        bool removed = false;
        for (size_t i = data_.size(); i-- > 0;) {
            if (equal_(data_[i].value, item)) {
                T value = std::move(data_[i].value);
                data_.erase(data_.begin() + i);
                listeners_.notifyRemove(i, value);
                removed = true;
            }
        }
        return removed;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t count = data_.size();
        data_.clear();
        listeners_.notifyClear(count);
    }

    // ==================== Копии для внешнего кода ====================

    /**
     * @brief Значения на момент вызова, в порядке списка
     *
     * Используется и как источник итерации:
     * @code
     *   for (const auto& item : list.snapshot()) { ... }
     * @endcode
     */
    std::vector<T> snapshot() const {
        std::vector<T> result;
        copyTo(std::back_inserter(result));
        return result;
    }

    /**
     * @brief Скопировать значения в выходной итератор
     * @return Итератор за последним записанным элементом
     */
    template<typename OutputIt>
    OutputIt copyTo(OutputIt out) const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : data_) {
            *out++ = entry.value;
        }
        return out;
    }

    // ==================== Конфигурация ====================

    Lifespan lifespan() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return lifespan_;
    }

    /// @throws ConfigurationError если lifespan < 0
    void setLifespan(Lifespan lifespan) {
        ExpiryConfig::validateLifespan(lifespan);
        std::lock_guard<std::mutex> lock(mutex_);
        lifespan_ = lifespan;
    }

    Interval interval() const {
        return scheduler_.interval();
    }

    /// @throws ConfigurationError если interval <= 0
    void setInterval(Interval interval) {
        scheduler_.setInterval(interval);
    }

    // ==================== Жизненный цикл ====================

    void start() { scheduler_.start(); }
    void stop() { scheduler_.stop(); }
    bool isRunning() const { return scheduler_.isRunning(); }
    bool sweepNow() { return scheduler_.sweepNow(); }

    const ExpiryScheduler& scheduler() const { return scheduler_; }

    // ==================== Слушатели ====================

    void addListener(ListenerPtr listener) {
        listeners_.add(std::move(listener));
    }

    bool removeListener(const ListenerPtr& listener) {
        return listeners_.remove(listener);
    }

private:
    void checkIndex(size_t index) const {
        if (index >= data_.size()) {
            throw IndexOutOfRangeError(index, data_.size());
        }
    }

    /**
     * @brief Удалить все просроченные элементы одним проходом
     * @return Количество удалённых
     *
     * Выжившие копируются в новый вектор, который затем подменяет
     * data_: соседние истёкшие элементы не пропускаются, порядок
     * сохраняется. Исключения слушателей гасит ListenerRegistry.
     */
    size_t removeExpired() {
        std::lock_guard<std::mutex> lock(mutex_);
        TimePoint now = Clock::now();

        std::vector<Entry> survivors;
        survivors.reserve(data_.size());

        for (size_t i = 0; i < data_.size(); ++i) {
            if (data_[i].isExpired(lifespan_, now)) {
                listeners_.notifyExpire(i, data_[i].value);
            } else {
                survivors.push_back(data_[i]);
            }
        }

        size_t removed = data_.size() - survivors.size();
        data_.swap(survivors);
        return removed;
    }

private:
    mutable std::mutex mutex_;
    std::vector<Entry> data_;
    Lifespan lifespan_;
    Equal equal_;

    ListenerRegistry<size_t, T> listeners_;

    /// Объявлен последним: разрушается первым
    ExpiryScheduler scheduler_;
};
