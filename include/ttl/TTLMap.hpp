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
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

/**
 * @brief Ассоциативный контейнер, элементы которого удаляются по истечении lifespan
 * @tparam K Тип ключа (hashable)
 * @tparam V Тип значения
 * @tparam Hash Хэш ключа
 * @tparam KeyEqual Сравнение ключей
 * @tparam ValueEqual Сравнение значений (для contains/remove по паре и containsValue)
 *
 * Архитектура:
 * - Данные: std::unordered_map<K, TimedEntry<V>> под одним mutex_
 * - Истечение: фоновый ExpiryScheduler раз в interval вызывает removeExpired()
 * - При чтении истечение НЕ проверяется: элемент, чей lifespan уже прошёл,
 *   виден (count, containsKey, tryGet) до ближайшей очистки
 *
 * Гарантия: элемент, вставленный в t0, доступен в [t0, t0 + lifespan)
 * и отсутствует к t0 + lifespan + interval.
 *
 * Пример использования:
 * @code
 *   TTLMap<std::string, std::string> sessions(
 *       std::chrono::milliseconds(100),   // interval
 *       std::chrono::minutes(30));        // lifespan
 *
 *   sessions.put("token", "alice");
 *   auto user = sessions.tryGet("token");
 * @endcode
 *
 * @note Слушатели вызываются под блокировкой контейнера и не должны
 *       обращаться к нему обратно (в том числе уничтожать его).
 */
template<typename K,
         typename V,
         typename Hash = std::hash<K>,
         typename KeyEqual = std::equal_to<K>,
         typename ValueEqual = std::equal_to<V>>
class TTLMap {
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using Interval = ExpiryConfig::Interval;
    using Lifespan = ExpiryConfig::Lifespan;
    using Entry = TimedEntry<V>;
    using Map = std::unordered_map<K, V, Hash, KeyEqual>;
    using ListenerPtr = std::shared_ptr<ITTLListener<K, V>>;

    /**
     * @brief Конструктор
     * @param interval Период фоновой очистки (> 0)
     * @param lifespan Время жизни элемента (>= 0)
     *
     * Фоновая очистка запускается сразу.
     *
     * @throws ConfigurationError при некорректных interval/lifespan
     */
    TTLMap(Interval interval, Lifespan lifespan)
        : TTLMap(interval, lifespan, Map{})
    {}

    explicit TTLMap(const ExpiryConfig& config)
        : TTLMap(config.interval, config.lifespan, Map{})
    {}

    /**
     * @brief Конструктор с начальными данными
     * @param initialData Пары ключ-значение, все получают метку времени создания
     */
    TTLMap(Interval interval, Lifespan lifespan, const Map& initialData)
        : lifespan_(lifespan)
        , listeners_("TTLMap")
        , scheduler_(interval, [this]() { return removeExpired(); }, &listeners_)
    {
        ExpiryConfig::validateLifespan(lifespan);

        TimePoint now = Clock::now();
        data_.reserve(initialData.size());
        for (const auto& [key, value] : initialData) {
            data_.emplace(key, Entry(now, value));
        }

        // Поток запускается последним: если что-то выше бросило,
        // останавливать нечего
        scheduler_.start();
    }

    TTLMap(const TTLMap&) = delete;
    TTLMap& operator=(const TTLMap&) = delete;

    // ==================== Вставка ====================

    /**
     * @brief Вставить новый элемент (только вставка)
     * @throws DuplicateKeyError если ключ уже есть (даже истёкший, но не удалённый)
     */
    void add(const K& key, const V& value) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto [it, inserted] = data_.try_emplace(key, Entry::stampNow(value));
        if (!inserted) {
            throw DuplicateKeyError("An element with the same key already exists");
        }
        listeners_.notifyInsert(it->first, it->second.value);
    }

    void add(const std::pair<K, V>& item) {
        add(item.first, item.second);
    }

    /**
     * @brief Вставить или перезаписать элемент
     *
     * Всегда успешно. При перезаписи метка времени обновляется:
     * элемент живёт lifespan заново.
     */
    void put(const K& key, const V& value) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = data_.find(key);
        if (it != data_.end()) {
            // Копия нового значения до того, как трогаем хранимое
            Entry fresh = Entry::stampNow(value);
            std::swap(it->second, fresh);
            listeners_.notifyUpdate(key, fresh.value, it->second.value);
            return;
        }

        auto inserted = data_.emplace(key, Entry::stampNow(value)).first;
        listeners_.notifyInsert(inserted->first, inserted->second.value);
    }

    // ==================== Чтение ====================

    /**
     * @brief Получить значение по ключу
     * @return Значение или nullopt если ключа нет (или он уже удалён очисткой)
     *
     * Метку времени не обновляет.
     */
    std::optional<V> tryGet(const K& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = data_.find(key);
        if (it == data_.end()) {
            return std::nullopt;
        }
        return it->second.value;
    }

    /**
     * @brief Получить значение по ключу (строго)
     * @throws KeyNotFoundError если ключа нет
     */
    V get(const K& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = data_.find(key);
        if (it == data_.end()) {
            throw KeyNotFoundError("The given key was not present in the map");
        }
        return it->second.value;
    }

    bool containsKey(const K& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return data_.find(key) != data_.end();
    }

    /**
     * @brief Есть ли пара key -> value (значение сравнивается через ValueEqual)
     */
    bool contains(const K& key, const V& value) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = data_.find(key);
        return it != data_.end() && valueEqual_(it->second.value, value);
    }

    /**
     * @brief Есть ли значение хотя бы у одного ключа: линейный проход
     */
    bool containsValue(const V& value) const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& pair : data_) {
            if (valueEqual_(pair.second.value, value)) {
                return true;
            }
        }
        return false;
    }

    /**
     * @brief Оставшееся время жизни ключа
     * @return nullopt если ключа нет, zero если истёк, но ещё не удалён
     */
    std::optional<Lifespan> timeToLive(const K& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = data_.find(key);
        if (it == data_.end()) {
            return std::nullopt;
        }
        return it->second.timeToLive(lifespan_, Clock::now());
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
     * @brief Удалить ключ независимо от его срока
     * @return true если элемент был
     */
    bool remove(const K& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = data_.find(key);
        if (it == data_.end()) {
            return false;
        }
        V value = std::move(it->second.value);
        data_.erase(it);
        listeners_.notifyRemove(key, value);
        return true;
    }

    /**
     * @brief Удалить пару, только если значение совпадает (ValueEqual)
     */
    bool remove(const K& key, const V& value) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = data_.find(key);
        if (it == data_.end() || !valueEqual_(it->second.value, value)) {
            return false;
        }
        data_.erase(it);
        listeners_.notifyRemove(key, value);
        return true;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t count = data_.size();
        data_.clear();
        listeners_.notifyClear(count);
    }

    // ==================== Копии для внешнего кода ====================

    /**
     * @brief Обычная карта ключ -> значение на момент вызова (без меток времени)
     */
    Map snapshot() const {
        std::lock_guard<std::mutex> lock(mutex_);
        Map result;
        result.reserve(data_.size());
        for (const auto& pair : data_) {
            result.emplace(pair.first, pair.second.value);
        }
        return result;
    }

    /**
     * @brief Пары на момент вызова: источник для итерации
     *
     * Копия снимается под блокировкой, поэтому очистка или вставка
     * во время обхода не инвалидирует его и не даёт "полуудалённых" пар.
     *
     * @code
     *   for (const auto& [key, value] : map.items()) { ... }
     * @endcode
     */
    std::vector<std::pair<K, V>> items() const {
        std::vector<std::pair<K, V>> result;
        copyTo(std::back_inserter(result));
        return result;
    }

    std::vector<K> keys() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<K> result;
        result.reserve(data_.size());
        for (const auto& pair : data_) {
            result.push_back(pair.first);
        }
        return result;
    }

    std::vector<V> values() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<V> result;
        result.reserve(data_.size());
        for (const auto& pair : data_) {
            result.push_back(pair.second.value);
        }
        return result;
    }

    /**
     * @brief Скопировать пары (K, V) в выходной итератор
     * @return Итератор за последним записанным элементом
     */
    template<typename OutputIt>
    OutputIt copyTo(OutputIt out) const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& pair : data_) {
            *out++ = std::pair<K, V>(pair.first, pair.second.value);
        }
        return out;
    }

    // ==================== Конфигурация ====================

    Lifespan lifespan() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return lifespan_;
    }

    /**
     * @brief Изменить время жизни
     *
     * Применяется к существующим элементам на ближайшей очистке
     * (по их исходным меткам), не мгновенно.
     *
     * @throws ConfigurationError если lifespan < 0
     */
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

    /**
     * @brief Провести очистку сейчас, в текущем потоке
     * @return false если очистка уже шла и запрос пропущен
     */
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
    /**
     * @brief Удалить все просроченные элементы
     * @return Количество удалённых
     *
     * Сначала собираем ключи, потом удаляем: карта не меняется
     * во время обхода. Исключения слушателей гасит ListenerRegistry,
     * поэтому проход всегда доходит до конца.
     */
    size_t removeExpired() {
        std::lock_guard<std::mutex> lock(mutex_);
        TimePoint now = Clock::now();

        std::vector<K> expired;
        for (const auto& pair : data_) {
            if (pair.second.isExpired(lifespan_, now)) {
                expired.push_back(pair.first);
            }
        }

        for (const K& key : expired) {
            auto it = data_.find(key);
            listeners_.notifyExpire(it->first, it->second.value);
            data_.erase(it);
        }

        return expired.size();
    }

private:
    mutable std::mutex mutex_;
    std::unordered_map<K, Entry, Hash, KeyEqual> data_;
    Lifespan lifespan_;
    ValueEqual valueEqual_;

    ListenerRegistry<K, V> listeners_;

    /// Объявлен последним: разрушается первым и останавливает поток
    /// раньше, чем исчезнут данные
    ExpiryScheduler scheduler_;
};
