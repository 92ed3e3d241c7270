#pragma once

#include <ttl/scheduler/ISweepObserver.hpp>
#include <cstddef>
#include <string>

/**
 * @brief Интерфейс слушателя событий истекающей коллекции
 * @tparam K Тип ключа (для TTLList: индекс элемента)
 * @tparam V Тип значения
 *
 * События коллекции вызываются под блокировкой коллекции:
 * слушатель не должен обращаться обратно к той же коллекции.
 * События очистки (onSweep*) приходят из ISweepObserver планировщика.
 */
template<typename K, typename V>
class ITTLListener {
public:
    using Duration = ISweepObserver::Duration;

    virtual ~ITTLListener() = default;

    virtual void onInsert(const K& key, const V& value) { (void)key; (void)value; }
    virtual void onUpdate(const K& key, const V& oldValue, const V& newValue) {
        (void)key; (void)oldValue; (void)newValue;
    }
    virtual void onRemove(const K& key, const V& value) { (void)key; (void)value; }
    virtual void onExpire(const K& key, const V& value) { (void)key; (void)value; }
    virtual void onClear(size_t count) { (void)count; }

    virtual void onSweep(size_t removed, Duration elapsed) { (void)removed; (void)elapsed; }
    virtual void onSweepSkipped(size_t skippedTicks) { (void)skippedTicks; }
    virtual void onSweepFault(const std::string& what) { (void)what; }
};
