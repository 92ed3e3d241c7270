#pragma once

#include <ttl/listeners/ITTLListener.hpp>
#include <ttl/scheduler/ISweepObserver.hpp>

#include <algorithm>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

/**
 * @brief Набор слушателей коллекции с рассылкой событий
 * @tparam K Тип ключа
 * @tparam V Тип значения
 *
 * Одновременно является ISweepObserver для ExpiryScheduler
 * коллекции: диагностика очистки рассылается тем же слушателям.
 *
 * Слушателей можно добавлять/удалять во время работы фонового
 * потока: список охраняется собственным mutex_.
 *
 * Исключение одного слушателя не прерывает рассылку и не выходит
 * наружу: остальные слушатели получают событие, а изменение
 * коллекции доводится до конца. Ошибка уходит всем слушателям
 * через onSweepFault("Listener error: ...").
 *
 * Ошибка очистки при пустом списке слушателей пишется в std::cerr,
 * чтобы не потеряться молча.
 */
template<typename K, typename V>
class ListenerRegistry : public ISweepObserver {
public:
    using ListenerPtr = std::shared_ptr<ITTLListener<K, V>>;

    explicit ListenerRegistry(std::string name = "ttl")
        : name_(std::move(name))
    {}

    void add(ListenerPtr listener) {
        if (!listener) {
            return;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        listeners_.push_back(std::move(listener));
    }

    bool remove(const ListenerPtr& listener) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = std::remove(listeners_.begin(), listeners_.end(), listener);
        if (it == listeners_.end()) {
            return false;
        }
        listeners_.erase(it, listeners_.end());
        return true;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return listeners_.size();
    }

    // ==================== События коллекции ====================

    void notifyInsert(const K& key, const V& value) {
        broadcast([&](ITTLListener<K, V>& l) { l.onInsert(key, value); });
    }

    void notifyUpdate(const K& key, const V& oldValue, const V& newValue) {
        broadcast([&](ITTLListener<K, V>& l) { l.onUpdate(key, oldValue, newValue); });
    }

    void notifyRemove(const K& key, const V& value) {
        broadcast([&](ITTLListener<K, V>& l) { l.onRemove(key, value); });
    }

    void notifyExpire(const K& key, const V& value) {
        broadcast([&](ITTLListener<K, V>& l) { l.onExpire(key, value); });
    }

    void notifyClear(size_t count) {
        broadcast([&](ITTLListener<K, V>& l) { l.onClear(count); });
    }

    // ==================== ISweepObserver ====================

    void onSweep(size_t removed, Duration elapsed) override {
        broadcast([&](ITTLListener<K, V>& l) { l.onSweep(removed, elapsed); });
    }

    void onSweepSkipped(size_t skippedTicks) override {
        broadcast([&](ITTLListener<K, V>& l) { l.onSweepSkipped(skippedTicks); });
    }

    void onSweepFault(const std::string& what) override {
        std::lock_guard<std::mutex> lock(mutex_);
        deliverFault(what);
    }

private:
    template<typename Action>
    void broadcast(Action&& action) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (listeners_.empty()) return;

        std::vector<std::string> errors;
        for (auto& listener : listeners_) {
            try {
                action(*listener);
            } catch (const std::exception& e) {
                errors.push_back(std::string("Listener error: ") + e.what());
            } catch (...) {
                errors.push_back("Listener error: unknown");
            }
        }

        for (const auto& error : errors) {
            deliverFault(error);
        }
    }

    /// Вызывается под mutex_
    void deliverFault(const std::string& what) {
        if (listeners_.empty()) {
            std::cerr << "[" << name_ << "] Sweep error: " << what << std::endl;
            return;
        }
        for (auto& listener : listeners_) {
            try {
                listener->onSweepFault(what);
            } catch (const std::exception& e) {
                std::cerr << "[" << name_ << "] Listener error: " << e.what() << std::endl;
            } catch (...) {
                std::cerr << "[" << name_ << "] Listener error: unknown" << std::endl;
            }
        }
    }

private:
    std::string name_;
    std::vector<ListenerPtr> listeners_;
    mutable std::mutex mutex_;
};
