#pragma once

#include <stdexcept>
#include <string>

/**
 * @brief Ошибки библиотеки истекающих коллекций
 *
 * Все ошибки, видимые вызывающему коду, выбрасываются синхронно
 * из вызванной операции. Ошибки внутри фоновой очистки (sweep)
 * наружу не выходят: см. ExpiryScheduler.
 */

/**
 * @brief Некорректная конфигурация: interval <= 0 или lifespan < 0
 */
class ConfigurationError : public std::invalid_argument {
public:
    explicit ConfigurationError(const std::string& what)
        : std::invalid_argument(what) {}
};

/**
 * @brief Вставка (add) ключа, который уже есть в TTLMap
 */
class DuplicateKeyError : public std::invalid_argument {
public:
    explicit DuplicateKeyError(const std::string& what)
        : std::invalid_argument(what) {}
};

/**
 * @brief Строгий поиск (get) отсутствующего или уже удалённого ключа
 */
class KeyNotFoundError : public std::out_of_range {
public:
    explicit KeyNotFoundError(const std::string& what)
        : std::out_of_range(what) {}
};

/**
 * @brief Индекс TTLList вне [0, count) (или [0, count] для insert)
 */
class IndexOutOfRangeError : public std::out_of_range {
public:
    IndexOutOfRangeError(size_t index, size_t count)
        : std::out_of_range("Index " + std::to_string(index) +
                            " is out of range (count = " +
                            std::to_string(count) + ")")
        , index_(index)
        , count_(count)
    {}

    size_t index() const { return index_; }
    size_t count() const { return count_; }

private:
    size_t index_;
    size_t count_;
};
