#include <gtest/gtest.h>
#include <ttl/TTLMap.hpp>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <iterator>
#include <map>
#include <stdexcept>
#include <string>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

/**
 * @brief Тесты для TTLMap
 *
 * Проверяем:
 * - Базовые операции (add, put, tryGet, get, remove, contains)
 * - Ошибки (дубликат ключа, отсутствующий ключ, конфигурация)
 * - Фоновое истечение и его границы
 * - Смену lifespan/interval на лету
 * - Копии для внешнего кода (snapshot, items, keys, values, copyTo)
 *
 * Там, где время важно до миллисекунд, фоновая очистка отодвинута
 * на час, а очистка запускается явно через sweepNow().
 */

using namespace std::chrono_literals;

using StringMap = TTLMap<std::string, std::string>;

namespace {
constexpr auto kNever = std::chrono::hours(1);

/**
 * @brief Значение, копирование которого можно заставить бросить
 */
struct FragileValue {
    static inline bool failCopy = false;

    std::string text;

    explicit FragileValue(std::string t) : text(std::move(t)) {}

    FragileValue(const FragileValue& other) : text(other.text) {
        if (failCopy) {
            throw std::runtime_error("copy failed");
        }
    }

    FragileValue(FragileValue&&) = default;
    FragileValue& operator=(const FragileValue&) = default;
    FragileValue& operator=(FragileValue&&) = default;
};
}  // namespace

// ==================== Конструктор ====================

TEST(TTLMapTest, ConstructorStartsSweeping) {
    StringMap map(50ms, 1s);

    EXPECT_TRUE(map.isRunning());
    EXPECT_EQ(map.interval(), std::chrono::milliseconds(50));
    EXPECT_EQ(map.lifespan(), std::chrono::seconds(1));
    EXPECT_TRUE(map.empty());
}

TEST(TTLMapTest, ConstructorThrowsOnZeroInterval) {
    EXPECT_THROW(StringMap(0ms, 1s), ConfigurationError);
}

TEST(TTLMapTest, ConstructorThrowsOnNegativeLifespan) {
    EXPECT_THROW(StringMap(10ms, -1s), ConfigurationError);
}

TEST(TTLMapTest, ConstructorFromConfig) {
    ExpiryConfig config = ExpiryConfig::fast();
    StringMap map(config);

    EXPECT_EQ(map.interval(), config.interval);
    EXPECT_EQ(map.lifespan(), config.lifespan);
}

// Начальные данные видны сразу после создания
TEST(TTLMapTest, SeededSnapshotEqualsSeed) {
    StringMap::Map seed = {{"a", "1"}, {"b", "2"}};
    StringMap map(50ms, std::chrono::hours(1), seed);

    EXPECT_EQ(map.snapshot(), seed);
    EXPECT_EQ(map.count(), 2u);
}

TEST(TTLMapTest, SeededEntriesExpireTogether) {
    StringMap map(kNever, 50ms, {{"a", "1"}, {"b", "2"}, {"c", "3"}});

    std::this_thread::sleep_for(80ms);
    map.sweepNow();

    EXPECT_TRUE(map.empty());
}

// ==================== Вставка ====================

TEST(TTLMapTest, AddAndGet) {
    StringMap map(kNever, 1s);

    map.add("key", "value");

    EXPECT_EQ(map.get("key"), "value");
    EXPECT_EQ(map.count(), 1u);
}

TEST(TTLMapTest, AddPair) {
    StringMap map(kNever, 1s);

    map.add(std::make_pair(std::string("key"), std::string("value")));

    EXPECT_TRUE(map.contains("key", "value"));
}

TEST(TTLMapTest, AddThrowsOnDuplicateKey) {
    StringMap map(kNever, 1s);
    map.add("key", "first");

    EXPECT_THROW(map.add("key", "second"), DuplicateKeyError);
    EXPECT_EQ(map.get("key"), "first");
    EXPECT_EQ(map.count(), 1u);
}

TEST(TTLMapTest, PutOverwrites) {
    StringMap map(kNever, 1s);

    map.put("key", "first");
    map.put("key", "second");

    EXPECT_EQ(map.get("key"), "second");
    EXPECT_EQ(map.count(), 1u);
}

TEST(TTLMapTest, FailedOverwriteKeepsOldValue) {
    TTLMap<std::string, FragileValue> map(kNever, 1s);
    map.put("k", FragileValue("original"));

    FragileValue replacement("replacement");
    FragileValue::failCopy = true;
    EXPECT_THROW(map.put("k", replacement), std::runtime_error);
    FragileValue::failCopy = false;

    EXPECT_EQ(map.get("k").text, "original");
    EXPECT_EQ(map.count(), 1u);
}

TEST(TTLMapTest, PutRefreshesTimestamp) {
    StringMap map(kNever, 150ms);

    map.put("key", "first");
    std::this_thread::sleep_for(100ms);
    map.put("key", "second");
    std::this_thread::sleep_for(100ms);
    map.sweepNow();

    // 200 мс от первой вставки, но только 100 от перезаписи
    EXPECT_EQ(map.tryGet("key"), std::optional<std::string>("second"));
}

// ==================== Чтение ====================

TEST(TTLMapTest, TryGetMissingReturnsNullopt) {
    StringMap map(kNever, 1s);

    EXPECT_FALSE(map.tryGet("missing").has_value());
}

TEST(TTLMapTest, GetMissingThrows) {
    StringMap map(kNever, 1s);

    EXPECT_THROW(map.get("missing"), KeyNotFoundError);
    EXPECT_THROW(map.get("missing"), std::out_of_range);
}

TEST(TTLMapTest, ReadsDoNotRefreshTimestamp) {
    StringMap map(kNever, 150ms);

    map.put("key", "value");
    std::this_thread::sleep_for(100ms);
    EXPECT_TRUE(map.tryGet("key").has_value());
    EXPECT_EQ(map.get("key"), "value");
    EXPECT_TRUE(map.containsKey("key"));
    std::this_thread::sleep_for(100ms);
    map.sweepNow();

    EXPECT_FALSE(map.containsKey("key"));
}

TEST(TTLMapTest, ContainsComparesValuesByEquality) {
    StringMap map(kNever, 1s);
    map.put("key", std::string("val") + "ue");

    // Другой объект строки с тем же содержимым
    std::string probe = "value";
    EXPECT_TRUE(map.contains("key", probe));
    EXPECT_FALSE(map.contains("key", "other"));
    EXPECT_FALSE(map.contains("missing", "value"));

    EXPECT_TRUE(map.containsValue(probe));
    EXPECT_FALSE(map.containsValue("other"));
}

TEST(TTLMapTest, CustomValueComparer) {
    struct CaseInsensitiveEqual {
        bool operator()(const std::string& a, const std::string& b) const {
            return a.size() == b.size() &&
                   std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
                       return std::tolower(static_cast<unsigned char>(x)) ==
                              std::tolower(static_cast<unsigned char>(y));
                   });
        }
    };

    TTLMap<std::string, std::string, std::hash<std::string>,
           std::equal_to<std::string>, CaseInsensitiveEqual> map(kNever, 1s);
    map.put("key", "Value");

    EXPECT_TRUE(map.contains("key", "VALUE"));
    EXPECT_TRUE(map.remove("key", "value"));
    EXPECT_TRUE(map.empty());
}

TEST(TTLMapTest, TimeToLive) {
    StringMap map(kNever, 1s);
    map.put("key", "value");

    auto ttl = map.timeToLive("key");
    ASSERT_TRUE(ttl.has_value());
    EXPECT_GT(ttl.value(), StringMap::Lifespan::zero());
    EXPECT_LE(ttl.value(), std::chrono::seconds(1));

    EXPECT_FALSE(map.timeToLive("missing").has_value());
}

TEST(TTLMapTest, TimeToLiveZeroWhenExpiredButNotSwept) {
    StringMap map(kNever, 30ms);
    map.put("key", "value");

    std::this_thread::sleep_for(50ms);

    auto ttl = map.timeToLive("key");
    ASSERT_TRUE(ttl.has_value());
    EXPECT_EQ(ttl.value(), StringMap::Lifespan::zero());
}

// ==================== Удаление ====================

TEST(TTLMapTest, RemoveKey) {
    StringMap map(kNever, 1s);
    map.put("key", "value");

    EXPECT_TRUE(map.remove("key"));
    EXPECT_FALSE(map.remove("key"));
    EXPECT_FALSE(map.containsKey("key"));
}

TEST(TTLMapTest, RemoveExpiredButNotSweptKey) {
    StringMap map(kNever, 10ms);
    map.put("key", "value");

    std::this_thread::sleep_for(30ms);

    EXPECT_TRUE(map.remove("key"));
}

TEST(TTLMapTest, RemovePairRequiresEqualValue) {
    StringMap map(kNever, 1s);
    map.put("key", "value");

    EXPECT_FALSE(map.remove("key", "other"));
    EXPECT_TRUE(map.containsKey("key"));

    EXPECT_TRUE(map.remove("key", "value"));
    EXPECT_FALSE(map.containsKey("key"));
}

TEST(TTLMapTest, Clear) {
    StringMap map(kNever, 1s);
    map.put("a", "1");
    map.put("b", "2");

    map.clear();

    EXPECT_EQ(map.count(), 0u);
    EXPECT_TRUE(map.empty());
}

// ==================== Истечение ====================

TEST(TTLMapTest, EntryPresentBeforeLifespanAndGoneAfter) {
    StringMap map(50ms, 500ms);
    map.put("k", "v");

    std::this_thread::sleep_for(300ms);
    EXPECT_EQ(map.tryGet("k"), std::optional<std::string>("v"));

    std::this_thread::sleep_for(400ms);
    EXPECT_FALSE(map.tryGet("k").has_value());
    EXPECT_FALSE(map.containsKey("k"));
}

TEST(TTLMapTest, ExpiredEntryVisibleUntilSweep) {
    StringMap map(kNever, 20ms);
    map.put("k", "v");

    std::this_thread::sleep_for(50ms);

    // Ленивое физическое удаление: до очистки элемент виден
    EXPECT_TRUE(map.containsKey("k"));
    EXPECT_EQ(map.count(), 1u);

    map.sweepNow();

    EXPECT_FALSE(map.containsKey("k"));
    EXPECT_EQ(map.count(), 0u);
}

TEST(TTLMapTest, SweepRemovesOnlyExpired) {
    StringMap map(kNever, 100ms);
    map.put("old1", "1");
    map.put("old2", "2");

    std::this_thread::sleep_for(130ms);
    map.put("new", "3");
    map.sweepNow();

    EXPECT_EQ(map.count(), 1u);
    EXPECT_TRUE(map.containsKey("new"));
}

TEST(TTLMapTest, ZeroLifespanExpiresOnNextSweep) {
    StringMap map(kNever, StringMap::Lifespan::zero());
    map.put("a", "1");
    map.put("b", "2");

    EXPECT_EQ(map.count(), 2u);

    map.sweepNow();

    EXPECT_TRUE(map.empty());
}

TEST(TTLMapTest, ShorterLifespanAppliesOnNextSweep) {
    StringMap map(kNever, std::chrono::hours(1));
    map.put("key", "value");

    std::this_thread::sleep_for(100ms);
    map.setLifespan(50ms);

    // Не мгновенно
    EXPECT_TRUE(map.containsKey("key"));

    map.sweepNow();

    // По исходной метке времени: 100 мс >= 50 мс
    EXPECT_FALSE(map.containsKey("key"));
}

TEST(TTLMapTest, LongerLifespanKeepsEntries) {
    StringMap map(kNever, 50ms);
    map.put("key", "value");

    map.setLifespan(std::chrono::hours(1));
    std::this_thread::sleep_for(80ms);
    map.sweepNow();

    EXPECT_TRUE(map.containsKey("key"));
}

TEST(TTLMapTest, SetLifespanValidates) {
    StringMap map(kNever, 1s);

    EXPECT_THROW(map.setLifespan(-1ms), ConfigurationError);
    EXPECT_EQ(map.lifespan(), std::chrono::seconds(1));
}

TEST(TTLMapTest, IntervalChangeDoesNotChangeWhatIsExpired) {
    StringMap map(kNever, 1s);
    map.put("key", "value");

    map.setInterval(10ms);
    map.sweepNow();

    EXPECT_EQ(map.interval(), std::chrono::milliseconds(10));
    EXPECT_TRUE(map.containsKey("key"));
}

TEST(TTLMapTest, ShorterIntervalDoesNotWaitForOldTick) {
    StringMap map(kNever, 10ms);
    map.put("key", "value");

    map.setInterval(20ms);
    std::this_thread::sleep_for(200ms);

    EXPECT_FALSE(map.containsKey("key"));
}

TEST(TTLMapTest, SetIntervalValidates) {
    StringMap map(kNever, 1s);

    EXPECT_THROW(map.setInterval(0ms), ConfigurationError);
}

// ==================== Жизненный цикл ====================

TEST(TTLMapTest, StoppedMapDoesNotExpire) {
    StringMap map(10ms, 20ms);
    map.stop();
    EXPECT_FALSE(map.isRunning());

    map.put("key", "value");
    std::this_thread::sleep_for(80ms);

    EXPECT_TRUE(map.containsKey("key"));

    map.start();
    std::this_thread::sleep_for(80ms);

    EXPECT_FALSE(map.containsKey("key"));
}

TEST(TTLMapTest, UsableAfterStop) {
    StringMap map(10ms, 1s);
    map.stop();

    map.put("key", "value");
    EXPECT_EQ(map.get("key"), "value");
    EXPECT_TRUE(map.remove("key"));
}

// ==================== Копии ====================

TEST(TTLMapTest, ItemsIsPointInTimeCopy) {
    StringMap map(kNever, 1s);
    map.put("a", "1");
    map.put("b", "2");

    auto items = map.items();
    map.put("c", "3");
    map.remove("a");

    std::map<std::string, std::string> seen(items.begin(), items.end());
    EXPECT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen["a"], "1");
    EXPECT_EQ(seen["b"], "2");
}

TEST(TTLMapTest, IterationSurvivesConcurrentSweep) {
    StringMap map(kNever, 30ms);
    for (int i = 0; i < 100; ++i) {
        map.put("key" + std::to_string(i), std::to_string(i));
    }
    std::this_thread::sleep_for(50ms);

    size_t visited = 0;
    for (const auto& [key, value] : map.items()) {
        if (visited == 0) {
            map.sweepNow();  // удаляет всё прямо во время обхода
        }
        EXPECT_EQ(key, "key" + value);
        ++visited;
    }

    EXPECT_EQ(visited, 100u);
    EXPECT_TRUE(map.empty());
}

TEST(TTLMapTest, KeysAndValues) {
    StringMap map(kNever, 1s);
    map.put("a", "1");
    map.put("b", "2");

    auto keys = map.keys();
    auto values = map.values();
    std::sort(keys.begin(), keys.end());
    std::sort(values.begin(), values.end());

    EXPECT_EQ(keys, (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(values, (std::vector<std::string>{"1", "2"}));
}

TEST(TTLMapTest, CopyTo) {
    TTLMap<int, int> map(kNever, 1s);
    map.put(1, 10);
    map.put(2, 20);

    std::map<int, int> out;
    map.copyTo(std::inserter(out, out.end()));

    EXPECT_EQ(out, (std::map<int, int>{{1, 10}, {2, 20}}));
}

TEST(TTLMapTest, SnapshotIsValueOnly) {
    TTLMap<int, std::string> map(kNever, 1s);
    map.put(1, "one");

    std::unordered_map<int, std::string> plain = map.snapshot();

    EXPECT_EQ(plain.size(), 1u);
    EXPECT_EQ(plain.at(1), "one");
}
