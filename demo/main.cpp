#include <ttl/TTLList.hpp>
#include <ttl/TTLMap.hpp>
#include <ttl/listeners/LoggingListener.hpp>
#include <ttl/listeners/StatsListener.hpp>

#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

/**
 * @brief Демонстрация TTL-коллекций
 *
 * Сценарии:
 * 1. Хранилище сессий: токены живут фиксированное время
 * 2. Лента последних действий: список, из которого старое уходит само
 * 3. Изменение параметров на лету и ручная очистка
 */

using namespace std::chrono_literals;

void printSeparator(const std::string& title) {
    std::cout << "\n" << std::string(60, '=') << "\n";
    std::cout << "  " << title << "\n";
    std::cout << std::string(60, '=') << "\n\n";
}

/**
 * @brief Демо 1: Хранилище сессий
 *
 * Токен -> пользователь. Сессия живёт 300 мс, очистка каждые 50 мс.
 * Повторный логин (put) продлевает сессию.
 */
void demoSessionStore() {
    printSeparator("Demo 1: Session Store");

    TTLMap<std::string, std::string> sessions(50ms, 300ms);
    auto stats = std::make_shared<StatsListener<std::string, std::string>>();
    sessions.addListener(std::make_shared<LoggingListener<std::string, std::string>>("sessions"));
    sessions.addListener(stats);

    sessions.put("tok-alice", "alice");
    sessions.put("tok-bob", "bob");
    sessions.add("tok-carol", "carol");

    try {
        sessions.add("tok-alice", "mallory");
    } catch (const DuplicateKeyError& e) {
        std::cout << "  Rejected duplicate login: " << e.what() << "\n";
    }

    std::this_thread::sleep_for(200ms);
    std::cout << "\n  Alice logs in again, her session is renewed\n";
    sessions.put("tok-alice", "alice");

    std::this_thread::sleep_for(250ms);

    std::cout << "\n  After 450 ms:\n";
    for (const auto& [token, user] : sessions.items()) {
        std::cout << "    " << token << " -> " << user << "\n";
    }

    auto bob = sessions.tryGet("tok-bob");
    std::cout << "  Bob's session: " << (bob ? *bob : std::string("expired")) << "\n";

    std::cout << "\n  Stats: inserts=" << stats->inserts()
              << " updates=" << stats->updates()
              << " expirations=" << stats->expirations()
              << " sweeps=" << stats->sweeps() << "\n";
}

/**
 * @brief Демо 2: Лента последних действий
 *
 * События добавляются в конец, старые исчезают из головы.
 */
void demoActivityFeed() {
    printSeparator("Demo 2: Recent Activity Feed");

    TTLList<std::string> feed(ExpiryConfig::fast());
    auto stats = std::make_shared<StatsListener<size_t, std::string>>();
    feed.addListener(stats);

    const std::vector<std::string> events = {
        "alice opened dashboard",
        "bob uploaded report.pdf",
        "alice commented on report.pdf",
        "carol joined the team",
    };

    for (const auto& event : events) {
        feed.add(event);
        std::this_thread::sleep_for(150ms);
    }

    std::cout << "  Feed after posting " << events.size() << " events "
              << "(lifespan " << std::chrono::duration_cast<std::chrono::milliseconds>(
                     feed.lifespan()).count() << " ms):\n";
    auto snapshot = feed.snapshot();
    for (size_t i = 0; i < snapshot.size(); ++i) {
        std::cout << "    [" << i << "] " << snapshot[i] << "\n";
    }

    size_t index = feed.indexOf("carol joined the team");
    if (index != TTLList<std::string>::npos) {
        std::cout << "  Latest event is at index " << index << "\n";
    }

    std::cout << "  Expired so far: " << stats->expirations() << "\n";
}

/**
 * @brief Демо 3: Параметры на лету
 *
 * Останавливаем фоновую очистку, укорачиваем lifespan и чистим вручную.
 */
void demoReconfigure() {
    printSeparator("Demo 3: Reconfiguration and Manual Sweep");

    TTLMap<int, std::string> cache(ExpiryConfig::standard());
    cache.addListener(std::make_shared<LoggingListener<int, std::string>>("cache"));

    for (int i = 1; i <= 3; ++i) {
        cache.put(i, "value-" + std::to_string(i));
    }

    cache.stop();
    std::cout << "\n  Background sweep running: " << std::boolalpha << cache.isRunning() << "\n";

    std::this_thread::sleep_for(100ms);
    cache.setLifespan(50ms);
    std::cout << "  Lifespan shortened to 50 ms, count before sweep: " << cache.count() << "\n";

    cache.sweepNow();
    std::cout << "  Count after manual sweep: " << cache.count() << "\n";

    cache.setInterval(20ms);
    cache.start();
    cache.put(42, "answer");
    std::this_thread::sleep_for(120ms);
    std::cout << "  Count after restart: " << cache.count() << "\n";

    try {
        cache.setInterval(0ms);
    } catch (const ConfigurationError& e) {
        std::cout << "  Rejected interval: " << e.what() << "\n";
    }
}

int main() {
    std::cout << "=== TTL Collections Demo ===\n";

    try {
        demoSessionStore();
        demoActivityFeed();
        demoReconfigure();

        std::cout << "\n" << std::string(60, '=') << "\n";
        std::cout << "  Demo Complete!\n";
        std::cout << std::string(60, '=') << "\n";

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
