#include <rediscache/Cache.hpp>
#include <rediscache/compression/ZlibCompressor.hpp>
#include <rediscache/hooks/MetricsHook.hpp>
#include <rediscache/listeners/LoggingListener.hpp>
#include <rediscache/listeners/StatsListener.hpp>
#include <rediscache/serialization/JsonCodec.hpp>
#include <rediscache/store/InMemoryStore.hpp>
#include <rediscache/store/RedisStore.hpp>

#include <iomanip>
#include <iostream>
#include <thread>
#include <vector>

/**
 * @brief Демонстрация кэша поверх Redis на примере профилей пользователей
 *
 * Подключение берётся из окружения (REDIS_HOST, REDIS_PORT, ...).
 * Если Redis недоступен, демо работает на InMemoryStore.
 *
 * Сценарии:
 * 1. set / get / KeyNotFound
 * 2. Пакетное чтение mget
 * 3. Конкурентный счётчик через upsert
 * 4. Метрики конвейера и статистика слушателя
 */

struct Person {
    std::string name;
    int age = 0;
    int visits = 0;
};

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(Person, name, age, visits)

void printSeparator(const std::string& title) {
    std::cout << "\n" << std::string(60, '=') << "\n";
    std::cout << "  " << title << "\n";
    std::cout << std::string(60, '=') << "\n\n";
}

std::shared_ptr<IStore> connectStore() {
    try {
        RedisStoreOptions options = RedisStoreOptions::fromEnvironment();
        auto store = std::make_shared<RedisStore>(options);
        std::cout << "Connected to Redis at " << options.host << ":" << options.port
                  << " (db " << options.db << ")\n";
        return store;
    } catch (const StoreError& e) {
        std::cout << "Redis is not available (" << e.what()
                  << "), falling back to in-memory store\n";
        return std::make_shared<InMemoryStore>();
    }
}

/**
 * @brief Демо 1: базовые операции
 */
void demoBasics(Cache<Person>& cache, const Context& ctx) {
    printSeparator("Demo 1: set / get");

    cache.set(ctx, "person:alice", Person{"Alice", 30, 0}, std::chrono::minutes(10));
    Person alice = cache.get(ctx, "person:alice");
    std::cout << "  Loaded: " << alice.name << ", " << alice.age << "\n";

    auto ttl = cache.ttl(ctx, "person:alice");
    if (ttl) {
        std::cout << "  TTL: " << ttl->count() << " ms\n";
    }

    try {
        cache.get(ctx, "person:nobody");
    } catch (const KeyNotFoundError& e) {
        std::cout << "  Expected miss: " << e.what() << "\n";
    }
}

/**
 * @brief Демо 2: пакетное чтение
 */
void demoMultiGet(Cache<Person>& cache, const Context& ctx) {
    printSeparator("Demo 2: batched mget");

    cache.mset(ctx, {
        {"person:bob", Person{"Bob", 41, 0}},
        {"person:carol", Person{"Carol", 25, 0}},
    });

    auto results = cache.mget(ctx, {"person:alice", "person:ghost", "person:bob", "person:carol"});
    for (const auto& result : results) {
        std::cout << "  " << std::left << std::setw(16) << result.key;
        if (result.found()) {
            std::cout << result.value->name << " (" << result.value->age << ")\n";
        } else {
            std::cout << "<not found>\n";
        }
    }
}

/**
 * @brief Демо 3: счётчик посещений из нескольких потоков
 */
void demoUpsert(Cache<Person>& cache) {
    printSeparator("Demo 3: concurrent upsert");

    const int threads = 4;
    const int perThread = 25;
    std::vector<std::thread> workers;
    for (int t = 0; t < threads; ++t) {
        workers.emplace_back([&cache]() {
            auto ctx = Context::withTimeout(std::chrono::seconds(30));
            for (int i = 0; i < perThread; ++i) {
                cache.upsert(ctx, "person:alice", [](const std::optional<Person>& current) {
                    std::optional<Person> next = current;
                    if (!next) {
                        next = Person{"Alice", 30, 0};
                    }
                    next->visits += 1;
                    return next;
                });
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    Person alice = cache.get(Context::background(), "person:alice");
    std::cout << "  Visits: " << alice.visits << " (expected "
              << threads * perThread << ")\n";
}

int main() {
    auto store = connectStore();

    CacheConfig<Person> config;
    config.codec = std::make_shared<MsgpackCodec<Person>>();
    config.compressor = std::make_shared<ZlibCompressor>();
    config.batchSize = 2;
    config.upsertMaxRetries = 100;
    config.upsertRetryBackoff = Duration(1);

    auto metrics = std::make_shared<MetricsHook<Person>>();
    config.hooks.push_back(metrics);

    Cache<Person> cache(store, config);

    auto stats = std::make_shared<StatsListener>();
    cache.addListener(stats);
    auto logging = std::make_shared<LoggingListener>("Cache", std::cout);
    cache.addListener(logging);

    auto ctx = Context::withTimeout(std::chrono::seconds(10));

    try {
        demoBasics(cache, ctx);
        demoMultiGet(cache, ctx);
    } catch (const CacheError& e) {
        std::cerr << "Cache error: " << e.what() << "\n";
        return 1;
    }

    // Счётчик шумит в логе, поэтому только статистика
    cache.removeListener(logging);
    demoUpsert(cache);

    printSeparator("Statistics");
    std::cout << "  Hits: " << stats->hits() << ", misses: " << stats->misses()
              << ", sets: " << stats->sets() << ", conflicts: " << stats->conflicts() << "\n";
    std::cout << "  Hit rate: " << std::fixed << std::setprecision(1)
              << stats->hitRate() * 100 << "%\n";
    std::cout << "  Encodes: " << metrics->encodes() << ", decodes: " << metrics->decodes()
              << ", encode+decode time: " << std::setprecision(3)
              << metrics->serializationTime().sumSeconds() * 1000 << " ms\n";

    cache.remove(Context::background(), "person:alice");
    cache.remove(Context::background(), "person:bob");
    cache.remove(Context::background(), "person:carol");

    return 0;
}
