#include <gtest/gtest.h>
#include <rediscache/Cache.hpp>
#include <rediscache/compression/ZlibCompressor.hpp>
#include <rediscache/hooks/MetricsHook.hpp>
#include <rediscache/listeners/StatsListener.hpp>
#include <rediscache/serialization/BinaryCodec.hpp>
#include <rediscache/store/InMemoryStore.hpp>

#include <atomic>
#include <thread>
#include <vector>

/**
 * @brief Тесты конкурентного использования фасада
 *
 * Проверяем:
 * - Параллельные set/get/mget на разных ключах без внешней синхронизации
 * - addHook / addListener во время работы других потоков
 * - Данные корректны после многопоточной работы
 */

namespace {

Cache<std::string> makeCache(std::shared_ptr<InMemoryStore> store) {
    CacheConfig<std::string> config;
    config.codec = std::make_shared<BinaryCodec<std::string>>();
    config.compressor = std::make_shared<ZlibCompressor>();
    config.batchSize = 3;
    return Cache<std::string>(std::move(store), config);
}

}  // namespace

TEST(ConcurrencyTest, ParallelSetAndGet) {
    auto store = std::make_shared<InMemoryStore>();
    auto cache = makeCache(store);
    auto stats = std::make_shared<StatsListener>();
    cache.addListener(stats);
    const int threads = 8;
    const int perThread = 200;

    std::vector<std::thread> workers;
    for (int t = 0; t < threads; ++t) {
        workers.emplace_back([&, t] {
            auto ctx = Context::background();
            for (int i = 0; i < perThread; ++i) {
                std::string key = "t" + std::to_string(t) + ":" + std::to_string(i);
                cache.set(ctx, key, key + "-value");
                EXPECT_EQ(cache.get(ctx, key), key + "-value");
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    EXPECT_EQ(store->size(), static_cast<size_t>(threads * perThread));
    EXPECT_EQ(stats->sets(), static_cast<uint64_t>(threads * perThread));
    EXPECT_EQ(stats->hits(), static_cast<uint64_t>(threads * perThread));
    EXPECT_EQ(stats->failures(), 0u);
}

TEST(ConcurrencyTest, ParallelMgetPreservesOrder) {
    auto store = std::make_shared<InMemoryStore>();
    auto cache = makeCache(store);
    auto ctx = Context::background();
    std::vector<std::string> keys;
    for (int i = 0; i < 10; ++i) {
        keys.push_back("k" + std::to_string(i));
        cache.set(ctx, keys.back(), "v" + std::to_string(i));
    }

    std::atomic<int> mismatches{0};
    std::vector<std::thread> workers;
    for (int t = 0; t < 4; ++t) {
        workers.emplace_back([&] {
            for (int round = 0; round < 100; ++round) {
                auto results = cache.mget(Context::background(), keys);
                for (size_t i = 0; i < results.size(); ++i) {
                    if (!results[i].found() || *results[i].value != "v" + std::to_string(i)) {
                        ++mismatches;
                    }
                }
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    EXPECT_EQ(mismatches.load(), 0);
}

TEST(ConcurrencyTest, AddHookWhileOperating) {
    auto store = std::make_shared<InMemoryStore>();
    auto cache = makeCache(store);
    std::atomic<bool> stop{false};
    std::atomic<int> errors{0};

    std::vector<std::thread> workers;
    for (int t = 0; t < 4; ++t) {
        workers.emplace_back([&, t] {
            auto ctx = Context::background();
            std::string key = "key" + std::to_string(t);
            while (!stop) {
                try {
                    cache.set(ctx, key, "value");
                    if (cache.get(ctx, key) != "value") {
                        ++errors;
                    }
                } catch (const CacheError&) {
                    ++errors;
                }
            }
        });
    }

    std::vector<std::shared_ptr<MetricsHook<std::string>>> hooks;
    for (int i = 0; i < 10; ++i) {
        auto hook = std::make_shared<MetricsHook<std::string>>();
        hooks.push_back(hook);
        cache.addHook(hook);
        cache.addListener(std::make_shared<StatsListener>());
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    stop = true;
    for (auto& worker : workers) {
        worker.join();
    }

    EXPECT_EQ(errors.load(), 0);
    EXPECT_EQ(cache.hookCount(), 10u);

    // Все добавленные хуки входят в текущий снимок конвейера
    cache.set(Context::background(), "final", "x");
    EXPECT_GT(hooks.front()->encodes(), 0u);
    EXPECT_GT(hooks.back()->encodes(), 0u);
}
