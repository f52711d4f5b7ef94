#include <rediscache/Cache.hpp>
#include <rediscache/compression/ZlibCompressor.hpp>
#include <rediscache/hooks/MetricsHook.hpp>
#include <rediscache/listeners/ICacheListener.hpp>
#include <rediscache/listeners/StatsListener.hpp>
#include <rediscache/listeners/ThreadPerListenerComposite.hpp>
#include <rediscache/serialization/BinaryCodec.hpp>
#include <rediscache/store/InMemoryStore.hpp>

#include <atomic>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <random>
#include <string>
#include <thread>
#include <vector>

/**
 * @brief Бенчмарк фасада поверх InMemoryStore
 *
 * Измеряем:
 * - Стоимость конвейера (кодек, сжатие, хуки) на set/get
 * - Число round-trip'ов mget при разных batchSize
 * - Влияние слушателей: sync vs async
 * - Пропускную способность upsert при конкуренции за один ключ
 */

// ==================== Утилиты ====================

template<typename Func>
double measureMs(Func&& func) {
    auto start = std::chrono::high_resolution_clock::now();
    func();
    auto end = std::chrono::high_resolution_clock::now();

    std::chrono::duration<double, std::milli> duration = end - start;
    return duration.count();
}

void printResult(const std::string& name, double timeMs, size_t operations) {
    double opsPerSec = (operations / timeMs) * 1000.0;
    std::cout << std::left << std::setw(45) << name
              << std::right << std::setw(10) << std::fixed << std::setprecision(2)
              << timeMs << " ms"
              << std::setw(15) << std::fixed << std::setprecision(0)
              << opsPerSec << " ops/sec\n";
}

Cache<std::string> makeCache(std::shared_ptr<InMemoryStore> store,
                             bool compress = false, size_t batchSize = 0) {
    CacheConfig<std::string> config;
    config.codec = std::make_shared<BinaryCodec<std::string>>();
    if (compress) {
        config.compressor = std::make_shared<ZlibCompressor>();
    }
    config.batchSize = batchSize;
    return Cache<std::string>(std::move(store), config);
}

std::string makeValue(size_t size) {
    std::string value;
    value.reserve(size);
    while (value.size() < size) {
        value += "quote:SBER:last=271.35;";
    }
    value.resize(size);
    return value;
}

// ==================== Конвейер ====================

void benchmarkPipeline(size_t numOperations, size_t valueSize) {
    std::string value = makeValue(valueSize);
    auto ctx = Context::background();

    {
        auto cache = makeCache(std::make_shared<InMemoryStore>());
        double timeMs = measureMs([&]() {
            for (size_t i = 0; i < numOperations; ++i) {
                std::string key = "k" + std::to_string(i % 1000);
                cache.set(ctx, key, value);
                cache.get(ctx, key);
            }
        });
        printResult("set+get, no compression (" + std::to_string(valueSize) + "B)",
                    timeMs, numOperations * 2);
    }

    {
        auto cache = makeCache(std::make_shared<InMemoryStore>(), true);
        double timeMs = measureMs([&]() {
            for (size_t i = 0; i < numOperations; ++i) {
                std::string key = "k" + std::to_string(i % 1000);
                cache.set(ctx, key, value);
                cache.get(ctx, key);
            }
        });
        printResult("set+get, zlib (" + std::to_string(valueSize) + "B)",
                    timeMs, numOperations * 2);
    }

    {
        auto cache = makeCache(std::make_shared<InMemoryStore>(), true);
        auto metrics = std::make_shared<MetricsHook<std::string>>();
        cache.addHook(metrics);
        double timeMs = measureMs([&]() {
            for (size_t i = 0; i < numOperations; ++i) {
                std::string key = "k" + std::to_string(i % 1000);
                cache.set(ctx, key, value);
                cache.get(ctx, key);
            }
        });
        printResult("set+get, zlib + MetricsHook", timeMs, numOperations * 2);
        std::cout << "   Encodes: " << metrics->encodes()
                  << ", decodes: " << metrics->decodes() << "\n";
    }
}

// ==================== MGet ====================

void benchmarkMultiGet(size_t numKeys, size_t rounds) {
    auto ctx = Context::background();
    std::vector<std::string> keys;
    for (size_t i = 0; i < numKeys; ++i) {
        keys.push_back("key:" + std::to_string(i));
    }

    for (size_t batchSize : {size_t(0), size_t(10), size_t(100)}) {
        auto store = std::make_shared<InMemoryStore>();
        auto cache = makeCache(store, false, batchSize);
        for (size_t i = 0; i < numKeys; i += 2) {
            cache.set(ctx, keys[i], "value" + std::to_string(i));
        }
        size_t before = store->roundTrips();

        double timeMs = measureMs([&]() {
            for (size_t r = 0; r < rounds; ++r) {
                cache.mget(ctx, keys);
            }
        });

        printResult("mget " + std::to_string(numKeys) + " keys, batch=" +
                    std::to_string(batchSize), timeMs, rounds * numKeys);
        std::cout << "   Round-trips per call: "
                  << (store->roundTrips() - before) / rounds << "\n";
    }
}

// ==================== Слушатели ====================

/**
 * @brief "Медленный" слушатель — симулирует отправку метрик по сети
 *
 * Busy wait вместо sleep: предсказуемее на коротких задержках.
 */
class SlowListener : public ICacheListener {
public:
    explicit SlowListener(std::chrono::microseconds delay) : delay_(delay) {}

    void onOperation(const OperationEvent&) override { doWork(); }

    std::atomic<uint64_t> callCount{0};

private:
    void doWork() {
        ++callCount;
        auto start = std::chrono::high_resolution_clock::now();
        while (std::chrono::high_resolution_clock::now() - start < delay_) {
            // spin
        }
    }

    std::chrono::microseconds delay_;
};

void benchmarkListenerOverhead(size_t numOperations) {
    std::cout << "\n--- Listener overhead: sync vs async (10us per event) ---\n\n";
    auto ctx = Context::background();

    auto run = [&](Cache<std::string>& cache) {
        return measureMs([&]() {
            for (size_t i = 0; i < numOperations; ++i) {
                cache.set(ctx, "k" + std::to_string(i % 100), "v");
            }
        });
    };

    {
        auto cache = makeCache(std::make_shared<InMemoryStore>());
        printResult("  Baseline (no listeners)", run(cache), numOperations);
    }

    {
        auto cache = makeCache(std::make_shared<InMemoryStore>());
        cache.addListener(std::make_shared<StatsListener>());
        printResult("  SYNC StatsListener", run(cache), numOperations);
    }

    {
        auto cache = makeCache(std::make_shared<InMemoryStore>());
        cache.addListener(std::make_shared<SlowListener>(std::chrono::microseconds(10)));
        printResult("  SYNC SlowListener", run(cache), numOperations);
    }

    {
        auto cache = makeCache(std::make_shared<InMemoryStore>());
        auto composite = std::make_shared<ThreadPerListenerComposite>();
        composite->addListener(std::make_shared<SlowListener>(std::chrono::microseconds(10)));
        cache.addListener(composite);
        printResult("  ASYNC SlowListener", run(cache), numOperations);

        double drainTime = measureMs([&]() {
            composite->stop();
        });
        std::cout << "     Background drain: " << std::fixed << std::setprecision(0)
                  << drainTime << " ms\n";
    }
}

// ==================== Upsert ====================

void benchmarkUpsertContention(size_t numThreads, size_t perThread) {
    auto store = std::make_shared<InMemoryStore>();
    CacheConfig<int> config;
    config.codec = std::make_shared<BinaryCodec<int>>();
    config.upsertMaxRetries = 1000;
    Cache<int> cache(store, config);
    auto stats = std::make_shared<StatsListener>();
    cache.addListener(stats);

    double timeMs = measureMs([&]() {
        std::vector<std::thread> workers;
        for (size_t t = 0; t < numThreads; ++t) {
            workers.emplace_back([&]() {
                auto ctx = Context::background();
                for (size_t i = 0; i < perThread; ++i) {
                    cache.upsert(ctx, "counter", [](const std::optional<int>& current) {
                        return std::optional<int>(current.value_or(0) + 1);
                    });
                }
            });
        }
        for (auto& worker : workers) {
            worker.join();
        }
    });

    printResult("upsert, " + std::to_string(numThreads) + " threads, one key",
                timeMs, numThreads * perThread);
    std::cout << "   Final counter: " << cache.get(Context::background(), "counter")
              << ", conflicts: " << stats->conflicts() << "\n";
}

// ==================== Main ====================

int main() {
    const size_t NUM_OPS = 200000;

    std::cout << "=== Cache Benchmark (InMemoryStore) ===\n";
    std::cout << "Operations: " << NUM_OPS << "\n\n";

    std::cout << "--- Codec pipeline ---\n";
    benchmarkPipeline(NUM_OPS, 64);
    benchmarkPipeline(NUM_OPS / 10, 4096);

    std::cout << "\n--- Batched mget ---\n";
    benchmarkMultiGet(1000, 200);

    benchmarkListenerOverhead(NUM_OPS / 10);

    std::cout << "\n--- CAS upsert ---\n";
    benchmarkUpsertContention(8, 2000);

    std::cout << "\n=== Benchmark complete ===\n";

    return 0;
}
