#include <gtest/gtest.h>
#include <rediscache/Cache.hpp>
#include <rediscache/listeners/StatsListener.hpp>
#include <rediscache/serialization/BinaryCodec.hpp>
#include <rediscache/store/InMemoryStore.hpp>

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <thread>
#include <vector>

/**
 * @brief Тесты upsert (compare-and-set)
 *
 * Проверяем:
 * - Создание при отсутствии ключа, обновление существующего
 * - Отказ от записи (Aborted) не трогает хранилище
 * - Гонку двух писателей: ровно один конфликт, итог +2
 * - Внутренние повторы и их исчерпание
 * - TTL: сохранение (KEEPTTL) и явная установка
 * - Ошибки callback и декодирования пробрасываются без записи
 * - Отмену контекста во время паузы между повторами
 */

// ==================== Вспомогательные типы ====================

namespace {

CacheConfig<int> counterConfig(int maxRetries = 0) {
    CacheConfig<int> config;
    config.codec = std::make_shared<BinaryCodec<int>>();
    config.upsertMaxRetries = maxRetries;
    return config;
}

std::optional<int> increment(const std::optional<int>& current) {
    return current.value_or(0) + 1;
}

/// Одноразовый барьер: все участники ждут, пока не придут total потоков
class Barrier {
public:
    explicit Barrier(int total)
        : total_(total)
    {}

    void arriveAndWait() {
        std::unique_lock<std::mutex> lock(mutex_);
        if (++arrived_ >= total_) {
            condVar_.notify_all();
            return;
        }
        condVar_.wait(lock, [this] { return arrived_ >= total_; });
    }

private:
    std::mutex mutex_;
    std::condition_variable condVar_;
    int total_;
    int arrived_ = 0;
};

/// Хранилище, в котором compareAndSet всегда проигрывает гонку
class AlwaysConflictStore : public InMemoryStore {
public:
    bool compareAndSet(const Context& ctx, const std::string& key,
                       const std::optional<Bytes>& expected, const Bytes& value,
                       std::optional<Duration> ttl) override {
        (void)key; (void)expected; (void)value; (void)ttl;
        ctx.throwIfDone();
        ++casCalls;
        return false;
    }

    std::atomic<int> casCalls{0};
};

}  // namespace

// ==================== Базовые сценарии ====================

TEST(UpsertTest, CreatesMissingKey) {
    Cache<int> cache(std::make_shared<InMemoryStore>(), counterConfig());
    auto ctx = Context::background();
    bool sawAbsent = false;

    auto result = cache.upsert(ctx, "counter", [&](const std::optional<int>& current) {
        sawAbsent = !current.has_value();
        return std::optional<int>(10);
    });

    EXPECT_EQ(result, UpsertResult::Written);
    EXPECT_TRUE(sawAbsent);
    EXPECT_EQ(cache.get(ctx, "counter"), 10);
}

TEST(UpsertTest, UpdatesExistingValue) {
    Cache<int> cache(std::make_shared<InMemoryStore>(), counterConfig());
    auto ctx = Context::background();
    cache.set(ctx, "counter", 41);

    EXPECT_EQ(cache.upsert(ctx, "counter", increment), UpsertResult::Written);
    EXPECT_EQ(cache.get(ctx, "counter"), 42);
}

TEST(UpsertTest, AbortLeavesValueUnchanged) {
    auto store = std::make_shared<InMemoryStore>();
    Cache<int> cache(store, counterConfig());
    auto ctx = Context::background();
    cache.set(ctx, "counter", 5);
    auto before = store->get(ctx, "counter");

    auto result = cache.upsert(ctx, "counter", [](const std::optional<int>&) {
        return std::optional<int>();
    });

    EXPECT_EQ(result, UpsertResult::Aborted);
    EXPECT_EQ(store->get(ctx, "counter"), before);
    EXPECT_EQ(cache.get(ctx, "counter"), 5);
}

TEST(UpsertTest, AbortOnMissingKeyCreatesNothing) {
    auto store = std::make_shared<InMemoryStore>();
    Cache<int> cache(store, counterConfig());

    auto result = cache.upsert(Context::background(), "counter",
                               [](const std::optional<int>&) { return std::optional<int>(); });

    EXPECT_EQ(result, UpsertResult::Aborted);
    EXPECT_EQ(store->size(), 0u);
}

TEST(UpsertTest, NullCallbackRejected) {
    Cache<int> cache(std::make_shared<InMemoryStore>(), counterConfig());

    EXPECT_THROW(cache.upsert(Context::background(), "counter", Cache<int>::UpdateFn()),
                 std::invalid_argument);
}

// ==================== Гонка ====================

TEST(UpsertTest, TwoRacingWritersOneConflictNoLostUpdate) {
    Cache<int> cache(std::make_shared<InMemoryStore>(), counterConfig(0));
    auto ctx = Context::background();
    cache.set(ctx, "counter", 0);

    Barrier barrier(2);
    std::atomic<int> conflicts{0};

    auto writer = [&] {
        bool first = true;
        for (;;) {
            try {
                cache.upsert(ctx, "counter", [&](const std::optional<int>& current) {
                    // Оба писателя прочитали одно и то же значение до записи
                    if (first) {
                        first = false;
                        barrier.arriveAndWait();
                    }
                    return increment(current);
                });
                return;
            } catch (const RetryableConflictError&) {
                ++conflicts;
            }
        }
    };

    std::thread a(writer);
    std::thread b(writer);
    a.join();
    b.join();

    EXPECT_EQ(conflicts.load(), 1);
    EXPECT_EQ(cache.get(ctx, "counter"), 2);
}

TEST(UpsertTest, InternalRetryResolvesRace) {
    Cache<int> cache(std::make_shared<InMemoryStore>(), counterConfig(1));
    auto stats = std::make_shared<StatsListener>();
    cache.addListener(stats);
    auto ctx = Context::background();
    cache.set(ctx, "counter", 0);

    Barrier barrier(2);
    auto writer = [&] {
        bool first = true;
        cache.upsert(ctx, "counter", [&](const std::optional<int>& current) {
            if (first) {
                first = false;
                barrier.arriveAndWait();
            }
            return increment(current);
        });
    };

    std::thread a(writer);
    std::thread b(writer);
    a.join();
    b.join();

    EXPECT_EQ(cache.get(ctx, "counter"), 2);
    EXPECT_EQ(stats->conflicts(), 1u);
    EXPECT_EQ(stats->failures(), 0u);
}

TEST(UpsertTest, ManyWritersNeverLoseIncrements) {
    Cache<int> cache(std::make_shared<InMemoryStore>(), counterConfig(1000));
    auto ctx = Context::background();
    const int threads = 8;
    const int perThread = 50;

    std::vector<std::thread> workers;
    for (int t = 0; t < threads; ++t) {
        workers.emplace_back([&] {
            for (int i = 0; i < perThread; ++i) {
                cache.upsert(ctx, "counter", increment);
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    EXPECT_EQ(cache.get(ctx, "counter"), threads * perThread);
}

// ==================== Повторы ====================

TEST(UpsertTest, ConflictSurfacedWithoutRetries) {
    auto store = std::make_shared<AlwaysConflictStore>();
    Cache<int> cache(store, counterConfig(0));

    try {
        cache.upsert(Context::background(), "counter", increment);
        FAIL() << "expected RetryableConflictError";
    } catch (const RetryableConflictError& e) {
        EXPECT_EQ(e.attempts(), 1);
        EXPECT_EQ(e.operation(), "upsert");
        EXPECT_EQ(e.key(), "counter");
    }
    EXPECT_EQ(store->casCalls.load(), 1);
}

TEST(UpsertTest, RetriesAreBounded) {
    auto store = std::make_shared<AlwaysConflictStore>();
    Cache<int> cache(store, counterConfig(3));

    try {
        cache.upsert(Context::background(), "counter", increment);
        FAIL() << "expected RetryableConflictError";
    } catch (const RetryableConflictError& e) {
        EXPECT_EQ(e.attempts(), 4);
    }
    EXPECT_EQ(store->casCalls.load(), 4);
}

TEST(UpsertTest, ConflictIsNotStoreError) {
    Cache<int> cache(std::make_shared<AlwaysConflictStore>(), counterConfig(0));

    try {
        cache.upsert(Context::background(), "counter", increment);
        FAIL() << "expected RetryableConflictError";
    } catch (const StoreError&) {
        FAIL() << "conflict must be distinguishable from StoreError";
    } catch (const RetryableConflictError&) {
        SUCCEED();
    }
}

TEST(UpsertTest, CancelDuringBackoffStopsRetrying) {
    auto store = std::make_shared<AlwaysConflictStore>();
    auto config = counterConfig(100);
    config.upsertRetryBackoff = Duration(10000);
    Cache<int> cache(store, config);
    Context ctx;

    std::thread canceller([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        ctx.cancel();
    });

    auto start = Clock::now();
    EXPECT_THROW(cache.upsert(ctx, "counter", increment), CancelledError);
    canceller.join();

    EXPECT_LT(Clock::now() - start, std::chrono::seconds(5));
    EXPECT_EQ(store->casCalls.load(), 1);
}

TEST(UpsertTest, DeadlineBoundsBackoff) {
    auto store = std::make_shared<AlwaysConflictStore>();
    auto config = counterConfig(100);
    config.upsertRetryBackoff = Duration(10000);
    Cache<int> cache(store, config);
    auto ctx = Context::withTimeout(Duration(50));

    auto start = Clock::now();
    EXPECT_THROW(cache.upsert(ctx, "counter", increment), DeadlineExceededError);
    EXPECT_LT(Clock::now() - start, std::chrono::seconds(5));
}

// ==================== TTL ====================

TEST(UpsertTest, KeepsExistingTtlByDefault) {
    Cache<int> cache(std::make_shared<InMemoryStore>(), counterConfig());
    auto ctx = Context::background();
    cache.set(ctx, "counter", 1, Duration(10000));

    cache.upsert(ctx, "counter", increment);

    auto remaining = cache.ttl(ctx, "counter");
    ASSERT_TRUE(remaining.has_value());
    EXPECT_GT(remaining->count(), 9000);
}

TEST(UpsertTest, ExplicitTtlReplacesExisting) {
    Cache<int> cache(std::make_shared<InMemoryStore>(), counterConfig());
    auto ctx = Context::background();
    cache.set(ctx, "counter", 1, Duration(10000));

    cache.upsert(ctx, "counter", increment, Duration(0));

    EXPECT_FALSE(cache.ttl(ctx, "counter").has_value());
}

TEST(UpsertTest, ExplicitTtlOnCreate) {
    Cache<int> cache(std::make_shared<InMemoryStore>(), counterConfig());
    auto ctx = Context::background();

    cache.upsert(ctx, "counter", increment, Duration(5000));

    auto remaining = cache.ttl(ctx, "counter");
    ASSERT_TRUE(remaining.has_value());
    EXPECT_LE(remaining->count(), 5000);
}

// ==================== Ошибки ====================

TEST(UpsertTest, CallbackExceptionPropagatesUnchanged) {
    auto store = std::make_shared<InMemoryStore>();
    Cache<int> cache(store, counterConfig());
    auto ctx = Context::background();
    cache.set(ctx, "counter", 1);

    EXPECT_THROW(cache.upsert(ctx, "counter", [](const std::optional<int>&) -> std::optional<int> {
        throw std::logic_error("business rule violated");
    }), std::logic_error);
    EXPECT_EQ(cache.get(ctx, "counter"), 1);
}

TEST(UpsertTest, CorruptedPriorValueNotOverwritten) {
    auto store = std::make_shared<InMemoryStore>();
    Cache<int> cache(store, counterConfig());
    auto ctx = Context::background();
    store->set(ctx, "counter", Bytes{0x01, 0x02}, Duration(0));
    bool called = false;

    EXPECT_THROW(cache.upsert(ctx, "counter", [&](const std::optional<int>& current) {
        called = true;
        return increment(current);
    }), DataCorruptionError);

    EXPECT_FALSE(called);
    EXPECT_EQ(store->get(ctx, "counter"), (Bytes{0x01, 0x02}));
}
