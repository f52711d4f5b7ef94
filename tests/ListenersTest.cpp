#include <gtest/gtest.h>
#include <rediscache/Cache.hpp>
#include <rediscache/listeners/LoggingListener.hpp>
#include <rediscache/listeners/StatsListener.hpp>
#include <rediscache/serialization/BinaryCodec.hpp>
#include <rediscache/store/InMemoryStore.hpp>

#include <mutex>
#include <sstream>

/**
 * @brief Тесты для слушателей операций
 *
 * Проверяем:
 * - StatsListener корректно считает статистику
 * - Ровно одно OperationEvent на вызов, в том числе при ошибке
 * - KeyNotFound — успешный исход с hit = false
 * - LoggingListener выводит сообщения
 * - Удаление слушателей, исключение слушателя не ломает операцию
 */

// ==================== Вспомогательные функции ====================

namespace {

Cache<int> makeCache(std::shared_ptr<IStore> store = std::make_shared<InMemoryStore>()) {
    CacheConfig<int> config;
    config.codec = std::make_shared<BinaryCodec<int>>();
    return Cache<int>(std::move(store), config);
}

/// Слушатель, запоминающий все события операций
class RecordingListener : public ICacheListener {
public:
    void onOperation(const OperationEvent& event) override {
        std::lock_guard<std::mutex> lock(mutex);
        events.push_back(event);
    }

    std::mutex mutex;
    std::vector<OperationEvent> events;
};

class ThrowingListener : public ICacheListener {
public:
    void onOperation(const OperationEvent&) override {
        throw std::runtime_error("listener is broken");
    }
};

class BrokenStore : public InMemoryStore {
public:
    bool set(const Context&, const std::string&, const Bytes&, Duration, SetMode) override {
        throw StoreError("READONLY You can't write against a read only replica");
    }
};

}  // namespace

// ==================== StatsListener ====================

TEST(StatsListenerTest, InitiallyZero) {
    StatsListener stats;

    EXPECT_EQ(stats.hits(), 0u);
    EXPECT_EQ(stats.misses(), 0u);
    EXPECT_EQ(stats.sets(), 0u);
    EXPECT_EQ(stats.removes(), 0u);
    EXPECT_EQ(stats.conflicts(), 0u);
    EXPECT_EQ(stats.operations(), 0u);
    EXPECT_EQ(stats.failures(), 0u);
    EXPECT_DOUBLE_EQ(stats.hitRate(), 0.0);
}

TEST(StatsListenerTest, CountsHitsAndMisses) {
    auto cache = makeCache();
    auto stats = std::make_shared<StatsListener>();
    cache.addListener(stats);
    auto ctx = Context::background();

    cache.set(ctx, "key1", 42);
    cache.get(ctx, "key1");                                          // Hit
    cache.get(ctx, "key1");                                          // Hit
    EXPECT_THROW(cache.get(ctx, "missing"), KeyNotFoundError);      // Miss

    EXPECT_EQ(stats->hits(), 2u);
    EXPECT_EQ(stats->misses(), 1u);
    EXPECT_EQ(stats->totalReads(), 3u);
    EXPECT_EQ(stats->failures(), 0u);
}

TEST(StatsListenerTest, HitRateCalculation) {
    auto cache = makeCache();
    auto stats = std::make_shared<StatsListener>();
    cache.addListener(stats);
    auto ctx = Context::background();

    cache.set(ctx, "key1", 42);
    cache.mget(ctx, {"key1", "key1", "key1", "missing"});

    // 3 hits, 1 miss = 75% hit rate
    EXPECT_DOUBLE_EQ(stats->hitRate(), 0.75);
}

TEST(StatsListenerTest, CountsSetsAndRemoves) {
    auto cache = makeCache();
    auto stats = std::make_shared<StatsListener>();
    cache.addListener(stats);
    auto ctx = Context::background();

    cache.set(ctx, "a", 1);
    cache.set(ctx, "b", 2);
    cache.remove(ctx, "a");
    cache.remove(ctx, "missing");   // не удалён — не считается

    EXPECT_EQ(stats->sets(), 2u);
    EXPECT_EQ(stats->removes(), 1u);
}

TEST(StatsListenerTest, Reset) {
    auto cache = makeCache();
    auto stats = std::make_shared<StatsListener>();
    cache.addListener(stats);
    auto ctx = Context::background();

    cache.set(ctx, "a", 1);
    cache.get(ctx, "a");
    stats->reset();

    EXPECT_EQ(stats->hits(), 0u);
    EXPECT_EQ(stats->sets(), 0u);
    EXPECT_EQ(stats->operations(), 0u);
}

// ==================== OperationEvent ====================

TEST(OperationEventTest, OneEventPerCall) {
    auto cache = makeCache();
    auto recorder = std::make_shared<RecordingListener>();
    cache.addListener(recorder);
    auto ctx = Context::background();

    cache.set(ctx, "a", 1);
    cache.get(ctx, "a");
    cache.mget(ctx, {"a", "b"});
    cache.upsert(ctx, "a", [](const std::optional<int>& v) { return v.value_or(0) + 1; });
    cache.remove(ctx, "a");

    ASSERT_EQ(recorder->events.size(), 5u);
    EXPECT_EQ(recorder->events[0].operation, "set");
    EXPECT_EQ(recorder->events[1].operation, "get");
    EXPECT_TRUE(recorder->events[1].hit);
    EXPECT_EQ(recorder->events[2].operation, "mget");
    EXPECT_EQ(recorder->events[2].keyCount, 2u);
    EXPECT_TRUE(recorder->events[2].hit);
    EXPECT_EQ(recorder->events[3].operation, "upsert");
    EXPECT_EQ(recorder->events[4].operation, "remove");
    for (const auto& event : recorder->events) {
        EXPECT_TRUE(event.success);
        EXPECT_TRUE(event.error.empty());
    }
}

TEST(OperationEventTest, KeyNotFoundIsSuccessfulMiss) {
    auto cache = makeCache();
    auto recorder = std::make_shared<RecordingListener>();
    cache.addListener(recorder);

    EXPECT_THROW(cache.get(Context::background(), "missing"), KeyNotFoundError);

    ASSERT_EQ(recorder->events.size(), 1u);
    EXPECT_TRUE(recorder->events[0].success);
    EXPECT_FALSE(recorder->events[0].hit);
    EXPECT_EQ(recorder->events[0].key, "missing");
}

TEST(OperationEventTest, FailureReportedOnce) {
    auto cache = makeCache(std::make_shared<BrokenStore>());
    auto recorder = std::make_shared<RecordingListener>();
    auto stats = std::make_shared<StatsListener>();
    cache.addListener(recorder);
    cache.addListener(stats);

    EXPECT_THROW(cache.set(Context::background(), "key", 1), StoreError);

    ASSERT_EQ(recorder->events.size(), 1u);
    EXPECT_FALSE(recorder->events[0].success);
    EXPECT_NE(recorder->events[0].error.find("READONLY"), std::string::npos);
    EXPECT_NE(recorder->events[0].error.find("set \"key\""), std::string::npos);
    EXPECT_EQ(stats->failures(), 1u);
    EXPECT_EQ(stats->sets(), 0u);
}

TEST(OperationEventTest, DurationMeasured) {
    auto cache = makeCache();
    auto recorder = std::make_shared<RecordingListener>();
    cache.addListener(recorder);

    cache.set(Context::background(), "a", 1);

    ASSERT_EQ(recorder->events.size(), 1u);
    EXPECT_GE(recorder->events[0].duration.count(), 0);
}

// ==================== LoggingListener ====================

TEST(LoggingListenerTest, LogsOperations) {
    std::ostringstream oss;
    auto cache = makeCache();
    cache.addListener(std::make_shared<LoggingListener>("Test", oss));
    auto ctx = Context::background();

    cache.set(ctx, "key1", 42);
    cache.get(ctx, "key1");

    std::string output = oss.str();
    EXPECT_NE(output.find("[Test] set \"key1\""), std::string::npos);
    EXPECT_NE(output.find("[Test] get \"key1\" HIT"), std::string::npos);
}

TEST(LoggingListenerTest, LogsFailures) {
    std::ostringstream oss;
    auto cache = makeCache(std::make_shared<BrokenStore>());
    cache.addListener(std::make_shared<LoggingListener>("Test", oss));

    EXPECT_THROW(cache.set(Context::background(), "key1", 42), StoreError);

    EXPECT_NE(oss.str().find("FAILED"), std::string::npos);
    EXPECT_NE(oss.str().find("READONLY"), std::string::npos);
}

TEST(LoggingListenerTest, VerboseLogsKeyEvents) {
    std::ostringstream quiet;
    std::ostringstream verbose;
    auto cache = makeCache();
    cache.addListener(std::make_shared<LoggingListener>("Q", quiet));
    cache.addListener(std::make_shared<LoggingListener>("V", verbose, true));

    EXPECT_THROW(cache.get(Context::background(), "missing"), KeyNotFoundError);

    EXPECT_EQ(quiet.str().find("MISS"), std::string::npos);
    EXPECT_NE(verbose.str().find("MISS: missing"), std::string::npos);
}

// ==================== Управление слушателями ====================

TEST(ListenersTest, RemoveListener) {
    auto cache = makeCache();
    auto stats = std::make_shared<StatsListener>();
    cache.addListener(stats);
    auto ctx = Context::background();

    cache.set(ctx, "a", 1);
    cache.removeListener(stats);
    cache.set(ctx, "b", 2);

    EXPECT_EQ(stats->sets(), 1u);
}

TEST(ListenersTest, NullListenerIgnored) {
    auto cache = makeCache();

    cache.addListener(nullptr);

    EXPECT_NO_THROW(cache.set(Context::background(), "a", 1));
}

TEST(ListenersTest, ThrowingListenerDoesNotBreakOperation) {
    auto cache = makeCache();
    auto stats = std::make_shared<StatsListener>();
    cache.addListener(std::make_shared<ThrowingListener>());
    cache.addListener(stats);
    auto ctx = Context::background();

    EXPECT_NO_THROW(cache.set(ctx, "a", 1));
    EXPECT_EQ(cache.get(ctx, "a"), 1);
    EXPECT_EQ(stats->operations(), 2u);
    EXPECT_EQ(stats->failures(), 0u);
}
