#include <gtest/gtest.h>
#include <rediscache/Cache.hpp>
#include <rediscache/batch/BatchedMultiGet.hpp>
#include <rediscache/serialization/BinaryCodec.hpp>
#include <rediscache/store/InMemoryStore.hpp>

/**
 * @brief Тесты пакетного чтения (mget)
 *
 * Проверяем:
 * - chunkRanges: последовательные отрезки без перекрытий
 * - Порядок результатов совпадает с порядком ключей при любом batchSize
 * - Количество и размер round-trip'ов
 * - Дубликаты ключей
 * - Изоляцию: битый payload одного ключа не ломает остальные
 * - Ошибки хранилища прерывают весь вызов
 */

// ==================== Вспомогательные функции ====================

namespace {

CacheConfig<int> intConfig(size_t batchSize) {
    CacheConfig<int> config;
    config.codec = std::make_shared<BinaryCodec<int>>();
    config.batchSize = batchSize;
    return config;
}

void fill(Cache<int>& cache, const std::vector<std::string>& keys) {
    auto ctx = Context::background();
    int value = 1;
    for (const auto& key : keys) {
        cache.set(ctx, key, value++);
    }
}

std::vector<std::string> keysOf(const std::vector<MultiGetResult<int>>& results) {
    std::vector<std::string> keys;
    for (const auto& result : results) {
        keys.push_back(result.key);
    }
    return keys;
}

/// Хранилище, которое падает на N-м вызове mget
class FailingMgetStore : public InMemoryStore {
public:
    explicit FailingMgetStore(int failOnCall)
        : failOnCall_(failOnCall)
    {}

    std::vector<std::optional<Bytes>> mget(const Context& ctx,
                                           const std::vector<std::string>& keys) override {
        if (++calls_ == failOnCall_) {
            throw StoreError("connection reset");
        }
        return InMemoryStore::mget(ctx, keys);
    }

private:
    int failOnCall_;
    int calls_ = 0;
};

}  // namespace

// ==================== chunkRanges ====================

TEST(ChunkRangesTest, EmptyInputHasNoChunks) {
    EXPECT_TRUE(chunkRanges(0, 3).empty());
    EXPECT_TRUE(chunkRanges(0, 0).empty());
}

TEST(ChunkRangesTest, ZeroBatchSizeIsSingleChunk) {
    auto ranges = chunkRanges(7, 0);

    ASSERT_EQ(ranges.size(), 1u);
    EXPECT_EQ(ranges[0], std::make_pair(size_t(0), size_t(7)));
}

TEST(ChunkRangesTest, LastChunkIsShorter) {
    auto ranges = chunkRanges(5, 2);

    std::vector<std::pair<size_t, size_t>> expected = {{0, 2}, {2, 4}, {4, 5}};
    EXPECT_EQ(ranges, expected);
}

TEST(ChunkRangesTest, BatchLargerThanInput) {
    auto ranges = chunkRanges(3, 10);

    ASSERT_EQ(ranges.size(), 1u);
    EXPECT_EQ(ranges[0].second, 3u);
}

// ==================== Порядок ====================

class MultiGetOrderTest : public ::testing::TestWithParam<size_t> {};

TEST_P(MultiGetOrderTest, PreservesKeyOrder) {
    Cache<int> cache(std::make_shared<InMemoryStore>(), intConfig(GetParam()));
    fill(cache, {"k1", "k2", "k3"});

    auto results = cache.mget(Context::background(), {"k3", "k1", "k2"});

    ASSERT_EQ(results.size(), 3u);
    EXPECT_EQ(keysOf(results), (std::vector<std::string>{"k3", "k1", "k2"}));
    EXPECT_EQ(results[0].value, 3);
    EXPECT_EQ(results[1].value, 1);
    EXPECT_EQ(results[2].value, 2);
}

INSTANTIATE_TEST_SUITE_P(BatchSizes, MultiGetOrderTest,
                         ::testing::Values(size_t(0), size_t(1), size_t(2), size_t(3), size_t(100)));

TEST(MultiGetTest, BatchSizeOneIssuesRoundTripPerKey) {
    auto store = std::make_shared<InMemoryStore>();
    Cache<int> cache(store, intConfig(1));
    fill(cache, {"k1", "k2", "k3"});

    cache.mget(Context::background(), {"k1", "k2", "k3"});

    EXPECT_EQ(store->mgetBatchSizes(), (std::vector<size_t>{1, 1, 1}));
}

TEST(MultiGetTest, UnboundedIssuesSingleRoundTrip) {
    auto store = std::make_shared<InMemoryStore>();
    Cache<int> cache(store, intConfig(0));
    fill(cache, {"a", "b", "c", "d", "e"});

    cache.mget(Context::background(), {"a", "b", "c", "d", "e"});

    EXPECT_EQ(store->mgetBatchSizes(), (std::vector<size_t>{5}));
}

TEST(MultiGetTest, BatchesAreContiguous) {
    auto store = std::make_shared<InMemoryStore>();
    Cache<int> cache(store, intConfig(2));
    fill(cache, {"a", "b", "c", "d", "e"});

    auto results = cache.mget(Context::background(), {"a", "b", "c", "d", "e"});

    EXPECT_EQ(store->mgetBatchSizes(), (std::vector<size_t>{2, 2, 1}));
    for (size_t i = 0; i < results.size(); ++i) {
        EXPECT_EQ(results[i].value, static_cast<int>(i + 1));
    }
}

TEST(MultiGetTest, EmptyKeysNoRoundTrip) {
    auto store = std::make_shared<InMemoryStore>();
    Cache<int> cache(store, intConfig(2));

    auto results = cache.mget(Context::background(), {});

    EXPECT_TRUE(results.empty());
    EXPECT_TRUE(store->mgetBatchSizes().empty());
}

// ==================== Исходы по ключам ====================

TEST(MultiGetTest, MissingKeysReportedNotFound) {
    Cache<int> cache(std::make_shared<InMemoryStore>(), intConfig(0));
    fill(cache, {"present"});

    auto results = cache.mget(Context::background(), {"absent", "present"});

    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results[0].status, MultiGetStatus::NotFound);
    EXPECT_FALSE(results[0].value.has_value());
    EXPECT_EQ(results[1].status, MultiGetStatus::Found);
    EXPECT_EQ(results[1].value, 1);
}

TEST(MultiGetTest, DuplicateKeysEachGetPosition) {
    Cache<int> cache(std::make_shared<InMemoryStore>(), intConfig(1));
    fill(cache, {"x"});

    auto results = cache.mget(Context::background(), {"x", "y", "x"});

    ASSERT_EQ(results.size(), 3u);
    EXPECT_TRUE(results[0].found());
    EXPECT_FALSE(results[1].found());
    EXPECT_TRUE(results[2].found());
    EXPECT_EQ(results[2].value, 1);
}

TEST(MultiGetTest, CorruptedKeyDoesNotFailOthers) {
    auto store = std::make_shared<InMemoryStore>();
    Cache<int> cache(store, intConfig(0));
    auto ctx = Context::background();
    fill(cache, {"k1", "k3"});
    store->set(ctx, "k2", Bytes{0x01}, Duration(0));   // 1 байт вместо sizeof(int)

    auto results = cache.mget(ctx, {"k1", "k2", "k3"});

    ASSERT_EQ(results.size(), 3u);
    EXPECT_EQ(results[0].status, MultiGetStatus::Found);
    EXPECT_EQ(results[0].value, 1);
    EXPECT_EQ(results[1].status, MultiGetStatus::DecodeError);
    EXPECT_FALSE(results[1].value.has_value());
    EXPECT_FALSE(results[1].error.empty());
    EXPECT_EQ(results[2].status, MultiGetStatus::Found);
    EXPECT_EQ(results[2].value, 2);
}

TEST(MultiGetTest, CorruptedKeyIsolatedAcrossBatches) {
    auto store = std::make_shared<InMemoryStore>();
    Cache<int> cache(store, intConfig(1));
    auto ctx = Context::background();
    fill(cache, {"k1", "k3"});
    store->set(ctx, "k2", Bytes{0xFF, 0xFF}, Duration(0));

    auto results = cache.mget(ctx, {"k1", "k2", "k3"});

    EXPECT_TRUE(results[0].found());
    EXPECT_EQ(results[1].status, MultiGetStatus::DecodeError);
    EXPECT_TRUE(results[2].found());
}

// ==================== Ошибки хранилища ====================

TEST(MultiGetTest, StoreErrorFailsWholeCall) {
    auto store = std::make_shared<FailingMgetStore>(2);
    Cache<int> cache(store, intConfig(1));
    fill(cache, {"a", "b", "c"});

    try {
        cache.mget(Context::background(), {"a", "b", "c"});
        FAIL() << "expected StoreError";
    } catch (const StoreError& e) {
        EXPECT_EQ(e.operation(), "mget");
        EXPECT_EQ(e.key(), "a");
    }
}

TEST(MultiGetTest, CancelledContextThrows) {
    Cache<int> cache(std::make_shared<InMemoryStore>(), intConfig(1));
    Context ctx;
    ctx.cancel();

    EXPECT_THROW(cache.mget(ctx, {"a", "b"}), CancelledError);
}

// ==================== BatchedMultiGet напрямую ====================

TEST(BatchedMultiGetTest, WorksWithoutFacade) {
    InMemoryStore store;
    auto ctx = Context::background();
    CodecPipeline<int> pipeline(std::make_shared<BinaryCodec<int>>());
    store.set(ctx, "a", pipeline.toBytes(10), Duration(0));
    store.set(ctx, "c", pipeline.toBytes(30), Duration(0));

    BatchedMultiGet<int> batch(store, 2);
    auto results = batch.fetch(ctx, {"a", "b", "c"}, pipeline);

    ASSERT_EQ(results.size(), 3u);
    EXPECT_EQ(results[0].value, 10);
    EXPECT_EQ(results[1].status, MultiGetStatus::NotFound);
    EXPECT_EQ(results[2].value, 30);
    EXPECT_EQ(store.mgetBatchSizes(), (std::vector<size_t>{2, 1}));
}
