#pragma once

#include <rediscache/store/IStore.hpp>
#include <rediscache/utils/Histogram.hpp>

#include <atomic>
#include <map>
#include <memory>
#include <stdexcept>

/**
 * @brief Декоратор хранилища с метриками команд
 *
 * Оборачивает любой IStore и для каждой команды собирает:
 * - длительность (гистограмма, секунды)
 * - количество вызовов и ошибок
 * - количество чтений через near-cache (getCached)
 *
 * Имена команд фиксированы (GET, SET, DEL, MGET, MSET, CAS, PTTL,
 * PEXPIRE, FLUSHDB) и создаются в конструкторе, поэтому запись метрик
 * не требует блокировок.
 *
 * @code
 *   auto redis = std::make_shared<RedisStore>(RedisStoreOptions::fromEnvironment());
 *   auto store = std::make_shared<InstrumentedStore>(redis);
 *   Cache<Person> cache(store, config);
 *   // ...
 *   store->stats("GET").duration.count();
 * @endcode
 */
class InstrumentedStore : public IStore {
public:
    struct CommandStats {
        explicit CommandStats(const std::vector<double>& buckets)
            : duration(buckets)
        {}

        Histogram duration;
        std::atomic<uint64_t> calls{0};
        std::atomic<uint64_t> errors{0};
    };

    explicit InstrumentedStore(std::shared_ptr<IStore> inner,
                               std::vector<double> buckets = exponentialBuckets(0.001, 2, 10))
        : inner_(std::move(inner))
    {
        if (!inner_) {
            throw std::invalid_argument("Inner store cannot be null");
        }
        for (const char* name : {"GET", "SET", "DEL", "MGET", "MSET", "CAS",
                                 "PTTL", "PEXPIRE", "FLUSHDB"}) {
            stats_.emplace(name, std::make_unique<CommandStats>(buckets));
        }
    }

    std::optional<Bytes> get(const Context& ctx, const std::string& key) override {
        return record("GET", [&] { return inner_->get(ctx, key); });
    }

    std::optional<Bytes> getCached(const Context& ctx, const std::string& key,
                                   Duration ttl) override {
        ++nearCacheReads_;
        return record("GET", [&] { return inner_->getCached(ctx, key, ttl); });
    }

    bool set(const Context& ctx, const std::string& key, const Bytes& value,
             Duration ttl, SetMode mode = SetMode::Always) override {
        return record("SET", [&] { return inner_->set(ctx, key, value, ttl, mode); });
    }

    size_t remove(const Context& ctx, const std::vector<std::string>& keys) override {
        return record("DEL", [&] { return inner_->remove(ctx, keys); });
    }

    std::vector<std::optional<Bytes>> mget(const Context& ctx,
                                           const std::vector<std::string>& keys) override {
        return record("MGET", [&] { return inner_->mget(ctx, keys); });
    }

    void mset(const Context& ctx,
              const std::vector<std::pair<std::string, Bytes>>& entries,
              Duration ttl) override {
        record("MSET", [&] { inner_->mset(ctx, entries, ttl); return true; });
    }

    bool compareAndSet(const Context& ctx, const std::string& key,
                       const std::optional<Bytes>& expected, const Bytes& value,
                       std::optional<Duration> ttl) override {
        return record("CAS", [&] {
            return inner_->compareAndSet(ctx, key, expected, value, ttl);
        });
    }

    std::optional<Duration> ttl(const Context& ctx, const std::string& key) override {
        return record("PTTL", [&] { return inner_->ttl(ctx, key); });
    }

    bool expire(const Context& ctx, const std::string& key, Duration ttl) override {
        return record("PEXPIRE", [&] { return inner_->expire(ctx, key, ttl); });
    }

    void flush(const Context& ctx) override {
        record("FLUSHDB", [&] { inner_->flush(ctx); return true; });
    }

    // ==================== Геттеры ====================

    /**
     * @brief Метрики команды
     * @throws std::out_of_range для неизвестного имени
     */
    const CommandStats& stats(const std::string& command) const {
        return *stats_.at(command);
    }

    uint64_t nearCacheReads() const { return nearCacheReads_; }

    IStore& inner() { return *inner_; }

private:
    template<typename Call>
    auto record(const char* command, Call&& call) -> decltype(call()) {
        CommandStats& stats = *stats_.at(command);
        ++stats.calls;
        auto start = Clock::now();
        try {
            auto result = call();
            stats.duration.observe(std::chrono::duration<double>(Clock::now() - start).count());
            return result;
        } catch (...) {
            stats.duration.observe(std::chrono::duration<double>(Clock::now() - start).count());
            ++stats.errors;
            throw;
        }
    }

    std::shared_ptr<IStore> inner_;
    std::map<std::string, std::unique_ptr<CommandStats>> stats_;
    std::atomic<uint64_t> nearCacheReads_{0};
};
