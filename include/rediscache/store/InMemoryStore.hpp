#pragma once

#include <rediscache/store/IStore.hpp>

#include <atomic>
#include <mutex>
#include <unordered_map>

/**
 * @brief In-process реализация IStore
 *
 * Данные в std::unordered_map под одним mutex — каждая операция атомарна,
 * в том числе compareAndSet. Истечение TTL ленивое: просроченный ключ
 * удаляется при первом обращении (как Cache::get с политикой TTL).
 *
 * Используется:
 * - в тестах вместо Redis (семантика команд совпадает с RedisStore)
 * - как встраиваемое хранилище в одном процессе
 *
 * Счётчики round-trip позволяют проверять, сколько запросов сделал фасад.
 */
class InMemoryStore : public IStore {
public:
    using TimePoint = Clock::time_point;

    std::optional<Bytes> get(const Context& ctx, const std::string& key) override {
        begin(ctx);
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = findLive(key);
        if (it == data_.end()) {
            return std::nullopt;
        }
        return it->second.data;
    }

    std::optional<Bytes> getCached(const Context& ctx, const std::string& key,
                                   Duration ttl) override {
        (void)ttl;
        ++cachedReads_;
        return get(ctx, key);
    }

    bool set(const Context& ctx, const std::string& key, const Bytes& value,
             Duration ttl, SetMode mode = SetMode::Always) override {
        begin(ctx);
        std::lock_guard<std::mutex> lock(mutex_);
        bool exists = findLive(key) != data_.end();
        if ((mode == SetMode::IfAbsent && exists) || (mode == SetMode::IfPresent && !exists)) {
            return false;
        }
        data_[key] = Entry{value, deadlineFor(ttl)};
        return true;
    }

    size_t remove(const Context& ctx, const std::vector<std::string>& keys) override {
        begin(ctx);
        std::lock_guard<std::mutex> lock(mutex_);
        size_t removed = 0;
        for (const auto& key : keys) {
            auto it = findLive(key);
            if (it != data_.end()) {
                data_.erase(it);
                ++removed;
            }
        }
        return removed;
    }

    std::vector<std::optional<Bytes>> mget(const Context& ctx,
                                           const std::vector<std::string>& keys) override {
        begin(ctx);
        std::lock_guard<std::mutex> lock(mutex_);
        mgetBatchSizes_.push_back(keys.size());
        std::vector<std::optional<Bytes>> result;
        result.reserve(keys.size());
        for (const auto& key : keys) {
            auto it = findLive(key);
            if (it == data_.end()) {
                result.emplace_back(std::nullopt);
            } else {
                result.emplace_back(it->second.data);
            }
        }
        return result;
    }

    void mset(const Context& ctx,
              const std::vector<std::pair<std::string, Bytes>>& entries,
              Duration ttl) override {
        begin(ctx);
        std::lock_guard<std::mutex> lock(mutex_);
        msetBatchSizes_.push_back(entries.size());
        for (const auto& [key, value] : entries) {
            data_[key] = Entry{value, deadlineFor(ttl)};
        }
    }

    bool compareAndSet(const Context& ctx, const std::string& key,
                       const std::optional<Bytes>& expected, const Bytes& value,
                       std::optional<Duration> ttl) override {
        begin(ctx);
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = findLive(key);
        if (!expected) {
            if (it != data_.end()) {
                return false;
            }
        } else if (it == data_.end() || it->second.data != *expected) {
            return false;
        }

        std::optional<TimePoint> expiresAt;
        if (ttl) {
            expiresAt = deadlineFor(*ttl);
        } else if (it != data_.end()) {
            expiresAt = it->second.expiresAt;   // KEEPTTL
        }
        data_[key] = Entry{value, expiresAt};
        return true;
    }

    std::optional<Duration> ttl(const Context& ctx, const std::string& key) override {
        begin(ctx);
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = findLive(key);
        if (it == data_.end()) {
            return std::nullopt;
        }
        if (!it->second.expiresAt) {
            return Duration(-1);
        }
        return std::chrono::duration_cast<Duration>(*it->second.expiresAt - Clock::now());
    }

    bool expire(const Context& ctx, const std::string& key, Duration ttl) override {
        begin(ctx);
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = findLive(key);
        if (it == data_.end()) {
            return false;
        }
        it->second.expiresAt = deadlineFor(ttl);
        return true;
    }

    void flush(const Context& ctx) override {
        begin(ctx);
        std::lock_guard<std::mutex> lock(mutex_);
        data_.clear();
    }

    // ==================== Диагностика ====================

    /// Количество live-ключей (просроченные не считаются)
    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t count = 0;
        auto now = Clock::now();
        for (const auto& entry : data_) {
            if (!entry.second.expiresAt || now < *entry.second.expiresAt) {
                ++count;
            }
        }
        return count;
    }

    uint64_t roundTrips() const { return roundTrips_; }
    uint64_t cachedReads() const { return cachedReads_; }

    /// Размеры запросов mget в порядке поступления
    std::vector<size_t> mgetBatchSizes() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return mgetBatchSizes_;
    }

    std::vector<size_t> msetBatchSizes() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return msetBatchSizes_;
    }

private:
    struct Entry {
        Bytes data;
        std::optional<TimePoint> expiresAt;
    };

    using Map = std::unordered_map<std::string, Entry>;

    void begin(const Context& ctx) {
        ctx.throwIfDone();
        ++roundTrips_;
    }

    static std::optional<TimePoint> deadlineFor(Duration ttl) {
        if (ttl.count() <= 0) {
            return std::nullopt;
        }
        return Clock::now() + ttl;
    }

    /**
     * @brief Найти ключ, удалив его, если TTL истёк
     * @note Вызывать под lock!
     */
    Map::iterator findLive(const std::string& key) {
        auto it = data_.find(key);
        if (it != data_.end() && it->second.expiresAt && Clock::now() >= *it->second.expiresAt) {
            data_.erase(it);
            return data_.end();
        }
        return it;
    }

    mutable std::mutex mutex_;
    Map data_;
    std::vector<size_t> mgetBatchSizes_;
    std::vector<size_t> msetBatchSizes_;
    std::atomic<uint64_t> roundTrips_{0};
    std::atomic<uint64_t> cachedReads_{0};
};
