#pragma once

#include <rediscache/listeners/ICacheListener.hpp>

#include <atomic>
#include <cstdint>

/**
 * @brief Слушатель для сбора статистики кэша
 *
 * Собирает:
 * - hits/misses — для расчёта hit rate
 * - sets/removes — объём записи
 * - conflicts — проигранные гонки upsert
 * - operations/failures — завершённые вызовы фасада и неуспешные из них
 *
 * Использование:
 *   auto stats = std::make_shared<StatsListener>();
 *   cache.addListener(stats);
 *   // ... работа с кэшем ...
 *   std::cout << "Hit rate: " << stats->hitRate() << std::endl;
 *
 * Примечание: счётчики atomic для потокобезопасности.
 */
class StatsListener : public ICacheListener {
public:
    void onHit(const std::string& key) override {
        (void)key;
        ++hits_;
    }

    void onMiss(const std::string& key) override {
        (void)key;
        ++misses_;
    }

    void onSet(const std::string& key) override {
        (void)key;
        ++sets_;
    }

    void onRemove(const std::string& key) override {
        (void)key;
        ++removes_;
    }

    void onConflict(const std::string& key) override {
        (void)key;
        ++conflicts_;
    }

    void onOperation(const OperationEvent& event) override {
        ++operations_;
        if (!event.success) {
            ++failures_;
        }
    }

    // ==================== Геттеры ====================

    uint64_t hits() const { return hits_; }
    uint64_t misses() const { return misses_; }
    uint64_t sets() const { return sets_; }
    uint64_t removes() const { return removes_; }
    uint64_t conflicts() const { return conflicts_; }
    uint64_t operations() const { return operations_; }
    uint64_t failures() const { return failures_; }

    /**
     * @brief Общее количество чтений ключей (get и каждый ключ mget)
     */
    uint64_t totalReads() const {
        return hits_ + misses_;
    }

    /**
     * @brief Процент попаданий (0.0 - 1.0)
     * @return hit rate или 0.0 если чтений не было
     */
    double hitRate() const {
        uint64_t total = totalReads();
        if (total == 0) return 0.0;
        return static_cast<double>(hits_) / static_cast<double>(total);
    }

    void reset() {
        hits_ = 0;
        misses_ = 0;
        sets_ = 0;
        removes_ = 0;
        conflicts_ = 0;
        operations_ = 0;
        failures_ = 0;
    }

private:
    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> sets_{0};
    std::atomic<uint64_t> removes_{0};
    std::atomic<uint64_t> conflicts_{0};
    std::atomic<uint64_t> operations_{0};
    std::atomic<uint64_t> failures_{0};
};
