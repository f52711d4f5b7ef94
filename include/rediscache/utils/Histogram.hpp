#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <vector>

/**
 * @brief Экспоненциальные границы бакетов гистограммы
 * @param start Верхняя граница первого бакета (> 0)
 * @param factor Множитель (> 1)
 * @param count Количество границ (> 0)
 *
 * exponentialBuckets(0.001, 2, 5) -> {0.001, 0.002, 0.004, 0.008, 0.016}
 */
inline std::vector<double> exponentialBuckets(double start, double factor, size_t count) {
    if (count == 0) {
        throw std::invalid_argument("exponentialBuckets needs a positive count");
    }
    if (start <= 0.0) {
        throw std::invalid_argument("exponentialBuckets needs a positive start");
    }
    if (factor <= 1.0) {
        throw std::invalid_argument("exponentialBuckets needs a factor greater than 1");
    }
    std::vector<double> buckets;
    buckets.reserve(count);
    double bound = start;
    for (size_t i = 0; i < count; ++i) {
        buckets.push_back(bound);
        bound *= factor;
    }
    return buckets;
}

/**
 * @brief Потокобезопасная гистограмма длительностей (в секундах)
 *
 * Бакет i считает наблюдения <= bounds[i]; последний (overflow) бакет —
 * всё, что больше последней границы. Счётчики atomic, запись без блокировок.
 */
class Histogram {
public:
    explicit Histogram(std::vector<double> bounds)
        : bounds_(std::move(bounds))
        , counts_(std::make_unique<std::atomic<uint64_t>[]>(bounds_.size() + 1))
    {
        if (bounds_.empty()) {
            throw std::invalid_argument("Histogram needs at least one bucket bound");
        }
    }

    void observe(double seconds) {
        size_t i = 0;
        while (i < bounds_.size() && seconds > bounds_[i]) {
            ++i;
        }
        ++counts_[i];
        ++total_;
        // atomic<double> += недоступен в C++17, копим микросекунды
        sumMicros_ += static_cast<uint64_t>(seconds * 1e6);
    }

    uint64_t count() const { return total_; }

    double sumSeconds() const {
        return static_cast<double>(sumMicros_.load()) / 1e6;
    }

    /**
     * @brief Счётчики по бакетам (размер bounds().size() + 1)
     */
    std::vector<uint64_t> bucketCounts() const {
        std::vector<uint64_t> result(bounds_.size() + 1);
        for (size_t i = 0; i < result.size(); ++i) {
            result[i] = counts_[i];
        }
        return result;
    }

    const std::vector<double>& bounds() const { return bounds_; }

private:
    std::vector<double> bounds_;
    std::unique_ptr<std::atomic<uint64_t>[]> counts_;
    std::atomic<uint64_t> total_{0};
    std::atomic<uint64_t> sumMicros_{0};
};
