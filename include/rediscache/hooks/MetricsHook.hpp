#pragma once

#include <rediscache/hooks/IHook.hpp>
#include <rediscache/utils/Histogram.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>

/**
 * @brief Хук сбора метрик конвейера
 * @tparam V Тип значения
 *
 * Наблюдающий хук: значение и исключения пробрасываются без изменений.
 *
 * Собирает:
 * - serializationTime  — длительность encode/decode (секунды)
 * - serializationErrors — ошибки encode/decode
 * - compressionTime    — длительность compress/decompress (секунды)
 * - compressionErrors  — ошибки compress/decompress
 * - счётчики вызовов каждого этапа
 *
 * @code
 *   auto metrics = std::make_shared<MetricsHook<Person>>();
 *   cache.addHook(metrics);
 *   // ...
 *   std::cout << metrics->serializationTime().count() << "\n";
 * @endcode
 */
template<typename V>
class MetricsHook : public IHook<V> {
public:
    using typename IHook<V>::EncodeFn;
    using typename IHook<V>::DecodeFn;
    using typename IHook<V>::CompressFn;

    explicit MetricsHook(std::vector<double> buckets = exponentialBuckets(0.001, 2, 5))
        : serializationTime_(buckets)
        , compressionTime_(buckets)
    {}

    EncodeFn wrapEncode(EncodeFn next) override {
        return [this, next](const V& value) {
            return measure(next, value, encodes_, serializationTime_, serializationErrors_);
        };
    }

    DecodeFn wrapDecode(DecodeFn next) override {
        return [this, next](const Bytes& data) {
            return measure(next, data, decodes_, serializationTime_, serializationErrors_);
        };
    }

    CompressFn wrapCompress(CompressFn next) override {
        return [this, next](const Bytes& data) {
            return measure(next, data, compressions_, compressionTime_, compressionErrors_);
        };
    }

    CompressFn wrapDecompress(CompressFn next) override {
        return [this, next](const Bytes& data) {
            return measure(next, data, decompressions_, compressionTime_, compressionErrors_);
        };
    }

    // ==================== Геттеры ====================

    const Histogram& serializationTime() const { return serializationTime_; }
    const Histogram& compressionTime() const { return compressionTime_; }

    uint64_t serializationErrors() const { return serializationErrors_; }
    uint64_t compressionErrors() const { return compressionErrors_; }

    uint64_t encodes() const { return encodes_; }
    uint64_t decodes() const { return decodes_; }
    uint64_t compressions() const { return compressions_; }
    uint64_t decompressions() const { return decompressions_; }

private:
    template<typename Fn, typename Arg>
    static auto measure(const Fn& next, const Arg& arg,
                        std::atomic<uint64_t>& calls,
                        Histogram& time,
                        std::atomic<uint64_t>& errors) -> decltype(next(arg)) {
        ++calls;
        auto start = Clock::now();
        try {
            auto result = next(arg);
            time.observe(secondsSince(start));
            return result;
        } catch (...) {
            time.observe(secondsSince(start));
            ++errors;
            throw;
        }
    }

    static double secondsSince(Clock::time_point start) {
        return std::chrono::duration<double>(Clock::now() - start).count();
    }

    Histogram serializationTime_;
    Histogram compressionTime_;
    std::atomic<uint64_t> serializationErrors_{0};
    std::atomic<uint64_t> compressionErrors_{0};
    std::atomic<uint64_t> encodes_{0};
    std::atomic<uint64_t> decodes_{0};
    std::atomic<uint64_t> compressions_{0};
    std::atomic<uint64_t> decompressions_{0};
};
