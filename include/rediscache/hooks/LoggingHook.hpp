#pragma once

#include <rediscache/hooks/IHook.hpp>

#include <chrono>
#include <exception>
#include <iostream>
#include <mutex>
#include <string>

/**
 * @brief Хук логирования этапов конвейера в поток
 * @tparam V Тип значения
 *
 * Наблюдающий хук. Пишет одну строку на выполненный этап:
 *   [Pipeline] encode 12 bytes in 3us
 *   [Pipeline] decode FAILED after 5us: ...
 *
 * Для отключения логирования в бенчмарках — просто не добавляем хук.
 */
template<typename V>
class LoggingHook : public IHook<V> {
public:
    using typename IHook<V>::EncodeFn;
    using typename IHook<V>::DecodeFn;
    using typename IHook<V>::CompressFn;

    explicit LoggingHook(const std::string& prefix = "Pipeline",
                         std::ostream& os = std::cout)
        : prefix_(prefix)
        , os_(os)
    {}

    EncodeFn wrapEncode(EncodeFn next) override {
        return [this, next](const V& value) {
            return logged("encode", [&] { return next(value); });
        };
    }

    DecodeFn wrapDecode(DecodeFn next) override {
        return [this, next](const Bytes& data) {
            return logged("decode", [&] { return next(data); });
        };
    }

    CompressFn wrapCompress(CompressFn next) override {
        return [this, next](const Bytes& data) {
            return logged("compress", [&] { return next(data); });
        };
    }

    CompressFn wrapDecompress(CompressFn next) override {
        return [this, next](const Bytes& data) {
            return logged("decompress", [&] { return next(data); });
        };
    }

private:
    template<typename Call>
    auto logged(const char* stage, Call&& call) -> decltype(call()) {
        auto start = Clock::now();
        try {
            auto result = call();
            write(stage, start, describeResult(result), nullptr);
            return result;
        } catch (const std::exception& e) {
            write(stage, start, std::string(), e.what());
            throw;
        }
    }

    static std::string describeResult(const Bytes& bytes) {
        return std::to_string(bytes.size()) + " bytes";
    }

    template<typename T>
    static std::string describeResult(const T&) {
        return "value";
    }

    void write(const char* stage, Clock::time_point start,
               const std::string& result, const char* error) {
        auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
            Clock::now() - start).count();
        std::lock_guard<std::mutex> lock(mutex_);
        os_ << "[" << prefix_ << "] " << stage;
        if (error) {
            os_ << " FAILED after " << micros << "us: " << error << "\n";
        } else {
            os_ << " " << result << " in " << micros << "us\n";
        }
    }

    std::string prefix_;
    std::ostream& os_;
    std::mutex mutex_;
};
