#pragma once

#include <rediscache/Types.hpp>
#include <rediscache/compression/ICompressor.hpp>
#include <rediscache/hooks/IHook.hpp>
#include <rediscache/serialization/ICodec.hpp>

#include <memory>
#include <stdexcept>
#include <vector>

/**
 * @brief Конфигурация кэша, задаётся один раз при создании
 * @tparam V Тип значения
 *
 * @code
 *   CacheConfig<Person> config;
 *   config.codec = std::make_shared<JsonCodec<Person>>();
 *   config.compressor = std::make_shared<ZlibCompressor>();
 *   config.batchSize = 100;
 *   config.upsertMaxRetries = 3;
 *
 *   Cache<Person> cache(store, config);
 * @endcode
 */
template<typename V>
struct CacheConfig {
    /// Кодек значений (обязателен). Сменить кодек — создать новый Cache
    std::shared_ptr<ICodec<V>> codec;

    /// Компрессор; nullptr — без сжатия, хуки сжатия не вызываются
    std::shared_ptr<ICompressor> compressor;

    /// Размер порции mget; 0 — один запрос на все ключи
    size_t batchSize = 0;

    /// Размер порции mset; 0 — один запрос на все записи
    size_t msetBatchSize = 0;

    /// Допустимая устарелость near-cache; 0 — near-cache выключен
    Duration nearCacheTtl = Duration(0);

    /// Хуки в порядке вложенности (первый — внешний)
    std::vector<std::shared_ptr<IHook<V>>> hooks;

    /// Повторы upsert при конфликте; 0 — конфликт сразу уходит вызывающему
    int upsertMaxRetries = 0;

    /// Пауза между повторами upsert
    Duration upsertRetryBackoff = Duration(0);

    /**
     * @throws std::invalid_argument при некорректной конфигурации
     */
    void validate() const {
        if (!codec) {
            throw std::invalid_argument("CacheConfig: codec cannot be null");
        }
        if (nearCacheTtl.count() < 0) {
            throw std::invalid_argument("CacheConfig: nearCacheTtl must be non-negative");
        }
        if (upsertMaxRetries < 0) {
            throw std::invalid_argument("CacheConfig: upsertMaxRetries must be non-negative");
        }
        if (upsertRetryBackoff.count() < 0) {
            throw std::invalid_argument("CacheConfig: upsertRetryBackoff must be non-negative");
        }
        for (const auto& hook : hooks) {
            if (!hook) {
                throw std::invalid_argument("CacheConfig: hook cannot be null");
            }
        }
    }
};
