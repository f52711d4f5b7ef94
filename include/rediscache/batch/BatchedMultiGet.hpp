#pragma once

#include <rediscache/Errors.hpp>
#include <rediscache/pipeline/CodecPipeline.hpp>
#include <rediscache/store/IStore.hpp>

#include <optional>
#include <string>
#include <utility>
#include <vector>

/**
 * @brief Разбить [0, count) на последовательные отрезки длиной не больше batchSize
 * @param batchSize 0 — один отрезок на всё
 * @return Пары [begin, end) в порядке возрастания
 *
 * Отрезки идут подряд и не перекрываются: склейка результатов в порядке
 * отрезков восстанавливает исходный порядок элементов.
 */
inline std::vector<std::pair<size_t, size_t>> chunkRanges(size_t count, size_t batchSize) {
    std::vector<std::pair<size_t, size_t>> ranges;
    if (count == 0) {
        return ranges;
    }
    if (batchSize == 0 || batchSize >= count) {
        ranges.emplace_back(0, count);
        return ranges;
    }
    for (size_t begin = 0; begin < count; begin += batchSize) {
        size_t end = begin + batchSize < count ? begin + batchSize : count;
        ranges.emplace_back(begin, end);
    }
    return ranges;
}

/// Исход чтения одного ключа в mget
enum class MultiGetStatus {
    Found,        ///< Ключ есть, значение декодировано
    NotFound,     ///< Ключа нет в хранилище
    DecodeError   ///< Байты есть, но не распаковываются/не декодируются
};

template<typename V>
struct MultiGetResult {
    std::string key;
    MultiGetStatus status = MultiGetStatus::NotFound;
    std::optional<V> value;      ///< Только для Found
    std::string error;           ///< Только для DecodeError

    bool found() const { return status == MultiGetStatus::Found; }
};

/**
 * @brief Пакетное чтение ключей ограниченными порциями
 * @tparam V Тип значения
 *
 * Алгоритм:
 * 1. Ключи режутся на последовательные порции по batchSize (0 — одна порция)
 * 2. На каждую порцию — один round-trip MGET, порции идут по очереди
 * 3. Результаты склеиваются в порядке порций = порядке ключей
 *
 * Порции не распараллеливаются: цель батчинга — ограничить время, на
 * которое однопоточный Redis занят одной командой, а не ускорить клиента.
 *
 * Дубликаты ключей допустимы, каждый получает свою позицию в результате.
 * Ошибка декодирования одного ключа не влияет на остальные; ошибки
 * хранилища и отмена контекста прерывают весь вызов.
 */
template<typename V>
class BatchedMultiGet {
public:
    BatchedMultiGet(IStore& store, size_t batchSize)
        : store_(store)
        , batchSize_(batchSize)
    {}

    std::vector<MultiGetResult<V>> fetch(const Context& ctx,
                                         const std::vector<std::string>& keys,
                                         const CodecPipeline<V>& pipeline) {
        std::vector<MultiGetResult<V>> results;
        results.reserve(keys.size());

        for (const auto& range : chunkRanges(keys.size(), batchSize_)) {
            std::vector<std::string> chunk(keys.begin() + range.first,
                                           keys.begin() + range.second);
            auto values = store_.mget(ctx, chunk);
            if (values.size() != chunk.size()) {
                throw StoreError("mget returned " + std::to_string(values.size()) +
                                 " values for " + std::to_string(chunk.size()) + " keys");
            }
            for (size_t i = 0; i < chunk.size(); ++i) {
                results.push_back(classify(chunk[i], values[i], pipeline));
            }
        }
        return results;
    }

    size_t batchSize() const { return batchSize_; }

private:
    static MultiGetResult<V> classify(const std::string& key,
                                      const std::optional<Bytes>& data,
                                      const CodecPipeline<V>& pipeline) {
        MultiGetResult<V> result;
        result.key = key;
        if (!data) {
            result.status = MultiGetStatus::NotFound;
            return result;
        }
        try {
            result.value = pipeline.fromBytes(*data);
            result.status = MultiGetStatus::Found;
        } catch (const DecodeError& e) {
            result.status = MultiGetStatus::DecodeError;
            result.error = e.what();
        }
        return result;
    }

    IStore& store_;
    size_t batchSize_;
};
