#pragma once

#include <rediscache/Errors.hpp>
#include <rediscache/compression/ICompressor.hpp>
#include <rediscache/hooks/HookChain.hpp>
#include <rediscache/serialization/ICodec.hpp>

#include <memory>
#include <stdexcept>

/**
 * @brief Конвейер преобразования значения в байты и обратно
 * @tparam V Тип значения
 *
 * Запись:  value -> encode -> [compress] -> bytes
 * Чтение:  bytes -> [decompress] -> decode -> value
 *
 * Каждый этап обёрнут цепочкой хуков. Объект неизменяемый: добавление
 * хука создаёт новый конвейер (withHook), поэтому Cache может отдавать
 * снимок конвейера конкурентным вызовам без блокировок на время операции.
 *
 * Классификация ошибок выполняется на уровне базовых функций —
 * хуки видят уже типизированные исключения:
 * - encode / compress     -> EncodeError
 * - decompress / decode   -> DataCorruptionError
 *
 * Ошибки кодирования никогда не повторяются: это ошибка схемы или
 * программы, а не временный сбой.
 */
template<typename V>
class CodecPipeline {
public:
    using Stages = PipelineStages<V>;

    /**
     * @param codec Кодек значений (обязателен)
     * @param compressor Компрессор (nullptr — без сжатия)
     * @param hooks Цепочка хуков
     */
    CodecPipeline(std::shared_ptr<ICodec<V>> codec,
                  std::shared_ptr<ICompressor> compressor = nullptr,
                  HookChain<V> hooks = HookChain<V>())
        : codec_(std::move(codec))
        , compressor_(std::move(compressor))
        , hooks_(std::move(hooks))
    {
        if (!codec_) {
            throw std::invalid_argument("Codec cannot be null");
        }
        stages_ = hooks_.compose(baseStages());
    }

    /**
     * @brief Закодировать и (если настроено) сжать значение
     * @throws EncodeError
     */
    Bytes toBytes(const V& value) const {
        try {
            Bytes encoded = stages_.encode(value);
            if (stages_.compress) {
                return stages_.compress(encoded);
            }
            return encoded;
        } catch (const CacheError&) {
            throw;
        } catch (const std::exception& e) {
            // Исключение из хука, не прошедшее через базовую функцию
            throw EncodeError(Stage::Encode, e.what());
        }
    }

    /**
     * @brief Распаковать и декодировать сохранённые байты
     * @throws DataCorruptionError
     */
    V fromBytes(const Bytes& data) const {
        try {
            if (stages_.decompress) {
                return stages_.decode(stages_.decompress(data));
            }
            return stages_.decode(data);
        } catch (const CacheError&) {
            throw;
        } catch (const std::exception& e) {
            throw DataCorruptionError(Stage::Decode, e.what());
        }
    }

    /**
     * @brief Новый конвейер с дополнительным хуком в конце цепочки
     */
    CodecPipeline withHook(std::shared_ptr<IHook<V>> hook) const {
        HookChain<V> hooks = hooks_;
        hooks.add(std::move(hook));
        return CodecPipeline(codec_, compressor_, std::move(hooks));
    }

    bool hasCompression() const { return compressor_ != nullptr; }

    const HookChain<V>& hooks() const { return hooks_; }

private:
    static std::string describe(const std::exception& e) {
        if (auto cacheError = dynamic_cast<const CacheError*>(&e)) {
            return cacheError->message();
        }
        return e.what();
    }

    Stages baseStages() const {
        Stages base;

        auto codec = codec_;
        base.encode = [codec](const V& value) -> Bytes {
            try {
                return codec->encode(value);
            } catch (const EncodeError&) {
                throw;
            } catch (const std::exception& e) {
                throw EncodeError(Stage::Encode, describe(e));
            }
        };
        base.decode = [codec](const Bytes& data) -> V {
            try {
                return codec->decode(data);
            } catch (const DataCorruptionError&) {
                throw;
            } catch (const std::exception& e) {
                throw DataCorruptionError(Stage::Decode, describe(e));
            }
        };

        if (compressor_) {
            auto compressor = compressor_;
            base.compress = [compressor](const Bytes& data) -> Bytes {
                try {
                    return compressor->compress(data);
                } catch (const EncodeError&) {
                    throw;
                } catch (const std::exception& e) {
                    throw EncodeError(Stage::Compress, describe(e));
                }
            };
            base.decompress = [compressor](const Bytes& data) -> Bytes {
                try {
                    return compressor->decompress(data);
                } catch (const DataCorruptionError&) {
                    throw;
                } catch (const std::exception& e) {
                    throw DataCorruptionError(Stage::Decompress, describe(e));
                }
            };
        }
        return base;
    }

    std::shared_ptr<ICodec<V>> codec_;
    std::shared_ptr<ICompressor> compressor_;
    HookChain<V> hooks_;
    Stages stages_;
};
