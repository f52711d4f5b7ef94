#pragma once

#include <rediscache/Types.hpp>

/**
 * @brief Интерфейс сжатия байтов
 *
 * Контракт:
 * - decompress(compress(b)) == b для любого b
 * - пустой вход даёт пустой выход в обе стороны
 * - повторное сжатие уже сжатых данных допустимо и не портит их
 *
 * При ошибке реализация бросает исключение; CodecPipeline превращает его
 * в EncodeError (при записи) или DataCorruptionError (при чтении).
 */
class ICompressor {
public:
    virtual ~ICompressor() = default;

    virtual Bytes compress(const Bytes& data) = 0;

    virtual Bytes decompress(const Bytes& data) = 0;
};
