#pragma once

#include <rediscache/Types.hpp>

/**
 * @brief Интерфейс кодека значений
 * @tparam V Тип значения
 *
 * Пара чистых функций value -> bytes и bytes -> value.
 * Не знает о сжатии и о хранилище — только формат данных.
 *
 * Контракт: decode(encode(v)) наблюдаемо равно v.
 * При ошибке реализация бросает исключение (любое производное от
 * std::exception) — конвейер классифицирует его как EncodeError
 * или DataCorruptionError.
 *
 * Реализации:
 * - BinaryCodec  — арифметические типы и строки без обёрток
 * - JsonCodec    — JSON через nlohmann::json
 * - MsgpackCodec — MessagePack через nlohmann::json
 */
template<typename V>
class ICodec {
public:
    virtual ~ICodec() = default;

    virtual Bytes encode(const V& value) = 0;

    virtual V decode(const Bytes& data) = 0;
};
