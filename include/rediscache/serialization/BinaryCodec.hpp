#pragma once

#include <rediscache/Errors.hpp>
#include <rediscache/serialization/ICodec.hpp>

#include <cstring>
#include <string>
#include <type_traits>

/**
 * @brief Бинарный кодек для простых значений
 * @tparam V Тип значения
 *
 * Формат:
 * - арифметические типы — sizeof(V) байт, little-endian порядок хоста
 *   (копия через memcpy)
 * - std::string — байты строки как есть, без префикса длины
 *
 * Длина payload известна из хранилища, поэтому префикс не нужен.
 * Для арифметики размер проверяется строго: payload другой длины —
 * DecodeError, а не мусорное значение.
 *
 * Для структур используйте JsonCodec/MsgpackCodec или свою реализацию ICodec.
 */
template<typename V>
class BinaryCodec : public ICodec<V> {
    static_assert(std::is_arithmetic<V>::value || std::is_same<V, std::string>::value,
                  "BinaryCodec supports arithmetic types and std::string");

public:
    Bytes encode(const V& value) override {
        return encodeValue(value);
    }

    V decode(const Bytes& data) override {
        V value{};
        decodeValue(data, value);
        return value;
    }

private:
    // ==================== Сериализация типов ====================

    template<typename T>
    typename std::enable_if<std::is_arithmetic<T>::value, Bytes>::type
    encodeValue(const T& value) {
        Bytes result(sizeof(T));
        std::memcpy(result.data(), &value, sizeof(T));
        return result;
    }

    Bytes encodeValue(const std::string& value) {
        return Bytes(value.begin(), value.end());
    }

    // ==================== Десериализация типов ====================

    template<typename T>
    typename std::enable_if<std::is_arithmetic<T>::value>::type
    decodeValue(const Bytes& data, T& value) {
        if (data.size() != sizeof(T)) {
            throw DecodeError(Stage::Decode,
                "expected " + std::to_string(sizeof(T)) + " bytes, got " +
                std::to_string(data.size()));
        }
        std::memcpy(&value, data.data(), sizeof(T));
    }

    void decodeValue(const Bytes& data, std::string& value) {
        value.assign(data.begin(), data.end());
    }
};
