#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

/**
 * @brief Байтовое представление значения в хранилище
 *
 * Всё, что уходит в Redis, проходит через этот тип:
 * Bytes = compress(encode(value)).
 */
using Bytes = std::vector<uint8_t>;

/// Часы для измерения длительностей операций и TTL
using Clock = std::chrono::steady_clock;

/// Длительность TTL и таймаутов (миллисекундная точность, как у Redis PX)
using Duration = std::chrono::milliseconds;

inline Bytes toBytes(const std::string& s) {
    return Bytes(s.begin(), s.end());
}

inline std::string toString(const Bytes& b) {
    return std::string(b.begin(), b.end());
}
