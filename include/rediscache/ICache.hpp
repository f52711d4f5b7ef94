#pragma once

#include <rediscache/Context.hpp>
#include <rediscache/Types.hpp>
#include <rediscache/batch/BatchedMultiGet.hpp>

#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

/// Исход upsert
enum class UpsertResult {
    Written,   ///< Новое значение записано
    Aborted    ///< Callback отказался от записи, хранилище не изменено
};

/**
 * @brief Базовый интерфейс кэша
 * @tparam V Тип значения (ключ всегда std::string)
 *
 * Все операции принимают Context первым аргументом и сообщают об ошибках
 * исключениями из Errors.hpp.
 */
template<typename V>
class ICache {
public:
    /**
     * @brief Функция обновления для upsert
     *
     * Получает текущее значение (nullopt — ключа нет), возвращает новое
     * значение или nullopt для отказа от записи. Может вызываться
     * несколько раз за один upsert — не должна иметь побочных эффектов.
     */
    using UpdateFn = std::function<std::optional<V>(const std::optional<V>&)>;

    virtual ~ICache() = default;

    /**
     * @brief Записать значение
     * @param ttl Время жизни; 0 — без истечения
     * @throws EncodeError, StoreError
     */
    virtual void set(const Context& ctx, const std::string& key, const V& value,
                     Duration ttl = Duration(0)) = 0;

    /**
     * @brief Прочитать значение
     * @throws KeyNotFoundError если ключа нет
     * @throws DataCorruptionError если байты не декодируются
     */
    virtual V get(const Context& ctx, const std::string& key) = 0;

    /**
     * @brief Удалить значение (удаление отсутствующего ключа — не ошибка)
     * @return true, если ключ существовал
     */
    virtual bool remove(const Context& ctx, const std::string& key) = 0;

    /**
     * @brief Прочитать несколько ключей
     * @return Исходы в порядке keys
     */
    virtual std::vector<MultiGetResult<V>> mget(const Context& ctx,
                                                const std::vector<std::string>& keys) = 0;

    /**
     * @brief Атомарное чтение-изменение-запись через compare-and-set
     * @param ttl TTL новой записи; nullopt — сохранить текущий TTL ключа
     * @throws RetryableConflictError если значение менялось конкурентно
     *         и повторы (если настроены) исчерпаны
     */
    virtual UpsertResult upsert(const Context& ctx, const std::string& key,
                                const UpdateFn& update,
                                std::optional<Duration> ttl = std::nullopt) = 0;
};
