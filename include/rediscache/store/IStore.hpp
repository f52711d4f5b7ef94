#pragma once

#include <rediscache/Context.hpp>
#include <rediscache/Types.hpp>

#include <optional>
#include <string>
#include <utility>
#include <vector>

/**
 * @brief Интерфейс удалённого key-value хранилища (Redis)
 *
 * Работает только с байтами; про кодеки и хуки не знает.
 * Каждый метод — один round-trip (для mget/mset — один на вызов,
 * разбиение на батчи делает фасад).
 *
 * Общие правила:
 * - перед обращением к серверу проверяется ctx (CancelledError /
 *   DeadlineExceededError), отмена прерывает идущий запрос
 * - транспортные и серверные ошибки — StoreError
 * - отсутствие ключа — не ошибка, а std::nullopt / false
 * - ttl == 0 — без истечения
 *
 * Реализации:
 * - RedisStore        — hiredis, CAS через Lua-скрипт
 * - InMemoryStore     — in-process хранилище (тесты, встраивание)
 * - InstrumentedStore — декоратор с метриками команд
 */
class IStore {
public:
    virtual ~IStore() = default;

    /// Условие записи для set
    enum class SetMode {
        Always,     ///< SET
        IfAbsent,   ///< SET NX
        IfPresent   ///< SET XX
    };

    virtual std::optional<Bytes> get(const Context& ctx, const std::string& key) = 0;

    /**
     * @brief Чтение с разрешённым near-cache
     * @param ttl Максимальная устарелость локальной копии
     *
     * Клиентское кэширование целиком на стороне клиента хранилища;
     * по умолчанию — обычный get.
     */
    virtual std::optional<Bytes> getCached(const Context& ctx, const std::string& key,
                                           Duration ttl) {
        (void)ttl;
        return get(ctx, key);
    }

    /**
     * @brief Записать значение
     * @return true если запись выполнена (для IfAbsent/IfPresent может быть false)
     */
    virtual bool set(const Context& ctx, const std::string& key, const Bytes& value,
                     Duration ttl, SetMode mode = SetMode::Always) = 0;

    /**
     * @brief Удалить ключи
     * @return Количество реально удалённых ключей
     */
    virtual size_t remove(const Context& ctx, const std::vector<std::string>& keys) = 0;

    /**
     * @brief Прочитать несколько ключей за один round-trip
     * @return Значения в порядке keys; nullopt — ключа нет
     */
    virtual std::vector<std::optional<Bytes>> mget(const Context& ctx,
                                                   const std::vector<std::string>& keys) = 0;

    /**
     * @brief Записать несколько ключей за один round-trip
     */
    virtual void mset(const Context& ctx,
                      const std::vector<std::pair<std::string, Bytes>>& entries,
                      Duration ttl) = 0;

    /**
     * @brief Атомарная условная запись (compare-and-set)
     * @param expected Ожидаемые текущие байты; nullopt — ключ должен отсутствовать
     * @param value Новые байты
     * @param ttl Новый TTL; nullopt — сохранить текущий TTL ключа (KEEPTTL)
     * @return true — записано; false — значение изменилось (конфликт)
     *
     * Сравнение и запись выполняются на сервере одной неделимой операцией.
     */
    virtual bool compareAndSet(const Context& ctx, const std::string& key,
                               const std::optional<Bytes>& expected, const Bytes& value,
                               std::optional<Duration> ttl) = 0;

    /**
     * @brief Оставшееся время жизни ключа
     * @return nullopt — ключа нет; Duration(-1) — ключ без истечения
     */
    virtual std::optional<Duration> ttl(const Context& ctx, const std::string& key) = 0;

    /**
     * @brief Установить TTL существующему ключу
     * @return false — ключа нет
     */
    virtual bool expire(const Context& ctx, const std::string& key, Duration ttl) = 0;

    /// Удалить все ключи текущей базы
    virtual void flush(const Context& ctx) = 0;
};
