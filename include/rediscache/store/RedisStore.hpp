#pragma once

#include <rediscache/store/IStore.hpp>
#include <rediscache/utils/ThreadSafeQueue.hpp>

#include <chrono>
#include <memory>
#include <string>

struct redisContext;
struct redisReply;

/**
 * @brief Параметры подключения к Redis
 */
struct RedisStoreOptions {
    std::string host = "127.0.0.1";
    int port = 6379;
    int db = 0;
    std::string username;                 ///< ACL-пользователь (Redis 6+), пусто — только пароль
    std::string password;
    size_t poolSize = 4;                  ///< Количество соединений
    Duration connectTimeout = Duration(2000);
    Duration commandTimeout = Duration(5000);
    Duration acquireTimeout = Duration(5000);   ///< Ожидание свободного соединения

    /**
     * @brief Параметры из окружения
     *
     * REDIS_HOST, REDIS_PORT, REDIS_DB, REDIS_USERNAME, REDIS_PASSWORD,
     * REDIS_POOL_SIZE. Неуказанные — значения по умолчанию.
     * @throws std::invalid_argument при нечисловом значении порта/базы/пула
     */
    static RedisStoreOptions fromEnvironment();

    /// @throws std::invalid_argument при некорректных значениях
    void validate() const;
};

/**
 * @brief Хранилище на Redis через hiredis
 *
 * Жизненный цикл явный: соединения открываются в конструкторе
 * (с проверкой PING), закрываются в close() или деструкторе. Объект
 * создаётся один раз на процесс и передаётся в Cache через shared_ptr.
 *
 * Потокобезопасность: пул из poolSize соединений; каждая операция берёт
 * соединение из пула на время одного round-trip. Оборванное соединение
 * пересоздаётся при следующем захвате.
 *
 * compareAndSet выполняется Lua-скриптом (EVALSHA, при NOSCRIPT — EVAL):
 * сравнение текущих байтов с ожидаемыми и запись — одна атомарная
 * операция на сервере.
 *
 * Отмена контекста закрывает сокет занятого соединения (shutdown), что
 * прерывает блокирующее чтение ответа; соединение затем пересоздаётся.
 *
 * Near-cache: hiredis не поддерживает клиентское кэширование,
 * getCached выполняет обычный GET.
 */
class RedisStore : public IStore {
public:
    explicit RedisStore(RedisStoreOptions options = RedisStoreOptions());
    ~RedisStore() override;

    RedisStore(const RedisStore&) = delete;
    RedisStore& operator=(const RedisStore&) = delete;

    std::optional<Bytes> get(const Context& ctx, const std::string& key) override;

    bool set(const Context& ctx, const std::string& key, const Bytes& value,
             Duration ttl, SetMode mode = SetMode::Always) override;

    size_t remove(const Context& ctx, const std::vector<std::string>& keys) override;

    std::vector<std::optional<Bytes>> mget(const Context& ctx,
                                           const std::vector<std::string>& keys) override;

    void mset(const Context& ctx,
              const std::vector<std::pair<std::string, Bytes>>& entries,
              Duration ttl) override;

    bool compareAndSet(const Context& ctx, const std::string& key,
                       const std::optional<Bytes>& expected, const Bytes& value,
                       std::optional<Duration> ttl) override;

    std::optional<Duration> ttl(const Context& ctx, const std::string& key) override;

    bool expire(const Context& ctx, const std::string& key, Duration ttl) override;

    void flush(const Context& ctx) override;

    /// @throws StoreError если сервер не ответил PONG
    void ping(const Context& ctx);

    /**
     * @brief Закрыть все соединения
     * @note Вызывать после завершения всех операций
     */
    void close();

    const RedisStoreOptions& options() const { return options_; }

    /// Lua-скрипт условной записи (для отладки через redis-cli)
    static const char* compareAndSetScript();

private:
    struct ContextDeleter {
        void operator()(redisContext* rc) const;
    };
    struct ReplyDeleter {
        void operator()(redisReply* reply) const;
    };

    using ConnectionPtr = std::unique_ptr<redisContext, ContextDeleter>;
    using ReplyPtr = std::unique_ptr<redisReply, ReplyDeleter>;
    using Args = std::vector<std::string>;

    class Lease;

    ConnectionPtr connect() const;
    Lease acquire(const Context& ctx);
    void release(ConnectionPtr connection);

    ReplyPtr command(const Context& ctx, const Args& args);
    std::vector<ReplyPtr> pipeline(const Context& ctx, const std::vector<Args>& commands);

    RedisStoreOptions options_;
    ThreadSafeQueue<ConnectionPtr> pool_;
    std::string casSha_;
};
