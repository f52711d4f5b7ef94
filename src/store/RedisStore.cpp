#include <rediscache/store/RedisStore.hpp>

#include <rediscache/Errors.hpp>

#include <hiredis/hiredis.h>

#include <sys/socket.h>
#include <sys/time.h>

#include <algorithm>
#include <cstdlib>
#include <stdexcept>

namespace {

/**
 * @brief Условная запись: SET только если текущие байты равны ожидаемым
 *
 * KEYS[1] — ключ
 * ARGV[1] — '1' если ожидается значение, '0' если ожидается отсутствие
 * ARGV[2] — ожидаемые байты
 * ARGV[3] — новые байты
 * ARGV[4] — TTL в мс: > 0 — PX, 0 — без истечения, -1 — KEEPTTL
 *
 * Возвращает 1 если записано, 0 при конфликте.
 */
const char* const kCompareAndSetScript = R"lua(
local current = redis.call('GET', KEYS[1])
if ARGV[1] == '0' then
  if current then
    return 0
  end
elseif current ~= ARGV[2] then
  return 0
end
local ttl = tonumber(ARGV[4])
if ttl > 0 then
  redis.call('SET', KEYS[1], ARGV[3], 'PX', ttl)
elseif ttl == 0 then
  redis.call('SET', KEYS[1], ARGV[3])
else
  redis.call('SET', KEYS[1], ARGV[3], 'KEEPTTL')
end
return 1
)lua";

timeval toTimeval(Duration d) {
    timeval tv;
    tv.tv_sec = static_cast<time_t>(d.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((d.count() % 1000) * 1000);
    return tv;
}

std::string envOr(const char* name, const std::string& fallback) {
    const char* value = std::getenv(name);
    return (value && *value) ? std::string(value) : fallback;
}

long parseNumber(const char* name, const std::string& value) {
    char* end = nullptr;
    long result = std::strtol(value.c_str(), &end, 10);
    if (end == value.c_str() || *end != '\0') {
        throw std::invalid_argument(std::string(name) + " is not a number: " + value);
    }
    return result;
}

bool isError(const redisReply* reply) {
    return reply->type == REDIS_REPLY_ERROR;
}

void checkReply(const redisReply* reply) {
    if (isError(reply)) {
        throw StoreError(std::string("redis: ") + std::string(reply->str, reply->len));
    }
}

Bytes replyBytes(const redisReply* reply) {
    return Bytes(reply->str, reply->str + reply->len);
}

std::string ttlArgument(Duration ttl) {
    return ttl.count() > 0 ? std::to_string(ttl.count()) : std::string();
}

}  // namespace

// ==================== RedisStoreOptions ====================

RedisStoreOptions RedisStoreOptions::fromEnvironment() {
    RedisStoreOptions options;
    options.host = envOr("REDIS_HOST", options.host);
    options.port = static_cast<int>(
        parseNumber("REDIS_PORT", envOr("REDIS_PORT", std::to_string(options.port))));
    options.db = static_cast<int>(
        parseNumber("REDIS_DB", envOr("REDIS_DB", std::to_string(options.db))));
    options.username = envOr("REDIS_USERNAME", options.username);
    options.password = envOr("REDIS_PASSWORD", options.password);
    options.poolSize = static_cast<size_t>(
        parseNumber("REDIS_POOL_SIZE", envOr("REDIS_POOL_SIZE", std::to_string(options.poolSize))));
    return options;
}

void RedisStoreOptions::validate() const {
    if (host.empty()) {
        throw std::invalid_argument("Redis host cannot be empty");
    }
    if (port <= 0 || port > 65535) {
        throw std::invalid_argument("Redis port must be in [1, 65535]");
    }
    if (db < 0) {
        throw std::invalid_argument("Redis db cannot be negative");
    }
    if (poolSize == 0) {
        throw std::invalid_argument("Redis pool size must be greater than 0");
    }
    if (connectTimeout.count() <= 0 || commandTimeout.count() <= 0) {
        throw std::invalid_argument("Redis timeouts must be positive");
    }
}

// ==================== Lease ====================

/**
 * @brief Соединение, взятое из пула на время одного round-trip
 *
 * Деструктор возвращает соединение в пул. Оборванное (markBroken)
 * возвращается пустым слотом — при следующем захвате оно пересоздаётся.
 */
class RedisStore::Lease {
public:
    Lease(RedisStore& store, ConnectionPtr connection)
        : store_(&store)
        , connection_(std::move(connection))
    {}

    Lease(Lease&& other) noexcept
        : store_(other.store_)
        , connection_(std::move(other.connection_))
        , broken_(other.broken_)
    {
        other.store_ = nullptr;
    }

    Lease(const Lease&) = delete;
    Lease& operator=(const Lease&) = delete;

    ~Lease() {
        if (!store_) {
            return;
        }
        if (broken_) {
            connection_.reset();
        }
        store_->release(std::move(connection_));
    }

    redisContext* get() const { return connection_.get(); }

    void markBroken() { broken_ = true; }

private:
    RedisStore* store_;
    ConnectionPtr connection_;
    bool broken_ = false;
};

// ==================== RedisStore ====================

void RedisStore::ContextDeleter::operator()(redisContext* rc) const {
    redisFree(rc);
}

void RedisStore::ReplyDeleter::operator()(redisReply* reply) const {
    freeReplyObject(reply);
}

const char* RedisStore::compareAndSetScript() {
    return kCompareAndSetScript;
}

RedisStore::RedisStore(RedisStoreOptions options)
    : options_(std::move(options))
{
    options_.validate();

    for (size_t i = 0; i < options_.poolSize; ++i) {
        pool_.push(connect());
    }

    Context ctx = Context::withTimeout(options_.connectTimeout);
    ping(ctx);

    ReplyPtr reply = command(ctx, {"SCRIPT", "LOAD", kCompareAndSetScript});
    checkReply(reply.get());
    casSha_.assign(reply->str, reply->len);
}

RedisStore::~RedisStore() {
    close();
}

void RedisStore::close() {
    pool_.shutdown();
    ConnectionPtr connection;
    while (pool_.tryPopImmediate(connection)) {
        connection.reset();
    }
}

RedisStore::ConnectionPtr RedisStore::connect() const {
    ConnectionPtr rc(redisConnectWithTimeout(options_.host.c_str(), options_.port,
                                             toTimeval(options_.connectTimeout)));
    if (!rc) {
        throw StoreError("redis: cannot allocate connection context");
    }
    if (rc->err) {
        throw StoreError("redis: connect " + options_.host + ":" +
                         std::to_string(options_.port) + ": " + rc->errstr);
    }
    redisSetTimeout(rc.get(), toTimeval(options_.commandTimeout));

    auto run = [&rc](const Args& args) {
        std::vector<const char*> argv;
        std::vector<size_t> lens;
        for (const auto& arg : args) {
            argv.push_back(arg.data());
            lens.push_back(arg.size());
        }
        ReplyPtr reply(static_cast<redisReply*>(
            redisCommandArgv(rc.get(), static_cast<int>(argv.size()), argv.data(), lens.data())));
        if (!reply) {
            throw StoreError(std::string("redis: ") + rc->errstr);
        }
        checkReply(reply.get());
    };

    if (!options_.password.empty()) {
        if (options_.username.empty()) {
            run({"AUTH", options_.password});
        } else {
            run({"AUTH", options_.username, options_.password});
        }
    }
    if (options_.db != 0) {
        run({"SELECT", std::to_string(options_.db)});
    }
    return rc;
}

RedisStore::Lease RedisStore::acquire(const Context& ctx) {
    Duration wait = options_.acquireTimeout;
    if (auto left = ctx.remaining()) {
        wait = std::min(wait, *left);
    }

    if (pool_.isShutdown()) {
        throw StoreError("redis: store is closed");
    }

    // Пустой слот в пуле — оборванное соединение, пересоздаём его здесь
    ConnectionPtr connection;
    bool popped = false;
    {
        Context::CancelRegistration registration = ctx.onCancel([this] {
            pool_.wakeWaiters();
        });
        popped = pool_.tryPop(connection, wait, [&ctx] { return ctx.isCancelled(); });
    }
    if (!popped) {
        ctx.throwIfDone();
        if (pool_.isShutdown()) {
            throw StoreError("redis: store is closed");
        }
        throw StoreError("redis: timed out waiting for a free connection");
    }

    if (!connection) {
        try {
            connection = connect();
        } catch (const StoreError&) {
            pool_.tryPush(nullptr);
            throw;
        }
    }
    return Lease(*this, std::move(connection));
}

void RedisStore::release(ConnectionPtr connection) {
    // После close() соединение закрывается, а не возвращается в пул
    pool_.tryPush(std::move(connection));
}

RedisStore::ReplyPtr RedisStore::command(const Context& ctx, const Args& args) {
    std::vector<ReplyPtr> replies = pipeline(ctx, {args});
    return std::move(replies.front());
}

std::vector<RedisStore::ReplyPtr> RedisStore::pipeline(const Context& ctx,
                                                       const std::vector<Args>& commands) {
    ctx.throwIfDone();
    Lease lease = acquire(ctx);
    redisContext* rc = lease.get();

    Duration timeout = options_.commandTimeout;
    if (auto left = ctx.remaining()) {
        if (left->count() <= 0) {
            throw DeadlineExceededError();
        }
        timeout = std::min(timeout, *left);
    }
    redisSetTimeout(rc, toTimeval(timeout));

    for (const auto& args : commands) {
        std::vector<const char*> argv;
        std::vector<size_t> lens;
        argv.reserve(args.size());
        lens.reserve(args.size());
        for (const auto& arg : args) {
            argv.push_back(arg.data());
            lens.push_back(arg.size());
        }
        if (redisAppendCommandArgv(rc, static_cast<int>(argv.size()),
                                   argv.data(), lens.data()) != REDIS_OK) {
            lease.markBroken();
            throw StoreError(std::string("redis: ") + rc->errstr);
        }
    }

    int fd = rc->fd;
    Context::CancelRegistration registration = ctx.onCancel([fd] {
        ::shutdown(fd, SHUT_RDWR);
    });

    std::vector<ReplyPtr> replies;
    replies.reserve(commands.size());
    for (size_t i = 0; i < commands.size(); ++i) {
        void* raw = nullptr;
        if (redisGetReply(rc, &raw) != REDIS_OK) {
            registration.reset();
            lease.markBroken();
            if (ctx.isCancelled()) {
                throw CancelledError();
            }
            if (ctx.isExpired()) {
                throw DeadlineExceededError();
            }
            throw StoreError(std::string("redis: ") + rc->errstr);
        }
        replies.emplace_back(static_cast<redisReply*>(raw));
    }
    registration.reset();

    // Отмена могла прийти между последним ответом и снятием подписки —
    // сокет уже закрыт, соединение в пул не возвращаем
    if (ctx.isCancelled()) {
        lease.markBroken();
    }
    return replies;
}

// ==================== Команды ====================

std::optional<Bytes> RedisStore::get(const Context& ctx, const std::string& key) {
    ReplyPtr reply = command(ctx, {"GET", key});
    checkReply(reply.get());
    if (reply->type == REDIS_REPLY_NIL) {
        return std::nullopt;
    }
    return replyBytes(reply.get());
}

bool RedisStore::set(const Context& ctx, const std::string& key, const Bytes& value,
                     Duration ttl, SetMode mode) {
    Args args{"SET", key, toString(value)};
    if (ttl.count() > 0) {
        args.push_back("PX");
        args.push_back(ttlArgument(ttl));
    }
    if (mode == SetMode::IfAbsent) {
        args.push_back("NX");
    } else if (mode == SetMode::IfPresent) {
        args.push_back("XX");
    }

    ReplyPtr reply = command(ctx, args);
    checkReply(reply.get());
    return reply->type != REDIS_REPLY_NIL;
}

size_t RedisStore::remove(const Context& ctx, const std::vector<std::string>& keys) {
    if (keys.empty()) {
        return 0;
    }
    Args args{"DEL"};
    args.insert(args.end(), keys.begin(), keys.end());

    ReplyPtr reply = command(ctx, args);
    checkReply(reply.get());
    return static_cast<size_t>(reply->integer);
}

std::vector<std::optional<Bytes>> RedisStore::mget(const Context& ctx,
                                                   const std::vector<std::string>& keys) {
    if (keys.empty()) {
        return {};
    }
    Args args{"MGET"};
    args.insert(args.end(), keys.begin(), keys.end());

    ReplyPtr reply = command(ctx, args);
    checkReply(reply.get());
    if (reply->type != REDIS_REPLY_ARRAY || reply->elements != keys.size()) {
        throw StoreError("redis: unexpected MGET reply shape");
    }

    std::vector<std::optional<Bytes>> result;
    result.reserve(keys.size());
    for (size_t i = 0; i < reply->elements; ++i) {
        const redisReply* element = reply->element[i];
        if (element->type == REDIS_REPLY_STRING) {
            result.emplace_back(replyBytes(element));
        } else {
            result.emplace_back(std::nullopt);
        }
    }
    return result;
}

void RedisStore::mset(const Context& ctx,
                      const std::vector<std::pair<std::string, Bytes>>& entries,
                      Duration ttl) {
    if (entries.empty()) {
        return;
    }
    std::vector<Args> commands;
    commands.reserve(entries.size());
    for (const auto& [key, value] : entries) {
        Args args{"SET", key, toString(value)};
        if (ttl.count() > 0) {
            args.push_back("PX");
            args.push_back(ttlArgument(ttl));
        }
        commands.push_back(std::move(args));
    }

    for (const auto& reply : pipeline(ctx, commands)) {
        checkReply(reply.get());
    }
}

bool RedisStore::compareAndSet(const Context& ctx, const std::string& key,
                               const std::optional<Bytes>& expected, const Bytes& value,
                               std::optional<Duration> ttl) {
    std::string ttlArg = "-1";
    if (ttl) {
        ttlArg = ttl->count() > 0 ? std::to_string(ttl->count()) : "0";
    }
    Args args{"EVALSHA", casSha_, "1", key,
              expected ? "1" : "0",
              expected ? toString(*expected) : std::string(),
              toString(value),
              ttlArg};

    ReplyPtr reply = command(ctx, args);
    if (isError(reply.get()) && std::string(reply->str, reply->len).rfind("NOSCRIPT", 0) == 0) {
        // Кэш скриптов сброшен (SCRIPT FLUSH, рестарт) — EVAL заново кэширует его
        args[0] = "EVAL";
        args[1] = kCompareAndSetScript;
        reply = command(ctx, args);
    }
    checkReply(reply.get());
    return reply->type == REDIS_REPLY_INTEGER && reply->integer == 1;
}

std::optional<Duration> RedisStore::ttl(const Context& ctx, const std::string& key) {
    ReplyPtr reply = command(ctx, {"PTTL", key});
    checkReply(reply.get());
    if (reply->integer == -2) {
        return std::nullopt;
    }
    return Duration(reply->integer);
}

bool RedisStore::expire(const Context& ctx, const std::string& key, Duration ttl) {
    ReplyPtr reply = command(ctx, {"PEXPIRE", key, std::to_string(ttl.count())});
    checkReply(reply.get());
    return reply->integer == 1;
}

void RedisStore::flush(const Context& ctx) {
    ReplyPtr reply = command(ctx, {"FLUSHDB"});
    checkReply(reply.get());
}

void RedisStore::ping(const Context& ctx) {
    ReplyPtr reply = command(ctx, {"PING"});
    checkReply(reply.get());
    if (reply->type != REDIS_REPLY_STATUS || std::string(reply->str, reply->len) != "PONG") {
        throw StoreError("redis: unexpected PING reply");
    }
}
