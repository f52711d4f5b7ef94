#pragma once

#include <rediscache/CacheConfig.hpp>
#include <rediscache/Errors.hpp>
#include <rediscache/ICache.hpp>
#include <rediscache/batch/BatchedMultiGet.hpp>
#include <rediscache/listeners/ICacheListener.hpp>
#include <rediscache/pipeline/CodecPipeline.hpp>
#include <rediscache/store/IStore.hpp>

#include <algorithm>
#include <condition_variable>
#include <iostream>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <vector>

/**
 * @brief Типизированный кэш поверх удалённого key-value хранилища
 * @tparam V Тип значения
 *
 * Архитектура:
 * - Значение превращается в байты через CodecPipeline (кодек, сжатие, хуки)
 * - Байты пишутся/читаются через IStore (Redis, in-memory, декораторы)
 * - Слушатели получают по одному OperationEvent на вызов (Observer pattern)
 *
 * Потокобезопасность:
 * - Между операциями не держится никаких эксклюзивных блокировок
 * - Конвейер и список слушателей — неизменяемые снимки за shared_mutex;
 *   addHook/addListener подменяют снимок, идущие операции дорабатывают
 *   со старым
 * - upsert на одном ключе из разных потоков координируется только
 *   атомарным compareAndSet хранилища
 *
 * Ошибки пробрасываются как есть, с дописанными операцией и ключом
 * (CacheError::attach). KeyNotFoundError для слушателей — успешный
 * исход с hit = false.
 *
 * Пример использования:
 * @code
 *   auto store = std::make_shared<RedisStore>(RedisStoreOptions::fromEnvironment());
 *
 *   CacheConfig<Person> config;
 *   config.codec = std::make_shared<JsonCodec<Person>>();
 *   Cache<Person> cache(store, config);
 *
 *   auto ctx = Context::withTimeout(std::chrono::seconds(1));
 *   cache.set(ctx, "person", Person{"Bob"});
 *   Person bob = cache.get(ctx, "person");
 *
 *   cache.upsert(ctx, "person", [](const std::optional<Person>& current) {
 *       Person next = current.value_or(Person{});
 *       next.visits++;
 *       return std::optional<Person>(next);
 *   });
 * @endcode
 */
template<typename V>
class Cache : public ICache<V> {
public:
    using UpdateFn = typename ICache<V>::UpdateFn;
    using Pipeline = CodecPipeline<V>;

    /**
     * @param store Хранилище (разделяемое, живёт дольше кэша)
     * @param config Конфигурация; проверяется через validate()
     * @throws std::invalid_argument
     */
    Cache(std::shared_ptr<IStore> store, CacheConfig<V> config)
        : store_(std::move(store))
        , config_(std::move(config))
        , listeners_(std::make_shared<const Listeners>())
    {
        if (!store_) {
            throw std::invalid_argument("Store cannot be null");
        }
        config_.validate();

        HookChain<V> chain;
        for (const auto& hook : config_.hooks) {
            chain.add(hook);
        }
        pipeline_ = std::make_shared<const Pipeline>(config_.codec, config_.compressor,
                                                     std::move(chain));
    }

    Cache(const Cache&) = delete;
    Cache& operator=(const Cache&) = delete;

    // ==================== Основные операции ====================

    void set(const Context& ctx, const std::string& key, const V& value,
             Duration ttl = Duration(0)) override {
        track("set", key, 1, [&](OperationEvent&) {
            requireNonNegative(ttl);
            Bytes data = pipeline()->toBytes(value);
            store_->set(ctx, key, data, ttl);
            notifySet(key);
        });
    }

    /**
     * @brief Прочитать значение
     *
     * При nearCacheTtl > 0 чтение идёт через IStore::getCached: значение
     * может отставать от хранилища не больше чем на nearCacheTtl.
     */
    V get(const Context& ctx, const std::string& key) override {
        return track("get", key, 1, [&](OperationEvent& event) {
            auto snapshot = pipeline();
            std::optional<Bytes> data = config_.nearCacheTtl.count() > 0
                ? store_->getCached(ctx, key, config_.nearCacheTtl)
                : store_->get(ctx, key);
            if (!data) {
                notifyMiss(key);
                throw KeyNotFoundError();
            }
            V value = snapshot->fromBytes(*data);
            event.hit = true;
            notifyHit(key);
            return value;
        });
    }

    bool remove(const Context& ctx, const std::string& key) override {
        return track("remove", key, 1, [&](OperationEvent& event) {
            bool removed = store_->remove(ctx, {key}) > 0;
            event.hit = removed;
            if (removed) {
                notifyRemove(key);
            }
            return removed;
        });
    }

    std::vector<MultiGetResult<V>> mget(const Context& ctx,
                                        const std::vector<std::string>& keys) override {
        return track("mget", firstKey(keys), keys.size(), [&](OperationEvent& event) {
            BatchedMultiGet<V> batch(*store_, config_.batchSize);
            auto results = batch.fetch(ctx, keys, *pipeline());
            for (const auto& result : results) {
                if (result.found()) {
                    event.hit = true;
                    notifyHit(result.key);
                } else if (result.status == MultiGetStatus::NotFound) {
                    notifyMiss(result.key);
                }
            }
            return results;
        });
    }

    /**
     * @brief Атомарное чтение-изменение-запись
     *
     * Одна попытка:
     * 1. GET текущих байтов (отсутствие ключа — допустимое состояние)
     * 2. Декодирование и вызов update с текущим значением или nullopt
     * 3. update вернул nullopt — выход без записи (Aborted)
     * 4. Кодирование нового значения и compareAndSet: запись только если
     *    байты в хранилище совпадают с прочитанными на шаге 1
     * 5. Конфликт — RetryableConflictError, либо повтор с шага 1, пока
     *    не исчерпан upsertMaxRetries
     *
     * Версия значения — сами предыдущие байты, отдельного счётчика нет.
     * Near-cache здесь не используется: сравнение идёт с авторитетной копией.
     *
     * @param ttl TTL записи; nullopt — сохранить текущий TTL ключа
     */
    UpsertResult upsert(const Context& ctx, const std::string& key,
                        const UpdateFn& update,
                        std::optional<Duration> ttl = std::nullopt) override {
        return track("upsert", key, 1, [&](OperationEvent& event) {
            if (!update) {
                throw std::invalid_argument("Update function cannot be null");
            }
            if (ttl) {
                requireNonNegative(*ttl);
            }

            for (int attempt = 1;; ++attempt) {
                auto snapshot = pipeline();
                std::optional<Bytes> current = store_->get(ctx, key);
                event.hit = current.has_value();

                std::optional<V> previous;
                if (current) {
                    previous = snapshot->fromBytes(*current);
                }

                std::optional<V> next = update(previous);
                if (!next) {
                    return UpsertResult::Aborted;
                }

                Bytes data = snapshot->toBytes(*next);
                if (store_->compareAndSet(ctx, key, current, data, ttl)) {
                    notifySet(key);
                    return UpsertResult::Written;
                }

                notifyConflict(key);
                if (attempt > config_.upsertMaxRetries) {
                    throw RetryableConflictError(attempt);
                }
                backoff(ctx);
            }
        });
    }

    // ==================== Дополнительные операции ====================

    /**
     * @brief Записать, только если ключа нет (SET NX)
     * @return true — записано
     */
    bool setIfAbsent(const Context& ctx, const std::string& key, const V& value,
                     Duration ttl = Duration(0)) {
        return conditionalSet("setIfAbsent", ctx, key, value, ttl, IStore::SetMode::IfAbsent);
    }

    /**
     * @brief Записать, только если ключ уже есть (SET XX)
     * @return true — записано
     */
    bool setIfPresent(const Context& ctx, const std::string& key, const V& value,
                      Duration ttl = Duration(0)) {
        return conditionalSet("setIfPresent", ctx, key, value, ttl, IStore::SetMode::IfPresent);
    }

    /**
     * @brief Записать несколько значений порциями по msetBatchSize
     *
     * Все значения кодируются до первой записи: ошибка кодирования
     * не оставляет частично записанный набор. Ошибка хранилища на
     * порции N оставляет порции 0..N-1 записанными.
     */
    void mset(const Context& ctx, const std::vector<std::pair<std::string, V>>& entries,
              Duration ttl = Duration(0)) {
        std::string key = entries.empty() ? std::string() : entries.front().first;
        track("mset", key, entries.size(), [&](OperationEvent&) {
            requireNonNegative(ttl);
            auto snapshot = pipeline();

            std::vector<std::pair<std::string, Bytes>> encoded;
            encoded.reserve(entries.size());
            for (const auto& entry : entries) {
                try {
                    encoded.emplace_back(entry.first, snapshot->toBytes(entry.second));
                } catch (CacheError& e) {
                    e.attach("mset", entry.first);
                    throw;
                }
            }

            for (const auto& range : chunkRanges(encoded.size(), config_.msetBatchSize)) {
                std::vector<std::pair<std::string, Bytes>> chunk(
                    encoded.begin() + range.first, encoded.begin() + range.second);
                store_->mset(ctx, chunk, ttl);
            }
            for (const auto& entry : entries) {
                notifySet(entry.first);
            }
        });
    }

    /**
     * @brief Оставшееся время жизни
     * @return nullopt — ключ бессрочный
     * @throws KeyNotFoundError если ключа нет
     */
    std::optional<Duration> ttl(const Context& ctx, const std::string& key) {
        return track("ttl", key, 1, [&](OperationEvent& event) -> std::optional<Duration> {
            auto remaining = store_->ttl(ctx, key);
            if (!remaining) {
                throw KeyNotFoundError();
            }
            event.hit = true;
            if (remaining->count() < 0) {
                return std::nullopt;
            }
            return remaining;
        });
    }

    /**
     * @brief Установить TTL существующему ключу
     * @throws KeyNotFoundError если ключа нет
     */
    void expire(const Context& ctx, const std::string& key, Duration ttl) {
        track("expire", key, 1, [&](OperationEvent& event) {
            if (ttl.count() <= 0) {
                throw std::invalid_argument("TTL must be positive");
            }
            if (!store_->expire(ctx, key, ttl)) {
                throw KeyNotFoundError();
            }
            event.hit = true;
        });
    }

    /// Удалить все ключи базы хранилища
    void flush(const Context& ctx) {
        track("flush", std::string(), 0, [&](OperationEvent&) {
            store_->flush(ctx);
        });
    }

    // ==================== Хуки и слушатели ====================

    /**
     * @brief Добавить хук в конец цепочки (самый внутренний)
     *
     * Конвейер пересобирается один раз; операции, уже взявшие снимок,
     * доработают без нового хука.
     */
    void addHook(std::shared_ptr<IHook<V>> hook) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        pipeline_ = std::make_shared<const Pipeline>(pipeline_->withHook(std::move(hook)));
    }

    size_t hookCount() const {
        return pipeline()->hooks().size();
    }

    /// Текущая цепочка хуков, включая добавленные через addHook
    std::vector<std::shared_ptr<IHook<V>>> hooks() const {
        return pipeline()->hooks().hooks();
    }

    void addListener(std::shared_ptr<ICacheListener> listener) {
        if (!listener) {
            return;
        }
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto next = std::make_shared<Listeners>(*listeners_);
        next->push_back(std::move(listener));
        listeners_ = std::move(next);
    }

    void removeListener(const std::shared_ptr<ICacheListener>& listener) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto next = std::make_shared<Listeners>(*listeners_);
        next->erase(std::remove(next->begin(), next->end(), listener), next->end());
        listeners_ = std::move(next);
    }

    /**
     * @brief Конфигурация, переданная в конструктор
     * @note config().hooks — только хуки из конструктора; актуальная
     *       цепочка доступна через hooks()
     */
    const CacheConfig<V>& config() const { return config_; }

    const std::shared_ptr<IStore>& store() const { return store_; }

private:
    using Listeners = std::vector<std::shared_ptr<ICacheListener>>;

    std::shared_ptr<const Pipeline> pipeline() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return pipeline_;
    }

    std::shared_ptr<const Listeners> listeners() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return listeners_;
    }

    static std::string firstKey(const std::vector<std::string>& keys) {
        return keys.empty() ? std::string() : keys.front();
    }

    static void requireNonNegative(Duration ttl) {
        if (ttl.count() < 0) {
            throw std::invalid_argument("TTL must be non-negative");
        }
    }

    bool conditionalSet(const char* operation, const Context& ctx, const std::string& key,
                        const V& value, Duration ttl, IStore::SetMode mode) {
        return track(operation, key, 1, [&](OperationEvent&) {
            requireNonNegative(ttl);
            Bytes data = pipeline()->toBytes(value);
            bool written = store_->set(ctx, key, data, ttl, mode);
            if (written) {
                notifySet(key);
            }
            return written;
        });
    }

    /**
     * @brief Пауза между попытками upsert, прерываемая отменой контекста
     */
    void backoff(const Context& ctx) const {
        Duration wait = config_.upsertRetryBackoff;
        auto remaining = ctx.remaining();
        if (remaining && *remaining < wait) {
            wait = *remaining;
        }
        if (wait.count() > 0) {
            std::mutex mutex;
            std::condition_variable wakeUp;
            bool cancelled = false;
            auto registration = ctx.onCancel([&] {
                std::lock_guard<std::mutex> lock(mutex);
                cancelled = true;
                wakeUp.notify_all();
            });
            std::unique_lock<std::mutex> lock(mutex);
            wakeUp.wait_for(lock, wait, [&] { return cancelled; });
        }
        ctx.throwIfDone();
    }

    /**
     * @brief Выполнить операцию и отправить слушателям ровно одно событие
     *
     * CacheError получает контекст (операция, ключ) и пробрасывается
     * тем же объектом — класс ошибки не меняется.
     */
    template<typename Fn>
    auto track(const char* operation, const std::string& key, size_t keyCount, Fn&& fn) {
        OperationEvent event;
        event.operation = operation;
        event.key = key;
        event.keyCount = keyCount;
        auto start = Clock::now();

        try {
            if constexpr (std::is_void<decltype(fn(event))>::value) {
                fn(event);
                finish(event, start);
                return;
            } else {
                auto result = fn(event);
                finish(event, start);
                return result;
            }
        } catch (KeyNotFoundError& e) {
            e.attach(operation, key);
            event.hit = false;
            finish(event, start);
            throw;
        } catch (CacheError& e) {
            e.attach(operation, key);
            fail(event, start, e);
            throw;
        } catch (const std::exception& e) {
            fail(event, start, e);
            throw;
        }
    }

    void finish(OperationEvent& event, Clock::time_point start) {
        event.duration = std::chrono::duration_cast<std::chrono::microseconds>(
            Clock::now() - start);
        forEachListener([&event](ICacheListener& listener) {
            listener.onOperation(event);
        });
    }

    void fail(OperationEvent& event, Clock::time_point start, const std::exception& e) {
        event.success = false;
        event.error = e.what();
        finish(event, start);
    }

    // ==================== Уведомления слушателей ====================

    void notifyHit(const std::string& key) {
        forEachListener([&key](ICacheListener& listener) { listener.onHit(key); });
    }

    void notifyMiss(const std::string& key) {
        forEachListener([&key](ICacheListener& listener) { listener.onMiss(key); });
    }

    void notifySet(const std::string& key) {
        forEachListener([&key](ICacheListener& listener) { listener.onSet(key); });
    }

    void notifyRemove(const std::string& key) {
        forEachListener([&key](ICacheListener& listener) { listener.onRemove(key); });
    }

    void notifyConflict(const std::string& key) {
        forEachListener([&key](ICacheListener& listener) { listener.onConflict(key); });
    }

    /**
     * @brief Вызвать всех слушателей снимка
     *
     * Исключение слушателя пишется в std::cerr и не меняет исход операции.
     */
    template<typename Action>
    void forEachListener(Action action) {
        auto snapshot = listeners();
        if (snapshot->empty()) return;
        for (const auto& listener : *snapshot) {
            try {
                action(*listener);
            } catch (const std::exception& e) {
                std::cerr << "[Cache] Listener error: " << e.what() << std::endl;
            }
        }
    }

    std::shared_ptr<IStore> store_;
    CacheConfig<V> config_;
    mutable std::shared_mutex mutex_;
    std::shared_ptr<const Pipeline> pipeline_;
    std::shared_ptr<const Listeners> listeners_;
};
