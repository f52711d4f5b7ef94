#pragma once

#include <rediscache/Errors.hpp>
#include <rediscache/Types.hpp>

#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

/**
 * @brief Контекст вызова: отмена и дедлайн
 *
 * Копии разделяют общее состояние: отмена через любую копию видна всем.
 * Хранилище проверяет контекст перед каждым обращением к серверу и
 * может подписаться на отмену, чтобы прервать уже идущий round-trip.
 *
 * @code
 *   auto ctx = Context::withTimeout(std::chrono::milliseconds(200));
 *   cache.set(ctx, "key", value);
 *
 *   // из другого потока
 *   ctx.cancel();
 * @endcode
 */
class Context {
public:
    using TimePoint = Clock::time_point;
    using CancelCallback = std::function<void()>;

private:
    struct State {
        std::mutex mutex;
        std::condition_variable idle;     ///< Сигнал о завершении текущего callback
        bool cancelled = false;
        std::optional<TimePoint> deadline;
        std::map<size_t, CancelCallback> callbacks;
        size_t nextId = 1;
        size_t runningId = 0;             ///< Подписка, чей callback выполняется сейчас
        std::thread::id runningThread;
    };

public:
    /**
     * @brief RAII-подписка на отмену
     *
     * Деструктор снимает подписку. Если callback этой подписки уже
     * выполняется в другом потоке, reset() дожидается его завершения:
     * после возврата из reset() callback не выполняется и не будет вызван.
     */
    class CancelRegistration {
    public:
        CancelRegistration() = default;

        CancelRegistration(const CancelRegistration&) = delete;
        CancelRegistration& operator=(const CancelRegistration&) = delete;

        CancelRegistration(CancelRegistration&& other) noexcept
            : state_(std::move(other.state_))
            , id_(other.id_)
        {
            other.id_ = 0;
        }

        CancelRegistration& operator=(CancelRegistration&& other) noexcept {
            if (this != &other) {
                reset();
                state_ = std::move(other.state_);
                id_ = other.id_;
                other.id_ = 0;
            }
            return *this;
        }

        ~CancelRegistration() {
            reset();
        }

        void reset() {
            if (state_ && id_ != 0) {
                std::unique_lock<std::mutex> lock(state_->mutex);
                state_->callbacks.erase(id_);
                auto self = std::this_thread::get_id();
                state_->idle.wait(lock, [this, self] {
                    return state_->runningId != id_ || state_->runningThread == self;
                });
            }
            state_.reset();
            id_ = 0;
        }

    private:
        friend class Context;

        CancelRegistration(std::shared_ptr<State> state, size_t id)
            : state_(std::move(state))
            , id_(id)
        {}

        std::shared_ptr<State> state_;
        size_t id_ = 0;
    };

    /// Контекст без дедлайна (отменяемый вручную)
    Context()
        : state_(std::make_shared<State>())
    {}

    static Context background() {
        return Context();
    }

    static Context withDeadline(TimePoint deadline) {
        Context ctx;
        ctx.state_->deadline = deadline;
        return ctx;
    }

    static Context withTimeout(Duration timeout) {
        return withDeadline(Clock::now() + timeout);
    }

    /**
     * @brief Отменить контекст и вызвать подписчиков
     *
     * Callback'и вызываются вне мьютекса, по одному, в потоке cancel():
     * из callback можно обращаться к этому же контексту.
     */
    void cancel() const {
        std::unique_lock<std::mutex> lock(state_->mutex);
        if (state_->cancelled) {
            return;
        }
        state_->cancelled = true;
        while (!state_->callbacks.empty()) {
            auto it = state_->callbacks.begin();
            CancelCallback callback = std::move(it->second);
            state_->runningId = it->first;
            state_->runningThread = std::this_thread::get_id();
            state_->callbacks.erase(it);
            lock.unlock();
            try {
                callback();
            } catch (...) {
                finishCallback(lock);
                throw;
            }
            finishCallback(lock);
        }
    }

    bool isCancelled() const {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->cancelled;
    }

    bool isExpired() const {
        return state_->deadline.has_value() && Clock::now() >= *state_->deadline;
    }

    std::optional<TimePoint> deadline() const {
        return state_->deadline;
    }

    /**
     * @brief Оставшееся время до дедлайна (nullopt — дедлайна нет)
     */
    std::optional<Duration> remaining() const {
        if (!state_->deadline) {
            return std::nullopt;
        }
        auto left = std::chrono::duration_cast<Duration>(*state_->deadline - Clock::now());
        return left.count() > 0 ? left : Duration(0);
    }

    /**
     * @brief Бросить CancelledError / DeadlineExceededError, если контекст завершён
     */
    void throwIfDone() const {
        if (isCancelled()) {
            throw CancelledError();
        }
        if (isExpired()) {
            throw DeadlineExceededError();
        }
    }

    /**
     * @brief Подписаться на отмену
     * @param callback Вызывается не более одного раза, при cancel()
     *
     * Если контекст уже отменён, callback вызывается немедленно и
     * возвращается пустая подписка.
     */
    CancelRegistration onCancel(CancelCallback callback) const {
        std::unique_lock<std::mutex> lock(state_->mutex);
        if (state_->cancelled) {
            lock.unlock();
            callback();
            return CancelRegistration();
        }
        size_t id = state_->nextId++;
        state_->callbacks.emplace(id, std::move(callback));
        return CancelRegistration(state_, id);
    }

private:
    void finishCallback(std::unique_lock<std::mutex>& lock) const {
        lock.lock();
        state_->runningId = 0;
        state_->runningThread = std::thread::id();
        state_->idle.notify_all();
    }

    std::shared_ptr<State> state_;
};
