#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>

/**
 * @brief Блокирующая очередь для передачи работы между потоками
 * @tparam T Тип элементов
 *
 * Где используется:
 * - ThreadPerListenerComposite — очередь событий каждого слушателя
 * - RedisStore — пул свободных соединений
 *
 * После shutdown() ожидающие потоки просыпаются; оставшиеся элементы
 * можно выбрать через tryPopImmediate().
 */
template<typename T>
class ThreadSafeQueue {
public:
    ThreadSafeQueue() = default;

    ThreadSafeQueue(const ThreadSafeQueue&) = delete;
    ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;

    void push(T item) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            queue_.push_back(std::move(item));
        }
        condVar_.notify_one();
    }

    /**
     * @brief Извлечь элемент, ожидая не дольше timeout
     * @return false — таймаут или shutdown при пустой очереди
     */
    template<typename Rep, typename Period>
    bool tryPop(T& item, std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        condVar_.wait_for(lock, timeout, [this] {
            return !queue_.empty() || shutdown_;
        });
        if (queue_.empty()) {
            return false;
        }
        item = std::move(queue_.front());
        queue_.pop_front();
        return true;
    }

    /**
     * @brief Извлечь элемент, ожидая не дольше timeout или до stop()
     * @param stop Условие прекращения ожидания, проверяется под мьютексом
     *             очереди при каждом пробуждении
     * @return false — таймаут, shutdown при пустой очереди или stop()
     *
     * Тот, кто делает stop() истинным, должен вызвать wakeWaiters().
     */
    template<typename Rep, typename Period, typename Stop>
    bool tryPop(T& item, std::chrono::duration<Rep, Period> timeout, Stop stop) {
        std::unique_lock<std::mutex> lock(mutex_);
        condVar_.wait_for(lock, timeout, [this, &stop] {
            return !queue_.empty() || shutdown_ || stop();
        });
        if (stop()) {
            if (!queue_.empty()) {
                // Пробуждение от push предназначалось кому-то ещё
                condVar_.notify_one();
            }
            return false;
        }
        if (queue_.empty()) {
            return false;
        }
        item = std::move(queue_.front());
        queue_.pop_front();
        return true;
    }

    /**
     * @brief Положить элемент, если очередь не остановлена
     * @return false — очередь после shutdown(), элемент уничтожен
     */
    bool tryPush(T item) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (shutdown_) {
                return false;
            }
            queue_.push_back(std::move(item));
        }
        condVar_.notify_one();
        return true;
    }

    /// Разбудить всех ожидающих, чтобы они перепроверили stop()
    void wakeWaiters() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
        }
        condVar_.notify_all();
    }

    bool tryPopImmediate(T& item) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (queue_.empty()) {
            return false;
        }
        item = std::move(queue_.front());
        queue_.pop_front();
        return true;
    }

    void shutdown() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            shutdown_ = true;
        }
        condVar_.notify_all();
    }

    bool isShutdown() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return shutdown_;
    }

    /// Диагностика: значение может устареть сразу после возврата
    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

private:
    std::deque<T> queue_;
    mutable std::mutex mutex_;
    std::condition_variable condVar_;
    bool shutdown_ = false;
};
