#pragma once

#include <rediscache/listeners/ICacheListener.hpp>
#include <rediscache/utils/ThreadSafeQueue.hpp>

#include <algorithm>
#include <atomic>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

/**
 * @brief Композитный слушатель: каждый слушатель в своём потоке
 *
 * Операции кэша вызывают слушателей синхронно. Чтобы медленный
 * слушатель (запись в файл, отправка метрик по сети) не увеличивал
 * задержку get/set, его регистрируют через этот композит:
 * - один экземпляр регистрируется в кэше
 * - у каждого вложенного слушателя своя очередь команд и поток
 * - методы onXxx кладут лямбду в очереди и сразу возвращаются
 *
 * Исключение слушателя пишется в std::cerr и не доходит до кэша.
 * stop() дожидается выполнения всех уже поставленных команд.
 *
 * @code
 *   auto composite = std::make_shared<ThreadPerListenerComposite>();
 *   composite->addListener(std::make_shared<StatsListener>());
 *   composite->addListener(std::make_shared<LoggingListener>());
 *   cache.addListener(composite);
 * @endcode
 */
class ThreadPerListenerComposite : public ICacheListener {
public:
    using Command = std::function<void()>;

    /**
     * @param drainTimeoutMs Таймаут ожидания при извлечении из очереди (мс)
     */
    explicit ThreadPerListenerComposite(size_t drainTimeoutMs = 100)
        : drainTimeout_(drainTimeoutMs)
    {}

    ~ThreadPerListenerComposite() override {
        stop();
    }

    ThreadPerListenerComposite(const ThreadPerListenerComposite&) = delete;
    ThreadPerListenerComposite& operator=(const ThreadPerListenerComposite&) = delete;

    void addListener(std::shared_ptr<ICacheListener> listener) {
        if (!listener) {
            return;
        }

        auto entry = std::make_shared<ListenerEntry>();
        entry->listener = std::move(listener);
        entry->running = true;
        entry->thread = std::thread(&ThreadPerListenerComposite::workerLoop, this, entry);

        std::lock_guard<std::mutex> lock(mutex_);
        entries_.push_back(entry);
    }

    /**
     * @brief Удалить слушателя; его очередь дорабатывается до конца
     * @return false если слушатель не зарегистрирован
     */
    bool removeListener(const std::shared_ptr<ICacheListener>& listener) {
        if (!listener) {
            return false;
        }

        std::shared_ptr<ListenerEntry> entryToRemove;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = std::find_if(entries_.begin(), entries_.end(),
                [&listener](const std::shared_ptr<ListenerEntry>& entry) {
                    return entry->listener == listener;
                });
            if (it == entries_.end()) {
                return false;
            }
            entryToRemove = *it;
            entries_.erase(it);
        }

        stopEntry(entryToRemove);
        return true;
    }

    /**
     * @brief Остановить все потоки, выполнив накопленные команды
     */
    void stop() {
        std::vector<std::shared_ptr<ListenerEntry>> entriesToStop;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            entriesToStop.swap(entries_);
        }
        for (auto& entry : entriesToStop) {
            stopEntry(entry);
        }
    }

    size_t listenerCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

    size_t totalQueueSize() const {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t total = 0;
        for (const auto& entry : entries_) {
            total += entry->queue.size();
        }
        return total;
    }

    // ==================== ICacheListener ====================

    void onHit(const std::string& key) override {
        broadcast([key](ICacheListener& listener) { listener.onHit(key); });
    }

    void onMiss(const std::string& key) override {
        broadcast([key](ICacheListener& listener) { listener.onMiss(key); });
    }

    void onSet(const std::string& key) override {
        broadcast([key](ICacheListener& listener) { listener.onSet(key); });
    }

    void onRemove(const std::string& key) override {
        broadcast([key](ICacheListener& listener) { listener.onRemove(key); });
    }

    void onConflict(const std::string& key) override {
        broadcast([key](ICacheListener& listener) { listener.onConflict(key); });
    }

    void onOperation(const OperationEvent& event) override {
        broadcast([event](ICacheListener& listener) { listener.onOperation(event); });
    }

private:
    struct ListenerEntry {
        std::shared_ptr<ICacheListener> listener;
        ThreadSafeQueue<Command> queue;
        std::thread thread;
        std::atomic<bool> running{false};
    };

    template<typename Action>
    void broadcast(Action action) {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& entry : entries_) {
            auto listener = entry->listener;
            entry->queue.push([listener, action]() { action(*listener); });
        }
    }

    void workerLoop(std::shared_ptr<ListenerEntry> entry) {
        while (entry->running) {
            Command command;
            if (entry->queue.tryPop(command, std::chrono::milliseconds(drainTimeout_))) {
                executeCommand(command);
            }
        }
        drainQueue(*entry);
    }

    void drainQueue(ListenerEntry& entry) {
        Command command;
        while (entry.queue.tryPopImmediate(command)) {
            executeCommand(command);
        }
    }

    void executeCommand(const Command& command) {
        try {
            command();
        } catch (const std::exception& e) {
            std::cerr << "[ThreadPerListenerComposite] Listener error: "
                      << e.what() << std::endl;
        }
    }

    void stopEntry(const std::shared_ptr<ListenerEntry>& entry) {
        if (!entry) {
            return;
        }
        entry->running = false;
        entry->queue.shutdown();
        if (entry->thread.joinable()) {
            entry->thread.join();
        }
    }

    std::vector<std::shared_ptr<ListenerEntry>> entries_;
    mutable std::mutex mutex_;
    size_t drainTimeout_;
};
