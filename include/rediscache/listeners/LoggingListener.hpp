#pragma once

#include <rediscache/listeners/ICacheListener.hpp>

#include <iostream>
#include <mutex>
#include <string>

/**
 * @brief Слушатель для логирования операций кэша в поток
 *
 * Одна строка на завершённую операцию:
 *   [Cache] get "user:1" HIT 120us
 *   [Cache] upsert "counter" FAILED 340us: rediscache: upsert "counter": ...
 *
 * Использование:
 *   auto logger = std::make_shared<LoggingListener>();
 *   cache.addListener(logger);
 *
 * @param verbose Логировать также отдельные hit/miss/set/remove/conflict
 */
class LoggingListener : public ICacheListener {
public:
    explicit LoggingListener(const std::string& prefix = "Cache",
                             std::ostream& os = std::cout,
                             bool verbose = false)
        : prefix_(prefix)
        , os_(os)
        , verbose_(verbose)
    {}

    void onHit(const std::string& key) override {
        line("HIT: " + key);
    }

    void onMiss(const std::string& key) override {
        line("MISS: " + key);
    }

    void onSet(const std::string& key) override {
        line("SET: " + key);
    }

    void onRemove(const std::string& key) override {
        line("REMOVE: " + key);
    }

    void onConflict(const std::string& key) override {
        line("CONFLICT: " + key);
    }

    void onOperation(const OperationEvent& event) override {
        std::lock_guard<std::mutex> lock(mutex_);
        os_ << "[" << prefix_ << "] " << event.operation << " \"" << event.key << "\"";
        if (event.keyCount > 1) {
            os_ << " (+" << (event.keyCount - 1) << " keys)";
        }
        if (!event.success) {
            os_ << " FAILED " << event.duration.count() << "us: " << event.error << "\n";
            return;
        }
        os_ << (event.hit ? " HIT " : " ") << event.duration.count() << "us\n";
    }

private:
    void line(const std::string& text) {
        if (!verbose_) {
            return;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        os_ << "[" << prefix_ << "] " << text << "\n";
    }

    std::string prefix_;
    std::ostream& os_;
    bool verbose_;
    std::mutex mutex_;
};
