#pragma once

#include <stdexcept>
#include <string>

/**
 * @brief Этап, на котором произошла ошибка
 */
enum class Stage {
    None,
    Encode,
    Compress,
    Decompress,
    Decode,
    Store
};

inline const char* stageName(Stage stage) {
    switch (stage) {
        case Stage::Encode:     return "encode";
        case Stage::Compress:   return "compress";
        case Stage::Decompress: return "decompress";
        case Stage::Decode:     return "decode";
        case Stage::Store:      return "store";
        case Stage::None:       break;
    }
    return "none";
}

/**
 * @brief Базовое исключение библиотеки
 *
 * Таксономия:
 * - KeyNotFoundError       — ключа нет (ожидаемый исход, не сбой)
 * - EncodeError            — значение не удалось закодировать/сжать
 * - DecodeError            — байты не соответствуют схеме
 *   - DataCorruptionError  — сохранённые байты не распаковываются/не декодируются
 * - StoreError             — ошибка транспорта или сервера
 * - RetryableConflictError — проигранная гонка CAS в upsert
 * - CancelledError         — контекст вызова отменён
 *   - DeadlineExceededError — истёк дедлайн контекста
 *
 * Контекст (операция, ключ) дописывается фасадом через attach() перед
 * повторным выбросом того же объекта, поэтому тип исключения сохраняется.
 */
class CacheError : public std::runtime_error {
public:
    CacheError(Stage stage, const std::string& message)
        : std::runtime_error(message)
        , stage_(stage)
        , message_(message)
    {
        rebuild();
    }

    const char* what() const noexcept override {
        return full_.c_str();
    }

    /**
     * @brief Дописать контекст операции (один раз, внешний вызов не затирает)
     */
    void attach(const std::string& operation, const std::string& key) {
        if (!operation_.empty()) {
            return;
        }
        operation_ = operation;
        key_ = key;
        rebuild();
    }

    Stage stage() const { return stage_; }
    const std::string& operation() const { return operation_; }
    const std::string& key() const { return key_; }
    const std::string& message() const { return message_; }

private:
    void rebuild() {
        full_ = "rediscache";
        if (!operation_.empty()) {
            full_ += ": " + operation_ + " \"" + key_ + "\"";
        }
        if (stage_ != Stage::None) {
            full_ += ": ";
            full_ += stageName(stage_);
        }
        full_ += ": " + message_;
    }

    Stage stage_;
    std::string message_;
    std::string operation_;
    std::string key_;
    std::string full_;
};

class KeyNotFoundError : public CacheError {
public:
    KeyNotFoundError()
        : CacheError(Stage::None, "key not found")
    {}
};

class EncodeError : public CacheError {
public:
    using CacheError::CacheError;
};

class DecodeError : public CacheError {
public:
    using CacheError::CacheError;
};

class DataCorruptionError : public DecodeError {
public:
    using DecodeError::DecodeError;
};

class StoreError : public CacheError {
public:
    explicit StoreError(const std::string& message)
        : CacheError(Stage::Store, message)
    {}
};

class RetryableConflictError : public CacheError {
public:
    explicit RetryableConflictError(int attempts)
        : CacheError(Stage::Store,
                     "value changed concurrently after " +
                     std::to_string(attempts) + " attempt(s)")
        , attempts_(attempts)
    {}

    int attempts() const { return attempts_; }

private:
    int attempts_;
};

class CancelledError : public CacheError {
public:
    explicit CancelledError(const std::string& message = "context cancelled")
        : CacheError(Stage::None, message)
    {}
};

class DeadlineExceededError : public CancelledError {
public:
    DeadlineExceededError()
        : CancelledError("context deadline exceeded")
    {}
};
