#pragma once

#include <chrono>
#include <cstddef>
#include <string>

/**
 * @brief Событие завершения операции фасада
 *
 * Отправляется ровно один раз на каждый вызов Cache, успешный или нет.
 * KeyNotFound считается успешным исходом (success = true, hit = false).
 */
struct OperationEvent {
    std::string operation;               ///< "get", "set", "mget", "upsert", ...
    std::string key;                     ///< Для пакетных операций — первый ключ
    size_t keyCount = 1;
    std::chrono::microseconds duration{0};
    bool success = true;
    bool hit = false;                    ///< get: ключ найден; mget: найден хотя бы один
    std::string error;                   ///< what() исключения, если success = false
};

/**
 * @brief Интерфейс слушателя событий кэша
 *
 * Все методы по умолчанию пустые — переопределяем только нужные.
 * Вызываются синхронно в потоке операции; для тяжёлой обработки
 * оборачивайте слушателя в ThreadPerListenerComposite.
 */
class ICacheListener {
public:
    virtual ~ICacheListener() = default;

    virtual void onHit(const std::string& key) { (void)key; }
    virtual void onMiss(const std::string& key) { (void)key; }
    virtual void onSet(const std::string& key) { (void)key; }
    virtual void onRemove(const std::string& key) { (void)key; }
    /// Проигранная гонка CAS (до повторной попытки или до выброса RetryableConflict)
    virtual void onConflict(const std::string& key) { (void)key; }
    virtual void onOperation(const OperationEvent& event) { (void)event; }
};
