#pragma once

#include <rediscache/Types.hpp>

#include <functional>

/**
 * @brief Сигнатуры этапов конвейера
 * @tparam V Тип значения
 */
template<typename V>
struct PipelineStages {
    using EncodeFn = std::function<Bytes(const V&)>;
    using DecodeFn = std::function<V(const Bytes&)>;
    using CompressFn = std::function<Bytes(const Bytes&)>;

    EncodeFn encode;
    DecodeFn decode;
    /// Пустые функции — сжатие не настроено, этап не выполняется
    CompressFn compress;
    CompressFn decompress;
};

/**
 * @brief Интерфейс хука (middleware) конвейера
 * @tparam V Тип значения
 *
 * Каждый wrap-метод получает следующую функцию цепочки (next) и
 * возвращает замену с той же сигнатурой. Реализация по умолчанию
 * возвращает next без изменений — достаточно переопределить нужные этапы.
 *
 * Правила:
 * - хук может измерять время, смотреть вход/выход и менять
 *   передаваемое значение (наблюдающий vs преобразующий хук —
 *   документируется в реализации)
 * - исключение из next нельзя подавлять: перехватив его, хук обязан
 *   пробросить то же исключение (throw;) или более конкретное
 *
 * @code
 *   class TimingHook : public IHook<std::string> {
 *   public:
 *       EncodeFn wrapEncode(EncodeFn next) override {
 *           return [next](const std::string& v) {
 *               auto start = Clock::now();
 *               auto out = next(v);
 *               record(Clock::now() - start);
 *               return out;
 *           };
 *       }
 *   };
 * @endcode
 */
template<typename V>
class IHook {
public:
    using EncodeFn = typename PipelineStages<V>::EncodeFn;
    using DecodeFn = typename PipelineStages<V>::DecodeFn;
    using CompressFn = typename PipelineStages<V>::CompressFn;

    virtual ~IHook() = default;

    virtual EncodeFn wrapEncode(EncodeFn next) { return next; }
    virtual DecodeFn wrapDecode(DecodeFn next) { return next; }
    virtual CompressFn wrapCompress(CompressFn next) { return next; }
    virtual CompressFn wrapDecompress(CompressFn next) { return next; }
};
