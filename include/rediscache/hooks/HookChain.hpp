#pragma once

#include <rediscache/hooks/IHook.hpp>

#include <memory>
#include <stdexcept>
#include <vector>

/**
 * @brief Упорядоченный список хуков и их свёртка над базовыми этапами
 * @tparam V Тип значения
 *
 * Порядок регистрации = порядок вложенности: первый добавленный хук
 * становится самым внешним. Для хуков H1, H2 вызов encode выглядит так:
 *
 *   H1.before -> H2.before -> base encode -> H2.after -> H1.after
 *
 * Свёртка идёт с конца списка: base оборачивается последним хуком,
 * результат — предпоследним и т.д.
 */
template<typename V>
class HookChain {
public:
    using Stages = PipelineStages<V>;

    void add(std::shared_ptr<IHook<V>> hook) {
        if (!hook) {
            throw std::invalid_argument("Hook cannot be null");
        }
        hooks_.push_back(std::move(hook));
    }

    size_t size() const { return hooks_.size(); }
    bool empty() const { return hooks_.empty(); }

    const std::vector<std::shared_ptr<IHook<V>>>& hooks() const { return hooks_; }

    /**
     * @brief Обернуть базовые этапы всеми хуками
     * @param base Базовые функции кодека и компрессора
     * @return Составные функции, которые видит вызывающий код
     *
     * Этапы сжатия оборачиваются только если они заданы: хуки
     * не должны срабатывать на этапе, который не выполняется.
     */
    Stages compose(Stages base) const {
        Stages composed = std::move(base);
        for (auto it = hooks_.rbegin(); it != hooks_.rend(); ++it) {
            const auto& hook = *it;
            composed.encode = hook->wrapEncode(std::move(composed.encode));
            composed.decode = hook->wrapDecode(std::move(composed.decode));
            if (!composed.encode || !composed.decode) {
                throw std::invalid_argument("Hook returned an empty stage function");
            }
            if (composed.compress) {
                composed.compress = hook->wrapCompress(std::move(composed.compress));
                if (!composed.compress) {
                    throw std::invalid_argument("Hook returned an empty compress function");
                }
            }
            if (composed.decompress) {
                composed.decompress = hook->wrapDecompress(std::move(composed.decompress));
                if (!composed.decompress) {
                    throw std::invalid_argument("Hook returned an empty decompress function");
                }
            }
        }
        return composed;
    }

private:
    std::vector<std::shared_ptr<IHook<V>>> hooks_;
};
