#pragma once

#include <rediscache/serialization/ICodec.hpp>

#include <nlohmann/json.hpp>

/**
 * @brief JSON-кодек на nlohmann::json
 * @tparam V Тип значения с to_json/from_json (ADL или NLOHMANN_DEFINE_TYPE_*)
 *
 * Человекочитаемый формат — удобно смотреть данные через redis-cli.
 * Исключения nlohmann::json::exception пробрасываются как есть,
 * классификацию делает CodecPipeline.
 *
 * @code
 *   struct Person { std::string name; int age; };
 *   NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(Person, name, age)
 *
 *   CacheConfig<Person> config;
 *   config.codec = std::make_shared<JsonCodec<Person>>();
 * @endcode
 */
template<typename V>
class JsonCodec : public ICodec<V> {
public:
    Bytes encode(const V& value) override {
        std::string text = nlohmann::json(value).dump();
        return Bytes(text.begin(), text.end());
    }

    V decode(const Bytes& data) override {
        return nlohmann::json::parse(data.begin(), data.end()).template get<V>();
    }
};

/**
 * @brief MessagePack-кодек на nlohmann::json
 * @tparam V Тип значения с to_json/from_json
 *
 * Компактнее JSON; рекомендуемый формат по умолчанию для структур.
 */
template<typename V>
class MsgpackCodec : public ICodec<V> {
public:
    Bytes encode(const V& value) override {
        return nlohmann::json::to_msgpack(nlohmann::json(value));
    }

    V decode(const Bytes& data) override {
        return nlohmann::json::from_msgpack(data).template get<V>();
    }
};
