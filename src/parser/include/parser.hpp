#pragma once

#include <string>

#include <nlohmann/json.hpp>
using json = nlohmann::json;

#include <google/protobuf/util/json_util.h>

#include "parse_error.hpp"

namespace chainsink::parse
{
    // selects the protobuf JSON mapping, used for recovery job payloads
    struct use_protobuf_t{};

    // selects a hand written nlohmann mapping, used for notification payloads
    struct use_json_t{};

    static constexpr use_protobuf_t use_protobuf{};

    static constexpr use_json_t use_json{};

    /**
     * @brief Reads a T from a JSON object.
     *
     * Specialized next to each type that travels as plain JSON.
     */
    template<class T>
    Result<T> parseFromJson(json json, use_json_t);

    /**
     * @brief Reads a T from its protobuf JSON form.
     *
     * Unknown fields are ignored so payloads written by newer builds stay readable.
     */
    template<class T>
    Result<T> parseFromJson(std::string json_str, use_protobuf_t);

    template<class T>
    Result<json> parseToJson(T message, use_json_t);

    /**
     * @brief Writes T in its protobuf JSON form, keeping proto field names.
     */
    template<class T>
    Result<std::string> parseToJson(T message, use_protobuf_t);
}
