#include "change_event.hpp"

namespace chainsink::notify
{
    ChangeEvent inserted(std::string_view table, std::uint64_t key)
    {
        return ChangeEvent{std::string(table), "INSERT", key};
    }
}

namespace chainsink::parse
{
    template<>
    Result<json> parseToJson(notify::ChangeEvent event, use_json_t)
    {
        json json_obj = json::object();
        json_obj["table"] = std::move(event.table);
        json_obj["action"] = std::move(event.action);
        json_obj["key"] = event.key;
        return json_obj;
    }

    template<>
    Result<notify::ChangeEvent> parseFromJson(json json, use_json_t)
    {
        if(!json.is_object()) return std::unexpected(ParseError{ParseError::Kind::TYPE_MISMATCH, "change event must be an object"});
        if(!json.contains("table") || !json["table"].is_string()) return std::unexpected(ParseError{ParseError::Kind::INVALID_VALUE, "missing table"});
        if(!json.contains("action") || !json["action"].is_string()) return std::unexpected(ParseError{ParseError::Kind::INVALID_VALUE, "missing action"});
        if(!json.contains("key") || !json["key"].is_number_unsigned()) return std::unexpected(ParseError{ParseError::Kind::INVALID_VALUE, "missing key"});

        notify::ChangeEvent event;
        event.table = json["table"].get<std::string>();
        event.action = json["action"].get<std::string>();
        event.key = json["key"].get<std::uint64_t>();
        return event;
    }
}
