#include <realtime/protocol/Envelope.hpp>

#include <mudcast/core/Time.hpp>

#include <stdexcept>

namespace realtime::protocol
{
namespace
{
using json = nlohmann::json;

std::optional<std::string> optionalString(const json &j, const char *key)
{
    auto it = j.find(key);
    if (it == j.end() || it->is_null())
        return std::nullopt;
    if (!it->is_string())
        throw std::invalid_argument(std::string("envelope field '") + key + "' must be a string");
    return it->get<std::string>();
}

void putOptional(json &j, const char *key, const std::optional<std::string> &v)
{
    if (v)
        j[key] = *v;
}
} // namespace

Envelope makeEnvelope(std::string eventType, nlohmann::json data, std::string channel)
{
    Envelope env;
    env.eventType = std::move(eventType);
    env.data = data.is_null() ? json::object() : std::move(data);
    env.timestamp = mudcast::core::nowIso8601Utc();
    env.channel = std::move(channel);
    return env;
}

nlohmann::json toBusJson(const Envelope &env)
{
    json j = {
        {"event_type", env.eventType},
        {"data", env.data},
        {"timestamp", env.timestamp},
        {"sequence_number", env.sequenceNumber},
        {"channel", env.channel},
        {"origin", env.origin},
    };
    putOptional(j, "sender_id", env.senderId);
    putOptional(j, "room_id", env.roomId);
    putOptional(j, "party_id", env.partyId);
    putOptional(j, "target_player_id", env.targetPlayerId);
    return j;
}

Envelope fromBusJson(const nlohmann::json &j)
{
    if (!j.is_object())
        throw std::invalid_argument("envelope must be a JSON object");

    auto et = j.find("event_type");
    if (et == j.end() || !et->is_string())
        throw std::invalid_argument("envelope missing 'event_type'");

    Envelope env;
    env.eventType = et->get<std::string>();
    env.data = j.value("data", json::object());
    env.timestamp = j.value("timestamp", std::string{});
    env.sequenceNumber = j.value("sequence_number", std::uint64_t{0});
    env.channel = j.value("channel", std::string{});
    env.origin = j.value("origin", std::string{});
    env.senderId = optionalString(j, "sender_id");
    env.roomId = optionalString(j, "room_id");
    env.partyId = optionalString(j, "party_id");
    env.targetPlayerId = optionalString(j, "target_player_id");
    return env;
}

nlohmann::json toClientJson(const Envelope &env)
{
    json j = {
        {"event_type", env.eventType},
        {"timestamp", env.timestamp},
        {"sequence_number", env.sequenceNumber},
        {"data", env.data},
    };
    putOptional(j, "player_id", env.senderId);
    return j;
}

std::string toWireText(const nlohmann::json &j)
{
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

} // namespace realtime::protocol
