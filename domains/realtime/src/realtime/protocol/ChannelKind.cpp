#include <realtime/protocol/ChannelKind.hpp>

namespace realtime::protocol
{

ChannelKind parseChannel(std::string_view name)
{
    if (name == "say")
        return RoomLocal{RoomLocal::Mode::Say};
    if (name == "local")
        return RoomLocal{RoomLocal::Mode::Local};
    if (name == "emote")
        return RoomLocal{RoomLocal::Mode::Emote};
    if (name == "pose")
        return RoomLocal{RoomLocal::Mode::Pose};
    if (name == "global")
        return Global{};
    if (name == "party")
        return Party{};
    if (name == "whisper")
        return Whisper{};
    if (name == "system")
        return SystemAdmin{false};
    if (name == "admin")
        return SystemAdmin{true};
    return Unknown{std::string(name)};
}

std::string channelName(const ChannelKind &kind)
{
    return std::visit(Overloaded{
                          [](const RoomLocal &r) -> std::string {
                              switch (r.mode)
                              {
                              case RoomLocal::Mode::Say:
                                  return "say";
                              case RoomLocal::Mode::Local:
                                  return "local";
                              case RoomLocal::Mode::Emote:
                                  return "emote";
                              case RoomLocal::Mode::Pose:
                                  return "pose";
                              }
                              return "say";
                          },
                          [](const Global &) -> std::string { return "global"; },
                          [](const Party &) -> std::string { return "party"; },
                          [](const Whisper &) -> std::string { return "whisper"; },
                          [](const SystemAdmin &s) -> std::string { return s.admin ? "admin" : "system"; },
                          [](const Unknown &u) -> std::string { return u.raw; },
                      },
                      kind);
}

} // namespace realtime::protocol
