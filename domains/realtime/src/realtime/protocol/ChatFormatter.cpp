#include <realtime/protocol/ChatFormatter.hpp>
#include <realtime/protocol/ChannelKind.hpp>

#include <fmt/format.h>

namespace realtime::protocol
{

std::string formatChatMessage(std::string_view channel, std::string_view senderName, std::string_view content)
{
    const auto kind = parseChannel(channel);

    return std::visit(Overloaded{
                          [&](const RoomLocal &r) {
                              switch (r.mode)
                              {
                              case RoomLocal::Mode::Say:
                                  return fmt::format("{} says: {}", senderName, content);
                              case RoomLocal::Mode::Local:
                                  return fmt::format("{} (local): {}", senderName, content);
                              case RoomLocal::Mode::Emote:
                              case RoomLocal::Mode::Pose:
                                  return fmt::format("{} {}", senderName, content);
                              }
                              return fmt::format("{} says: {}", senderName, content);
                          },
                          [&](const Global &) { return fmt::format("{} (global): {}", senderName, content); },
                          [&](const Whisper &) { return fmt::format("{} whispers: {}", senderName, content); },
                          [&](const SystemAdmin &s) {
                              return s.admin ? fmt::format("[ADMIN] {}: {}", senderName, content) : fmt::format("[SYSTEM] {}", content);
                          },
                          [&](const Party &) { return fmt::format("{} (party): {}", senderName, content); },
                          [&](const Unknown &u) { return fmt::format("{} ({}): {}", senderName, u.raw, content); },
                      },
                      kind);
}

} // namespace realtime::protocol
