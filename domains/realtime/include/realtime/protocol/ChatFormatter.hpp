#pragma once

#include <string>
#include <string_view>

namespace realtime::protocol
{

// 채널별 채팅 표시 문자열
//   say     -> "X says: c"
//   local   -> "X (local): c"
//   global  -> "X (global): c"
//   emote/pose -> "X c"
//   whisper -> "X whispers: c"
//   system  -> "[SYSTEM] c"
//   admin   -> "[ADMIN] X: c"
//   그 외   -> "X (channel): c"
[[nodiscard]] std::string formatChatMessage(std::string_view channel, std::string_view senderName, std::string_view content);

} // namespace realtime::protocol
