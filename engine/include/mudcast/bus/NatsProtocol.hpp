#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace mudcast::bus::nats
{

struct ConnectOptions
{
    std::string name{"mudcast"};
    bool verbose{false};
    bool pedantic{false};
    std::optional<std::string> user;
    std::optional<std::string> password;
    std::optional<std::string> token;
};

// ===== client -> server =====
[[nodiscard]] std::string encodeConnect(const ConnectOptions &opt);
[[nodiscard]] std::string encodePub(std::string_view subject, std::string_view payload);
[[nodiscard]] std::string encodeSub(std::string_view subject, std::uint64_t sid);
[[nodiscard]] std::string encodeUnsub(std::uint64_t sid);

inline constexpr std::string_view kPing = "PING\r\n";
inline constexpr std::string_view kPong = "PONG\r\n";

// ===== server -> client =====
struct ServerOp
{
    enum class Kind
    {
        Msg,
        Ping,
        Pong,
        Ok,
        Err,
        Info,
    };

    Kind kind{Kind::Ok};
    std::string subject;  // Msg
    std::uint64_t sid{0}; // Msg
    std::string payload;  // Msg payload / Err text / Info json
};

/// 스트림 누적 파서.
///
/// feed()로 받은 바이트를 쌓고, next()로 완성된 op 를 하나씩 꺼냅니다.
/// 알 수 없는 op / 잘못된 MSG 헤더는 std::runtime_error 를 던집니다. (연결을 끊어야 함)
class Parser
{
  public:
    void feed(std::string_view bytes) { buf_.append(bytes.data(), bytes.size()); }

    /// @return 완성된 op 가 있으면 true
    bool next(ServerOp &out);

    [[nodiscard]] std::size_t buffered() const noexcept { return buf_.size(); }
    void reset() noexcept { buf_.clear(); }

  private:
    std::string buf_;
};

} // namespace mudcast::bus::nats
