#pragma once

#include <realtime/broadcast/IChannelStrategy.hpp>
#include <realtime/registry/ConnectionRegistry.hpp>
#include <realtime/registry/IMuteLookup.hpp>

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace realtime::broadcast
{

/// channel 문자열 -> strategy
///
/// - 기동 시 알려진 채널(say, local, emote, pose, global, party, whisper, system, admin)을 모두 등록한다.
/// - registerStrategy 로 이름 단위 교체 가능
/// - 등록되지 않은 이름은 channelType()==입력 인 UnknownChannelStrategy 를 돌려준다.
class ChannelStrategyFactory
{
  public:
    using StrategyPtr = std::shared_ptr<const IChannelStrategy>;

    ChannelStrategyFactory(registry::ConnectionRegistry &registry, std::shared_ptr<const registry::IMuteLookup> mutes);

    [[nodiscard]] StrategyPtr getStrategy(std::string_view channelType) const;

    void registerStrategy(std::string name, StrategyPtr strategy);

    [[nodiscard]] std::vector<std::string> registeredChannels() const;

  private:
    mutable std::mutex mutex_;
    std::map<std::string, StrategyPtr, std::less<>> strategies_;
};

} // namespace realtime::broadcast
