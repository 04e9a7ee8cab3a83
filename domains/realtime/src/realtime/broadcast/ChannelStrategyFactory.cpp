#include <realtime/broadcast/ChannelStrategies.hpp>
#include <realtime/broadcast/ChannelStrategyFactory.hpp>
#include <realtime/protocol/ChannelKind.hpp>

#include <mudcast/core/Logger.hpp>

#include <stdexcept>

namespace realtime::broadcast
{
namespace
{
constexpr std::string_view kKnownChannels[] = {"say", "local", "emote", "pose", "global", "party", "whisper", "system", "admin"};

ChannelStrategyFactory::StrategyPtr makeDefault(const protocol::ChannelKind &kind, registry::ConnectionRegistry &registry, const std::shared_ptr<const registry::IMuteLookup> &mutes)
{
    using namespace protocol;
    return std::visit(Overloaded{
                          [&](const RoomLocal &) -> ChannelStrategyFactory::StrategyPtr { return std::make_shared<RoomBasedStrategy>(channelName(kind), registry, mutes); },
                          [&](const Global &) -> ChannelStrategyFactory::StrategyPtr { return std::make_shared<GlobalStrategy>(registry); },
                          [&](const Party &) -> ChannelStrategyFactory::StrategyPtr { return std::make_shared<PartyStrategy>(); },
                          [&](const Whisper &) -> ChannelStrategyFactory::StrategyPtr { return std::make_shared<WhisperStrategy>(registry); },
                          [&](const SystemAdmin &) -> ChannelStrategyFactory::StrategyPtr { return std::make_shared<SystemAdminStrategy>(channelName(kind), registry); },
                          [&](const Unknown &u) -> ChannelStrategyFactory::StrategyPtr { return std::make_shared<UnknownChannelStrategy>(u.raw); },
                      },
                      kind);
}
} // namespace

ChannelStrategyFactory::ChannelStrategyFactory(registry::ConnectionRegistry &registry, std::shared_ptr<const registry::IMuteLookup> mutes)
{
    for (auto name : kKnownChannels)
        strategies_.emplace(std::string(name), makeDefault(protocol::parseChannel(name), registry, mutes));
}

ChannelStrategyFactory::StrategyPtr ChannelStrategyFactory::getStrategy(std::string_view channelType) const
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = strategies_.find(channelType);
        if (it != strategies_.end())
            return it->second;
    }
    return std::make_shared<UnknownChannelStrategy>(std::string(channelType));
}

void ChannelStrategyFactory::registerStrategy(std::string name, StrategyPtr strategy)
{
    if (name.empty() || !strategy)
        throw std::invalid_argument("registerStrategy requires a name and a strategy");

    SLOG_INFO("Broadcast", "StrategyRegistered", "channel={}", name);
    std::lock_guard<std::mutex> lock(mutex_);
    strategies_[std::move(name)] = std::move(strategy);
}

std::vector<std::string> ChannelStrategyFactory::registeredChannels() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> out;
    out.reserve(strategies_.size());
    for (const auto &[name, s] : strategies_)
        out.push_back(name);
    return out;
}

} // namespace realtime::broadcast
