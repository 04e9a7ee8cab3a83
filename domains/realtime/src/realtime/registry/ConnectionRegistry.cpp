#include <realtime/registry/ConnectionRegistry.hpp>

#include <mudcast/core/Logger.hpp>
#include <mudcast/monitoring/Metrics.hpp>

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace realtime::registry
{
using mudcast::transport::SendResult;

ConnectionRegistry::ConnectionRegistry(const mudcast::core::IClock &clock, RegistryOptions opt, payload::PayloadOptimizer optimizer)
    : clock_(clock), opt_(opt), optimizer_(optimizer)
{
    if (opt_.maxConnectionsPerPlayer == 0)
        throw std::invalid_argument("maxConnectionsPerPlayer must be >= 1");
}

bool ConnectionRegistry::registerConnection(const std::string &playerId, TransportPtr transport)
{
    if (playerId.empty() || !transport || !transport->isOpen())
        return false;

    const auto now = clock_.now();
    const auto handleId = transport->id();
    const auto kind = transport->kind();

    std::vector<TransportPtr> evicted;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto &entry = players_[playerId];

        while (entry.connections.size() >= opt_.maxConnectionsPerPlayer)
        {
            evicted.push_back(std::move(entry.connections.front().transport));
            entry.connections.erase(entry.connections.begin());
            --connectionCount_;
        }

        entry.connections.push_back(Connection{std::move(transport), now, now});
        ++connectionCount_;
    }

    auto &m = mudcast::monitoring::deliveryMetrics();
    m.onConnectionOpened();

    for (auto &t : evicted)
    {
        SLOG_INFO("Registry", "EvictOldest", "player={} handle={} cap={}", playerId, t->id(), opt_.maxConnectionsPerPlayer);
        t->close();
        m.onConnectionClosed();
    }

    SLOG_INFO("Registry", "Registered", "player={} handle={} kind={}", playerId, handleId, mudcast::transport::transportKindName(kind));
    return true;
}

bool ConnectionRegistry::unregisterConnection(const std::string &playerId, HandleId handleId)
{
    std::vector<TransportPtr> toClose;
    std::vector<OccupancyChange> events;
    bool removed = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        removed = removeHandleLocked(playerId, handleId, toClose, events);
    }

    if (removed)
        SLOG_INFO("Registry", "Unregistered", "player={} handle={}", playerId, handleId);

    closeAndNotify(toClose, events);
    return removed;
}

std::string ConnectionRegistry::renderForClient(const protocol::Envelope &env) const
{
    return protocol::toWireText(optimizer_.optimize(protocol::toClientJson(env)));
}

std::size_t ConnectionRegistry::sendLocal(const std::string &playerId, const protocol::Envelope &env)
{
    // 대상이 없으면 직렬화 비용도 쓰지 않는다.
    if (!hasPlayer(playerId))
        return 0;

    const std::string text = renderForClient(env);
    return sendRaw(playerId, env.eventType, text);
}

std::size_t ConnectionRegistry::sendRaw(const std::string &playerId, std::string_view eventType, std::string_view text)
{
    std::vector<Target> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = players_.find(playerId);
        if (it == players_.end())
            return 0;
        for (const auto &c : it->second.connections)
            targets.push_back(Target{playerId, c.transport});
    }

    return writeAll(targets, eventType, text).delivered;
}

DeliveryReport ConnectionRegistry::broadcastLocal(const protocol::Envelope &env, const std::optional<std::string> &excludePlayerId)
{
    std::vector<Target> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        targets.reserve(connectionCount_);
        for (const auto &[pid, entry] : players_)
        {
            if (excludePlayerId && pid == *excludePlayerId)
                continue;
            for (const auto &c : entry.connections)
                targets.push_back(Target{pid, c.transport});
        }
    }

    if (targets.empty())
        return {};

    const std::string text = renderForClient(env);
    return writeAll(targets, env.eventType, text);
}

DeliveryReport ConnectionRegistry::deliverTo(const std::vector<std::string> &playerIds, const protocol::Envelope &env)
{
    std::vector<Target> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto &pid : playerIds)
        {
            auto it = players_.find(pid);
            if (it == players_.end())
                continue;
            for (const auto &c : it->second.connections)
                targets.push_back(Target{pid, c.transport});
        }
    }

    if (targets.empty())
        return {};

    const std::string text = renderForClient(env);
    return writeAll(targets, env.eventType, text);
}

DeliveryReport ConnectionRegistry::writeAll(const std::vector<Target> &targets, std::string_view eventType, std::string_view text)
{
    DeliveryReport report;
    std::vector<TransportPtr> toClose;
    std::vector<OccupancyChange> events;

    for (const auto &t : targets)
    {
        ++report.attempted;
        const auto res = t.transport->sendText(eventType, text);
        if (res == SendResult::Queued)
        {
            ++report.delivered;
            continue;
        }

        // 이 handle 만 제거한다. 같은 플레이어의 다른 handle 과 나머지 수신자는 계속 진행
        ++report.failed;
        SLOG_WARN("Registry", "WriteFailed", "player={} handle={} result={}", t.playerId, t.transport->id(), res == SendResult::Backpressure ? "backpressure" : "closed");

        std::lock_guard<std::mutex> lock(mutex_);
        (void)removeHandleLocked(t.playerId, t.transport->id(), toClose, events);
    }

    auto &m = mudcast::monitoring::deliveryMetrics();
    if (report.delivered > 0)
        m.onLocalDelivery(report.delivered);
    if (report.failed > 0)
        m.onDeliveryFailure(report.failed);

    closeAndNotify(toClose, events);
    return report;
}

bool ConnectionRegistry::removeHandleLocked(const std::string &playerId, HandleId handleId, std::vector<TransportPtr> &toClose, std::vector<OccupancyChange> &events)
{
    auto it = players_.find(playerId);
    if (it == players_.end())
        return false;

    auto &conns = it->second.connections;
    auto cit = std::find_if(conns.begin(), conns.end(), [handleId](const Connection &c) { return c.transport->id() == handleId; });
    if (cit == conns.end())
        return false;

    toClose.push_back(std::move(cit->transport));
    conns.erase(cit);
    --connectionCount_;

    if (conns.empty())
    {
        leaveRoomLocked(playerId, it->second, events);
        players_.erase(it);
    }
    return true;
}

void ConnectionRegistry::leaveRoomLocked(const std::string &playerId, PlayerEntry &entry, std::vector<OccupancyChange> &events)
{
    if (entry.roomId.empty())
        return;

    auto rit = roomIndex_.find(entry.roomId);
    if (rit != roomIndex_.end())
    {
        rit->second.erase(playerId);
        if (rit->second.empty())
            roomIndex_.erase(rit);
    }

    events.push_back(OccupancyChange{playerId, std::move(entry.roomId), false});
    entry.roomId.clear();
}

void ConnectionRegistry::closeAndNotify(std::vector<TransportPtr> &toClose, std::vector<OccupancyChange> &events)
{
    auto &m = mudcast::monitoring::deliveryMetrics();
    for (auto &t : toClose)
    {
        t->close();
        m.onConnectionClosed();
    }

    if (events.empty())
        return;

    OccupancyListener listener;
    {
        std::lock_guard<std::mutex> lock(listenerMutex_);
        listener = listener_;
    }
    if (!listener)
        return;

    for (const auto &ev : events)
        listener(ev);
}

bool ConnectionRegistry::setPlayerRoom(const std::string &playerId, const std::string &roomId)
{
    std::vector<TransportPtr> none;
    std::vector<OccupancyChange> events;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = players_.find(playerId);
        if (it == players_.end())
            return false;

        auto &entry = it->second;
        if (entry.roomId == roomId)
            return true;

        leaveRoomLocked(playerId, entry, events);
        if (!roomId.empty())
        {
            entry.roomId = roomId;
            roomIndex_[roomId].insert(playerId);
            events.push_back(OccupancyChange{playerId, roomId, true});
        }
    }

    SLOG_DEBUG("Registry", "RoomChanged", "player={} room={}", playerId, roomId.empty() ? std::string_view("-") : std::string_view(roomId));
    closeAndNotify(none, events);
    return true;
}

std::optional<std::string> ConnectionRegistry::playerRoom(const std::string &playerId) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = players_.find(playerId);
    if (it == players_.end() || it->second.roomId.empty())
        return std::nullopt;
    return it->second.roomId;
}

std::set<std::string> ConnectionRegistry::roomOccupants(const std::string &roomId) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = roomIndex_.find(roomId);
    if (it == roomIndex_.end())
        return {};
    return std::set<std::string>(it->second.begin(), it->second.end());
}

std::vector<std::string> ConnectionRegistry::connectedPlayers() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> out;
    out.reserve(players_.size());
    for (const auto &[pid, entry] : players_)
        out.push_back(pid);
    return out;
}

bool ConnectionRegistry::touch(const std::string &playerId, HandleId handleId)
{
    const auto now = clock_.now();
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = players_.find(playerId);
    if (it == players_.end())
        return false;

    for (auto &c : it->second.connections)
    {
        if (c.transport->id() == handleId)
        {
            c.lastSeen = now;
            return true;
        }
    }
    return false;
}

std::size_t ConnectionRegistry::reapStale(mudcast::core::IClock::TimePoint now)
{
    std::vector<TransportPtr> toClose;
    std::vector<OccupancyChange> events;
    std::size_t reaped = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        std::vector<std::pair<std::string, HandleId>> stale;
        for (const auto &[pid, entry] : players_)
        {
            for (const auto &c : entry.connections)
            {
                if (!c.transport->isOpen() || now - c.lastSeen > opt_.staleTimeout)
                    stale.emplace_back(pid, c.transport->id());
            }
        }

        for (const auto &[pid, hid] : stale)
        {
            if (removeHandleLocked(pid, hid, toClose, events))
                ++reaped;
        }
    }

    if (reaped > 0)
        SLOG_INFO("Registry", "ReapedStale", "count={} remaining={}", reaped, connectionCount());

    closeAndNotify(toClose, events);
    return reaped;
}

std::size_t ConnectionRegistry::connectionCount() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return connectionCount_;
}

std::size_t ConnectionRegistry::playerCount() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return players_.size();
}

bool ConnectionRegistry::hasPlayer(const std::string &playerId) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return players_.count(playerId) > 0;
}

void ConnectionRegistry::setOccupancyListener(OccupancyListener listener)
{
    std::lock_guard<std::mutex> lock(listenerMutex_);
    listener_ = std::move(listener);
}

} // namespace realtime::registry
