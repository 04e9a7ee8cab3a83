#pragma once

#include <mutex>
#include <set>
#include <string>
#include <string_view>
#include <tuple>

namespace realtime::registry
{

// 뮤트 목록 조회 (게임 로직 쪽 협력자)
class IMuteLookup
{
  public:
    virtual ~IMuteLookup() = default;

    /// listener 가 channel 에서 speaker 를 뮤트했는지
    [[nodiscard]] virtual bool isMuted(std::string_view listenerId, std::string_view speakerId, std::string_view channel) const = 0;
};

/// 뮤트 규칙 메모리 보관. channel 이 "*" 인 규칙은 모든 채널에 적용된다.
class InMemoryMuteList final : public IMuteLookup
{
  public:
    void mute(std::string listenerId, std::string speakerId, std::string channel = "*")
    {
        std::lock_guard<std::mutex> lock(mutex_);
        rules_.emplace(std::move(listenerId), std::move(speakerId), std::move(channel));
    }

    void unmute(const std::string &listenerId, const std::string &speakerId, const std::string &channel = "*")
    {
        std::lock_guard<std::mutex> lock(mutex_);
        rules_.erase(std::make_tuple(listenerId, speakerId, channel));
    }

    [[nodiscard]] bool isMuted(std::string_view listenerId, std::string_view speakerId, std::string_view channel) const override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const std::string l(listenerId), s(speakerId);
        return rules_.count(std::make_tuple(l, s, std::string(channel))) > 0 || rules_.count(std::make_tuple(l, s, std::string("*"))) > 0;
    }

  private:
    mutable std::mutex mutex_;
    std::set<std::tuple<std::string, std::string, std::string>> rules_;
};

} // namespace realtime::registry
