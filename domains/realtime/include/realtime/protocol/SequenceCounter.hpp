#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace realtime::protocol
{

// sender 별 단조 증가 시퀀스 (1부터). sender 가 없는 이벤트는 "" 키를 공유한다.
class SequenceCounter
{
  public:
    std::uint64_t next(std::string_view senderId)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return ++counters_[std::string(senderId)];
    }

    [[nodiscard]] std::uint64_t current(std::string_view senderId) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = counters_.find(std::string(senderId));
        return it == counters_.end() ? 0 : it->second;
    }

    // 마지막 연결이 끊긴 sender 의 카운터를 버린다. 재접속하면 1부터 다시 센다.
    bool forget(std::string_view senderId)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return counters_.erase(std::string(senderId)) != 0;
    }

    [[nodiscard]] std::size_t size() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return counters_.size();
    }

  private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::uint64_t> counters_;
};

} // namespace realtime::protocol
