#pragma once

#include <cstddef>
#include <string_view>
#include <utility>
#include <vector>

#include <sys/uio.h>

namespace mudcast::buffer
{

/// 연결 하나의 outbound 바이트 큐 (고정 용량)
///
/// 용량이 곧 backpressure 한계다. 프레임 단위 기록은 tryAppend 로 하고,
/// 자리가 없으면 아무것도 쓰지 않는다. 잠금 없음: 소유 transport 의 mutex 아래에서만 쓴다.
class RingBuffer
{
  public:
    explicit RingBuffer(std::size_t capacity); // 0 -> std::invalid_argument

    [[nodiscard]] std::size_t capacity() const noexcept { return storage_.size(); }
    [[nodiscard]] std::size_t size() const noexcept { return used_; }
    [[nodiscard]] std::size_t freeSpace() const noexcept { return capacity() - used_; }
    [[nodiscard]] bool empty() const noexcept { return used_ == 0; }
    [[nodiscard]] bool full() const noexcept { return used_ == capacity(); }

    /// 들어가는 만큼만 기록하고 기록한 바이트 수를 돌려준다.
    std::size_t write(const std::byte *data, std::size_t len) noexcept;

    /// head + body 를 통째로 기록하거나, 공간이 모자라면 아무것도 하지 않는다.
    [[nodiscard]] bool tryAppend(std::string_view head, std::string_view body) noexcept;

    std::size_t read(std::byte *dest, std::size_t len) noexcept;
    std::size_t peek(std::byte *dest, std::size_t len) const noexcept;

    /// 앞쪽 최대 maxLen 바이트를 sendmsg 용 iovec 으로 (0~2개). consume 은 호출자 몫.
    [[nodiscard]] int peekIov(::iovec out[2], std::size_t maxLen) const noexcept;

    void consume(std::size_t n) noexcept;
    void clear() noexcept { start_ = used_ = 0; }

  private:
    // [pos, pos+len) 를 버퍼 끝 기준으로 자른 (앞 조각 길이, 뒤 조각 길이)
    [[nodiscard]] std::pair<std::size_t, std::size_t> split(std::size_t pos, std::size_t len) const noexcept;
    [[nodiscard]] std::size_t endPos() const noexcept { return (start_ + used_) % capacity(); }

    std::vector<std::byte> storage_;
    std::size_t start_{0}; // 가장 오래된 바이트 위치
    std::size_t used_{0};
};

} // namespace mudcast::buffer
