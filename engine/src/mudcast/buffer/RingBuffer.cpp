#include <mudcast/buffer/RingBuffer.hpp>

#include <algorithm>
#include <cstring>
#include <stdexcept>

namespace mudcast::buffer
{

RingBuffer::RingBuffer(std::size_t capacity) : storage_(capacity)
{
    if (capacity == 0)
        throw std::invalid_argument("RingBuffer: capacity must be > 0");
}

std::pair<std::size_t, std::size_t> RingBuffer::split(std::size_t pos, std::size_t len) const noexcept
{
    const std::size_t first = std::min(len, capacity() - pos);
    return {first, len - first};
}

std::size_t RingBuffer::write(const std::byte *data, std::size_t len) noexcept
{
    const std::size_t n = data ? std::min(len, freeSpace()) : 0;
    if (n == 0)
        return 0;

    const std::size_t at = endPos();
    const auto [first, wrapped] = split(at, n);
    std::memcpy(storage_.data() + at, data, first);
    if (wrapped != 0)
        std::memcpy(storage_.data(), data + first, wrapped);

    used_ += n;
    return n;
}

bool RingBuffer::tryAppend(std::string_view head, std::string_view body) noexcept
{
    if (head.size() + body.size() > freeSpace())
        return false;

    write(reinterpret_cast<const std::byte *>(head.data()), head.size());
    write(reinterpret_cast<const std::byte *>(body.data()), body.size());
    return true;
}

std::size_t RingBuffer::peek(std::byte *dest, std::size_t len) const noexcept
{
    const std::size_t n = dest ? std::min(len, used_) : 0;
    if (n == 0)
        return 0;

    const auto [first, wrapped] = split(start_, n);
    std::memcpy(dest, storage_.data() + start_, first);
    if (wrapped != 0)
        std::memcpy(dest + first, storage_.data(), wrapped);
    return n;
}

std::size_t RingBuffer::read(std::byte *dest, std::size_t len) noexcept
{
    const std::size_t n = peek(dest, len);
    consume(n);
    return n;
}

int RingBuffer::peekIov(::iovec out[2], std::size_t maxLen) const noexcept
{
    const std::size_t n = out ? std::min(maxLen, used_) : 0;
    if (n == 0)
        return 0;

    auto *base = const_cast<std::byte *>(storage_.data());
    const auto [first, wrapped] = split(start_, n);

    out[0] = ::iovec{base + start_, first};
    out[1] = ::iovec{wrapped != 0 ? base : nullptr, wrapped};
    return wrapped != 0 ? 2 : 1;
}

void RingBuffer::consume(std::size_t n) noexcept
{
    n = std::min(n, used_);
    used_ -= n;
    // 비면 0번으로 되감아 다음 프레임이 한 조각으로 놓이게 한다.
    start_ = used_ == 0 ? 0 : (start_ + n) % capacity();
}

} // namespace mudcast::buffer
