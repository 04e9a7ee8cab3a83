#include <mudcast/bus/DeadLetterStore.hpp>

#include <mudcast/core/Logger.hpp>
#include <mudcast/core/Time.hpp>

#include <nlohmann/json.hpp>

#include <stdexcept>

namespace mudcast::bus
{

DeadLetterStore::DeadLetterStore(std::size_t capacity, std::string path)
    : capacity_(capacity), path_(std::move(path))
{
    if (capacity_ == 0)
        throw std::invalid_argument("DeadLetterStore capacity must be greater than 0");

    if (!path_.empty())
    {
        file_.open(path_, std::ios::app);
        if (!file_.is_open())
            throw std::runtime_error("[DeadLetterStore] failed to open: " + path_);
    }
}

std::string DeadLetterStore::toJsonLine(const DeadLetterEntry &e)
{
    nlohmann::json j;
    j["message_id"] = e.messageId;
    j["subject"] = e.subject;
    j["data"] = e.payload;
    j["attempts"] = e.attemptCount;
    j["error"] = e.lastError;
    j["reason"] = e.reason;
    j["first_failed_at"] = mudcast::core::formatIso8601Utc(e.firstFailedAt);
    j["dead_lettered_at"] = mudcast::core::formatIso8601Utc(e.deadLetteredAt);
    // payload 에 깨진 UTF-8 이 있어도 파일 쓰기는 실패하지 않게 한다.
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

void DeadLetterStore::add(DeadLetterEntry entry)
{
    std::lock_guard<std::mutex> lock(mutex_);

    if (file_.is_open())
    {
        file_ << toJsonLine(entry) << '\n';
        file_.flush();
        if (!file_)
        {
            SLOG_ERROR("DeadLetter", "PersistFailed", "path={} id={}", path_, entry.messageId);
            file_.clear();
        }
    }

    if (entries_.size() >= capacity_)
    {
        SLOG_WARN("DeadLetter", "Evict", "capacity={} evicted_id={}", capacity_,
                  entries_.front().messageId);
        entries_.pop_front();
    }
    entries_.push_back(std::move(entry));
    ++totalWritten_;
}

std::vector<DeadLetterEntry> DeadLetterStore::list() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return {entries_.begin(), entries_.end()};
}

std::size_t DeadLetterStore::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

std::uint64_t DeadLetterStore::totalWritten() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return totalWritten_;
}

void DeadLetterStore::clear()
{
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

} // namespace mudcast::bus
