#include <realtime/payload/PayloadOptimizer.hpp>

#include <realtime/protocol/Envelope.hpp>

#include <mudcast/core/Logger.hpp>
#include <mudcast/monitoring/Metrics.hpp>

#include <fmt/format.h>
#include <zlib.h>

#include <string_view>
#include <vector>

namespace realtime::payload
{
namespace
{
using json = nlohmann::json;

std::vector<unsigned char> zlibCompress(std::string_view text)
{
    uLongf destLen = compressBound(static_cast<uLong>(text.size()));
    std::vector<unsigned char> out(destLen);

    const int rc = compress2(out.data(), &destLen, reinterpret_cast<const Bytef *>(text.data()), static_cast<uLong>(text.size()), Z_DEFAULT_COMPRESSION);
    if (rc != Z_OK)
        throw std::runtime_error(fmt::format("zlib compress2 failed rc={}", rc));

    out.resize(destLen);
    return out;
}

std::string toHex(const std::vector<unsigned char> &bytes)
{
    static constexpr char kDigits[] = "0123456789abcdef";
    std::string out;
    out.reserve(bytes.size() * 2);
    for (unsigned char b : bytes)
    {
        out.push_back(kDigits[b >> 4]);
        out.push_back(kDigits[b & 0x0F]);
    }
    return out;
}

int hexValue(char c) noexcept
{
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

std::vector<unsigned char> fromHex(std::string_view hex)
{
    if (hex.size() % 2 != 0)
        throw std::invalid_argument("hex data has odd length");

    std::vector<unsigned char> out(hex.size() / 2);
    for (std::size_t i = 0; i < out.size(); ++i)
    {
        const int hi = hexValue(hex[2 * i]);
        const int lo = hexValue(hex[2 * i + 1]);
        if (hi < 0 || lo < 0)
            throw std::invalid_argument("hex data has a non-hex character");
        out[i] = static_cast<unsigned char>((hi << 4) | lo);
    }
    return out;
}
} // namespace

PayloadTooLarge::PayloadTooLarge(std::size_t originalSize, std::size_t compressedSize, std::size_t limit)
    : std::runtime_error(fmt::format("payload too large: original={} compressed={} limit={}", originalSize, compressedSize, limit)), originalSize_(originalSize),
      compressedSize_(compressedSize), limit_(limit)
{
}

std::size_t PayloadOptimizer::sizeOf(const nlohmann::json &payload)
{
    return protocol::toWireText(payload).size();
}

nlohmann::json PayloadOptimizer::optimize(const nlohmann::json &payload, bool forceCompression) const
{
    const std::string text = protocol::toWireText(payload);
    const std::size_t originalSize = text.size();

    if (!forceCompression && originalSize < policy_.compressionThreshold)
        return payload;

    const auto compressed = zlibCompress(text);
    const std::size_t compressedSize = compressed.size();
    const bool oversize = originalSize > policy_.maxPayloadSize;

    if (oversize && compressedSize > policy_.maxCompressedSize)
    {
        mudcast::monitoring::deliveryMetrics().onPayloadTooLarge();
        SLOG_ERROR("Payload", "TooLarge", "original={} compressed={} limit={}", originalSize, compressedSize, policy_.maxCompressedSize);
        throw PayloadTooLarge(originalSize, compressedSize, policy_.maxCompressedSize);
    }

    // 감소율 = 1 - compressed/original (정수 연산: compressed*100 <= original*(100-min))
    const bool worthIt = compressedSize * 100 <= originalSize * (100 - policy_.minReductionPercent);
    if (!forceCompression && !oversize && !worthIt)
    {
        SLOG_TRACE("Payload", "CompressionSkipped", "original={} compressed={}", originalSize, compressedSize);
        return payload;
    }

    mudcast::monitoring::deliveryMetrics().onPayloadCompressed();
    SLOG_DEBUG("Payload", "Compressed", "original={} compressed={} forced={}", originalSize, compressedSize, forceCompression);

    return json{
        {"compressed", true},
        {"data", toHex(compressed)},
        {"original_size", originalSize},
        {"compressed_size", compressedSize},
        {"compression_ratio", static_cast<double>(compressedSize) / static_cast<double>(originalSize)},
    };
}

std::string PayloadOptimizer::decompress(const nlohmann::json &compressed)
{
    if (!compressed.is_object() || !compressed.value("compressed", false))
        throw std::invalid_argument("not a compressed payload");

    auto dataIt = compressed.find("data");
    auto sizeIt = compressed.find("original_size");
    if (dataIt == compressed.end() || !dataIt->is_string() || sizeIt == compressed.end() || !sizeIt->is_number_integer() || sizeIt->get<std::int64_t>() < 0)
        throw std::invalid_argument("compressed payload missing data/original_size");

    const auto bytes = fromHex(dataIt->get_ref<const std::string &>());
    const auto originalSize = sizeIt->get<std::size_t>();

    std::string out(originalSize, '\0');
    uLongf destLen = static_cast<uLongf>(originalSize);
    const int rc = uncompress(reinterpret_cast<Bytef *>(out.data()), &destLen, bytes.data(), static_cast<uLong>(bytes.size()));
    if (rc != Z_OK)
        throw std::runtime_error(fmt::format("zlib uncompress failed rc={}", rc));
    if (destLen != originalSize)
        throw std::runtime_error(fmt::format("decompressed size mismatch: expected={} got={}", originalSize, destLen));

    return out;
}

nlohmann::json PayloadOptimizer::incremental(const nlohmann::json &current, const nlohmann::json *previous)
{
    if (!previous)
        return current;

    if (!current.is_object() || !previous->is_object())
    {
        // 객체가 아니면 key 단위 비교가 불가능하다. 같으면 빈 diff, 다르면 전체.
        if (current == *previous)
            return json{{"incremental", true}, {"changes", json::object()}};
        return current;
    }

    json changes = json::object();
    for (auto it = current.begin(); it != current.end(); ++it)
    {
        auto prev = previous->find(it.key());
        if (prev == previous->end() || *prev != it.value())
            changes[it.key()] = it.value();
    }

    json removed = json::array();
    for (auto it = previous->begin(); it != previous->end(); ++it)
    {
        if (!current.contains(it.key()))
            removed.push_back(it.key());
    }

    json diff = {{"incremental", true}, {"changes", std::move(changes)}};
    if (!removed.empty())
        diff["removed"] = std::move(removed);
    return diff;
}

} // namespace realtime::payload
