#pragma once

#include <mudcast/core/Defaults.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace realtime::payload
{

/// 압축 후에도 상한을 넘는 payload. 상위 코드의 결함이므로 호출자에게 그대로 던진다.
class PayloadTooLarge : public std::runtime_error
{
  public:
    PayloadTooLarge(std::size_t originalSize, std::size_t compressedSize, std::size_t limit);

    [[nodiscard]] std::size_t originalSize() const noexcept { return originalSize_; }
    [[nodiscard]] std::size_t compressedSize() const noexcept { return compressedSize_; }
    [[nodiscard]] std::size_t limit() const noexcept { return limit_; }

  private:
    std::size_t originalSize_;
    std::size_t compressedSize_;
    std::size_t limit_;
};

struct PayloadPolicy
{
    std::size_t compressionThreshold{mudcast::core::defaults::kCompressionThreshold};
    std::size_t maxPayloadSize{mudcast::core::defaults::kMaxPayloadSize};
    std::size_t maxCompressedSize{mudcast::core::defaults::kMaxCompressedSize};
    std::uint32_t minReductionPercent{mudcast::core::defaults::kMinReductionPercent};
};

/// 송신 직전 envelope 크기 정책 (zlib)
///
/// - threshold 미만: 그대로 통과
/// - threshold 이상: 압축. 감소율이 minReductionPercent 미만이면 원본 유지
/// - maxPayloadSize 초과: 감소율과 무관하게 압축. 결과가 maxCompressedSize 초과면 PayloadTooLarge
///
/// 압축 결과 모양: {compressed:true, data:<hex>, original_size, compressed_size, compression_ratio}
class PayloadOptimizer
{
  public:
    explicit PayloadOptimizer(PayloadPolicy policy = {}) noexcept : policy_(policy) {}

    [[nodiscard]] const PayloadPolicy &policy() const noexcept { return policy_; }

    /// compact JSON 직렬화의 byte 길이
    [[nodiscard]] static std::size_t sizeOf(const nlohmann::json &payload);

    [[nodiscard]] nlohmann::json optimize(const nlohmann::json &payload, bool forceCompression = false) const;

    /// optimize 의 압축 결과에서 원본 JSON 텍스트를 복원한다.
    /// @throws std::invalid_argument 압축 payload 모양이 아님 / std::runtime_error zlib 실패
    [[nodiscard]] static std::string decompress(const nlohmann::json &compressed);

    /// 얕은(key 단위) diff
    ///   previous == nullptr -> current 그대로
    ///   변화 없음           -> {incremental:true, changes:{}}
    ///   그 외               -> {incremental:true, changes:{...}, removed:[...]}  (removed 는 있을 때만)
    [[nodiscard]] static nlohmann::json incremental(const nlohmann::json &current, const nlohmann::json *previous);

  private:
    PayloadPolicy policy_;
};

} // namespace realtime::payload
