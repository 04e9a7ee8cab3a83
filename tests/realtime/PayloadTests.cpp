#include <realtime/payload/PayloadOptimizer.hpp>

#include <mudcast/monitoring/Metrics.hpp>

#include <iostream>
#include <stdexcept>
#include <string>

using realtime::payload::PayloadOptimizer;
using realtime::payload::PayloadPolicy;
using realtime::payload::PayloadTooLarge;

namespace {

nlohmann::json repetitive(std::size_t bytes) {
    return {{"event_type", "room_state"}, {"data", {{"text", std::string(bytes, 'a')}}}};
}

bool test_small_payload_passes_through() {
    PayloadOptimizer opt;
    const nlohmann::json small = {{"event_type", "pong"}, {"data", nlohmann::json::object()}};
    if (opt.optimize(small) != small) {
        std::cerr << "[small] payload below threshold was modified\n";
        return false;
    }
    return true;
}

bool test_large_payload_is_compressed_and_restored() {
    PayloadOptimizer opt;
    const auto payload = repetitive(16 * 1024);
    const auto out = opt.optimize(payload);

    if (!out.value("compressed", false) || out["original_size"] != PayloadOptimizer::sizeOf(payload)) {
        std::cerr << "[compress] shape mismatch: " << out.dump().substr(0, 120) << "\n";
        return false;
    }
    const double ratio = out["compression_ratio"].get<double>();
    if (ratio <= 0.0 || ratio >= 0.5) {
        std::cerr << "[compress] ratio unexpected: " << ratio << "\n";
        return false;
    }
    if (nlohmann::json::parse(PayloadOptimizer::decompress(out)) != payload) {
        std::cerr << "[compress] decompress mismatch\n";
        return false;
    }
    return true;
}

/// 감소율이 기준 미만이면 원본을 그대로 보낸다.
bool test_incompressible_payload_kept() {
    PayloadPolicy policy;
    policy.compressionThreshold = 16;
    policy.minReductionPercent = 99;
    PayloadOptimizer opt(policy);

    const nlohmann::json payload = {{"text", "abcdefghijklmnopqrstuvwxyz0123456789"}};
    if (opt.optimize(payload) != payload) {
        std::cerr << "[keep] low-reduction payload was compressed\n";
        return false;
    }
    if (!opt.optimize(payload, true).value("compressed", false)) {
        std::cerr << "[keep] forced compression ignored\n";
        return false;
    }
    return true;
}

bool test_oversize_after_compression_throws() {
    PayloadPolicy policy;
    policy.compressionThreshold = 16;
    policy.maxPayloadSize = 64;
    policy.maxCompressedSize = 8;
    PayloadOptimizer opt(policy);

    mudcast::monitoring::deliveryMetrics().reset();
    try {
        (void)opt.optimize(repetitive(512));
        std::cerr << "[oversize] expected PayloadTooLarge\n";
        return false;
    } catch (const PayloadTooLarge &e) {
        if (e.limit() != 8 || e.compressedSize() <= 8 || e.originalSize() <= 512) {
            std::cerr << "[oversize] exception fields mismatch: " << e.what() << "\n";
            return false;
        }
    }
    if (mudcast::monitoring::deliveryMetrics().snapshot().payloadTooLargeTotal != 1) {
        std::cerr << "[oversize] metric not counted\n";
        return false;
    }
    return true;
}

bool test_decompress_rejects_non_compressed() {
    const nlohmann::json bad[] = {
        {{"compressed", false}, {"data", "00"}, {"original_size", 1}},
        {{"compressed", true}, {"original_size", 1}},
        {{"compressed", true}, {"data", "0g"}, {"original_size", 1}},
        {{"compressed", true}, {"data", "00"}, {"original_size", -1}},
    };
    for (const auto &j : bad) {
        try {
            (void)PayloadOptimizer::decompress(j);
            std::cerr << "[decompress] accepted " << j.dump() << "\n";
            return false;
        } catch (const std::invalid_argument &) {
        }
    }
    return true;
}

bool test_incremental_diff() {
    const nlohmann::json prev = {{"hp", 10}, {"mp", 5}, {"name", "Ann"}};
    const nlohmann::json cur = {{"hp", 8}, {"mp", 5}, {"level", 2}};

    if (PayloadOptimizer::incremental(cur, nullptr) != cur) {
        std::cerr << "[diff] first snapshot must be sent whole\n";
        return false;
    }

    const auto d = PayloadOptimizer::incremental(cur, &prev);
    const nlohmann::json expectedChanges = {{"hp", 8}, {"level", 2}};
    if (d["incremental"] != true || d["changes"] != expectedChanges || d["removed"] != nlohmann::json::array({"name"})) {
        std::cerr << "[diff] mismatch: " << d.dump() << "\n";
        return false;
    }

    const auto same = PayloadOptimizer::incremental(prev, &prev);
    if (!same["changes"].empty() || same.contains("removed")) {
        std::cerr << "[diff] identical snapshots must yield empty changes\n";
        return false;
    }
    return true;
}

} // namespace

int main() {
    bool ok = true;
    ok &= test_small_payload_passes_through();
    ok &= test_large_payload_is_compressed_and_restored();
    ok &= test_incompressible_payload_kept();
    ok &= test_oversize_after_compression_throws();
    ok &= test_decompress_rejects_non_compressed();
    ok &= test_incremental_diff();

    if (!ok) {
        std::cerr << "Payload tests FAILED\n";
        return 1;
    }
    std::cout << "Payload tests PASSED\n";
    return 0;
}
