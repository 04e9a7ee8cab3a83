#include <mudcast/core/ConfigLoader.hpp>

#include <mudcast/core/Logger.hpp>

#include <toml++/toml.hpp>

#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace
{
using namespace mudcast::core;

// -----------------------------------------------------------------------------
// Helper Functions (Validation & Parsing)
// -----------------------------------------------------------------------------

void printUsage(const char *argv0)
{
    std::string exe = "mudcast_node";
    if (argv0 && *argv0)
        exe = std::filesystem::path(argv0).filename().string();
    std::cout << "Usage: " << exe << " --config <path.toml>\n";
}

LogLevel parseLogLevel(std::string_view s)
{
    std::string v(s);
    for (auto &c : v)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

    if (v == "trace")
        return LogLevel::Trace;
    if (v == "debug")
        return LogLevel::Debug;
    if (v == "info")
        return LogLevel::Info;
    if (v == "warn" || v == "warning")
        return LogLevel::Warn;
    if (v == "error")
        return LogLevel::Error;
    if (v == "fatal")
        return LogLevel::Fatal;

    throw std::invalid_argument("Invalid log_level: " + std::string(s));
}

BrokerKind parseBrokerKind(std::string_view s)
{
    if (s == "inprocess")
        return BrokerKind::InProcess;
    if (s == "nats")
        return BrokerKind::Nats;
    throw std::invalid_argument("Invalid broker.kind: " + std::string(s));
}

std::optional<std::string> scanCliForConfigPath(int argc, char **argv)
{
    for (int i = 1; i < argc; ++i)
    {
        std::string_view a = argv[i] ? std::string_view(argv[i]) : std::string_view{};
        if (a == "--config" || a == "-c")
        {
            if (i + 1 >= argc || !argv[i + 1] || !*argv[i + 1])
                throw std::runtime_error("--config requires a path");
            return std::string(argv[i + 1]);
        }
    }
    return std::nullopt;
}

// [Strict Mode] range-checked conversions
std::uint16_t checkedPortFromI64(std::int64_t v, const char *key)
{
    if (v < 0 || v > 65535)
        throw std::invalid_argument(std::string(key) + " out of range (0..65535): " + std::to_string(v));
    return static_cast<std::uint16_t>(v);
}

std::uint32_t checkedU32FromI64(std::int64_t v, const char *key)
{
    if (v < 0 || v > static_cast<std::int64_t>(std::numeric_limits<std::uint32_t>::max()))
        throw std::invalid_argument(std::string(key) + " out of range: " + std::to_string(v));
    return static_cast<std::uint32_t>(v);
}

std::size_t checkedSizeFromI64(std::int64_t v, const char *key)
{
    if (v < 0)
        throw std::invalid_argument(std::string(key) + " must be non-negative: " + std::to_string(v));
    return static_cast<std::size_t>(v);
}

const toml::table &requireTable(const toml::table &root, const char *name)
{
    const auto *t = root[name].as_table();
    if (!t)
        throw std::runtime_error(std::string("Missing required [") + name + "] section");
    return *t;
}

void readU32(const toml::table &t, const char *key, std::uint32_t &out)
{
    if (auto v = t[key].value<std::int64_t>())
        out = checkedU32FromI64(*v, key);
}

void readSize(const toml::table &t, const char *key, std::size_t &out)
{
    if (auto v = t[key].value<std::int64_t>())
        out = checkedSizeFromI64(*v, key);
}

// -----------------------------------------------------------------------------
// Section Parsing
// -----------------------------------------------------------------------------

void applyNodeToml(GlobalConfig &cfg, const toml::table &root)
{
    // [Strict] [node] 섹션 필수
    const toml::table &node = requireTable(root, "node");

    if (auto s = node["process_id"].value<std::string>())
        cfg.node.processId = *s;
    if (auto s = node["log_level"].value<std::string>())
        cfg.node.logLevel = parseLogLevel(*s);
    if (auto s = node["log_file_path"].value<std::string>())
        cfg.node.logFilePath = *s;
    readU32(node, "reap_interval_ms", cfg.node.reapIntervalMs);
}

void applyBrokerToml(GlobalConfig &cfg, const toml::table &root)
{
    const auto *broker = root["broker"].as_table();
    if (!broker)
        return;

    if (auto s = (*broker)["kind"].value<std::string>())
        cfg.broker.kind = parseBrokerKind(*s);
    if (auto s = (*broker)["host"].value<std::string>())
        cfg.broker.host = *s;
    if (auto v = (*broker)["port"].value<std::int64_t>())
        cfg.broker.port = checkedPortFromI64(*v, "port");
    readU32(*broker, "connect_timeout_ms", cfg.broker.connectTimeoutMs);
}

void applyBusToml(GlobalConfig &cfg, const toml::table &root)
{
    const auto *bus = root["bus"].as_table();
    if (!bus)
        return;

    readU32(*bus, "max_attempts", cfg.bus.maxAttempts);
    readU32(*bus, "base_delay_ms", cfg.bus.baseDelayMs);
    readU32(*bus, "max_delay_ms", cfg.bus.maxDelayMs);
    readU32(*bus, "breaker_failure_threshold", cfg.bus.breakerFailureThreshold);
    readU32(*bus, "breaker_open_timeout_ms", cfg.bus.breakerOpenTimeoutMs);
    readU32(*bus, "breaker_success_threshold", cfg.bus.breakerSuccessThreshold);
    readSize(*bus, "outbound_capacity", cfg.bus.outboundCapacity);
    readSize(*bus, "inbound_capacity", cfg.bus.inboundCapacity);
    readSize(*bus, "dead_letter_capacity", cfg.bus.deadLetterCapacity);
    if (auto s = (*bus)["dead_letter_path"].value<std::string>())
        cfg.bus.deadLetterPath = *s;
    readU32(*bus, "tick_resolution_ms", cfg.bus.tickResolutionMs);
    readSize(*bus, "timer_slots", cfg.bus.timerSlots);
}

void applyDomainToml(GlobalConfig &cfg, const toml::table &root)
{
    if (const auto *p = root["payload"].as_table())
    {
        readSize(*p, "compression_threshold", cfg.payload.compressionThreshold);
        readSize(*p, "max_payload_size", cfg.payload.maxPayloadSize);
        readSize(*p, "max_compressed_size", cfg.payload.maxCompressedSize);
        readU32(*p, "min_reduction_percent", cfg.payload.minReductionPercent);
    }

    if (const auto *r = root["registry"].as_table())
    {
        readSize(*r, "max_connections_per_player", cfg.registry.maxConnectionsPerPlayer);
        readU32(*r, "stale_timeout_ms", cfg.registry.staleTimeoutMs);
        readSize(*r, "send_buffer_bytes", cfg.registry.sendBufferBytes);
    }

    if (const auto *i = root["inbound"].as_table())
    {
        readU32(*i, "max_messages_per_window", cfg.inbound.maxMessagesPerWindow);
        readU32(*i, "window_ms", cfg.inbound.windowMs);
    }
}

GlobalConfig fromTable(const toml::table &root)
{
    GlobalConfig cfg{};
    applyNodeToml(cfg, root);
    applyBrokerToml(cfg, root);
    applyBusToml(cfg, root);
    applyDomainToml(cfg, root);

    validateGlobalConfig(cfg);
    return cfg;
}

} // namespace

namespace mudcast::core
{

GlobalConfig ConfigLoader::load(int argc, char **argv)
{
    for (int i = 1; i < argc; ++i)
    {
        std::string_view a = argv[i] ? std::string_view(argv[i]) : std::string_view{};
        if (a == "--help" || a == "-h")
        {
            printUsage((argc > 0) ? argv[0] : nullptr);
            std::exit(0);
        }
    }

    auto configOpt = scanCliForConfigPath(argc, argv);
    if (!configOpt.has_value())
    {
        printUsage((argc > 0) ? argv[0] : nullptr);
        throw std::runtime_error("Missing required argument: --config <path.toml>");
    }

    return loadFile(*configOpt);
}

GlobalConfig ConfigLoader::loadFile(const std::string &path)
{
    if (!std::filesystem::exists(path))
        throw std::runtime_error("Config file not found: " + path);

    toml::table root;
    try
    {
        root = toml::parse_file(path);
    }
    catch (const toml::parse_error &e)
    {
        throw std::runtime_error("TOML Parse Error: " + std::string(e.description()));
    }

    GlobalConfig cfg = fromTable(root);
    std::cout << "[ConfigLoader] Successfully loaded: " << path << "\n";
    return cfg;
}

GlobalConfig ConfigLoader::parse(std::string_view tomlText)
{
    toml::table root;
    try
    {
        root = toml::parse(tomlText);
    }
    catch (const toml::parse_error &e)
    {
        throw std::runtime_error("TOML Parse Error: " + std::string(e.description()));
    }
    return fromTable(root);
}

} // namespace mudcast::core
