/*
 * service_config.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "service_config.hpp"

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <thread>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "exception.hpp"

namespace runway::config {

namespace {

// Crow stores its worker count in a uint16_t.
constexpr std::size_t kMaxThreadCount =
    std::numeric_limits<std::uint16_t>::max();

template <typename T>
auto parseUnsigned(std::string_view text, std::string_view source) -> T {
    T value{};
    const auto* first = text.data();
    const auto* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (text.empty() || ec != std::errc{} || ptr != last) {
        throw InvalidConfigException(fmt::format(
            "{}: expected a non-negative integer, got '{}'", source, text));
    }
    return value;
}

auto parsePort(std::string_view text, std::string_view source) -> int {
    const auto value = parseUnsigned<unsigned>(text, source);
    if (value == 0 || value > 65535) {
        throw InvalidConfigException(
            fmt::format("{}: port out of range: {}", source, text));
    }
    return static_cast<int>(value);
}

auto parseThreads(std::string_view text, std::string_view source)
    -> std::size_t {
    const auto value = parseUnsigned<std::size_t>(text, source);
    if (value == 0) {
        throw InvalidConfigException(
            fmt::format("{}: thread count must be positive", source));
    }
    if (value > kMaxThreadCount) {
        throw InvalidConfigException(fmt::format(
            "{}: thread count must not exceed {}", source, kMaxThreadCount));
    }
    return value;
}

/// Reads an unsigned field, rejecting negative and non-integer JSON numbers.
template <typename T>
auto unsignedValue(const json& j, const char* key, T current) -> T {
    const auto it = j.find(key);
    if (it == j.end()) {
        return current;
    }
    if (!it->is_number_integer() ||
        (!it->is_number_unsigned() && it->get<std::int64_t>() < 0)) {
        throw InvalidConfigException(fmt::format(
            "{}: expected a non-negative integer, got {}", key, it->dump()));
    }
    return it->get<T>();
}

void validate(const ServiceConfig& cfg) {
    if (cfg.port <= 0 || cfg.port > 65535) {
        throw InvalidConfigException(
            fmt::format("port out of range: {}", cfg.port));
    }
    if (cfg.threadCount == 0) {
        throw InvalidConfigException("threadCount must be positive");
    }
    if (cfg.threadCount > kMaxThreadCount) {
        throw InvalidConfigException(fmt::format(
            "threadCount must not exceed {}: {}", kMaxThreadCount,
            cfg.threadCount));
    }
    if (cfg.defaultTimeoutSeconds > exec::kMaxDeadlineSeconds ||
        cfg.compileTimeoutSeconds > exec::kMaxDeadlineSeconds) {
        throw InvalidConfigException(fmt::format(
            "timeouts must not exceed {}s", exec::kMaxDeadlineSeconds));
    }
    if (cfg.killGraceMillis > exec::kMaxKillGraceMillis) {
        throw InvalidConfigException(
            fmt::format("killGraceMillis must not exceed {}",
                        exec::kMaxKillGraceMillis));
    }
    if (cfg.host.empty()) {
        throw InvalidConfigException("host must not be empty");
    }
}

}  // namespace

auto processEnvironment() -> EnvLookup {
    return [](std::string_view name) -> std::optional<std::string> {
        const std::string key(name);
        if (const char* value = std::getenv(key.c_str()); value != nullptr) {
            return std::string(value);
        }
        return std::nullopt;
    };
}

ServiceConfig::ServiceConfig() = default;

auto ServiceConfig::defaultThreadCount() -> std::size_t {
    return std::max<std::size_t>(2, std::thread::hardware_concurrency());
}

auto ServiceConfig::serialize() const -> json {
    return {
        // Network
        {"host", host},
        {"port", port},
        {"threadCount", threadCount},
        // Execution
        {"tempRoot", tempRoot.string()},
        {"defaultTimeoutSeconds", defaultTimeoutSeconds},
        {"compileTimeoutSeconds", compileTimeoutSeconds},
        {"maxOutputBytes", maxOutputBytes},
        {"killGraceMillis", killGraceMillis},
        // Logging
        {"logging", logging.toJson()}};
}

auto ServiceConfig::deserialize(const json& j, ServiceConfig base)
    -> ServiceConfig {
    if (!j.is_object()) {
        throw InvalidConfigException("configuration root must be an object");
    }

    ServiceConfig cfg = std::move(base);
    try {
        // Network
        cfg.host = j.value("host", cfg.host);
        cfg.port = j.value("port", cfg.port);
        cfg.threadCount = unsignedValue(j, "threadCount", cfg.threadCount);

        // Execution
        cfg.tempRoot = j.value("tempRoot", cfg.tempRoot.string());
        cfg.defaultTimeoutSeconds = unsignedValue(
            j, "defaultTimeoutSeconds", cfg.defaultTimeoutSeconds);
        cfg.compileTimeoutSeconds = unsignedValue(
            j, "compileTimeoutSeconds", cfg.compileTimeoutSeconds);
        cfg.maxOutputBytes =
            unsignedValue(j, "maxOutputBytes", cfg.maxOutputBytes);
        cfg.killGraceMillis =
            unsignedValue(j, "killGraceMillis", cfg.killGraceMillis);

        // Logging
        if (j.contains("logging")) {
            cfg.logging =
                logging::LoggingConfig::fromJson(j.at("logging"), cfg.logging);
        }
    } catch (const json::exception& e) {
        throw InvalidConfigException(
            fmt::format("invalid configuration value: {}", e.what()));
    }

    validate(cfg);
    return cfg;
}

void ServiceConfig::mergeFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw ConfigIOException(
            fmt::format("cannot open config file: {}", path.string()));
    }

    json j;
    try {
        j = json::parse(file);
    } catch (const json::parse_error& e) {
        throw ConfigIOException(fmt::format("cannot parse config file {}: {}",
                                            path.string(), e.what()));
    }
    *this = deserialize(j, std::move(*this));
    spdlog::debug("ServiceConfig: merged {}", path.string());
}

void ServiceConfig::mergeEnvironment(const EnvLookup& env) {
    if (auto v = env("HOST"); v && !v->empty()) {
        host = *v;
    }
    if (auto v = env("PORT")) {
        port = parsePort(*v, "PORT");
    }
    if (auto v = env("EXEC_THREADS")) {
        threadCount = parseThreads(*v, "EXEC_THREADS");
    }
    if (auto v = env("EXEC_TEMP_ROOT"); v && !v->empty()) {
        tempRoot = *v;
    }
    if (auto v = env("EXEC_DEFAULT_TIMEOUT")) {
        defaultTimeoutSeconds =
            parseUnsigned<std::uint64_t>(*v, "EXEC_DEFAULT_TIMEOUT");
    }
    if (auto v = env("EXEC_COMPILE_TIMEOUT")) {
        compileTimeoutSeconds =
            parseUnsigned<std::uint64_t>(*v, "EXEC_COMPILE_TIMEOUT");
    }
    if (auto v = env("EXEC_MAX_OUTPUT_BYTES")) {
        maxOutputBytes = parseUnsigned<std::size_t>(*v, "EXEC_MAX_OUTPUT_BYTES");
    }
    if (auto v = env("EXEC_KILL_GRACE_MS")) {
        killGraceMillis = parseUnsigned<std::uint64_t>(*v, "EXEC_KILL_GRACE_MS");
    }
    if (auto v = env("LOG_LEVEL"); v && !v->empty()) {
        logging.level = logging::levelFromString(*v);
    }
    if (auto v = env("LOG_FILE")) {
        logging.filePath = *v;
    }
}

auto ServiceConfig::orchestratorOptions() const -> exec::OrchestratorOptions {
    exec::OrchestratorOptions options;
    options.tempRoot = tempRoot;
    options.defaultTimeoutSeconds = defaultTimeoutSeconds;
    options.compileTimeoutSeconds = compileTimeoutSeconds;
    options.maxOutputBytes = maxOutputBytes;
    options.killGrace =
        std::chrono::milliseconds(static_cast<std::int64_t>(killGraceMillis));
    return options;
}

auto parseCommandLine(int argc, const char* const* argv)
    -> CommandLineOptions {
    static constexpr std::string_view kValueFlags[] = {
        "--host",      "--port",      "--threads", "--temp-root",
        "--log-level", "--log-file", "--config"};

    CommandLineOptions options;
    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            options.showHelp = true;
            continue;
        }

        std::string name(arg);
        std::optional<std::string> value;
        if (auto eq = arg.find('='); eq != std::string_view::npos) {
            name = std::string(arg.substr(0, eq));
            value = std::string(arg.substr(eq + 1));
        }

        if (std::ranges::find(kValueFlags, name) == std::end(kValueFlags)) {
            throw InvalidConfigException(
                fmt::format("unknown option: {}", arg));
        }
        if (!value) {
            if (i + 1 >= argc) {
                throw InvalidConfigException(
                    fmt::format("option {} requires a value", name));
            }
            value = argv[++i];
        }

        if (name == "--config") {
            options.configFile = *value;
        } else {
            options.overrides.emplace_back(std::move(name), std::move(*value));
        }
    }
    return options;
}

void applyCommandLine(ServiceConfig& config,
                      const CommandLineOptions& options) {
    for (const auto& [name, value] : options.overrides) {
        if (name == "--host") {
            if (value.empty()) {
                throw InvalidConfigException("--host must not be empty");
            }
            config.host = value;
        } else if (name == "--port") {
            config.port = parsePort(value, name);
        } else if (name == "--threads") {
            config.threadCount = parseThreads(value, name);
        } else if (name == "--temp-root") {
            config.tempRoot = value;
        } else if (name == "--log-level") {
            config.logging.level = logging::levelFromString(value);
        } else if (name == "--log-file") {
            config.logging.filePath = value;
        }
    }
}

auto loadServiceConfig(const CommandLineOptions& options, const EnvLookup& env)
    -> ServiceConfig {
    ServiceConfig config;
    if (options.configFile) {
        config.mergeFile(*options.configFile);
    }
    config.mergeEnvironment(env);
    applyCommandLine(config, options);
    validate(config);
    return config;
}

auto usage(std::string_view program) -> std::string {
    return fmt::format(
        "Usage: {} [options]\n"
        "\n"
        "Options:\n"
        "  --host <addr>         Bind address (env HOST, default 0.0.0.0)\n"
        "  --port <port>         Listen port (env PORT, default 8004)\n"
        "  --threads <n>         HTTP worker threads (env EXEC_THREADS)\n"
        "  --temp-root <dir>     Workspace root (env EXEC_TEMP_ROOT)\n"
        "  --log-level <level>   trace|debug|info|warn|error|critical|off "
        "(env LOG_LEVEL)\n"
        "  --log-file <path>     Rotating log file (env LOG_FILE)\n"
        "  --config <file>       JSON configuration file\n"
        "  -h, --help            Show this help\n",
        program);
}

}  // namespace runway::config
