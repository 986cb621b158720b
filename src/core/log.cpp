#include <learnvault/core/log.h>

#include <cstdlib>
#include <memory>
#include <mutex>
#include <string>

namespace learnvault::log {
namespace {

constexpr const char* kLevelEnv = "LEARNVAULT_LOG_LEVEL";

std::once_flag g_once;
std::unique_ptr<chlog::logger> g_logger;

chlog::logger& Instance() {
    std::call_once(g_once, [] {
        chlog::logger_config cfg;
        cfg.name = "learnvault";
        cfg.level = chlog::level::info;
        cfg.pattern = "[{date} {time}.{ms}][{lvl}][tid={tid}] {msg}";
        cfg.async.enabled = false;
        cfg.parallel_sinks = false;

        auto logger = std::make_unique<chlog::logger>(std::move(cfg));
        logger->add_sink(std::make_shared<chlog::console_sink>(chlog::console_sink::style::color));
        g_logger = std::move(logger);
    });
    return *g_logger;
}

} // namespace

std::optional<chlog::level> ParseLevel(std::string_view name) {
    if (name == "trace") return chlog::level::trace;
    if (name == "debug") return chlog::level::debug;
    if (name == "info") return chlog::level::info;
    if (name == "warn" || name == "warning") return chlog::level::warn;
    if (name == "error") return chlog::level::error;
    if (name == "critical") return chlog::level::critical;
    if (name == "off") return chlog::level::off;
    return std::nullopt;
}

void Init(std::string_view level) {
    std::string requested(level);
    if (const char* env = std::getenv(kLevelEnv); env != nullptr && *env != '\0') {
        requested = env;
    }

    auto& logger = Instance();
    auto parsed = ParseLevel(requested);
    logger.set_level(parsed.value_or(chlog::level::info));
    if (!parsed) {
        logger.warn("unknown log level '{}', using info", requested);
    }
}

chlog::logger& Get() {
    return Instance();
}

} // namespace learnvault::log
