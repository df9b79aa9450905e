#include "../include/options.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <limits>
#include <optional>

#include "../include/errors.hpp"
#include "../include/logger.hpp"

namespace selforg {

namespace {

std::string Lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

// Strictly positive decimal that fits in int64_t, no sign or trailing junk.
std::optional<int64_t> ParsePositive(const std::string& text) {
    if (text.empty() || !std::all_of(text.begin(), text.end(),
                                     [](unsigned char c) { return std::isdigit(c); })) {
        return std::nullopt;
    }
    errno = 0;
    char* end = nullptr;
    unsigned long long value = std::strtoull(text.c_str(), &end, 10);
    if (errno != 0 || value == 0 ||
        value > static_cast<unsigned long long>(std::numeric_limits<int64_t>::max())) {
        return std::nullopt;
    }
    return static_cast<int64_t>(value);
}

std::optional<logger::Level> ParseLevel(const std::string& text) {
    auto level = Lower(text);
    if (level == "debug") return logger::Level::DEBUG;
    if (level == "info") return logger::Level::INFO;
    if (level == "warning" || level == "warn") return logger::Level::WARNING;
    if (level == "error") return logger::Level::ERROR;
    return std::nullopt;
}

} // namespace

std::string GetEnv(const char* name, const std::string& default_value) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : default_value;
}

bool GetEnvBool(const char* name, bool default_value) {
    const char* value = std::getenv(name);
    if (!value) return default_value;
    auto text = Lower(value);
    return text == "1" || text == "true" || text == "yes" || text == "on";
}

void ListOptions::Validate() const {
    if (capacity <= 0) {
        throw InvalidConfiguration("capacity must be positive");
    }
    if (strategy == StrategyKind::kUnset) {
        throw InvalidConfiguration("strategy cannot be unset");
    }
}

ListOptions ListOptions::FromEnv(const ListOptions& defaults) {
    ListOptions options = defaults;

    if (const char* raw = std::getenv("SELFORG_CAPACITY")) {
        if (auto capacity = ParsePositive(raw)) {
            options.capacity = *capacity;
        } else {
            SELFORG_LOG_WARNING("ignoring SELFORG_CAPACITY=%s: not a positive integer", raw);
        }
    }

    if (const char* raw = std::getenv("SELFORG_STRATEGY")) {
        if (auto strategy = ParseStrategy(raw)) {
            options.strategy = *strategy;
        } else {
            SELFORG_LOG_WARNING("ignoring SELFORG_STRATEGY=%s: unknown strategy", raw);
        }
    }

    if (const char* raw = std::getenv("SELFORG_RECENT_OPERATIONS")) {
        if (auto limit = ParsePositive(raw)) {
            options.recent_operations_limit = static_cast<size_t>(*limit);
        } else {
            SELFORG_LOG_WARNING("ignoring SELFORG_RECENT_OPERATIONS=%s: not a positive integer", raw);
        }
    }

    return options;
}

ListOptions ListOptions::FromEnv() {
    return FromEnv(ListOptions{});
}

// Runs inside the Logger constructor, so it must not log.
logger::LogConfig logger::LogConfig::FromEnv() {
    LogConfig config;
    config.log_dir = GetEnv("SELFORG_LOG_DIR", config.log_dir);
    config.use_stdout = GetEnvBool("SELFORG_LOG_STDOUT", config.use_stdout);
    config.async_mode = GetEnvBool("SELFORG_LOG_ASYNC", config.async_mode);
    if (const char* raw = std::getenv("SELFORG_LOG_LEVEL")) {
        if (auto level = ParseLevel(raw)) {
            config.min_level = *level;
        }
    }
    return config;
}

} // namespace selforg
