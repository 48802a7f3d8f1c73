#pragma once

/**
 * @file logging.hpp
 * @brief Process-wide leveled logging for the routing core.
 *
 * Records go to stderr unless a sink is installed with SetLogSink. Secret
 * key material must never be passed to these macros; public keys are
 * rendered through ShortHex.
 */

#include <fmt/core.h>

#include <cstdint>
#include <functional>
#include <span>
#include <string>
#include <string_view>

namespace sectrust::log {

enum class Level : uint8_t {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Off = 5
};

using Sink = std::function<void(Level, std::string_view)>;

void SetLevel(Level level) noexcept;
[[nodiscard]] Level GetLevel() noexcept;
[[nodiscard]] bool IsEnabled(Level level) noexcept;

/**
 * @brief Replace the output sink.
 *
 * Passing an empty function restores the default stderr sink.
 */
void SetLogSink(Sink sink);

void Write(Level level, std::string_view message);

[[nodiscard]] const char* LevelToString(Level level) noexcept;

[[nodiscard]] std::string ToHex(std::span<const uint8_t> data);

/// First few bytes of a public value as hex, suffixed with "..".
[[nodiscard]] std::string ShortHex(std::span<const uint8_t> data);

} // namespace sectrust::log

#define SECTRUST_LOG(level, ...) \
    do { \
        if (::sectrust::log::IsEnabled(level)) { \
            ::sectrust::log::Write(level, ::fmt::format(__VA_ARGS__)); \
        } \
    } while(0)

#define SECTRUST_LOG_TRACE(...) SECTRUST_LOG(::sectrust::log::Level::Trace, __VA_ARGS__)
#define SECTRUST_LOG_DEBUG(...) SECTRUST_LOG(::sectrust::log::Level::Debug, __VA_ARGS__)
#define SECTRUST_LOG_INFO(...) SECTRUST_LOG(::sectrust::log::Level::Info, __VA_ARGS__)
#define SECTRUST_LOG_WARN(...) SECTRUST_LOG(::sectrust::log::Level::Warn, __VA_ARGS__)
#define SECTRUST_LOG_ERROR(...) SECTRUST_LOG(::sectrust::log::Level::Error, __VA_ARGS__)
