#include "sectrust/core/logging.hpp"
#include "sectrust/core/constants.hpp"

#include <atomic>
#include <cstdio>
#include <mutex>

namespace sectrust::log {

namespace {
    std::atomic<Level> g_level{Level::Info};
    std::mutex g_sink_lock;
    Sink g_sink;
}

void SetLevel(const Level level) noexcept {
    g_level.store(level, std::memory_order_relaxed);
}

Level GetLevel() noexcept {
    return g_level.load(std::memory_order_relaxed);
}

bool IsEnabled(const Level level) noexcept {
    return level != Level::Off &&
           static_cast<uint8_t>(level) >= static_cast<uint8_t>(GetLevel());
}

void SetLogSink(Sink sink) {
    std::lock_guard guard(g_sink_lock);
    g_sink = std::move(sink);
}

void Write(const Level level, const std::string_view message) {
    std::lock_guard guard(g_sink_lock);
    if (g_sink) {
        g_sink(level, message);
        return;
    }
    fprintf(stderr, "[SECTRUST] %s %.*s\n",
        LevelToString(level),
        static_cast<int>(message.size()),
        message.data());
    fflush(stderr);
}

const char* LevelToString(const Level level) noexcept {
    switch (level) {
        case Level::Trace: return "TRACE";
        case Level::Debug: return "DEBUG";
        case Level::Info: return "INFO";
        case Level::Warn: return "WARN";
        case Level::Error: return "ERROR";
        default: return "OFF";
    }
}

std::string ToHex(const std::span<const uint8_t> data) {
    static constexpr char hex_chars[] = "0123456789abcdef";
    std::string result;
    result.reserve(data.size() * 2);
    for (const auto byte : data) {
        result.push_back(hex_chars[(byte >> 4) & 0x0F]);
        result.push_back(hex_chars[byte & 0x0F]);
    }
    return result;
}

std::string ShortHex(const std::span<const uint8_t> data) {
    if (data.size() <= Constants::LOG_KEY_PREFIX_BYTES) {
        return ToHex(data);
    }
    return ToHex(data.first(Constants::LOG_KEY_PREFIX_BYTES)) + "..";
}

}
