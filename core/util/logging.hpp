#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace ember {
namespace log {

// ─── Logging Channels ──────────────────────────────────────────
// One spdlog logger per subsystem, created on first use and shared
// through the spdlog registry. All channels write to stderr.

enum class Channel {
    Search,
    Generator,
    Cache
};

std::shared_ptr<spdlog::logger> get(Channel channel);

/// Set the level on every channel (existing and future).
void setLevel(spdlog::level::level_enum level);

std::string channelName(Channel channel);

} // namespace log
} // namespace ember

#define EMBER_LOG_DEBUG(channel, ...) \
    ::ember::log::get(::ember::log::Channel::channel)->debug(__VA_ARGS__)
#define EMBER_LOG_INFO(channel, ...) \
    ::ember::log::get(::ember::log::Channel::channel)->info(__VA_ARGS__)
#define EMBER_LOG_WARN(channel, ...) \
    ::ember::log::get(::ember::log::Channel::channel)->warn(__VA_ARGS__)
#define EMBER_LOG_ERROR(channel, ...) \
    ::ember::log::get(::ember::log::Channel::channel)->error(__VA_ARGS__)
