#include "util/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <atomic>
#include <mutex>

namespace ember {
namespace log {

namespace {

std::atomic<spdlog::level::level_enum> g_level{spdlog::level::info};
std::mutex g_create_mutex;

} // namespace

std::string channelName(Channel channel) {
    switch (channel) {
        case Channel::Search:    return "ember.search";
        case Channel::Generator: return "ember.generator";
        case Channel::Cache:     return "ember.cache";
    }
    return "ember";
}

std::shared_ptr<spdlog::logger> get(Channel channel) {
    const std::string name = channelName(channel);
    if (auto existing = spdlog::get(name)) {
        return existing;
    }

    std::lock_guard<std::mutex> lock(g_create_mutex);
    if (auto existing = spdlog::get(name)) {
        return existing;
    }
    auto logger = spdlog::stderr_color_mt(name);
    logger->set_level(g_level.load());
    logger->set_pattern("[%H:%M:%S.%e] [%n] [%^%l%$] %v");
    return logger;
}

void setLevel(spdlog::level::level_enum level) {
    g_level.store(level);
    for (Channel c : {Channel::Search, Channel::Generator, Channel::Cache}) {
        get(c)->set_level(level);
    }
}

} // namespace log
} // namespace ember
