#include "SvgGeometry/Log.hpp"

#include <cstdlib>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace svggeo {
namespace {

constexpr const char* kLoggerName = "svggeo";

std::shared_ptr<spdlog::logger> CreateLogger() {
    auto logger = spdlog::get(kLoggerName);
    if (!logger) {
        logger = spdlog::stderr_color_mt(kLoggerName);
    }

    const char* env = std::getenv("SVGGEO_LOG");
    if (env != nullptr && env[0] != '\0') {
        logger->set_level(spdlog::level::debug);
    } else {
        logger->set_level(spdlog::level::warn);
    }
    return logger;
}

} // namespace

std::shared_ptr<spdlog::logger> Log() {
    static std::shared_ptr<spdlog::logger> logger = CreateLogger();
    return logger;
}

ScopedDebugLogging::ScopedDebugLogging(bool enabled)
    : enabled_(enabled), saved_level_(Log()->level()) {
    if (enabled_) {
        Log()->set_level(spdlog::level::debug);
    }
}

ScopedDebugLogging::~ScopedDebugLogging() {
    if (enabled_) {
        Log()->set_level(saved_level_);
    }
}

} // namespace svggeo
