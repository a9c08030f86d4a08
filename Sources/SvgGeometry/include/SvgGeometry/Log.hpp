#ifndef SVG_GEOMETRY_LOG_HPP
#define SVG_GEOMETRY_LOG_HPP

#include <memory>

#include <spdlog/spdlog.h>

namespace svggeo {

// Shared "svggeo" logger. Created on first use with a stderr sink; the level
// is warn unless SVGGEO_LOG is set in the environment.
std::shared_ptr<spdlog::logger> Log();

// Raises the logger to debug for the lifetime of the object when enabled.
class ScopedDebugLogging {
public:
    ScopedDebugLogging(bool enabled);
    ~ScopedDebugLogging();

    ScopedDebugLogging(const ScopedDebugLogging&) = delete;
    ScopedDebugLogging& operator=(const ScopedDebugLogging&) = delete;

private:
    bool enabled_;
    spdlog::level::level_enum saved_level_;
};

} // namespace svggeo

#endif
