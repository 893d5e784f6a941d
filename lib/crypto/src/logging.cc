#include "crypto/logging.hpp"

#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace Ballot::Logging {

std::shared_ptr<spdlog::logger> get(const std::string& name)
{
    // spdlog::stderr_color_mt throws if the name is already registered, so
    // lookup and creation happen under one lock.
    static std::mutex mutex;
    std::lock_guard lock(mutex);

    if (auto existing = spdlog::get(name)) {
        return existing;
    }
    return spdlog::stderr_color_mt(name);
}

} // namespace Ballot::Logging
