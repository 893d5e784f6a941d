#pragma once

#include <memory>
#include <string>
#include <string_view>

#include <spdlog/logger.h>

namespace Ballot::Logging {

// Named logger shared by every component with the same name. Created on first
// use with a colored stderr sink, leaving stdout to tool output; later
// spdlog::set_level calls apply to it.
std::shared_ptr<spdlog::logger> get(const std::string& name);

// Commitments and roots are only ever logged by prefix.
inline std::string_view abbrev(std::string_view hex)
{
    constexpr std::size_t kShown = 12;
    return hex.substr(0, kShown);
}

} // namespace Ballot::Logging
