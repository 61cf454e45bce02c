#include "tabvault/debug_utils.h"

#include <algorithm>

namespace tabvault {
namespace log {

Level levelFromString(const std::string& name) {
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lowered == "trace") return Level::TRACE;
    if (lowered == "debug") return Level::DEBUG;
    if (lowered == "warn" || lowered == "warning") return Level::WARN;
    if (lowered == "error") return Level::ERROR;
    if (lowered == "off" || lowered == "none") return Level::OFF;
    return Level::INFO;
}

} // namespace log
} // namespace tabvault
