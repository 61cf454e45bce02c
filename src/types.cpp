#include "tabvault/types.h"

#include <chrono>
#include <stdexcept>

namespace tabvault {

Timestamp systemNowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string navigationEventEntityId(TabId tab_id, Timestamp timestamp) {
    return std::to_string(tab_id) + "_" + std::to_string(timestamp);
}

bool parseNavigationEventEntityId(const std::string& entity_id, TabId& tab_id, Timestamp& timestamp) {
    size_t sep = entity_id.rfind('_');
    if (sep == std::string::npos || sep == 0 || sep + 1 >= entity_id.size()) {
        return false;
    }
    try {
        size_t consumed = 0;
        tab_id = std::stoll(entity_id.substr(0, sep), &consumed);
        if (consumed != sep) return false;
        std::string ts_part = entity_id.substr(sep + 1);
        timestamp = std::stoll(ts_part, &consumed);
        return consumed == ts_part.size();
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
}

} // namespace tabvault
