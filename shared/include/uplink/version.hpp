#pragma once

namespace uplink {

constexpr const char *VERSION = "0.4.0";

inline const char *version() {
    return VERSION;
}

} // namespace uplink
