#pragma once

namespace tabsync {

inline const char* appVersion() {
#ifdef TABSYNC_APP_VERSION
    return TABSYNC_APP_VERSION;
#else
    return "0.0.0";
#endif
}

} // namespace tabsync
