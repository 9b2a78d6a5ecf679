#pragma once

#include <QSettings>
#include "version.h"

namespace WearStitch {

inline constexpr const char* kOrganizationName = "WearStitch";
inline constexpr const char* kApplicationName = WEARSTITCH_APP_NAME;

inline QSettings getSettings()
{
    return QSettings(kOrganizationName, kApplicationName);
}

} // namespace WearStitch
