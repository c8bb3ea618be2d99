#pragma once

#include <QString>

namespace intervals {

// Directory holding the executable, or the working directory before QCoreApplication exists.
QString applicationDir();

// settings.json next to the executable.
QString defaultSettingsPath();

// intervals.ico next to the executable or in ../share/intervals-tray.
// Empty when no icon file could be found.
QString appIconPath();

} // namespace intervals
