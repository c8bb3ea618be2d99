#include "common/app_paths.hpp"

#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>
#include <QStringList>

namespace intervals {

namespace {

constexpr const char *kSettingsFileName = "settings.json";
constexpr const char *kIconFileName = "intervals.ico";

} // namespace

QString applicationDir()
{
    if (QCoreApplication::instance()) {
        return QCoreApplication::applicationDirPath();
    }
    return QDir::currentPath();
}

QString defaultSettingsPath()
{
    return QDir(applicationDir()).absoluteFilePath(QString::fromLatin1(kSettingsFileName));
}

QString appIconPath()
{
    const QString appDir = applicationDir();
    const QStringList relCandidates = {
        QStringLiteral("."),
        QStringLiteral("../share/intervals-tray"),
    };

    for (const QString &relPath : relCandidates) {
        const QString candidate = QDir(appDir).absoluteFilePath(
            relPath + QDir::separator() + QString::fromLatin1(kIconFileName));
        QFileInfo info(candidate);
        if (info.exists() && info.isFile()) {
            return info.absoluteFilePath();
        }
    }
    return QString();
}

} // namespace intervals
