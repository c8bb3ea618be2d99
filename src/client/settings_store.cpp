#include "client/settings_store.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace intervals {

namespace {

const QString kComponent = QStringLiteral("SettingsStore");

} // namespace

SettingsStore::SettingsStore(const QString &path)
    : m_path(path)
{
}

Credentials SettingsStore::load() const
{
    QFile file(m_path);
    if (!file.exists()) {
        ILOG_INFO(kComponent,
                  QStringLiteral("load"),
                  QStringLiteral("settings_defaults"),
                  QStringLiteral("file_missing"),
                  QStringLiteral("builtin_defaults"),
                  logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"path", m_path.toStdString()}}));
        return Credentials{};
    }

    if (!file.open(QIODevice::ReadOnly)) {
        ILOG_WARN(kComponent,
                  QStringLiteral("load"),
                  QStringLiteral("settings_load_failed"),
                  QStringLiteral("open_failed"),
                  QStringLiteral("builtin_defaults"),
                  logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"path", m_path.toStdString()},
                                  {"error", file.errorString().toStdString()}}));
        return Credentials{};
    }

    const QByteArray raw = file.readAll();
    const nlohmann::json doc = nlohmann::json::parse(raw.constData(),
                                                     raw.constData() + raw.size(),
                                                     nullptr,
                                                     false);
    if (doc.is_discarded() || !doc.is_object()) {
        ILOG_WARN(kComponent,
                  QStringLiteral("load"),
                  QStringLiteral("settings_load_failed"),
                  doc.is_discarded() ? QStringLiteral("invalid_json")
                                     : QStringLiteral("not_an_object"),
                  QStringLiteral("builtin_defaults"),
                  logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"path", m_path.toStdString()}}));
        return Credentials{};
    }

    return doc.get<Credentials>();
}

bool SettingsStore::save(const Credentials &credentials) const
{
    const QFileInfo info(m_path);
    QDir().mkpath(info.absolutePath());

    QSaveFile file(m_path);
    if (!file.open(QIODevice::WriteOnly)) {
        ILOG_ERROR(kComponent,
                   QStringLiteral("save"),
                   QStringLiteral("settings_save_failed"),
                   QStringLiteral("open_failed"),
                   QStringLiteral("qsavefile"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"path", m_path.toStdString()},
                                   {"error", file.errorString().toStdString()}}));
        return false;
    }

    const std::string payload = nlohmann::json(credentials).dump(
        -1, ' ', false, nlohmann::json::error_handler_t::replace);
    const QByteArray bytes(payload.data(), static_cast<int>(payload.size()));
    if (file.write(bytes) != bytes.size() || !file.commit()) {
        ILOG_ERROR(kComponent,
                   QStringLiteral("save"),
                   QStringLiteral("settings_save_failed"),
                   QStringLiteral("write_failed"),
                   QStringLiteral("qsavefile"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"path", m_path.toStdString()},
                                   {"error", file.errorString().toStdString()}}));
        return false;
    }

    ILOG_INFO(kComponent,
              QStringLiteral("save"),
              QStringLiteral("settings_saved"),
              QStringLiteral("user_action"),
              QStringLiteral("qsavefile"),
              logging::defaultWho(),
              QString(),
              (nlohmann::json{{"path", m_path.toStdString()}}));
    return true;
}

} // namespace intervals
