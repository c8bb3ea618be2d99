#include "tray/QtTrayShell.hpp"

#include <QAction>
#include <QApplication>
#include <QFileInfo>
#include <QFont>
#include <QFontDatabase>
#include <QLabel>
#include <QPixmap>
#include <QVBoxLayout>
#include <QWidget>

#include <memory>
#include <utility>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"
#include "tray/SettingsDialog.hpp"

namespace intervals {

namespace {

const QString kComponent = QStringLiteral("QtTrayShell");
constexpr int kFallbackIconSize = 64;

} // namespace

QtTrayShell::QtTrayShell(const QIcon &icon, QObject *parent)
    : QObject(parent)
    , m_icon(icon)
{
    m_trayIcon.setIcon(m_icon);
    m_trayIcon.setToolTip(QStringLiteral("Intervals"));

    connect(&m_trayIcon, &QSystemTrayIcon::activated,
            this, &QtTrayShell::onTrayActivated);

    setupMenu();
    m_trayIcon.show();
}

QtTrayShell::~QtTrayShell() = default;

QIcon QtTrayShell::loadTrayIcon(const QString &iconPath)
{
    if (!iconPath.isEmpty() && QFileInfo::exists(iconPath)) {
        QIcon icon(iconPath);
        if (!icon.isNull()) {
            return icon;
        }
    }

    ILOG_WARN(kComponent,
              QStringLiteral("loadTrayIcon"),
              QStringLiteral("tray_icon_missing"),
              QStringLiteral("file_not_loaded"),
              QStringLiteral("grey_fallback"),
              logging::defaultWho(),
              QString(),
              (nlohmann::json{{"path", iconPath.toStdString()}}));
    QPixmap fallback(kFallbackIconSize, kFallbackIconSize);
    fallback.fill(Qt::gray);
    return QIcon(fallback);
}

void QtTrayShell::setupMenu()
{
    auto *statsAction = m_menu.addAction(QStringLiteral("Stats"));
    QFont boldFont = statsAction->font();
    boldFont.setBold(true);
    statsAction->setFont(boldFont);
    connect(statsAction, &QAction::triggered, this, [this]() {
        if (m_handlers.onStatsRequested) {
            m_handlers.onStatsRequested();
        }
    });

    auto *refreshAction = m_menu.addAction(QStringLiteral("Refresh Now"));
    connect(refreshAction, &QAction::triggered, this, [this]() {
        if (m_handlers.onRefreshRequested) {
            m_handlers.onRefreshRequested();
        }
    });

    auto *settingsAction = m_menu.addAction(QStringLiteral("Settings"));
    connect(settingsAction, &QAction::triggered, this, [this]() {
        if (m_handlers.onSettingsRequested) {
            m_handlers.onSettingsRequested();
        }
    });

    m_menu.addSeparator();

    auto *exitAction = m_menu.addAction(QStringLiteral("Exit"));
    connect(exitAction, &QAction::triggered, qApp, &QCoreApplication::quit);

    m_trayIcon.setContextMenu(&m_menu);
}

void QtTrayShell::setHandlers(ShellHandlers handlers)
{
    m_handlers = std::move(handlers);
}

void QtTrayShell::setStatusText(const QString &text)
{
    m_trayIcon.setToolTip(text);
}

void QtTrayShell::showPopup(const QString &text)
{
    if (m_popup) {
        m_popupLabel->setText(text);
        m_popup->show();
        m_popup->raise();
        m_popup->activateWindow();
        return;
    }

    auto window = std::make_unique<QWidget>(nullptr, Qt::Window);
    window->setWindowTitle(QStringLiteral("Intervals Stats"));
    window->setWindowIcon(m_icon);
    window->resize(230, 180);

    auto *label = new QLabel(text, window.get());
    label->setFont(QFontDatabase::systemFont(QFontDatabase::FixedFont));
    label->setAlignment(Qt::AlignLeft | Qt::AlignTop);
    label->setTextInteractionFlags(Qt::TextSelectableByMouse);

    auto *layout = new QVBoxLayout(window.get());
    layout->setContentsMargins(10, 10, 10, 10);
    layout->addWidget(label);

    m_popup = std::move(window);
    m_popupLabel = label;
    m_popup->show();
    m_popup->raise();
    m_popup->activateWindow();
}

std::optional<Credentials> QtTrayShell::showSettingsDialog(const Credentials &initial)
{
    SettingsDialog dialog(initial);
    dialog.setWindowIcon(m_icon);
    if (dialog.exec() != QDialog::Accepted) {
        return std::nullopt;
    }
    return dialog.credentials();
}

void QtTrayShell::onTrayActivated(QSystemTrayIcon::ActivationReason reason)
{
    if (reason == QSystemTrayIcon::DoubleClick) {
        ILOG_DEBUG(kComponent,
                   QStringLiteral("onTrayActivated"),
                   QStringLiteral("tray_double_click"),
                   QStringLiteral("user_action"),
                   QStringLiteral("tray"),
                   logging::defaultWho(),
                   QString(),
                   nlohmann::json::object());
        if (m_handlers.onStatsRequested) {
            m_handlers.onStatsRequested();
        }
    }
}

} // namespace intervals
