#pragma once

#include <QIcon>
#include <QMenu>
#include <QObject>
#include <QSystemTrayIcon>

#include <memory>

#include "tray/PresentationShell.hpp"

class QLabel;
class QWidget;

namespace intervals {

// Qt Widgets adapter: tray icon, context menu, stats popup and settings dialog.
class QtTrayShell : public QObject, public PresentationShell
{
    Q_OBJECT
public:
    explicit QtTrayShell(const QIcon &icon, QObject *parent = nullptr);
    ~QtTrayShell() override;

    void setHandlers(ShellHandlers handlers) override;
    void setStatusText(const QString &text) override;
    void showPopup(const QString &text) override;
    std::optional<Credentials> showSettingsDialog(const Credentials &initial) override;

    // Stats popup, or null before the first showPopup().
    QWidget *popupWindow() const { return m_popup.get(); }

    // Loads the icon file, or a plain grey square when it is missing.
    static QIcon loadTrayIcon(const QString &iconPath);

private slots:
    void onTrayActivated(QSystemTrayIcon::ActivationReason reason);

private:
    void setupMenu();

    QIcon m_icon;
    QSystemTrayIcon m_trayIcon;
    QMenu m_menu;
    ShellHandlers m_handlers;
    // Created on first use and kept for reuse; closing only hides it.
    std::unique_ptr<QWidget> m_popup;
    QLabel *m_popupLabel = nullptr;
};

} // namespace intervals
