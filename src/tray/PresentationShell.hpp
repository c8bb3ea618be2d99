#pragma once

#include <QString>

#include <functional>
#include <optional>

#include "common/models.hpp"

namespace intervals {

// User intents raised by a shell; all are invoked on the UI thread.
struct ShellHandlers {
    std::function<void()> onStatsRequested;
    std::function<void()> onSettingsRequested;
    std::function<void()> onRefreshRequested;
};

// Everything the controller needs from a desktop toolkit.
class PresentationShell
{
public:
    virtual ~PresentationShell() = default;

    virtual void setHandlers(ShellHandlers handlers) = 0;
    virtual void setStatusText(const QString &text) = 0;
    virtual void showPopup(const QString &text) = 0;

    // Blocks in a modal dialog; std::nullopt when the user cancels.
    virtual std::optional<Credentials> showSettingsDialog(const Credentials &initial) = 0;
};

} // namespace intervals
