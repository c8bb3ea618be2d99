#pragma once

#include <QDialog>

#include "common/models.hpp"

class QLineEdit;

namespace intervals {

// Username / API key / athlete id form. Save accepts the dialog.
class SettingsDialog : public QDialog
{
    Q_OBJECT
public:
    explicit SettingsDialog(const Credentials &initial, QWidget *parent = nullptr);

    Credentials credentials() const;

private:
    QLineEdit *m_usernameEdit = nullptr;
    QLineEdit *m_passwordEdit = nullptr;
    QLineEdit *m_athleteEdit = nullptr;
};

} // namespace intervals
