#include "tray/SettingsDialog.hpp"

#include <QLabel>
#include <QLineEdit>
#include <QPushButton>
#include <QVBoxLayout>

namespace intervals {

SettingsDialog::SettingsDialog(const Credentials &initial, QWidget *parent)
    : QDialog(parent)
{
    setWindowTitle(QStringLiteral("Settings"));
    resize(300, 250);

    auto *layout = new QVBoxLayout(this);

    layout->addWidget(new QLabel(QStringLiteral("Username:"), this));
    m_usernameEdit = new QLineEdit(QString::fromStdString(initial.username), this);
    layout->addWidget(m_usernameEdit);

    layout->addWidget(new QLabel(QStringLiteral("API Key:"), this));
    m_passwordEdit = new QLineEdit(QString::fromStdString(initial.password), this);
    m_passwordEdit->setEchoMode(QLineEdit::PasswordEchoOnEdit);
    layout->addWidget(m_passwordEdit);

    layout->addWidget(new QLabel(QStringLiteral("Athlete ID:"), this));
    m_athleteEdit = new QLineEdit(QString::fromStdString(initial.athleteId), this);
    layout->addWidget(m_athleteEdit);

    layout->addStretch();

    auto *saveButton = new QPushButton(QStringLiteral("Save"), this);
    saveButton->setDefault(true);
    connect(saveButton, &QPushButton::clicked, this, &QDialog::accept);
    layout->addWidget(saveButton);
}

Credentials SettingsDialog::credentials() const
{
    Credentials result;
    result.username = m_usernameEdit->text().toStdString();
    result.password = m_passwordEdit->text().toStdString();
    result.athleteId = m_athleteEdit->text().toStdString();
    return result;
}

} // namespace intervals
