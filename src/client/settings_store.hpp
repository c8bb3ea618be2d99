#pragma once

#include <QString>

#include "common/models.hpp"

namespace intervals {

/**
 * SettingsStore persists the three credential fields as a small JSON object.
 *
 * Neither operation throws: load() degrades to defaults field by field and
 * save() reports failure through the log and its return value.
 */
class SettingsStore
{
public:
    explicit SettingsStore(const QString &path);

    Credentials load() const;
    bool save(const Credentials &credentials) const;

    const QString &path() const { return m_path; }

private:
    QString m_path;
};

} // namespace intervals
