#pragma once

#include <cstdint>

#include <QJsonObject>
#include <QString>

#include "keylight_session.h"
#include "keylight_types.h"

namespace keylight::control {

struct ControllerSettings {
    SessionSettings session;
    QString serviceType = QString::fromLatin1(kServiceType);
    bool enableDiscovery = true;
    bool singleInstance = true;
    bool debugLogging = false;
    PowerSemantics powerSemantics = PowerSemantics::AnyOn;
    // Master controls also drive locked lights.
    bool ignoreLocks = true;
    SyncMode syncMode = SyncMode::Off;
};

// $XDG_CONFIG_HOME/keylight-control, falling back to ~/.config/keylight-control.
QString defaultConfigDirectory();
QString defaultSettingsPath();
QString defaultLabelsPath();

ControllerSettings settingsFromJson(const QJsonObject &obj);
QJsonObject settingsToJson(const ControllerSettings &settings);

// A missing file yields defaults and succeeds. Unreadable or invalid JSON
// also yields defaults but returns false with `error` set.
bool loadSettings(const QString &path, ControllerSettings *settings, QString *error = nullptr);
bool saveSettings(const QString &path, const ControllerSettings &settings, QString *error = nullptr);

// Custom device names, keyed by hardware address so they survive IP and
// instance-name changes.
class DeviceLabelStore
{
public:
    explicit DeviceLabelStore(const QString &path = defaultLabelsPath());

    bool load(QString *error = nullptr);
    QString path() const { return m_path; }

    QString label(const QString &key, const QString &fallback) const;
    bool hasLabel(const QString &key) const;
    bool setLabel(const QString &key,
                  const QString &originalName,
                  const QString &label,
                  const QString &currentIp = QString(),
                  QString *error = nullptr);
    bool removeLabel(const QString &key, QString *error = nullptr);
    bool touch(const QString &key, const QString &currentIp, QString *error = nullptr);

    // Locked lights are left alone by sync and, unless told otherwise, by
    // master controls. The flag lives in the same entry as the label.
    bool isLocked(const QString &key) const;
    bool setLocked(const QString &key,
                   const QString &originalName,
                   bool locked,
                   const QString &currentIp = QString(),
                   QString *error = nullptr);

    // Returns the number of entries dropped, or -1 if the file could not be written.
    int cleanupOlderThan(int days, std::int64_t nowMs, QString *error = nullptr);

    bool exportTo(const QString &path, QString *error = nullptr) const;
    bool importFrom(const QString &path, bool merge, QString *error = nullptr);

    QJsonObject devices() const;

private:
    bool save(QString *error);

    QString m_path;
    QJsonObject m_data;
};

} // namespace keylight::control
