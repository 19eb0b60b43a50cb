#pragma once

#include <optional>

#include <QHash>
#include <QList>
#include <QObject>
#include <QPointer>
#include <QString>
#include <QStringList>

#include "keylight_session.h"
#include "keylight_types.h"

namespace keylight::control {

class DeviceLabelStore;
class DiscoveryWatcher;

// Fields to change on a light; unset fields keep their current value.
struct StatePatch {
    std::optional<bool> on;
    std::optional<int> brightness;
    std::optional<int> temperatureKelvin;

    bool isEmpty() const { return !on && !brightness && !temperatureKelvin; }

    DeviceState applyTo(DeviceState state) const
    {
        if (on)
            state.on = *on;
        if (brightness)
            state.brightness = *brightness;
        if (temperatureKelvin)
            state.temperatureKelvin = *temperatureKelvin;
        return state;
    }
};

struct DeviceSnapshot {
    DeviceRecord record;
    bool hasState = false;
    DeviceState state;
    bool hasPendingChange = false;
    bool degraded = false;
    QString lastError;
    AccessoryInfo accessory;
    QString label;
    bool locked = false;
};

// Owns the identity -> session mapping. Only discovery events mutate it;
// everyone else gets snapshots or a pointer to a single session.
class DeviceRegistry : public QObject
{
    Q_OBJECT
public:
    DeviceRegistry(DeviceTransport *transport,
                   const SessionSettings &settings,
                   QObject *parent = nullptr);
    ~DeviceRegistry() override;

    void attach(DiscoveryWatcher *watcher);
    void setLabelStore(DeviceLabelStore *labels);

    DeviceSession *session(const QString &identity) const;
    QStringList identities() const;
    QList<DeviceSnapshot> snapshot() const;
    int size() const { return m_sessions.size(); }

    QString labelKey(const QString &identity) const;
    QString displayName(const QString &identity) const;

    void setPowerSemantics(PowerSemantics semantics) { m_powerSemantics = semantics; }
    PowerSemantics powerSemantics() const { return m_powerSemantics; }
    void setIgnoreLocks(bool ignore) { m_ignoreLocks = ignore; }
    bool ignoresLocks() const { return m_ignoreLocks; }
    void setSyncMode(SyncMode mode) { m_syncMode = mode; }
    SyncMode syncMode() const { return m_syncMode; }

    // Lock flags are stored with the labels; without a label store nothing
    // is locked and setLocked() fails.
    bool isLocked(const QString &identity) const;
    bool setLocked(const QString &identity, bool locked, QString *error = nullptr);

    // Changes one light, then copies the fields selected by syncMode() to
    // every other unlocked light with a known state.
    bool requestState(const QString &identity, const StatePatch &patch, QString *error = nullptr);

    // Master controls. Lights without a known state are skipped, locked
    // lights too unless ignoresLocks().
    int applyToAll(const StatePatch &patch, QStringList *problems = nullptr);
    int setPowerAll(bool on);
    // AnyOn: on when at least one light is on. AllOn: only when every light is.
    bool masterPowerOn() const;
    int toggleAll();

    // One-shot copy from `sourceIdentity` to the other lights. Locked lights
    // never take part, whatever ignoresLocks() says.
    int syncFrom(const QString &sourceIdentity,
                 bool brightness,
                 bool temperature,
                 QString *error = nullptr);

    void clear();

public slots:
    void handleAdded(const keylight::control::DeviceRecord &record);
    void handleUpdated(const keylight::control::DeviceRecord &record);
    void handleRemoved(const QString &identity);

signals:
    void deviceAvailable(const QString &identity);
    void deviceGone(const QString &identity);
    void deviceStateChanged(const QString &identity);
    void deviceAvailabilityChanged(const QString &identity, bool available);

private:
    DeviceSession *createSession(const DeviceRecord &record);
    void retire(DeviceSession *session);
    void propagate(const QString &sourceIdentity, const StatePatch &patch);

    DeviceTransport *m_transport = nullptr;
    SessionSettings m_settings;
    QHash<QString, DeviceSession *> m_sessions;
    QPointer<DiscoveryWatcher> m_watcher;
    DeviceLabelStore *m_labels = nullptr;
    PowerSemantics m_powerSemantics = PowerSemantics::AnyOn;
    bool m_ignoreLocks = true;
    SyncMode m_syncMode = SyncMode::Off;
};

} // namespace keylight::control
