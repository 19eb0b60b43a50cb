#include "keylight_registry.h"

#include <algorithm>
#include <utility>

#include <QLoggingCategory>

#include "keylight_config.h"
#include "keylight_discovery.h"

Q_LOGGING_CATEGORY(registryLog, "keylight.registry")

namespace keylight::control {

DeviceRegistry::DeviceRegistry(DeviceTransport *transport,
                               const SessionSettings &settings,
                               QObject *parent)
    : QObject(parent)
    , m_transport(transport)
    , m_settings(settings)
{
}

DeviceRegistry::~DeviceRegistry()
{
    clear();
}

void DeviceRegistry::attach(DiscoveryWatcher *watcher)
{
    if (m_watcher)
        disconnect(m_watcher, nullptr, this, nullptr);
    m_watcher = watcher;
    if (!watcher)
        return;

    connect(watcher, &DiscoveryWatcher::deviceAdded, this, &DeviceRegistry::handleAdded);
    connect(watcher, &DiscoveryWatcher::deviceUpdated, this, &DeviceRegistry::handleUpdated);
    connect(watcher, &DiscoveryWatcher::deviceRemoved, this, &DeviceRegistry::handleRemoved);
}

void DeviceRegistry::setLabelStore(DeviceLabelStore *labels)
{
    m_labels = labels;
}

DeviceSession *DeviceRegistry::session(const QString &identity) const
{
    return m_sessions.value(identity, nullptr);
}

QStringList DeviceRegistry::identities() const
{
    QStringList out = m_sessions.keys();
    std::sort(out.begin(), out.end());
    return out;
}

QList<DeviceSnapshot> DeviceRegistry::snapshot() const
{
    QList<DeviceSnapshot> out;
    const QStringList ids = identities();
    out.reserve(ids.size());
    for (const QString &id : ids) {
        const DeviceSession *s = m_sessions.value(id);
        DeviceSnapshot snap;
        snap.record = s->record();
        snap.hasState = s->hasState();
        snap.state = s->effectiveState();
        snap.hasPendingChange = s->hasPendingChange();
        snap.degraded = s->isDegraded();
        snap.lastError = s->lastError();
        snap.accessory = s->accessoryInfo();
        snap.label = displayName(id);
        snap.locked = isLocked(id);
        out.append(snap);
    }
    return out;
}

QString DeviceRegistry::labelKey(const QString &identity) const
{
    const DeviceSession *s = session(identity);
    if (!s)
        return {};

    const AccessoryInfo info = s->accessoryInfo();
    const QString mac = normalizeMacAddress(info.macAddress);
    if (!mac.isEmpty())
        return mac;
    if (!info.serialNumber.isEmpty())
        return info.serialNumber;

    QString host = s->record().host;
    host.replace(QLatin1Char('.'), QLatin1Char('_'));
    host.replace(QLatin1Char(':'), QLatin1Char('_'));
    return QStringLiteral("IP_") + host;
}

QString DeviceRegistry::displayName(const QString &identity) const
{
    const DeviceSession *s = session(identity);
    if (!s)
        return identity;

    QString fallback = s->accessoryInfo().displayName;
    if (fallback.isEmpty())
        fallback = identity;
    if (!m_labels)
        return fallback;
    return m_labels->label(labelKey(identity), fallback);
}

bool DeviceRegistry::isLocked(const QString &identity) const
{
    if (!m_labels || !session(identity))
        return false;
    return m_labels->isLocked(labelKey(identity));
}

bool DeviceRegistry::setLocked(const QString &identity, bool locked, QString *error)
{
    const DeviceSession *s = session(identity);
    if (!s) {
        if (error)
            *error = QStringLiteral("Unknown device %1").arg(identity);
        return false;
    }
    if (!m_labels) {
        if (error)
            *error = QStringLiteral("Locks need a label store");
        return false;
    }

    QString original = s->accessoryInfo().displayName;
    if (original.isEmpty())
        original = identity;
    if (!m_labels->setLocked(labelKey(identity), original, locked, s->record().host, error))
        return false;

    qCInfo(registryLog).noquote() << identity << (locked ? "locked" : "unlocked");
    return true;
}

bool DeviceRegistry::requestState(const QString &identity, const StatePatch &patch, QString *error)
{
    DeviceSession *s = session(identity);
    if (!s) {
        if (error)
            *error = QStringLiteral("Unknown device %1").arg(identity);
        return false;
    }
    if (!s->hasState() && !s->hasPendingChange()) {
        if (error)
            *error = QStringLiteral("State of %1 is not known yet").arg(identity);
        return false;
    }

    if (!s->requestState(patch.applyTo(s->effectiveState()), error))
        return false;

    propagate(identity, patch);
    return true;
}

void DeviceRegistry::propagate(const QString &sourceIdentity, const StatePatch &patch)
{
    if (m_syncMode == SyncMode::Off)
        return;

    StatePatch copy;
    if (m_syncMode == SyncMode::All)
        copy.on = patch.on;
    if (m_syncMode == SyncMode::All || m_syncMode == SyncMode::Brightness)
        copy.brightness = patch.brightness;
    if (m_syncMode == SyncMode::All || m_syncMode == SyncMode::Temperature)
        copy.temperatureKelvin = patch.temperatureKelvin;
    if (copy.isEmpty())
        return;

    int changed = 0;
    for (auto it = m_sessions.constBegin(); it != m_sessions.constEnd(); ++it) {
        DeviceSession *s = it.value();
        if (it.key() == sourceIdentity || isLocked(it.key()) || (!s->hasState() && !s->hasPendingChange()))
            continue;
        if (s->requestState(copy.applyTo(s->effectiveState())))
            ++changed;
    }
    qCDebug(registryLog).noquote() << "sync" << syncModeName(m_syncMode) << "from" << sourceIdentity
                                   << "reached" << changed << "device(s)";
}

int DeviceRegistry::applyToAll(const StatePatch &patch, QStringList *problems)
{
    int changed = 0;
    for (const QString &id : identities()) {
        DeviceSession *s = m_sessions.value(id);
        if (!m_ignoreLocks && isLocked(id))
            continue;
        if (!s->hasState() && !s->hasPendingChange()) {
            if (problems)
                problems->append(QStringLiteral("%1: state not known yet").arg(displayName(id)));
            continue;
        }

        QString error;
        if (!s->requestState(patch.applyTo(s->effectiveState()), &error)) {
            if (problems)
                problems->append(QStringLiteral("%1: %2").arg(displayName(id), error));
            continue;
        }
        ++changed;
    }
    return changed;
}

int DeviceRegistry::setPowerAll(bool on)
{
    StatePatch patch;
    patch.on = on;
    const int changed = applyToAll(patch);
    qCDebug(registryLog) << "power" << (on ? "on" : "off") << "for" << changed << "device(s)";
    return changed;
}

bool DeviceRegistry::masterPowerOn() const
{
    int known = 0;
    int on = 0;
    for (const DeviceSession *s : std::as_const(m_sessions)) {
        if (!s->hasState() && !s->hasPendingChange())
            continue;
        ++known;
        if (s->effectiveState().on)
            ++on;
    }

    if (m_powerSemantics == PowerSemantics::AllOn)
        return known > 0 && on == known;
    return on > 0;
}

int DeviceRegistry::toggleAll()
{
    return setPowerAll(!masterPowerOn());
}

int DeviceRegistry::syncFrom(const QString &sourceIdentity,
                             bool brightness,
                             bool temperature,
                             QString *error)
{
    const DeviceSession *source = session(sourceIdentity);
    if (!source) {
        if (error)
            *error = QStringLiteral("Unknown device %1").arg(sourceIdentity);
        return -1;
    }
    if (isLocked(sourceIdentity)) {
        if (error)
            *error = QStringLiteral("%1 is locked").arg(displayName(sourceIdentity));
        return -1;
    }
    if (!source->hasState() && !source->hasPendingChange()) {
        if (error)
            *error = QStringLiteral("State of %1 is not known yet").arg(sourceIdentity);
        return -1;
    }
    if (!brightness && !temperature) {
        if (error)
            *error = QStringLiteral("Nothing to sync");
        return -1;
    }

    const DeviceState reference = source->effectiveState();
    int changed = 0;
    for (auto it = m_sessions.constBegin(); it != m_sessions.constEnd(); ++it) {
        DeviceSession *s = it.value();
        if (it.key() == sourceIdentity || isLocked(it.key()) || (!s->hasState() && !s->hasPendingChange()))
            continue;

        DeviceState desired = s->effectiveState();
        if (brightness)
            desired.brightness = reference.brightness;
        if (temperature)
            desired.temperatureKelvin = reference.temperatureKelvin;
        if (s->requestState(desired))
            ++changed;
    }

    if (error)
        error->clear();
    qCDebug(registryLog).noquote() << "synced" << changed << "device(s) from" << sourceIdentity;
    return changed;
}

void DeviceRegistry::clear()
{
    const QHash<QString, DeviceSession *> sessions = std::exchange(m_sessions, {});
    for (DeviceSession *s : sessions) {
        const QString id = s->identity();
        retire(s);
        emit deviceGone(id);
    }
}

void DeviceRegistry::handleAdded(const DeviceRecord &record)
{
    if (record.identity.isEmpty())
        return;

    // A repeated Added is a discovery race; only Updated moves the target.
    if (m_sessions.contains(record.identity)) {
        qCDebug(registryLog).noquote() << "ignoring duplicate add for" << record.identity;
        return;
    }

    DeviceSession *s = createSession(record);
    m_sessions.insert(record.identity, s);
    qCInfo(registryLog).noquote() << "device available" << record.identity
                                  << "at" << record.host << ":" << record.port;

    s->fetchState();
    s->refreshAccessoryInfo();
    emit deviceAvailable(record.identity);
}

void DeviceRegistry::handleUpdated(const DeviceRecord &record)
{
    DeviceSession *s = session(record.identity);
    if (!s) {
        handleAdded(record);
        return;
    }
    s->rebind(record);
}

void DeviceRegistry::handleRemoved(const QString &identity)
{
    DeviceSession *s = m_sessions.take(identity);
    if (!s)
        return;

    qCInfo(registryLog).noquote() << "device gone" << identity;
    retire(s);
    emit deviceGone(identity);
}

DeviceSession *DeviceRegistry::createSession(const DeviceRecord &record)
{
    auto *s = new DeviceSession(record, m_transport, m_settings, this);
    const QString id = record.identity;

    connect(s, &DeviceSession::stateChanged, this, [this, id](const DeviceState &) {
        emit deviceStateChanged(id);
    });
    connect(s, &DeviceSession::availabilityChanged, this, [this, id](bool available) {
        emit deviceAvailabilityChanged(id, available);
    });
    connect(s, &DeviceSession::accessoryInfoChanged, this, [this, id]() {
        DeviceSession *current = session(id);
        if (!current || !m_labels)
            return;
        QString error;
        if (!m_labels->touch(labelKey(id), current->record().host, &error))
            qCWarning(registryLog).noquote() << "cannot update label record:" << error;
    });
    return s;
}

void DeviceRegistry::retire(DeviceSession *session)
{
    disconnect(session, nullptr, this, nullptr);
    session->shutdown();
    session->deleteLater();
}

} // namespace keylight::control
