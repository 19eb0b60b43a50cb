#include "keylight_discovery.h"

#include <algorithm>
#include <limits>
#include <utility>

#include <QDateTime>
#include <QHostAddress>
#include <QLoggingCategory>
#include <QNetworkDatagram>
#include <QNetworkInterface>
#include <QSet>
#include <QUdpSocket>

Q_LOGGING_CATEGORY(discoveryLog, "keylight.discovery")

namespace keylight::control {

namespace {

constexpr int kInitialQueryIntervalMs = 1000;
constexpr int kMaxQueryIntervalMs = 60000;
constexpr int kInitialRebindDelayMs = 1000;
constexpr int kMaxRebindDelayMs = 30000;
constexpr int kFollowUpDelayMs = 250;
constexpr int kMaxFollowUpDelayMs = 60000;

std::int64_t expiresAt(std::int64_t nowMs, quint32 ttlSeconds)
{
    return nowMs + static_cast<std::int64_t>(ttlSeconds) * 1000;
}

std::int64_t earliest(std::int64_t a, std::int64_t b)
{
    if (a <= 0)
        return b;
    if (b <= 0)
        return a;
    return std::min(a, b);
}

} // namespace

ServiceTracker::ServiceTracker(const QString &serviceType)
    : m_serviceType(serviceType)
    , m_serviceKey(mdns::canonicalName(serviceType))
{
}

QString ServiceTracker::identityFromInstance(const QString &instanceName) const
{
    QString name = instanceName.trimmed();
    while (name.endsWith(QLatin1Char('.')) && !name.endsWith(QStringLiteral("\\.")))
        name.chop(1);

    const QString suffix = QLatin1Char('.') + m_serviceKey;
    if (name.toLower().endsWith(suffix))
        name.chop(suffix.size());
    name.replace(QStringLiteral("\\."), QStringLiteral("."));
    return name;
}

bool ServiceTracker::belongsToService(const QString &canonical) const
{
    return canonical.size() > m_serviceKey.size() + 1
        && canonical.endsWith(QLatin1Char('.') + m_serviceKey);
}

ServiceTracker::Instance &ServiceTracker::ensureInstance(const QString &fullName)
{
    const QString key = mdns::canonicalName(fullName);
    auto it = m_instances.find(key);
    if (it == m_instances.end()) {
        Instance instance;
        instance.fullName = fullName.trimmed();
        instance.identity = identityFromInstance(fullName);
        it = m_instances.insert(key, instance);
    }
    return it.value();
}

QList<DiscoveryEvent> ServiceTracker::ingest(const mdns::Message &message,
                                             std::int64_t nowMs,
                                             QStringList *malformed)
{
    QList<DiscoveryEvent> events;
    if (!message.isResponse())
        return events;

    const QList<mdns::ResourceRecord> records = message.answers + message.additionals;

    QStringList touched;
    QSet<QString> goodbyes;
    auto touch = [&touched](const QString &key) {
        if (!touched.contains(key))
            touched.append(key);
    };
    auto reject = [malformed](const QString &reason) {
        if (malformed)
            malformed->append(reason);
    };

    // Addresses first so SRV targets in the same packet resolve immediately.
    for (const mdns::ResourceRecord &record : records) {
        if (record.type != mdns::RecordType::A && record.type != mdns::RecordType::AAAA)
            continue;
        if (record.address.isNull()) {
            reject(QStringLiteral("Address record for %1 without address").arg(record.name));
            continue;
        }

        const QString hostKey = mdns::canonicalName(record.name);
        HostAddresses &host = m_hosts[hostKey];
        if (record.type == mdns::RecordType::A) {
            host.ipv4 = record.ttl == 0 ? QString() : record.address.toString();
            host.ipv4ExpiresMs = record.ttl == 0 ? 0 : expiresAt(nowMs, record.ttl);
        } else {
            host.ipv6 = record.ttl == 0 ? QString() : record.address.toString();
            host.ipv6ExpiresMs = record.ttl == 0 ? 0 : expiresAt(nowMs, record.ttl);
        }
        if (host.isEmpty())
            m_hosts.remove(hostKey);

        for (auto it = m_instances.cbegin(); it != m_instances.cend(); ++it) {
            if (it->hasSrv && mdns::canonicalName(it->target) == hostKey)
                touch(it.key());
        }
    }

    for (const mdns::ResourceRecord &record : records) {
        if (record.type != mdns::RecordType::PTR)
            continue;
        if (mdns::canonicalName(record.name) != m_serviceKey)
            continue;

        const QString key = mdns::canonicalName(record.target);
        if (!belongsToService(key)) {
            reject(QStringLiteral("PTR target %1 outside %2").arg(record.target, m_serviceType));
            continue;
        }
        touch(key);
        if (record.ttl == 0) {
            goodbyes.insert(key);
            continue;
        }
        ensureInstance(record.target).ptrExpiresMs = expiresAt(nowMs, record.ttl);
    }

    for (const mdns::ResourceRecord &record : records) {
        if (record.type != mdns::RecordType::SRV)
            continue;
        const QString key = mdns::canonicalName(record.name);
        if (!belongsToService(key))
            continue;

        if (record.ttl == 0) {
            touch(key);
            goodbyes.insert(key);
            continue;
        }
        if (record.target.trimmed().isEmpty() || record.port == 0) {
            reject(QStringLiteral("SRV for %1 has no target or port").arg(record.name));
            continue;
        }

        Instance &instance = ensureInstance(record.name);
        instance.hasSrv = true;
        instance.target = record.target;
        instance.port = record.port;
        instance.srvExpiresMs = expiresAt(nowMs, record.ttl);
        touch(key);
    }

    for (const mdns::ResourceRecord &record : records) {
        if (record.type != mdns::RecordType::TXT || record.ttl == 0)
            continue;
        auto it = m_instances.find(mdns::canonicalName(record.name));
        if (it != m_instances.end())
            it->txt = record.txt;
    }

    for (const QString &key : std::as_const(touched)) {
        if (goodbyes.contains(key)) {
            dropInstance(key, &events);
            continue;
        }
        if (m_instances.contains(key))
            evaluate(key, nowMs, &events);
    }

    return events;
}

void ServiceTracker::evaluate(const QString &key, std::int64_t nowMs, QList<DiscoveryEvent> *events)
{
    Instance &instance = m_instances[key];
    if (!instance.hasSrv)
        return;

    const auto hostIt = m_hosts.constFind(mdns::canonicalName(instance.target));
    if (hostIt == m_hosts.cend() || hostIt->isEmpty())
        return;

    DeviceRecord record;
    record.identity = instance.identity;
    record.host = hostIt->ipv4.isEmpty() ? hostIt->ipv6 : hostIt->ipv4;
    record.hostName = instance.target;
    record.port = instance.port;
    record.lastSeenMs = nowMs;
    record.txt = instance.txt;

    if (!instance.announced) {
        instance.announced = true;
        instance.published = record;
        DiscoveryEvent event;
        event.kind = DiscoveryEvent::Kind::Added;
        event.record = record;
        event.identity = record.identity;
        events->append(event);
        return;
    }

    if (!instance.published.sameEndpoint(record)) {
        instance.published = record;
        DiscoveryEvent event;
        event.kind = DiscoveryEvent::Kind::Updated;
        event.record = record;
        event.identity = record.identity;
        events->append(event);
        return;
    }

    instance.published.lastSeenMs = nowMs;
    instance.published.txt = instance.txt;
}

void ServiceTracker::dropInstance(const QString &key, QList<DiscoveryEvent> *events)
{
    auto it = m_instances.find(key);
    if (it == m_instances.end())
        return;

    if (it->announced) {
        DiscoveryEvent event;
        event.kind = DiscoveryEvent::Kind::Removed;
        event.identity = it->identity;
        event.record = it->published;
        events->append(event);
    }
    m_instances.erase(it);
}

QList<DiscoveryEvent> ServiceTracker::expire(std::int64_t nowMs)
{
    QList<DiscoveryEvent> events;

    for (auto it = m_hosts.begin(); it != m_hosts.end();) {
        if (it->ipv4ExpiresMs > 0 && it->ipv4ExpiresMs <= nowMs) {
            it->ipv4.clear();
            it->ipv4ExpiresMs = 0;
        }
        if (it->ipv6ExpiresMs > 0 && it->ipv6ExpiresMs <= nowMs) {
            it->ipv6.clear();
            it->ipv6ExpiresMs = 0;
        }
        if (it->isEmpty())
            it = m_hosts.erase(it);
        else
            ++it;
    }

    QStringList expired;
    for (auto it = m_instances.cbegin(); it != m_instances.cend(); ++it) {
        const std::int64_t deadline = earliest(it->ptrExpiresMs, it->hasSrv ? it->srvExpiresMs : 0);
        if (deadline > 0 && deadline <= nowMs)
            expired.append(it.key());
    }
    for (const QString &key : std::as_const(expired))
        dropInstance(key, &events);

    return events;
}

QStringList ServiceTracker::unresolvedInstances() const
{
    QStringList out;
    for (const Instance &instance : m_instances) {
        if (!instance.hasSrv)
            out.append(instance.fullName);
    }
    return out;
}

QStringList ServiceTracker::unresolvedHosts() const
{
    QStringList out;
    for (const Instance &instance : m_instances) {
        if (!instance.hasSrv)
            continue;
        const auto hostIt = m_hosts.constFind(mdns::canonicalName(instance.target));
        if ((hostIt == m_hosts.cend() || hostIt->isEmpty()) && !out.contains(instance.target))
            out.append(instance.target);
    }
    return out;
}

std::int64_t ServiceTracker::nextExpiryMs() const
{
    std::int64_t next = 0;
    for (const Instance &instance : m_instances) {
        next = earliest(next, instance.ptrExpiresMs);
        if (instance.hasSrv)
            next = earliest(next, instance.srvExpiresMs);
    }
    for (const HostAddresses &host : m_hosts) {
        next = earliest(next, host.ipv4ExpiresMs);
        next = earliest(next, host.ipv6ExpiresMs);
    }
    return next;
}

DiscoveryWatcher::DiscoveryWatcher(const QString &serviceType, QObject *parent)
    : QObject(parent)
    , m_tracker(serviceType)
    , m_followUpDelayMs(kFollowUpDelayMs)
{
    qRegisterMetaType<keylight::control::DeviceRecord>("keylight::control::DeviceRecord");

    m_queryTimer.setSingleShot(true);
    connect(&m_queryTimer, &QTimer::timeout, this, &DiscoveryWatcher::onQueryTimeout);

    m_followUpTimer.setSingleShot(true);
    connect(&m_followUpTimer, &QTimer::timeout, this, &DiscoveryWatcher::onFollowUpTimeout);

    m_expiryTimer.setSingleShot(true);
    connect(&m_expiryTimer, &QTimer::timeout, this, &DiscoveryWatcher::onExpiryTimeout);

    m_rebindTimer.setSingleShot(true);
    connect(&m_rebindTimer, &QTimer::timeout, this, &DiscoveryWatcher::onRebindTimeout);
}

DiscoveryWatcher::~DiscoveryWatcher()
{
    stop();
}

bool DiscoveryWatcher::start(QString *error)
{
    if (m_stopped) {
        if (error)
            *error = QStringLiteral("Discovery watcher was stopped and cannot be restarted");
        return false;
    }
    if (m_running)
        return true;

    QString bindError;
    int joined = 0;
    if (!bindSocket(&bindError, &joined)) {
        m_lastError = DeviceError::DiscoveryBindFailure;
        qCCritical(discoveryLog).noquote() << "cannot bind mDNS socket:" << bindError;
        if (error)
            *error = QStringLiteral("%1: %2").arg(deviceErrorName(m_lastError), bindError);
        return false;
    }

    m_running = true;
    m_lastError = DeviceError::None;
    m_rebindDelayMs = 0;
    m_queryIntervalMs = kInitialQueryIntervalMs;
    m_queryTimer.start(0);
    if (joined == 0)
        scheduleRebind();

    qCInfo(discoveryLog).noquote() << "browsing for" << m_tracker.serviceType()
                                   << "on" << joined << "interface(s)";
    if (error)
        error->clear();
    return true;
}

void DiscoveryWatcher::stop()
{
    if (m_stopped)
        return;

    m_stopped = true;
    m_running = false;
    m_queryTimer.stop();
    m_followUpTimer.stop();
    m_expiryTimer.stop();
    m_rebindTimer.stop();
    closeSocket();
    qCDebug(discoveryLog) << "discovery stopped";
}

bool DiscoveryWatcher::bindSocket(QString *error, int *joined)
{
    auto *socket = new QUdpSocket(this);
    if (!socket->bind(QHostAddress(QHostAddress::AnyIPv4),
                      mdns::kPort,
                      QAbstractSocket::ShareAddress | QAbstractSocket::ReuseAddressHint)) {
        *error = socket->errorString();
        delete socket;
        return false;
    }

    socket->setSocketOption(QAbstractSocket::MulticastTtlOption, 255);

    const QHostAddress group(QString::fromLatin1(mdns::kIpv4Group));
    int count = 0;
    const QList<QNetworkInterface> interfaces = QNetworkInterface::allInterfaces();
    for (const QNetworkInterface &iface : interfaces) {
        const QNetworkInterface::InterfaceFlags flags = iface.flags();
        if (!flags.testFlag(QNetworkInterface::IsUp)
            || !flags.testFlag(QNetworkInterface::IsRunning)
            || !flags.testFlag(QNetworkInterface::CanMulticast)
            || flags.testFlag(QNetworkInterface::IsLoopBack)) {
            continue;
        }
        if (socket->joinMulticastGroup(group, iface))
            ++count;
        else
            qCDebug(discoveryLog) << "join failed on" << iface.name() << socket->errorString();
    }
    if (count == 0 && socket->joinMulticastGroup(group))
        count = 1;

    adoptSocket(socket);
    *joined = count;
    return true;
}

void DiscoveryWatcher::adoptSocket(QUdpSocket *socket)
{
    connect(socket, &QUdpSocket::readyRead, this, &DiscoveryWatcher::onReadyRead);
    connect(socket, &QAbstractSocket::errorOccurred, this, &DiscoveryWatcher::onSocketError);
    m_socket = socket;
}

void DiscoveryWatcher::closeSocket()
{
    if (!m_socket)
        return;

    disconnect(m_socket, nullptr, this, nullptr);
    m_socket->close();
    m_socket->deleteLater();
    m_socket = nullptr;
}

void DiscoveryWatcher::scheduleRebind()
{
    if (!m_running || m_rebindTimer.isActive())
        return;

    const int delay = m_rebindDelayMs > 0 ? m_rebindDelayMs : kInitialRebindDelayMs;
    m_rebindDelayMs = std::min(delay * 2, kMaxRebindDelayMs);
    qCInfo(discoveryLog) << "re-binding mDNS socket in" << delay << "ms";
    m_rebindTimer.start(delay);
}

void DiscoveryWatcher::onRebindTimeout()
{
    if (!m_running)
        return;

    closeSocket();

    QString error;
    int joined = 0;
    if (!bindSocket(&error, &joined)) {
        qCWarning(discoveryLog).noquote() << "mDNS re-bind failed:" << error;
        scheduleRebind();
        return;
    }
    if (joined == 0) {
        qCWarning(discoveryLog) << "no multicast-capable interface is up";
        scheduleRebind();
    } else {
        m_rebindDelayMs = 0;
    }

    m_queryIntervalMs = kInitialQueryIntervalMs;
    m_followUpDelayMs = kFollowUpDelayMs;
    m_queryTimer.start(0);
}

void DiscoveryWatcher::onSocketError()
{
    if (!m_running || !m_socket)
        return;

    qCWarning(discoveryLog).noquote() << "mDNS socket error:" << m_socket->errorString();
    closeSocket();
    scheduleRebind();
}

void DiscoveryWatcher::onReadyRead()
{
    while (m_socket && m_socket->hasPendingDatagrams()) {
        const QNetworkDatagram datagram = m_socket->receiveDatagram();
        if (!datagram.isValid())
            break;
        processDatagram(datagram.data());
    }
}

void DiscoveryWatcher::processDatagram(const QByteArray &datagram)
{
    mdns::Message message;
    QString error;
    if (!mdns::parseMessage(datagram, &message, &error)) {
        qCWarning(discoveryLog).noquote() << deviceErrorName(DeviceError::MalformedAnnouncement)
                                          << "packet skipped:" << error;
        return;
    }

    QStringList malformed;
    const QList<DiscoveryEvent> events = m_tracker.ingest(message, nowMs(), &malformed);
    for (const QString &reason : std::as_const(malformed)) {
        qCWarning(discoveryLog).noquote() << deviceErrorName(DeviceError::MalformedAnnouncement)
                                          << "record skipped:" << reason;
    }

    dispatch(events);

    const bool unresolved = !m_tracker.unresolvedInstances().isEmpty() || !m_tracker.unresolvedHosts().isEmpty();
    if (!unresolved) {
        m_followUpTimer.stop();
        m_followUpDelayMs = kFollowUpDelayMs;
    } else if (m_running && !m_followUpTimer.isActive()) {
        const int delay = m_followUpDelayMs;
        m_followUpDelayMs = std::min(delay * 2, kMaxFollowUpDelayMs);
        m_followUpTimer.start(delay);
    }
    scheduleExpiry();
}

void DiscoveryWatcher::onQueryTimeout()
{
    if (!m_running)
        return;

    mdns::Question question;
    question.name = m_tracker.serviceType();
    question.type = mdns::RecordType::PTR;
    sendDatagram(mdns::buildQuery({ question }));

    const int next = m_queryIntervalMs > 0 ? m_queryIntervalMs : kInitialQueryIntervalMs;
    m_queryTimer.start(next);
    m_queryIntervalMs = std::min(next * 2, kMaxQueryIntervalMs);
}

void DiscoveryWatcher::onFollowUpTimeout()
{
    if (!m_running)
        return;

    QList<mdns::Question> questions;
    const QStringList instances = m_tracker.unresolvedInstances();
    for (const QString &instance : instances) {
        mdns::Question srv;
        srv.name = instance;
        srv.type = mdns::RecordType::SRV;
        questions.append(srv);

        mdns::Question txt;
        txt.name = instance;
        txt.type = mdns::RecordType::TXT;
        questions.append(txt);
    }
    const QStringList hosts = m_tracker.unresolvedHosts();
    for (const QString &host : hosts) {
        mdns::Question a;
        a.name = host;
        a.type = mdns::RecordType::A;
        questions.append(a);
    }

    if (questions.isEmpty())
        return;

    qCDebug(discoveryLog) << "follow-up query for" << instances.size() << "instance(s) and"
                          << hosts.size() << "host(s)";
    sendDatagram(mdns::buildQuery(questions));
}

void DiscoveryWatcher::sendDatagram(const QByteArray &datagram)
{
    if (!m_socket)
        return;

    const qint64 written = m_socket->writeDatagram(datagram,
                                                   QHostAddress(QString::fromLatin1(mdns::kIpv4Group)),
                                                   mdns::kPort);
    if (written < 0)
        qCDebug(discoveryLog).noquote() << "mDNS query not sent:" << m_socket->errorString();
}

void DiscoveryWatcher::scheduleExpiry()
{
    const std::int64_t next = m_tracker.nextExpiryMs();
    if (next <= 0) {
        m_expiryTimer.stop();
        return;
    }

    const std::int64_t delay = std::clamp<std::int64_t>(next - nowMs(),
                                                        0,
                                                        std::numeric_limits<int>::max());
    m_expiryTimer.start(static_cast<int>(delay));
}

void DiscoveryWatcher::onExpiryTimeout()
{
    dispatch(m_tracker.expire(nowMs()));
    scheduleExpiry();
}

void DiscoveryWatcher::dispatch(const QList<DiscoveryEvent> &events)
{
    for (const DiscoveryEvent &event : events) {
        switch (event.kind) {
        case DiscoveryEvent::Kind::Added:
            qCInfo(discoveryLog).noquote() << "found" << event.identity
                                           << "at" << event.record.host << ":" << event.record.port;
            emit deviceAdded(event.record);
            break;
        case DiscoveryEvent::Kind::Updated:
            qCInfo(discoveryLog).noquote() << "moved" << event.identity
                                           << "to" << event.record.host << ":" << event.record.port;
            emit deviceUpdated(event.record);
            break;
        case DiscoveryEvent::Kind::Removed:
            qCInfo(discoveryLog).noquote() << "lost" << event.identity;
            emit deviceRemoved(event.identity);
            break;
        }
    }
}

std::int64_t DiscoveryWatcher::nowMs()
{
    return QDateTime::currentMSecsSinceEpoch();
}

} // namespace keylight::control
