#pragma once

#include <cstdint>

#include <QHash>
#include <QList>
#include <QObject>
#include <QString>
#include <QStringList>
#include <QTimer>

#include "keylight_mdns.h"
#include "keylight_types.h"

class QUdpSocket;

namespace keylight::control {

struct DiscoveryEvent {
    enum class Kind {
        Added,
        Updated,
        Removed,
    };

    Kind kind = Kind::Added;
    DeviceRecord record;
    QString identity;
};

// Joins PTR, SRV, TXT and address records for one service type across
// packets and turns them into add/update/remove events. Holds no sockets.
class ServiceTracker
{
public:
    explicit ServiceTracker(const QString &serviceType = QString::fromLatin1(kServiceType));

    QList<DiscoveryEvent> ingest(const mdns::Message &message,
                                 std::int64_t nowMs,
                                 QStringList *malformed = nullptr);
    QList<DiscoveryEvent> expire(std::int64_t nowMs);

    // Instances still missing an SRV record, and SRV targets still missing an
    // address; both are asked for explicitly by the watcher.
    QStringList unresolvedInstances() const;
    QStringList unresolvedHosts() const;

    std::int64_t nextExpiryMs() const;
    int instanceCount() const { return m_instances.size(); }
    QString serviceType() const { return m_serviceType; }

    QString identityFromInstance(const QString &instanceName) const;

private:
    struct Instance {
        QString fullName;
        QString identity;
        std::int64_t ptrExpiresMs = 0;
        std::int64_t srvExpiresMs = 0;
        bool hasSrv = false;
        QString target;
        quint16 port = 0;
        QHash<QString, QString> txt;
        bool announced = false;
        DeviceRecord published;
    };

    struct HostAddresses {
        QString ipv4;
        std::int64_t ipv4ExpiresMs = 0;
        QString ipv6;
        std::int64_t ipv6ExpiresMs = 0;

        bool isEmpty() const { return ipv4.isEmpty() && ipv6.isEmpty(); }
    };

    bool belongsToService(const QString &canonical) const;
    Instance &ensureInstance(const QString &fullName);
    void evaluate(const QString &key, std::int64_t nowMs, QList<DiscoveryEvent> *events);
    void dropInstance(const QString &key, QList<DiscoveryEvent> *events);

    QString m_serviceType;
    QString m_serviceKey;
    QHash<QString, Instance> m_instances;
    QHash<QString, HostAddresses> m_hosts;
};

class DiscoveryWatcher : public QObject
{
    Q_OBJECT
public:
    explicit DiscoveryWatcher(const QString &serviceType = QString::fromLatin1(kServiceType),
                              QObject *parent = nullptr);
    ~DiscoveryWatcher() override;

    // Binds the mDNS socket and starts querying. A bind failure here is
    // reported as DiscoveryBindFailure; later socket trouble is retried
    // internally. A stopped watcher cannot be started again.
    bool start(QString *error = nullptr);
    void stop();

    bool isRunning() const { return m_running; }
    DeviceError lastError() const { return m_lastError; }
    const ServiceTracker &tracker() const { return m_tracker; }
    // Delay before the next follow-up query; doubles while records stay
    // unresolved and resets once everything resolves.
    int followUpDelayMs() const { return m_followUpDelayMs; }

    // Feeds one received packet through the tracker. Exposed for replaying
    // captured traffic.
    void processDatagram(const QByteArray &datagram);

signals:
    void deviceAdded(const keylight::control::DeviceRecord &record);
    void deviceUpdated(const keylight::control::DeviceRecord &record);
    void deviceRemoved(const QString &identity);

private slots:
    void onReadyRead();
    void onSocketError();
    void onQueryTimeout();
    void onFollowUpTimeout();
    void onExpiryTimeout();
    void onRebindTimeout();

protected:
    // Binds the mDNS port, joins the multicast group and hands the socket to
    // adoptSocket(). `joined` receives the number of interfaces joined.
    virtual bool bindSocket(QString *error, int *joined);
    virtual void sendDatagram(const QByteArray &datagram);
    void adoptSocket(QUdpSocket *socket);
    QUdpSocket *socket() const { return m_socket; }

private:
    void closeSocket();
    void scheduleRebind();
    void scheduleExpiry();
    void dispatch(const QList<DiscoveryEvent> &events);

    static std::int64_t nowMs();

    ServiceTracker m_tracker;
    QUdpSocket *m_socket = nullptr;
    QTimer m_queryTimer;
    QTimer m_followUpTimer;
    QTimer m_expiryTimer;
    QTimer m_rebindTimer;
    int m_queryIntervalMs = 0;
    int m_rebindDelayMs = 0;
    int m_followUpDelayMs = 0;
    bool m_running = false;
    bool m_stopped = false;
    DeviceError m_lastError = DeviceError::None;
};

} // namespace keylight::control
