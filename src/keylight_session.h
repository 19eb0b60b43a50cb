#pragma once

#include <functional>
#include <optional>

#include <QList>
#include <QObject>
#include <QString>
#include <QTimer>

#include "keylight_http.h"
#include "keylight_transport.h"
#include "keylight_types.h"

namespace keylight::control {

struct SessionSettings {
    int flushIntervalMs = 150;
    int requestTimeoutMs = 2000;
    // 0 disables periodic reconciliation while the device is healthy.
    int reconcileIntervalMs = 10000;
    int degradedRetryMs = 2000;
};

struct FetchResult {
    bool ok = false;
    DeviceError error = DeviceError::None;
    QString message;
    DeviceState state;
};

// Control channel for one device. Requested states are coalesced into a
// single pending change that a flush timer sends at most once per interval.
// After a failed call the session is degraded: requests are still buffered
// but nothing is written until a read succeeds again.
class DeviceSession : public QObject
{
    Q_OBJECT
public:
    using FetchCallback = std::function<void(const FetchResult &)>;

    DeviceSession(const DeviceRecord &record,
                  DeviceTransport *transport,
                  const SessionSettings &settings,
                  QObject *parent = nullptr);
    ~DeviceSession() override;

    QString identity() const { return m_record.identity; }
    DeviceRecord record() const { return m_record; }
    ConnectionSettings target() const;
    SessionSettings settings() const { return m_settings; }

    bool requestState(const DeviceState &desired, QString *error = nullptr);
    void fetchState(FetchCallback done = {});
    void refreshAccessoryInfo();
    void rebind(const DeviceRecord &record);
    void shutdown();

    bool hasState() const { return m_hasState; }
    DeviceState state() const { return m_state; }
    bool hasPendingChange() const { return m_pending.has_value(); }
    DeviceState pendingChange() const { return m_pending.value_or(m_state); }
    DeviceState effectiveState() const;

    bool isDegraded() const { return m_degraded; }
    bool isClosed() const { return m_closed; }
    QString lastError() const { return m_lastError; }
    bool isWriteInFlight() const { return m_writeCallId != 0; }
    bool isFetchInFlight() const { return m_fetchCallId != 0; }
    AccessoryInfo accessoryInfo() const { return m_accessory; }

signals:
    void stateChanged(const keylight::control::DeviceState &state);
    void availabilityChanged(bool available);
    void accessoryInfoChanged();

private slots:
    void flush();
    void onReconcileTimeout();

private:
    void armFlush();
    void onWriteFinished(const DeviceState &payload, const TransportResult &result);
    void onFetchFinished(const TransportResult &result);
    void markDegraded(const QString &reason);
    void clearDegraded();
    void scheduleReconcile();

    DeviceRecord m_record;
    DeviceTransport *m_transport = nullptr;
    SessionSettings m_settings;

    QTimer m_flushTimer;
    QTimer m_reconcileTimer;

    std::optional<DeviceState> m_pending;
    bool m_hasState = false;
    DeviceState m_state;
    AccessoryInfo m_accessory;

    bool m_degraded = false;
    bool m_closed = false;
    QString m_lastError;
    int m_retryDelayMs = 0;

    quint64 m_writeCallId = 0;
    quint64 m_fetchCallId = 0;
    // Writes issued so far, and the count seen when the current read started.
    quint64 m_writeSeq = 0;
    quint64 m_fetchWriteSeq = 0;
    quint64 m_infoCallId = 0;
    QList<FetchCallback> m_fetchWaiters;
};

} // namespace keylight::control
