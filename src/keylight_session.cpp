#include "keylight_session.h"

#include <algorithm>
#include <utility>

#include <QLoggingCategory>
#include <QPointer>

Q_LOGGING_CATEGORY(sessionLog, "keylight.session")

namespace keylight::control {

namespace {

constexpr int kMaxRetryDelayMs = 30000;

} // namespace

DeviceSession::DeviceSession(const DeviceRecord &record,
                             DeviceTransport *transport,
                             const SessionSettings &settings,
                             QObject *parent)
    : QObject(parent)
    , m_record(record)
    , m_transport(transport)
    , m_settings(settings)
{
    qRegisterMetaType<keylight::control::DeviceState>("keylight::control::DeviceState");

    m_flushTimer.setSingleShot(true);
    connect(&m_flushTimer, &QTimer::timeout, this, &DeviceSession::flush);

    m_reconcileTimer.setSingleShot(true);
    connect(&m_reconcileTimer, &QTimer::timeout, this, &DeviceSession::onReconcileTimeout);

    scheduleReconcile();
}

DeviceSession::~DeviceSession()
{
    shutdown();
}

ConnectionSettings DeviceSession::target() const
{
    ConnectionSettings settings;
    settings.host = m_record.host;
    settings.port = m_record.port;
    return settings;
}

DeviceState DeviceSession::effectiveState() const
{
    if (m_pending)
        return *m_pending;
    return m_state;
}

bool DeviceSession::requestState(const DeviceState &desired, QString *error)
{
    if (m_closed) {
        if (error)
            *error = QStringLiteral("Session for %1 is closed").arg(m_record.identity);
        return false;
    }

    QString reason;
    if (!validateState(desired, &reason)) {
        qCDebug(sessionLog).noquote() << m_record.identity << "rejected state:" << reason;
        if (error)
            *error = QStringLiteral("%1: %2").arg(deviceErrorName(DeviceError::InvalidStateValue), reason);
        return false;
    }

    m_pending = desired;
    armFlush();
    if (error)
        error->clear();
    return true;
}

void DeviceSession::armFlush()
{
    if (m_closed || m_degraded || !m_pending || m_flushTimer.isActive())
        return;
    m_flushTimer.start(m_settings.flushIntervalMs);
}

void DeviceSession::flush()
{
    if (m_closed || m_degraded || !m_pending || !m_transport)
        return;

    // One write in flight per device; try again next interval.
    if (m_writeCallId != 0) {
        m_flushTimer.start(m_settings.flushIntervalMs);
        return;
    }

    const DeviceState payload = *m_pending;
    m_pending.reset();
    ++m_writeSeq;

    QPointer<DeviceSession> self(this);
    QString error;
    const quint64 callId = m_transport->writeState(
        target(),
        payload,
        m_settings.requestTimeoutMs,
        [self, payload](const TransportResult &result) {
            if (self)
                self->onWriteFinished(payload, result);
        },
        &error);

    if (callId == 0) {
        TransportResult failed;
        failed.error = DeviceError::DeviceUnreachable;
        failed.message = error;
        onWriteFinished(payload, failed);
        return;
    }

    m_writeCallId = callId;
    qCDebug(sessionLog).noquote() << m_record.identity << "flush on=" << payload.on
                                  << "brightness=" << payload.brightness
                                  << "kelvin=" << payload.temperatureKelvin;
}

void DeviceSession::onWriteFinished(const DeviceState &payload, const TransportResult &result)
{
    m_writeCallId = 0;
    if (m_closed)
        return;

    if (!result.ok) {
        // Keep the failed value unless the caller already asked for something newer.
        if (!m_pending)
            m_pending = payload;
        markDegraded(result.message);
        scheduleReconcile();
        return;
    }

    const bool changed = !m_hasState || m_state != payload;
    m_state = payload;
    m_hasState = true;
    if (changed)
        emit stateChanged(m_state);

    armFlush();
}

void DeviceSession::fetchState(FetchCallback done)
{
    if (m_closed)
        return;

    if (done)
        m_fetchWaiters.append(std::move(done));
    if (m_fetchCallId != 0 || !m_transport)
        return;

    m_fetchWriteSeq = m_writeSeq;

    QPointer<DeviceSession> self(this);
    QString error;
    const quint64 callId = m_transport->readState(
        target(),
        m_settings.requestTimeoutMs,
        [self](const TransportResult &result) {
            if (self)
                self->onFetchFinished(result);
        },
        &error);

    if (callId == 0) {
        TransportResult failed;
        failed.error = DeviceError::DeviceUnreachable;
        failed.message = error;
        onFetchFinished(failed);
        return;
    }

    m_fetchCallId = callId;
}

void DeviceSession::onFetchFinished(const TransportResult &result)
{
    m_fetchCallId = 0;
    if (m_closed)
        return;

    FetchResult out;
    out.ok = result.ok;
    out.error = result.error;
    out.message = result.message;

    // A write issued while the read was out may have reached the device
    // after it answered; the written value is newer than this reply.
    const bool overtaken = result.ok && m_hasState && m_fetchWriteSeq != m_writeSeq;

    if (overtaken) {
        qCDebug(sessionLog).noquote() << m_record.identity << "discarding read older than last write";
        clearDegraded();
    } else if (result.ok) {
        DeviceState confirmed = result.state;
        confirmed.brightness = std::clamp(confirmed.brightness, kMinBrightness, kMaxBrightness);
        // The device stores temperature in coarser units; keep the cached
        // Kelvin value when it encodes to what the device reports.
        if (m_hasState
            && deviceUnitsFromKelvin(m_state.temperatureKelvin) == deviceUnitsFromKelvin(confirmed.temperatureKelvin)) {
            confirmed.temperatureKelvin = m_state.temperatureKelvin;
        }

        const bool changed = !m_hasState || m_state != confirmed;
        m_state = confirmed;
        m_hasState = true;
        clearDegraded();
        if (changed)
            emit stateChanged(m_state);
    } else {
        if (out.error == DeviceError::None)
            out.error = DeviceError::DeviceUnreachable;
        markDegraded(result.message);
    }

    out.state = m_state;
    scheduleReconcile();

    const QList<FetchCallback> waiters = std::exchange(m_fetchWaiters, {});
    for (const FetchCallback &waiter : waiters)
        waiter(out);
}

void DeviceSession::refreshAccessoryInfo()
{
    if (m_closed || m_infoCallId != 0 || !m_transport)
        return;

    QPointer<DeviceSession> self(this);
    QString error;
    const quint64 callId = m_transport->readAccessoryInfo(
        target(),
        m_settings.requestTimeoutMs,
        [self](const TransportResult &result) {
            if (!self)
                return;
            self->m_infoCallId = 0;
            if (self->m_closed)
                return;
            if (!result.ok) {
                qCDebug(sessionLog).noquote() << self->m_record.identity
                                              << "accessory info unavailable:" << result.message;
                return;
            }
            self->m_accessory = result.accessory;
            emit self->accessoryInfoChanged();
        },
        &error);

    if (callId == 0) {
        qCDebug(sessionLog).noquote() << m_record.identity << "accessory info not requested:" << error;
        return;
    }
    m_infoCallId = callId;
}

void DeviceSession::rebind(const DeviceRecord &record)
{
    if (m_closed)
        return;

    const bool moved = !m_record.sameEndpoint(record);
    m_record = record;
    if (!moved)
        return;

    qCInfo(sessionLog).noquote() << m_record.identity << "rebound to"
                                 << m_record.host << ":" << m_record.port;
    if (m_degraded) {
        m_retryDelayMs = 0;
        fetchState();
    }
}

void DeviceSession::shutdown()
{
    if (m_closed)
        return;

    m_closed = true;
    m_flushTimer.stop();
    m_reconcileTimer.stop();
    m_pending.reset();
    m_fetchWaiters.clear();

    if (m_transport) {
        if (m_writeCallId != 0)
            m_transport->cancel(m_writeCallId);
        if (m_fetchCallId != 0)
            m_transport->cancel(m_fetchCallId);
        if (m_infoCallId != 0)
            m_transport->cancel(m_infoCallId);
    }
    m_writeCallId = 0;
    m_fetchCallId = 0;
    m_infoCallId = 0;

    qCDebug(sessionLog).noquote() << m_record.identity << "session closed";
}

void DeviceSession::markDegraded(const QString &reason)
{
    m_lastError = reason.isEmpty() ? deviceErrorName(DeviceError::DeviceUnreachable) : reason;
    m_flushTimer.stop();
    if (m_degraded)
        return;

    m_degraded = true;
    qCWarning(sessionLog).noquote() << m_record.identity << "unreachable:" << m_lastError;
    emit availabilityChanged(false);
}

void DeviceSession::clearDegraded()
{
    m_retryDelayMs = 0;
    if (m_degraded) {
        m_degraded = false;
        m_lastError.clear();
        qCInfo(sessionLog).noquote() << m_record.identity << "reachable again";
        emit availabilityChanged(true);
    }
    armFlush();
}

void DeviceSession::scheduleReconcile()
{
    if (m_closed)
        return;

    if (m_degraded) {
        const int delay = m_retryDelayMs > 0 ? m_retryDelayMs : m_settings.degradedRetryMs;
        m_retryDelayMs = std::min(delay * 2, kMaxRetryDelayMs);
        m_reconcileTimer.start(delay);
        return;
    }

    if (m_settings.reconcileIntervalMs > 0)
        m_reconcileTimer.start(m_settings.reconcileIntervalMs);
    else
        m_reconcileTimer.stop();
}

void DeviceSession::onReconcileTimeout()
{
    fetchState();
}

} // namespace keylight::control
