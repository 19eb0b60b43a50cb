#include "keylight_http.h"

#include <utility>

#include <QEventLoop>
#include <QLoggingCategory>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QTimer>
#include <QUrl>

Q_LOGGING_CATEGORY(httpLog, "keylight.http")

namespace keylight::control {

namespace {

constexpr int kFallbackTimeoutMs = 2000;

} // namespace

HttpClient::HttpClient(QNetworkAccessManager *manager)
    : m_manager(manager)
{
}

HttpClient::~HttpClient()
{
    cancelAll();
}

QString HttpClient::effectiveHost(const ConnectionSettings &settings)
{
    const QString host = settings.host.trimmed();
    if (!host.isEmpty())
        return host;
    return settings.ip.trimmed();
}

HttpResult HttpClient::get(const ConnectionSettings &settings,
                           const QString &path,
                           int timeoutMs) const
{
    HttpResult result;

    if (!m_manager) {
        result.error = QStringLiteral("Network manager unavailable");
        return result;
    }

    QNetworkRequest requestObj;
    if (!buildRequest(settings, path, false, &requestObj, &result.error))
        return result;

    QNetworkReply *reply = m_manager->get(requestObj);
    if (!reply) {
        result.error = QStringLiteral("Failed to create network request");
        return result;
    }

    QEventLoop loop;
    QTimer timer;
    timer.setSingleShot(true);
    bool timedOut = false;

    QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
    QObject::connect(&timer, &QTimer::timeout, &loop, [&]() {
        timedOut = true;
        loop.quit();
    });

    timer.start(timeoutMs > 0 ? timeoutMs : kFallbackTimeoutMs);
    loop.exec();

    if (timedOut) {
        QObject::disconnect(reply, nullptr, &loop, nullptr);
        reply->abort();
        reply->deleteLater();
        result.timedOut = true;
        result.error = QStringLiteral("Request timed out");
        return result;
    }

    result = resultFromReply(reply);
    reply->deleteLater();
    return result;
}

quint64 HttpClient::getAsync(const ConnectionSettings &settings,
                             const QString &path,
                             int timeoutMs,
                             ResultCallback done,
                             QString *error)
{
    return startCall(settings, QByteArrayLiteral("GET"), path, {}, timeoutMs, std::move(done), error);
}

quint64 HttpClient::putJsonAsync(const ConnectionSettings &settings,
                                 const QString &path,
                                 const QByteArray &payload,
                                 int timeoutMs,
                                 ResultCallback done,
                                 QString *error)
{
    return startCall(settings, QByteArrayLiteral("PUT"), path, payload, timeoutMs, std::move(done), error);
}

void HttpClient::cancel(quint64 callId)
{
    auto it = m_pending.find(callId);
    if (it == m_pending.end())
        return;

    PendingCall call = it.value();
    m_pending.erase(it);
    detach(call);
    if (call.reply) {
        call.reply->abort();
        call.reply->deleteLater();
    }
}

void HttpClient::cancelAll()
{
    const QList<quint64> ids = m_pending.keys();
    for (quint64 id : ids)
        cancel(id);
}

bool HttpClient::buildRequest(const ConnectionSettings &settings,
                              const QString &path,
                              bool hasJsonBody,
                              QNetworkRequest *request,
                              QString *error) const
{
    if (!request) {
        if (error)
            *error = QStringLiteral("Request object is null");
        return false;
    }

    const QString host = effectiveHost(settings);
    if (host.isEmpty()) {
        if (error)
            *error = QStringLiteral("Device host is empty");
        return false;
    }

    QUrl url;
    url.setScheme(QStringLiteral("http"));
    url.setHost(host);
    url.setPort(settings.port > 0 ? settings.port : 80);
    if (path.startsWith(QLatin1Char('/')))
        url.setPath(path);
    else
        url.setPath(QStringLiteral("/") + path);

    if (!url.isValid()) {
        if (error)
            *error = QStringLiteral("Invalid device URL for host %1").arg(host);
        return false;
    }

    QNetworkRequest out(url);
    out.setRawHeader("Accept", "application/json");
    out.setRawHeader("User-Agent", "keylight-control/1.0");
    if (hasJsonBody)
        out.setHeader(QNetworkRequest::ContentTypeHeader, QStringLiteral("application/json"));

    *request = out;
    if (error)
        error->clear();
    return true;
}

quint64 HttpClient::startCall(const ConnectionSettings &settings,
                              const QByteArray &method,
                              const QString &path,
                              const QByteArray &payload,
                              int timeoutMs,
                              ResultCallback done,
                              QString *error)
{
    if (!m_manager) {
        if (error)
            *error = QStringLiteral("Network manager unavailable");
        return 0;
    }

    QNetworkRequest request;
    if (!buildRequest(settings, path, !payload.isEmpty(), &request, error))
        return 0;

    QNetworkReply *reply = nullptr;
    if (method == QByteArrayLiteral("GET"))
        reply = m_manager->get(request);
    else
        reply = m_manager->sendCustomRequest(request, method, payload);

    if (!reply) {
        if (error)
            *error = QStringLiteral("Failed to create network request");
        return 0;
    }

    const quint64 callId = m_nextCallId++;

    PendingCall call;
    call.reply = reply;
    call.timer = new QTimer(reply);
    call.timer->setSingleShot(true);
    call.done = std::move(done);
    call.finishedConnection = QObject::connect(reply, &QNetworkReply::finished, reply, [this, callId]() {
        finishCall(callId, false);
    });
    call.timeoutConnection = QObject::connect(call.timer, &QTimer::timeout, reply, [this, callId]() {
        finishCall(callId, true);
    });
    call.timer->start(timeoutMs > 0 ? timeoutMs : kFallbackTimeoutMs);
    m_pending.insert(callId, call);

    if (error)
        error->clear();
    return callId;
}

void HttpClient::finishCall(quint64 callId, bool timedOut)
{
    auto it = m_pending.find(callId);
    if (it == m_pending.end())
        return;

    PendingCall call = it.value();
    m_pending.erase(it);
    detach(call);

    HttpResult result;
    if (!call.reply) {
        result.error = QStringLiteral("Network reply vanished");
    } else if (timedOut) {
        qCDebug(httpLog) << "request timed out:" << call.reply->request().url().toString();
        call.reply->abort();
        result.timedOut = true;
        result.error = QStringLiteral("Request timed out");
    } else {
        result = resultFromReply(call.reply);
    }

    if (call.reply)
        call.reply->deleteLater();

    if (call.done)
        call.done(result);
}

HttpResult HttpClient::resultFromReply(QNetworkReply *reply)
{
    HttpResult result;
    result.statusCode = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    result.payload = reply->readAll();

    if (reply->error() != QNetworkReply::NoError) {
        result.error = reply->errorString();
        return result;
    }

    if (result.statusCode >= 200 && result.statusCode < 300)
        result.ok = true;
    else
        result.error = QStringLiteral("HTTP %1").arg(result.statusCode);
    return result;
}

void HttpClient::detach(PendingCall &call)
{
    QObject::disconnect(call.finishedConnection);
    QObject::disconnect(call.timeoutConnection);
    // The timer is owned by the reply.
    if (call.reply && call.timer)
        call.timer->stop();
}

} // namespace keylight::control
