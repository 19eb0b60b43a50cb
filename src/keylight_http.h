#pragma once

#include <functional>

#include <QByteArray>
#include <QHash>
#include <QMetaObject>
#include <QPointer>
#include <QString>

class QNetworkAccessManager;
class QNetworkReply;
class QNetworkRequest;
class QTimer;

namespace keylight::control {

struct ConnectionSettings {
    QString host;
    QString ip;
    int port = 0;
};

struct HttpResult {
    bool ok = false;
    bool timedOut = false;
    int statusCode = 0;
    QByteArray payload;
    QString error;
};

class HttpClient
{
public:
    using ResultCallback = std::function<void(const HttpResult &)>;

    explicit HttpClient(QNetworkAccessManager *manager);
    ~HttpClient();

    HttpClient(const HttpClient &) = delete;
    HttpClient &operator=(const HttpClient &) = delete;

    HttpResult get(const ConnectionSettings &settings,
                   const QString &path,
                   int timeoutMs = 2000) const;

    // Asynchronous variants return a non-zero call id, or 0 when the request
    // could not be created. The callback runs at most once and never after
    // cancel(id).
    quint64 getAsync(const ConnectionSettings &settings,
                     const QString &path,
                     int timeoutMs,
                     ResultCallback done,
                     QString *error = nullptr);

    quint64 putJsonAsync(const ConnectionSettings &settings,
                         const QString &path,
                         const QByteArray &payload,
                         int timeoutMs,
                         ResultCallback done,
                         QString *error = nullptr);

    void cancel(quint64 callId);
    void cancelAll();
    int pendingCount() const { return m_pending.size(); }

    static QString effectiveHost(const ConnectionSettings &settings);

private:
    struct PendingCall {
        QPointer<QNetworkReply> reply;
        QTimer *timer = nullptr;
        QMetaObject::Connection finishedConnection;
        QMetaObject::Connection timeoutConnection;
        ResultCallback done;
    };

    bool buildRequest(const ConnectionSettings &settings,
                      const QString &path,
                      bool hasJsonBody,
                      QNetworkRequest *request,
                      QString *error = nullptr) const;

    quint64 startCall(const ConnectionSettings &settings,
                      const QByteArray &method,
                      const QString &path,
                      const QByteArray &payload,
                      int timeoutMs,
                      ResultCallback done,
                      QString *error);
    void finishCall(quint64 callId, bool timedOut);
    static HttpResult resultFromReply(QNetworkReply *reply);
    static void detach(PendingCall &call);

    QNetworkAccessManager *m_manager = nullptr;
    QHash<quint64, PendingCall> m_pending;
    quint64 m_nextCallId = 1;
};

} // namespace keylight::control
