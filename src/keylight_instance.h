#pragma once

#include <memory>

#include <QString>
#include <QtGlobal>

class QTcpServer;

namespace keylight::control {

inline constexpr quint16 kInstanceGuardPort = 45654;

// Holds a loopback listener for the lifetime of the daemon. A second
// process fails to bind and can tell another instance is already running.
class SingleInstanceGuard
{
public:
    explicit SingleInstanceGuard(quint16 port = kInstanceGuardPort);
    ~SingleInstanceGuard();

    SingleInstanceGuard(const SingleInstanceGuard &) = delete;
    SingleInstanceGuard &operator=(const SingleInstanceGuard &) = delete;

    bool acquire(QString *error = nullptr);
    void release();
    bool isHeld() const;
    quint16 port() const { return m_port; }

private:
    quint16 m_port = kInstanceGuardPort;
    std::unique_ptr<QTcpServer> m_server;
};

} // namespace keylight::control
