#include "keylight_instance.h"

#include <utility>

#include <QHostAddress>
#include <QTcpServer>

namespace keylight::control {

SingleInstanceGuard::SingleInstanceGuard(quint16 port)
    : m_port(port)
{
}

SingleInstanceGuard::~SingleInstanceGuard()
{
    release();
}

bool SingleInstanceGuard::acquire(QString *error)
{
    if (m_server)
        return true;

    auto server = std::make_unique<QTcpServer>();
    if (!server->listen(QHostAddress::LocalHost, m_port)) {
        if (error) {
            *error = QStringLiteral("Another instance is already running (port %1: %2)")
                         .arg(m_port)
                         .arg(server->errorString());
        }
        return false;
    }

    m_server = std::move(server);
    return true;
}

void SingleInstanceGuard::release()
{
    if (!m_server)
        return;
    m_server->close();
    m_server.reset();
}

bool SingleInstanceGuard::isHeld() const
{
    return m_server && m_server->isListening();
}

} // namespace keylight::control
