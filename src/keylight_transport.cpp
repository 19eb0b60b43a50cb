#include "keylight_transport.h"

#include <utility>

#include <QNetworkAccessManager>

namespace keylight::control {

namespace {

TransportResult unreachable(const HttpResult &http)
{
    TransportResult out;
    out.error = DeviceError::DeviceUnreachable;
    out.message = http.error.isEmpty() ? QStringLiteral("Device did not answer") : http.error;
    return out;
}

} // namespace

HttpDeviceTransport::HttpDeviceTransport(QNetworkAccessManager *manager)
    : m_http(manager)
{
}

quint64 HttpDeviceTransport::readState(const ConnectionSettings &target,
                                       int timeoutMs,
                                       Callback done,
                                       QString *error)
{
    return m_http.getAsync(target,
                           QString::fromLatin1(kLightsPath),
                           timeoutMs,
                           [done = std::move(done)](const HttpResult &http) {
                               if (!http.ok) {
                                   done(unreachable(http));
                                   return;
                               }

                               TransportResult out;
                               QString decodeError;
                               if (!decodeLightsPayload(http.payload, &out.state, &decodeError)) {
                                   out.error = DeviceError::DeviceUnreachable;
                                   out.message = decodeError;
                                   done(out);
                                   return;
                               }
                               out.ok = true;
                               done(out);
                           },
                           error);
}

quint64 HttpDeviceTransport::writeState(const ConnectionSettings &target,
                                        const DeviceState &state,
                                        int timeoutMs,
                                        Callback done,
                                        QString *error)
{
    return m_http.putJsonAsync(target,
                               QString::fromLatin1(kLightsPath),
                               encodeLightsPayload(state),
                               timeoutMs,
                               [done = std::move(done), state](const HttpResult &http) {
                                   if (!http.ok) {
                                       done(unreachable(http));
                                       return;
                                   }
                                   TransportResult out;
                                   out.ok = true;
                                   out.state = state;
                                   done(out);
                               },
                               error);
}

quint64 HttpDeviceTransport::readAccessoryInfo(const ConnectionSettings &target,
                                               int timeoutMs,
                                               Callback done,
                                               QString *error)
{
    return m_http.getAsync(target,
                           QString::fromLatin1(kAccessoryInfoPath),
                           timeoutMs,
                           [done = std::move(done)](const HttpResult &http) {
                               if (!http.ok) {
                                   done(unreachable(http));
                                   return;
                               }

                               TransportResult out;
                               if (!decodeAccessoryInfo(http.payload, &out.accessory, &out.message)) {
                                   out.error = DeviceError::DeviceUnreachable;
                                   done(out);
                                   return;
                               }
                               out.ok = true;
                               done(out);
                           },
                           error);
}

void HttpDeviceTransport::cancel(quint64 callId)
{
    m_http.cancel(callId);
}

} // namespace keylight::control
