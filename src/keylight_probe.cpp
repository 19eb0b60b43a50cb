#include "keylight_probe.h"

#include "keylight_transport.h"

namespace keylight::control {

ProbeResult runProbe(HttpClient &http, const ConnectionSettings &settings, int timeoutMs)
{
    ProbeResult out;

    if (HttpClient::effectiveHost(settings).isEmpty()) {
        out.error = QStringLiteral("Host must not be empty");
        return out;
    }

    ConnectionSettings probeSettings = settings;
    if (probeSettings.port <= 0)
        probeSettings.port = kDefaultDevicePort;

    const HttpResult info = http.get(probeSettings, QString::fromLatin1(kAccessoryInfoPath), timeoutMs);
    if (!info.ok) {
        out.error = info.error.isEmpty() ? QStringLiteral("Device did not answer") : info.error;
        return out;
    }

    QString parseError;
    if (!decodeAccessoryInfo(info.payload, &out.accessory, &parseError)) {
        out.error = parseError;
        return out;
    }

    const HttpResult lights = http.get(probeSettings, QString::fromLatin1(kLightsPath), timeoutMs);
    if (lights.ok && decodeLightsPayload(lights.payload, &out.state, &parseError)) {
        out.hasState = true;
        out.message = QStringLiteral("Device reachable");
    } else {
        out.message = QStringLiteral("Device reachable, light state unavailable");
    }

    out.ok = true;
    return out;
}

} // namespace keylight::control
