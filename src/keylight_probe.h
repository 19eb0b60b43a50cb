#pragma once

#include <QString>

#include "keylight_http.h"
#include "keylight_types.h"

namespace keylight::control {

struct ProbeResult {
    bool ok = false;
    QString error;
    QString message;
    AccessoryInfo accessory;
    bool hasState = false;
    DeviceState state;
};

// Blocking reachability check used by `keylightd probe`.
ProbeResult runProbe(HttpClient &http,
                     const ConnectionSettings &settings,
                     int timeoutMs = 3000);

} // namespace keylight::control
