#pragma once

#include <functional>

#include <QString>

#include "keylight_http.h"
#include "keylight_types.h"

class QNetworkAccessManager;

namespace keylight::control {

inline constexpr const char kLightsPath[] = "/elgato/lights";
inline constexpr const char kAccessoryInfoPath[] = "/elgato/accessory-info";

struct TransportResult {
    bool ok = false;
    DeviceError error = DeviceError::None;
    QString message;
    DeviceState state;
    AccessoryInfo accessory;
};

// Control channel to one or more devices. Every call returns a non-zero id
// and later invokes its callback exactly once, unless cancelled. A zero id
// means the call could not be started; the callback is not invoked and
// `error` describes why.
class DeviceTransport
{
public:
    using Callback = std::function<void(const TransportResult &)>;

    virtual ~DeviceTransport() = default;

    virtual quint64 readState(const ConnectionSettings &target,
                              int timeoutMs,
                              Callback done,
                              QString *error = nullptr) = 0;
    virtual quint64 writeState(const ConnectionSettings &target,
                               const DeviceState &state,
                               int timeoutMs,
                               Callback done,
                               QString *error = nullptr) = 0;
    virtual quint64 readAccessoryInfo(const ConnectionSettings &target,
                                      int timeoutMs,
                                      Callback done,
                                      QString *error = nullptr) = 0;
    virtual void cancel(quint64 callId) = 0;
};

class HttpDeviceTransport final : public DeviceTransport
{
public:
    explicit HttpDeviceTransport(QNetworkAccessManager *manager);

    quint64 readState(const ConnectionSettings &target,
                      int timeoutMs,
                      Callback done,
                      QString *error = nullptr) override;
    quint64 writeState(const ConnectionSettings &target,
                       const DeviceState &state,
                       int timeoutMs,
                       Callback done,
                       QString *error = nullptr) override;
    quint64 readAccessoryInfo(const ConnectionSettings &target,
                              int timeoutMs,
                              Callback done,
                              QString *error = nullptr) override;
    void cancel(quint64 callId) override;

    HttpClient &http() { return m_http; }

private:
    HttpClient m_http;
};

} // namespace keylight::control
