#pragma once

#include <cstdint>

#include <QByteArray>
#include <QHash>
#include <QMetaType>
#include <QString>

namespace keylight::control {

inline constexpr const char kServiceType[] = "_elg._tcp.local";
inline constexpr int kDefaultDevicePort = 9123;

inline constexpr int kMinBrightness = 1;
inline constexpr int kMaxBrightness = 100;
inline constexpr int kMinKelvin = 2900;
inline constexpr int kMaxKelvin = 7000;
inline constexpr int kMinDeviceUnits = 143;
inline constexpr int kMaxDeviceUnits = 344;

enum class DeviceError {
    None,
    DiscoveryBindFailure,
    DeviceUnreachable,
    MalformedAnnouncement,
    InvalidStateValue,
};

QString deviceErrorName(DeviceError error);

// How the master power state is derived from the individual lights.
enum class PowerSemantics {
    AnyOn,
    AllOn,
};

// Which changes made to one light are copied to the other unlocked lights.
enum class SyncMode {
    Off,
    Brightness,
    Temperature,
    All,
};

QString powerSemanticsName(PowerSemantics semantics);
bool parsePowerSemantics(const QString &text, PowerSemantics *out);
QString syncModeName(SyncMode mode);
bool parseSyncMode(const QString &text, SyncMode *out);

struct DeviceRecord {
    QString identity;
    QString host;
    QString hostName;
    int port = kDefaultDevicePort;
    std::int64_t lastSeenMs = 0;
    QHash<QString, QString> txt;

    bool sameEndpoint(const DeviceRecord &other) const
    {
        return host == other.host && port == other.port;
    }
};

struct DeviceState {
    bool on = false;
    int brightness = 50;
    int temperatureKelvin = 4000;

    bool operator==(const DeviceState &other) const
    {
        return on == other.on
            && brightness == other.brightness
            && temperatureKelvin == other.temperatureKelvin;
    }
    bool operator!=(const DeviceState &other) const { return !(*this == other); }
};

struct AccessoryInfo {
    QString productName;
    QString serialNumber;
    QString macAddress;
    QString firmwareVersion;
    QString displayName;

    bool isEmpty() const
    {
        return productName.isEmpty() && serialNumber.isEmpty() && macAddress.isEmpty();
    }
};

bool validateState(const DeviceState &state, QString *error = nullptr);

int deviceUnitsFromKelvin(int kelvin);
int kelvinFromDeviceUnits(int units);

QByteArray encodeLightsPayload(const DeviceState &state);
bool decodeLightsPayload(const QByteArray &payload, DeviceState *state, QString *error = nullptr);

bool decodeAccessoryInfo(const QByteArray &payload, AccessoryInfo *info, QString *error = nullptr);
QString normalizeMacAddress(const QString &raw);

} // namespace keylight::control

Q_DECLARE_METATYPE(keylight::control::DeviceRecord)
Q_DECLARE_METATYPE(keylight::control::DeviceState)
