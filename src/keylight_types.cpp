#include "keylight_types.h"

#include <algorithm>
#include <cmath>

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

namespace keylight::control {

namespace {

int readNumber(const QJsonValue &value, bool *ok)
{
    if (value.isDouble()) {
        *ok = true;
        return static_cast<int>(std::lround(value.toDouble()));
    }
    if (value.isBool()) {
        *ok = true;
        return value.toBool() ? 1 : 0;
    }
    if (value.isString()) {
        return value.toString().trimmed().toInt(ok);
    }
    *ok = false;
    return 0;
}

} // namespace

QString deviceErrorName(DeviceError error)
{
    switch (error) {
    case DeviceError::None:
        return QStringLiteral("None");
    case DeviceError::DiscoveryBindFailure:
        return QStringLiteral("DiscoveryBindFailure");
    case DeviceError::DeviceUnreachable:
        return QStringLiteral("DeviceUnreachable");
    case DeviceError::MalformedAnnouncement:
        return QStringLiteral("MalformedAnnouncement");
    case DeviceError::InvalidStateValue:
        return QStringLiteral("InvalidStateValue");
    }
    return QStringLiteral("Unknown");
}

QString powerSemanticsName(PowerSemantics semantics)
{
    return semantics == PowerSemantics::AllOn ? QStringLiteral("AllOn") : QStringLiteral("AnyOn");
}

bool parsePowerSemantics(const QString &text, PowerSemantics *out)
{
    const QString key = text.trimmed();
    if (key.compare(QLatin1String("AnyOn"), Qt::CaseInsensitive) == 0) {
        *out = PowerSemantics::AnyOn;
        return true;
    }
    if (key.compare(QLatin1String("AllOn"), Qt::CaseInsensitive) == 0) {
        *out = PowerSemantics::AllOn;
        return true;
    }
    return false;
}

QString syncModeName(SyncMode mode)
{
    switch (mode) {
    case SyncMode::Off:
        return QStringLiteral("off");
    case SyncMode::Brightness:
        return QStringLiteral("brightness");
    case SyncMode::Temperature:
        return QStringLiteral("temperature");
    case SyncMode::All:
        return QStringLiteral("all");
    }
    return QStringLiteral("off");
}

bool parseSyncMode(const QString &text, SyncMode *out)
{
    const QString key = text.trimmed().toLower();
    if (key == QLatin1String("off") || key == QLatin1String("none"))
        *out = SyncMode::Off;
    else if (key == QLatin1String("brightness"))
        *out = SyncMode::Brightness;
    else if (key == QLatin1String("temperature") || key == QLatin1String("kelvin"))
        *out = SyncMode::Temperature;
    else if (key == QLatin1String("all"))
        *out = SyncMode::All;
    else
        return false;
    return true;
}

bool validateState(const DeviceState &state, QString *error)
{
    if (state.brightness < kMinBrightness || state.brightness > kMaxBrightness) {
        if (error)
            *error = QStringLiteral("Brightness %1 outside [%2, %3]")
                         .arg(state.brightness)
                         .arg(kMinBrightness)
                         .arg(kMaxBrightness);
        return false;
    }
    if (state.temperatureKelvin < kMinKelvin || state.temperatureKelvin > kMaxKelvin) {
        if (error)
            *error = QStringLiteral("Color temperature %1K outside [%2K, %3K]")
                         .arg(state.temperatureKelvin)
                         .arg(kMinKelvin)
                         .arg(kMaxKelvin);
        return false;
    }
    if (error)
        error->clear();
    return true;
}

// Device units run 143 (7000K) to 344 (2900K) on a straight line.
int deviceUnitsFromKelvin(int kelvin)
{
    const double units = (1993300.0 - 201.0 * kelvin) / 4100.0;
    return std::clamp(static_cast<int>(std::lround(units)), kMinDeviceUnits, kMaxDeviceUnits);
}

int kelvinFromDeviceUnits(int units)
{
    const int clamped = std::clamp(units, kMinDeviceUnits, kMaxDeviceUnits);
    return static_cast<int>(std::lround((1993300.0 - 4100.0 * clamped) / 201.0));
}

QByteArray encodeLightsPayload(const DeviceState &state)
{
    QJsonObject light;
    light.insert(QStringLiteral("on"), state.on ? 1 : 0);
    light.insert(QStringLiteral("brightness"), state.brightness);
    light.insert(QStringLiteral("temperature"), deviceUnitsFromKelvin(state.temperatureKelvin));

    QJsonArray lights;
    lights.append(light);

    QJsonObject body;
    body.insert(QStringLiteral("numberOfLights"), 1);
    body.insert(QStringLiteral("lights"), lights);
    return QJsonDocument(body).toJson(QJsonDocument::Compact);
}

bool decodeLightsPayload(const QByteArray &payload, DeviceState *state, QString *error)
{
    auto fail = [error](const QString &message) {
        if (error)
            *error = message;
        return false;
    };

    if (!state)
        return fail(QStringLiteral("State output is null"));

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(payload, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject())
        return fail(QStringLiteral("Lights response is not a JSON object"));

    const QJsonArray lights = doc.object().value(QStringLiteral("lights")).toArray();
    if (lights.isEmpty() || !lights.first().isObject())
        return fail(QStringLiteral("Lights response has no light entry"));

    const QJsonObject light = lights.first().toObject();

    bool ok = false;
    const int on = readNumber(light.value(QStringLiteral("on")), &ok);
    if (!ok)
        return fail(QStringLiteral("Light entry has no power value"));
    const int brightness = readNumber(light.value(QStringLiteral("brightness")), &ok);
    if (!ok)
        return fail(QStringLiteral("Light entry has no brightness value"));
    const int units = readNumber(light.value(QStringLiteral("temperature")), &ok);
    if (!ok)
        return fail(QStringLiteral("Light entry has no temperature value"));

    state->on = on != 0;
    state->brightness = std::clamp(brightness, kMinBrightness, kMaxBrightness);
    state->temperatureKelvin = kelvinFromDeviceUnits(units);

    if (error)
        error->clear();
    return true;
}

QString normalizeMacAddress(const QString &raw)
{
    QString out = raw.trimmed().toUpper();
    out.remove(QLatin1Char(':'));
    out.remove(QLatin1Char('-'));
    return out;
}

bool decodeAccessoryInfo(const QByteArray &payload, AccessoryInfo *info, QString *error)
{
    if (!info) {
        if (error)
            *error = QStringLiteral("Accessory info output is null");
        return false;
    }

    const QJsonDocument doc = QJsonDocument::fromJson(payload);
    if (!doc.isObject()) {
        if (error)
            *error = QStringLiteral("Accessory info is not a JSON object");
        return false;
    }

    const QJsonObject obj = doc.object();
    AccessoryInfo out;
    out.productName = obj.value(QStringLiteral("productName")).toString().trimmed();
    out.serialNumber = obj.value(QStringLiteral("serialNumber")).toString().trimmed();
    out.firmwareVersion = obj.value(QStringLiteral("firmwareVersion")).toString().trimmed();
    out.displayName = obj.value(QStringLiteral("displayName")).toString().trimmed();

    QString mac = obj.value(QStringLiteral("macAddress")).toString();
    if (mac.trimmed().isEmpty())
        mac = obj.value(QStringLiteral("mac")).toString();
    out.macAddress = normalizeMacAddress(mac);

    *info = out;
    if (error)
        error->clear();
    return true;
}

} // namespace keylight::control
