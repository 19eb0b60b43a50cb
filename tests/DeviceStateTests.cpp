#include <gtest/gtest.h>

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

#include "keylight_types.h"

using namespace keylight::control;

// ============================================================================
// Validation
// ============================================================================

TEST(DeviceState, DefaultsAreValid) {
    DeviceState state;
    EXPECT_FALSE(state.on);
    EXPECT_EQ(state.brightness, 50);
    EXPECT_EQ(state.temperatureKelvin, 4000);
    EXPECT_TRUE(validateState(state));
}

TEST(DeviceState, BrightnessOutsideRangeIsRejected) {
    DeviceState state;
    QString error;

    state.brightness = 0;
    EXPECT_FALSE(validateState(state, &error));
    EXPECT_FALSE(error.isEmpty());

    state.brightness = 101;
    EXPECT_FALSE(validateState(state, &error));

    state.brightness = 1;
    EXPECT_TRUE(validateState(state, &error));
    EXPECT_TRUE(error.isEmpty());

    state.brightness = 100;
    EXPECT_TRUE(validateState(state));
}

TEST(DeviceState, KelvinOutsideRangeIsRejected) {
    DeviceState state;
    state.temperatureKelvin = 2899;
    EXPECT_FALSE(validateState(state));
    state.temperatureKelvin = 7001;
    EXPECT_FALSE(validateState(state));
    state.temperatureKelvin = 2900;
    EXPECT_TRUE(validateState(state));
    state.temperatureKelvin = 7000;
    EXPECT_TRUE(validateState(state));
}

TEST(DeviceState, ErrorNames) {
    EXPECT_EQ(deviceErrorName(DeviceError::InvalidStateValue), QStringLiteral("InvalidStateValue"));
    EXPECT_EQ(deviceErrorName(DeviceError::DeviceUnreachable), QStringLiteral("DeviceUnreachable"));
    EXPECT_EQ(deviceErrorName(DeviceError::DiscoveryBindFailure), QStringLiteral("DiscoveryBindFailure"));
}

// ============================================================================
// Temperature Units
// ============================================================================

TEST(TemperatureUnits, EndpointsMapExactly) {
    EXPECT_EQ(deviceUnitsFromKelvin(7000), 143);
    EXPECT_EQ(deviceUnitsFromKelvin(2900), 344);
    EXPECT_EQ(kelvinFromDeviceUnits(143), 7000);
    EXPECT_EQ(kelvinFromDeviceUnits(344), 2900);
}

TEST(TemperatureUnits, OutOfRangeUnitsAreClamped) {
    EXPECT_EQ(kelvinFromDeviceUnits(0), 7000);
    EXPECT_EQ(kelvinFromDeviceUnits(1000), 2900);
    EXPECT_EQ(deviceUnitsFromKelvin(10000), 143);
    EXPECT_EQ(deviceUnitsFromKelvin(1000), 344);
}

TEST(TemperatureUnits, ConversionIsMonotonic) {
    int previous = deviceUnitsFromKelvin(kMinKelvin);
    for (int kelvin = kMinKelvin + 50; kelvin <= kMaxKelvin; kelvin += 50) {
        const int units = deviceUnitsFromKelvin(kelvin);
        EXPECT_LE(units, previous) << kelvin;
        previous = units;
    }
}

TEST(TemperatureUnits, QuantizedKelvinEncodesToSameUnits) {
    // 4000K is not representable; the device reports the nearest unit.
    const int units = deviceUnitsFromKelvin(4000);
    EXPECT_EQ(units, 290);
    EXPECT_EQ(kelvinFromDeviceUnits(units), 4001);
    EXPECT_EQ(deviceUnitsFromKelvin(kelvinFromDeviceUnits(units)), units);
}

// ============================================================================
// Lights Payload
// ============================================================================

TEST(LightsPayload, EncodesSingleLight) {
    DeviceState state;
    state.on = true;
    state.brightness = 80;
    state.temperatureKelvin = 4500;

    const QJsonObject body = QJsonDocument::fromJson(encodeLightsPayload(state)).object();
    EXPECT_EQ(body.value(QStringLiteral("numberOfLights")).toInt(), 1);

    const QJsonArray lights = body.value(QStringLiteral("lights")).toArray();
    ASSERT_EQ(lights.size(), 1);
    const QJsonObject light = lights.first().toObject();
    EXPECT_EQ(light.value(QStringLiteral("on")).toInt(), 1);
    EXPECT_EQ(light.value(QStringLiteral("brightness")).toInt(), 80);
    EXPECT_EQ(light.value(QStringLiteral("temperature")).toInt(), deviceUnitsFromKelvin(4500));
}

TEST(LightsPayload, DecodesDeviceResponse) {
    const QByteArray payload = R"({"numberOfLights":1,"lights":[{"on":1,"brightness":23,"temperature":213}]})";
    DeviceState state;
    QString error;
    ASSERT_TRUE(decodeLightsPayload(payload, &state, &error)) << error.toStdString();
    EXPECT_TRUE(state.on);
    EXPECT_EQ(state.brightness, 23);
    EXPECT_EQ(state.temperatureKelvin, kelvinFromDeviceUnits(213));
}

TEST(LightsPayload, InboundValuesAreClamped) {
    DeviceState state;
    ASSERT_TRUE(decodeLightsPayload(R"({"lights":[{"on":0,"brightness":0,"temperature":400}]})", &state));
    EXPECT_FALSE(state.on);
    EXPECT_EQ(state.brightness, 1);
    EXPECT_EQ(state.temperatureKelvin, 2900);

    ASSERT_TRUE(decodeLightsPayload(R"({"lights":[{"on":true,"brightness":250,"temperature":10}]})", &state));
    EXPECT_TRUE(state.on);
    EXPECT_EQ(state.brightness, 100);
    EXPECT_EQ(state.temperatureKelvin, 7000);
}

TEST(LightsPayload, MalformedResponsesFail) {
    DeviceState state;
    QString error;
    EXPECT_FALSE(decodeLightsPayload("not json", &state, &error));
    EXPECT_FALSE(error.isEmpty());
    EXPECT_FALSE(decodeLightsPayload(R"({"lights":[]})", &state));
    EXPECT_FALSE(decodeLightsPayload(R"({"lights":[{"on":1,"temperature":200}]})", &state));
    EXPECT_FALSE(decodeLightsPayload(R"([1,2,3])", &state));
}

// ============================================================================
// Accessory Info
// ============================================================================

TEST(AccessoryInfo, DecodesAndNormalizesMac) {
    const QByteArray payload = R"({
        "productName": "Elgato Key Light",
        "serialNumber": "BW33J1A02345",
        "firmwareVersion": "1.0.3",
        "displayName": "Desk Left",
        "macAddress": "3c:6a:9d:14:12:ab"
    })";

    AccessoryInfo info;
    ASSERT_TRUE(decodeAccessoryInfo(payload, &info));
    EXPECT_EQ(info.productName, QStringLiteral("Elgato Key Light"));
    EXPECT_EQ(info.serialNumber, QStringLiteral("BW33J1A02345"));
    EXPECT_EQ(info.displayName, QStringLiteral("Desk Left"));
    EXPECT_EQ(info.macAddress, QStringLiteral("3C6A9D1412AB"));
    EXPECT_FALSE(info.isEmpty());
}

TEST(AccessoryInfo, RejectsNonObject) {
    AccessoryInfo info;
    EXPECT_FALSE(decodeAccessoryInfo("[]", &info));
    EXPECT_TRUE(info.isEmpty());
}

TEST(AccessoryInfo, MacNormalization) {
    EXPECT_EQ(normalizeMacAddress(QStringLiteral(" aa-bb-cc-dd-ee-ff ")), QStringLiteral("AABBCCDDEEFF"));
    EXPECT_EQ(normalizeMacAddress(QString()), QString());
}
