#include <gtest/gtest.h>

#include <QHostAddress>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QNetworkAccessManager>
#include <QTcpServer>
#include <QTcpSocket>

#include "TestSupport.h"
#include "keylight_probe.h"
#include "keylight_transport.h"

using namespace keylight::control;
using keylight::control::test::waitUntil;

namespace {

// Minimal HTTP/1.1 device on 127.0.0.1 answering /elgato/* requests.
class FakeDeviceServer : public QObject
{
public:
    struct Request {
        QByteArray method;
        QByteArray path;
        QByteArray body;
    };

    bool silent = false;
    int status = 200;
    QByteArray lightsBody = R"({"numberOfLights":1,"lights":[{"on":1,"brightness":42,"temperature":213}]})";
    QByteArray infoBody = R"({"productName":"Elgato Key Light","serialNumber":"BW33J1A02345",)"
                          R"("firmwareVersion":"1.0.3","displayName":"Desk","macAddress":"3C:6A:9D:14:12:AB"})";
    QList<Request> requests;

    bool listen()
    {
        connect(&m_server, &QTcpServer::newConnection, this, [this]() {
            while (QTcpSocket *socket = m_server.nextPendingConnection()) {
                socket->setParent(this);
                connect(socket, &QTcpSocket::readyRead, this, [this, socket]() { onReadyRead(socket); });
                connect(socket, &QTcpSocket::disconnected, socket, &QObject::deleteLater);
            }
        });
        return m_server.listen(QHostAddress::LocalHost, 0);
    }

    ConnectionSettings target() const
    {
        ConnectionSettings settings;
        settings.host = QStringLiteral("127.0.0.1");
        settings.port = m_server.serverPort();
        return settings;
    }

private:
    void onReadyRead(QTcpSocket *socket)
    {
        QByteArray &buffer = m_buffers[socket];
        buffer.append(socket->readAll());

        const int headerEnd = buffer.indexOf("\r\n\r\n");
        if (headerEnd < 0)
            return;

        const QByteArray head = buffer.left(headerEnd);
        const QList<QByteArray> lines = head.split('\n');
        int contentLength = 0;
        for (const QByteArray &line : lines) {
            const QByteArray trimmed = line.trimmed();
            if (trimmed.toLower().startsWith("content-length:"))
                contentLength = trimmed.mid(15).trimmed().toInt();
        }
        if (buffer.size() < headerEnd + 4 + contentLength)
            return;

        const QList<QByteArray> requestLine = lines.first().trimmed().split(' ');
        Request request;
        request.method = requestLine.value(0);
        request.path = requestLine.value(1);
        request.body = buffer.mid(headerEnd + 4, contentLength);
        requests.append(request);
        m_buffers.remove(socket);

        if (silent)
            return;

        QByteArray body;
        if (request.method == "GET" && request.path == "/elgato/lights")
            body = lightsBody;
        else if (request.method == "GET" && request.path == "/elgato/accessory-info")
            body = infoBody;
        else if (request.method == "PUT" && request.path == "/elgato/lights")
            body = request.body;

        QByteArray response = "HTTP/1.1 " + QByteArray::number(status) + " Status\r\n";
        response += "Content-Type: application/json\r\n";
        response += "Content-Length: " + QByteArray::number(body.size()) + "\r\n";
        response += "Connection: close\r\n\r\n";
        response += body;
        socket->write(response);
        socket->disconnectFromHost();
    }

    QTcpServer m_server;
    QHash<QTcpSocket *, QByteArray> m_buffers;
};

} // namespace

class HttpTransportTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(device.listen());
    }

    FakeDeviceServer device;
    QNetworkAccessManager nam;
    HttpDeviceTransport transport{ &nam };
};

// ============================================================================
// Reads
// ============================================================================

TEST_F(HttpTransportTest, ReadStateDecodesLights) {
    bool done = false;
    TransportResult result;
    const quint64 id = transport.readState(device.target(), 2000, [&](const TransportResult &r) {
        result = r;
        done = true;
    });
    ASSERT_NE(id, 0u);
    EXPECT_FALSE(done);

    ASSERT_TRUE(waitUntil([&]() { return done; }, 5000));
    ASSERT_TRUE(result.ok) << result.message.toStdString();
    EXPECT_TRUE(result.state.on);
    EXPECT_EQ(result.state.brightness, 42);
    EXPECT_EQ(result.state.temperatureKelvin, kelvinFromDeviceUnits(213));

    ASSERT_EQ(device.requests.size(), 1);
    EXPECT_EQ(device.requests.first().method, QByteArray("GET"));
    EXPECT_EQ(device.requests.first().path, QByteArray("/elgato/lights"));
}

TEST_F(HttpTransportTest, ReadAccessoryInfo) {
    bool done = false;
    TransportResult result;
    transport.readAccessoryInfo(device.target(), 2000, [&](const TransportResult &r) {
        result = r;
        done = true;
    });
    ASSERT_TRUE(waitUntil([&]() { return done; }, 5000));
    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.accessory.displayName, QStringLiteral("Desk"));
    EXPECT_EQ(result.accessory.macAddress, QStringLiteral("3C6A9D1412AB"));
}

// ============================================================================
// Writes
// ============================================================================

TEST_F(HttpTransportTest, WriteStateSendsPutBody) {
    DeviceState state;
    state.on = true;
    state.brightness = 80;
    state.temperatureKelvin = 4500;

    bool done = false;
    TransportResult result;
    transport.writeState(device.target(), state, 2000, [&](const TransportResult &r) {
        result = r;
        done = true;
    });
    ASSERT_TRUE(waitUntil([&]() { return done; }, 5000));
    ASSERT_TRUE(result.ok) << result.message.toStdString();

    ASSERT_EQ(device.requests.size(), 1);
    EXPECT_EQ(device.requests.first().method, QByteArray("PUT"));
    const QJsonObject light = QJsonDocument::fromJson(device.requests.first().body)
                                  .object().value(QStringLiteral("lights")).toArray().first().toObject();
    EXPECT_EQ(light.value(QStringLiteral("on")).toInt(), 1);
    EXPECT_EQ(light.value(QStringLiteral("brightness")).toInt(), 80);
    EXPECT_EQ(light.value(QStringLiteral("temperature")).toInt(), deviceUnitsFromKelvin(4500));
}

// ============================================================================
// Failures
// ============================================================================

TEST_F(HttpTransportTest, HttpErrorIsUnreachable) {
    device.status = 500;
    bool done = false;
    TransportResult result;
    transport.readState(device.target(), 2000, [&](const TransportResult &r) {
        result = r;
        done = true;
    });
    ASSERT_TRUE(waitUntil([&]() { return done; }, 5000));
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error, DeviceError::DeviceUnreachable);
}

TEST_F(HttpTransportTest, SilentDeviceTimesOut) {
    device.silent = true;
    bool done = false;
    TransportResult result;
    transport.readState(device.target(), 200, [&](const TransportResult &r) {
        result = r;
        done = true;
    });
    ASSERT_TRUE(waitUntil([&]() { return done; }, 5000));
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error, DeviceError::DeviceUnreachable);
    EXPECT_TRUE(result.message.contains(QStringLiteral("timed out")));
    EXPECT_EQ(transport.http().pendingCount(), 0);
}

TEST_F(HttpTransportTest, CancelledCallNeverCompletes) {
    device.silent = true;
    bool done = false;
    const quint64 id = transport.readState(device.target(), 300, [&](const TransportResult &) { done = true; });
    ASSERT_NE(id, 0u);
    transport.cancel(id);
    EXPECT_EQ(transport.http().pendingCount(), 0);

    keylight::control::test::spin(500);
    EXPECT_FALSE(done);
}

TEST_F(HttpTransportTest, EmptyHostFailsImmediately) {
    ConnectionSettings empty;
    QString error;
    bool called = false;
    EXPECT_EQ(transport.readState(empty, 200, [&](const TransportResult &) { called = true; }, &error), 0u);
    EXPECT_FALSE(error.isEmpty());
    EXPECT_FALSE(called);
}

// ============================================================================
// Probe
// ============================================================================

TEST_F(HttpTransportTest, ProbeReadsInfoAndState) {
    const ProbeResult result = runProbe(transport.http(), device.target(), 3000);
    ASSERT_TRUE(result.ok) << result.message.toStdString();
    EXPECT_EQ(result.accessory.productName, QStringLiteral("Elgato Key Light"));
    EXPECT_TRUE(result.hasState);
    EXPECT_EQ(result.state.brightness, 42);
}
