#include <atomic>
#include <csignal>
#include <cstdlib>
#include <iostream>

#include <QCoreApplication>
#include <QEventLoop>
#include <QLoggingCategory>
#include <QNetworkAccessManager>
#include <QTimer>

#include "keylight_config.h"
#include "keylight_console.h"
#include "keylight_discovery.h"
#include "keylight_instance.h"
#include "keylight_probe.h"
#include "keylight_registry.h"
#include "keylight_transport.h"

namespace {

namespace kc = keylight::control;

std::atomic_bool g_running{true};

void handleSignal(int)
{
    g_running.store(false);
}

int runProbeCommand(int argc, char **argv)
{
    if (argc < 3) {
        std::cerr << "usage: keylightd probe <host> [port]" << '\n';
        return 2;
    }

    kc::ConnectionSettings settings;
    settings.host = QString::fromLocal8Bit(argv[2]);
    settings.port = kc::kDefaultDevicePort;
    if (argc > 3) {
        bool ok = false;
        settings.port = QString::fromLocal8Bit(argv[3]).toInt(&ok);
        if (!ok || settings.port <= 0 || settings.port > 65535) {
            std::cerr << "invalid port: " << argv[3] << '\n';
            return 2;
        }
    }

    QNetworkAccessManager nam;
    kc::HttpClient http(&nam);
    const kc::ProbeResult result = kc::runProbe(http, settings);
    if (!result.ok) {
        std::cerr << "probe failed: " << result.error.toStdString() << " " << result.message.toStdString() << '\n';
        return 1;
    }

    std::cout << result.accessory.productName.toStdString()
              << " \"" << result.accessory.displayName.toStdString() << "\""
              << " serial=" << result.accessory.serialNumber.toStdString()
              << " firmware=" << result.accessory.firmwareVersion.toStdString() << '\n';
    if (result.hasState) {
        std::cout << "on=" << result.state.on
                  << " brightness=" << result.state.brightness
                  << " kelvin=" << result.state.temperatureKelvin << '\n';
    }
    return 0;
}

} // namespace

int main(int argc, char **argv)
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("keylightd"));

    if (argc > 1 && qstrcmp(argv[1], "probe") == 0)
        return runProbeCommand(argc, argv);

    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);

    const char *envConfigPath = std::getenv("KEYLIGHT_CONFIG_PATH");
    const QString configPath = (argc > 1)
        ? QString::fromLocal8Bit(argv[1])
        : (envConfigPath ? QString::fromLocal8Bit(envConfigPath) : kc::defaultSettingsPath());

    kc::ControllerSettings settings;
    QString error;
    if (!kc::loadSettings(configPath, &settings, &error))
        std::cerr << "config: " << error.toStdString() << " (using defaults)" << '\n';

    if (settings.debugLogging)
        QLoggingCategory::setFilterRules(QStringLiteral("keylight.*.debug=true"));

    std::cerr << "starting keylightd service=" << settings.serviceType.toStdString()
              << " config=" << configPath.toStdString() << '\n';

    kc::SingleInstanceGuard guard;
    if (settings.singleInstance && !guard.acquire(&error)) {
        std::cerr << error.toStdString() << '\n';
        return 1;
    }

    kc::DeviceLabelStore labels;
    if (!labels.load(&error))
        std::cerr << "labels: " << error.toStdString() << '\n';

    QNetworkAccessManager nam;
    kc::HttpDeviceTransport transport(&nam);
    kc::DeviceRegistry registry(&transport, settings.session);
    registry.setLabelStore(&labels);
    registry.setPowerSemantics(settings.powerSemantics);
    registry.setIgnoreLocks(settings.ignoreLocks);
    registry.setSyncMode(settings.syncMode);

    QObject::connect(&registry, &kc::DeviceRegistry::deviceAvailable, [&registry](const QString &id) {
        std::cout << "+ " << registry.displayName(id).toStdString() << '\n';
    });
    QObject::connect(&registry, &kc::DeviceRegistry::deviceGone, [](const QString &id) {
        std::cout << "- " << id.toStdString() << '\n';
    });
    QObject::connect(&registry, &kc::DeviceRegistry::deviceAvailabilityChanged,
                     [&registry](const QString &id, bool available) {
                         std::cout << registry.displayName(id).toStdString()
                                   << (available ? " reachable" : " unreachable") << '\n';
                     });

    kc::DiscoveryWatcher watcher(settings.serviceType);
    registry.attach(&watcher);
    if (settings.enableDiscovery) {
        if (!watcher.start(&error)) {
            std::cerr << "failed to start discovery: " << error.toStdString() << '\n';
            return 1;
        }
    } else {
        std::cerr << "discovery disabled by configuration" << '\n';
    }

    kc::ConsoleController console(&registry, &labels);
    QObject::connect(&console, &kc::ConsoleController::output, [](const QString &text) {
        std::cout << text.toStdString() << std::endl;
    });
    QObject::connect(&console, &kc::ConsoleController::quitRequested, []() {
        g_running.store(false);
    });
    if (!console.start(&error))
        std::cerr << "console unavailable: " << error.toStdString() << '\n';

    // Wakes the loop so a signal is noticed without other activity.
    QTimer heartbeat;
    heartbeat.start(250);

    while (g_running.load())
        QCoreApplication::processEvents(QEventLoop::AllEvents | QEventLoop::WaitForMoreEvents);

    console.stop();
    watcher.stop();
    registry.clear();
    QCoreApplication::processEvents(QEventLoop::AllEvents, 5);
    std::cerr << "stopping keylightd" << '\n';
    return 0;
}
