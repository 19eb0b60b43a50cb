#include <gtest/gtest.h>

#include <memory>

#include <QSignalSpy>
#include <QTemporaryDir>

#include "FakeTransport.h"
#include "TestSupport.h"
#include "keylight_config.h"
#include "keylight_console.h"
#include "keylight_registry.h"

using namespace keylight::control;
using keylight::control::test::FakeTransport;
using keylight::control::test::waitUntil;

// ============================================================================
// Parsing
// ============================================================================

TEST(ParseCommand, BlankLineIsNotACommand) {
    Command cmd;
    QString error = QStringLiteral("stale");
    EXPECT_FALSE(parseCommand(QStringLiteral("   \n"), &cmd, &error));
    EXPECT_TRUE(error.isEmpty());
}

TEST(ParseCommand, SimpleVerbs) {
    Command cmd;
    ASSERT_TRUE(parseCommand(QStringLiteral("list"), &cmd));
    EXPECT_EQ(cmd.kind, CommandKind::List);
    ASSERT_TRUE(parseCommand(QStringLiteral("HELP"), &cmd));
    EXPECT_EQ(cmd.kind, CommandKind::Help);
    ASSERT_TRUE(parseCommand(QStringLiteral("quit\n"), &cmd));
    EXPECT_EQ(cmd.kind, CommandKind::Quit);
}

TEST(ParseCommand, SetWithAllFields) {
    Command cmd;
    QString error;
    ASSERT_TRUE(parseCommand(QStringLiteral("set 2 on brightness=40 kelvin=5600"), &cmd, &error)) << error.toStdString();
    EXPECT_EQ(cmd.kind, CommandKind::Set);
    EXPECT_EQ(cmd.target, QStringLiteral("2"));
    ASSERT_TRUE(cmd.power.has_value());
    EXPECT_TRUE(*cmd.power);
    ASSERT_TRUE(cmd.brightness.has_value());
    EXPECT_EQ(*cmd.brightness, 40);
    ASSERT_TRUE(cmd.kelvin.has_value());
    EXPECT_EQ(*cmd.kelvin, 5600);
}

TEST(ParseCommand, SetAllOff) {
    Command cmd;
    ASSERT_TRUE(parseCommand(QStringLiteral("set all off"), &cmd));
    EXPECT_TRUE(cmd.targetsAll());
    ASSERT_TRUE(cmd.power.has_value());
    EXPECT_FALSE(*cmd.power);
    EXPECT_FALSE(cmd.brightness.has_value());
}

TEST(ParseCommand, SetKeepsOutOfRangeValuesForTheSession) {
    Command cmd;
    ASSERT_TRUE(parseCommand(QStringLiteral("set desk brightness=0"), &cmd));
    EXPECT_EQ(*cmd.brightness, 0);
}

TEST(ParseCommand, SetErrors) {
    Command cmd;
    QString error;
    EXPECT_FALSE(parseCommand(QStringLiteral("set"), &cmd, &error));
    EXPECT_FALSE(error.isEmpty());
    EXPECT_FALSE(parseCommand(QStringLiteral("set desk"), &cmd, &error));
    EXPECT_FALSE(parseCommand(QStringLiteral("set desk brightness=bright"), &cmd, &error));
    EXPECT_TRUE(error.contains(QStringLiteral("brightness=bright")));
    EXPECT_FALSE(parseCommand(QStringLiteral("set desk dim"), &cmd, &error));
}

TEST(ParseCommand, SyncDefaultsToBothFields) {
    Command cmd;
    ASSERT_TRUE(parseCommand(QStringLiteral("sync desk"), &cmd));
    EXPECT_TRUE(cmd.syncBrightness);
    EXPECT_TRUE(cmd.syncTemperature);

    ASSERT_TRUE(parseCommand(QStringLiteral("sync desk temperature"), &cmd));
    EXPECT_FALSE(cmd.syncBrightness);
    EXPECT_TRUE(cmd.syncTemperature);

    QString error;
    EXPECT_FALSE(parseCommand(QStringLiteral("sync all"), &cmd, &error));
    EXPECT_FALSE(error.isEmpty());
}

TEST(ParseCommand, LabelJoinsRemainingWords) {
    Command cmd;
    ASSERT_TRUE(parseCommand(QStringLiteral("label 1 Desk   Left"), &cmd));
    EXPECT_EQ(cmd.kind, CommandKind::Label);
    EXPECT_EQ(cmd.target, QStringLiteral("1"));
    EXPECT_EQ(cmd.text, QStringLiteral("Desk Left"));

    EXPECT_FALSE(parseCommand(QStringLiteral("label 1"), &cmd));
}

TEST(ParseCommand, LockVerbsTakeOneDevice) {
    Command cmd;
    ASSERT_TRUE(parseCommand(QStringLiteral("lock 2"), &cmd));
    EXPECT_EQ(cmd.kind, CommandKind::Lock);
    EXPECT_EQ(cmd.target, QStringLiteral("2"));
    ASSERT_TRUE(parseCommand(QStringLiteral("Unlock desk"), &cmd));
    EXPECT_EQ(cmd.kind, CommandKind::Unlock);

    QString error;
    EXPECT_FALSE(parseCommand(QStringLiteral("lock all"), &cmd, &error));
    EXPECT_FALSE(error.isEmpty());
    EXPECT_FALSE(parseCommand(QStringLiteral("unlock"), &cmd, &error));
    EXPECT_FALSE(parseCommand(QStringLiteral("lock 1 2"), &cmd, &error));
}

TEST(ParseCommand, SyncModeNeedsKnownMode) {
    Command cmd;
    ASSERT_TRUE(parseCommand(QStringLiteral("syncmode Brightness"), &cmd));
    EXPECT_EQ(cmd.kind, CommandKind::SyncMode);
    EXPECT_EQ(cmd.mode, SyncMode::Brightness);
    ASSERT_TRUE(parseCommand(QStringLiteral("syncmode off"), &cmd));
    EXPECT_EQ(cmd.mode, SyncMode::Off);

    QString error;
    EXPECT_FALSE(parseCommand(QStringLiteral("syncmode"), &cmd, &error));
    EXPECT_TRUE(error.contains(QStringLiteral("syncmode")));
    EXPECT_FALSE(parseCommand(QStringLiteral("syncmode hue"), &cmd, &error));
    EXPECT_FALSE(parseCommand(QStringLiteral("syncmode all extra"), &cmd, &error));
}

TEST(ParseCommand, UnknownVerbAndStrayArguments) {
    Command cmd;
    QString error;
    EXPECT_FALSE(parseCommand(QStringLiteral("dance"), &cmd, &error));
    EXPECT_TRUE(error.contains(QStringLiteral("dance")));
    EXPECT_FALSE(parseCommand(QStringLiteral("list everything"), &cmd, &error));
    EXPECT_FALSE(parseCommand(QStringLiteral("fetch"), &cmd, &error));
}

// ============================================================================
// Execution
// ============================================================================

class ConsoleControllerTest : public ::testing::Test {
protected:
    void SetUp() override {
        SessionSettings settings;
        settings.flushIntervalMs = 20;
        settings.reconcileIntervalMs = 0;
        registry = std::make_unique<DeviceRegistry>(&transport, settings);
        labels = std::make_unique<DeviceLabelStore>(dir.filePath(QStringLiteral("device-labels.json")));
        registry->setLabelStore(labels.get());
        console = std::make_unique<ConsoleController>(registry.get(), labels.get());

        transport.device.on = true;
        transport.device.brightness = 30;
        transport.accessory.macAddress = QStringLiteral("3C6A9D1412AB");
        addDevice(QStringLiteral("light-a"), QStringLiteral("192.0.2.1"));
        transport.accessory.macAddress = QStringLiteral("3C6A9D1412AC");
        addDevice(QStringLiteral("light-b"), QStringLiteral("192.0.2.2"));
    }

    void TearDown() override {
        console.reset();
        registry.reset();
    }

    void addDevice(const QString &identity, const QString &host) {
        DeviceRecord record;
        record.identity = identity;
        record.host = host;
        registry->handleAdded(record);
        DeviceSession *session = registry->session(identity);
        ASSERT_TRUE(waitUntil([&]() { return session->hasState() && !session->accessoryInfo().isEmpty(); }));
    }

    QString run(const QString &line) {
        Command cmd;
        QString error;
        if (!parseCommand(line, &cmd, &error))
            return error;
        return console->execute(cmd);
    }

    QTemporaryDir dir;
    FakeTransport transport;
    std::unique_ptr<DeviceRegistry> registry;
    std::unique_ptr<DeviceLabelStore> labels;
    std::unique_ptr<ConsoleController> console;
};

TEST_F(ConsoleControllerTest, ListShowsNumberedDevices) {
    const QString text = run(QStringLiteral("list"));
    EXPECT_TRUE(text.contains(QStringLiteral("1. light-a")));
    EXPECT_TRUE(text.contains(QStringLiteral("2. light-b")));
    EXPECT_TRUE(text.contains(QStringLiteral("192.0.2.2:9123")));
    EXPECT_TRUE(text.contains(QStringLiteral("on 30%")));
}

TEST_F(ConsoleControllerTest, ResolvesByIndexIdentityAndLabel) {
    EXPECT_EQ(console->resolve(QStringLiteral("2")), registry->session(QStringLiteral("light-b")));
    EXPECT_EQ(console->resolve(QStringLiteral("LIGHT-A")), registry->session(QStringLiteral("light-a")));
    EXPECT_EQ(console->resolve(QStringLiteral("3")), nullptr);
    EXPECT_EQ(console->resolve(QStringLiteral("nope")), nullptr);
}

TEST_F(ConsoleControllerTest, SetQueuesChange) {
    const QString text = run(QStringLiteral("set 1 off brightness=75"));
    EXPECT_TRUE(text.contains(QStringLiteral("Updated 1")));

    DeviceSession *session = registry->session(QStringLiteral("light-a"));
    EXPECT_TRUE(session->hasPendingChange());
    EXPECT_FALSE(session->pendingChange().on);
    EXPECT_EQ(session->pendingChange().brightness, 75);
}

TEST_F(ConsoleControllerTest, SetReportsInvalidValues) {
    const QString text = run(QStringLiteral("set light-a brightness=0"));
    EXPECT_TRUE(text.contains(QStringLiteral("Updated 0")));
    EXPECT_TRUE(text.contains(QStringLiteral("InvalidStateValue")));
    EXPECT_FALSE(registry->session(QStringLiteral("light-a"))->hasPendingChange());
}

TEST_F(ConsoleControllerTest, ToggleAll) {
    const QString text = run(QStringLiteral("toggle all"));
    EXPECT_TRUE(text.contains(QStringLiteral("2")));
    EXPECT_FALSE(registry->session(QStringLiteral("light-a"))->effectiveState().on);
    EXPECT_FALSE(registry->session(QStringLiteral("light-b"))->effectiveState().on);
}

TEST_F(ConsoleControllerTest, FetchReportsLater) {
    QSignalSpy output(console.get(), &ConsoleController::output);
    const QString text = run(QStringLiteral("fetch 2"));
    EXPECT_TRUE(text.startsWith(QStringLiteral("Fetching")));
    ASSERT_TRUE(waitUntil([&]() { return output.count() == 1; }));
    EXPECT_TRUE(output.first().first().toString().contains(QStringLiteral("on 30%")));
}

TEST_F(ConsoleControllerTest, LabelAndUnlabel) {
    run(QStringLiteral("label light-a Key Left"));
    EXPECT_EQ(registry->displayName(QStringLiteral("light-a")), QStringLiteral("Key Left"));
    EXPECT_EQ(registry->displayName(QStringLiteral("light-b")), QStringLiteral("light-b"));
    EXPECT_EQ(console->resolve(QStringLiteral("key left")), registry->session(QStringLiteral("light-a")));
    EXPECT_EQ(console->resolve(QStringLiteral("Key")), nullptr);

    run(QStringLiteral("unlabel light-a"));
    EXPECT_EQ(registry->displayName(QStringLiteral("light-a")), QStringLiteral("light-a"));
}

TEST_F(ConsoleControllerTest, QuitIsSignalled) {
    QSignalSpy quit(console.get(), &ConsoleController::quitRequested);
    EXPECT_TRUE(run(QStringLiteral("quit")).isEmpty());
    EXPECT_EQ(quit.count(), 1);
}

TEST_F(ConsoleControllerTest, UnknownDevice) {
    EXPECT_TRUE(run(QStringLiteral("toggle 9")).contains(QStringLiteral("Unknown device")));
    EXPECT_TRUE(run(QStringLiteral("sync ghost")).contains(QStringLiteral("Unknown device")));
}

TEST_F(ConsoleControllerTest, LockShowsInListAndBlocksSync) {
    EXPECT_TRUE(run(QStringLiteral("lock 2")).contains(QStringLiteral("locked")));
    EXPECT_TRUE(registry->isLocked(QStringLiteral("light-b")));
    EXPECT_TRUE(labels->isLocked(QStringLiteral("3C6A9D1412AC")));
    EXPECT_TRUE(run(QStringLiteral("list")).contains(QStringLiteral("(locked)")));

    run(QStringLiteral("set 1 brightness=70"));
    run(QStringLiteral("sync 1 brightness"));
    EXPECT_EQ(registry->session(QStringLiteral("light-b"))->effectiveState().brightness, 30);

    EXPECT_TRUE(run(QStringLiteral("unlock light-b")).contains(QStringLiteral("unlocked")));
    EXPECT_FALSE(registry->isLocked(QStringLiteral("light-b")));
    EXPECT_FALSE(run(QStringLiteral("list")).contains(QStringLiteral("(locked)")));
    EXPECT_TRUE(run(QStringLiteral("lock 9")).contains(QStringLiteral("Unknown device")));
}

TEST_F(ConsoleControllerTest, SyncModeMirrorsSingleDeviceChanges) {
    EXPECT_EQ(run(QStringLiteral("syncmode brightness")), QStringLiteral("Sync mode: brightness"));
    EXPECT_EQ(registry->syncMode(), SyncMode::Brightness);

    run(QStringLiteral("set 1 off brightness=55"));
    const DeviceState b = registry->session(QStringLiteral("light-b"))->effectiveState();
    EXPECT_EQ(b.brightness, 55);
    EXPECT_TRUE(b.on);

    run(QStringLiteral("syncmode off"));
    run(QStringLiteral("set 1 brightness=65"));
    EXPECT_EQ(registry->session(QStringLiteral("light-b"))->effectiveState().brightness, 55);
}

TEST_F(ConsoleControllerTest, StartWatchesStdinOnce) {
    QString error;
    if (!console->start(&error))
        GTEST_SKIP() << "stdin unavailable: " << error.toStdString();
    EXPECT_TRUE(console->start(&error));
    console->stop();
    console->stop();
}
