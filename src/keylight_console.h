#pragma once

#include <optional>

#include <QObject>
#include <QString>
#include <QStringList>

#include "keylight_types.h"

class QFile;
class QSocketNotifier;

namespace keylight::control {

class DeviceLabelStore;
class DeviceRegistry;
class DeviceSession;

enum class CommandKind {
    List,
    Set,
    Toggle,
    Fetch,
    Sync,
    Label,
    Unlabel,
    Lock,
    Unlock,
    SyncMode,
    Help,
    Quit
};

struct Command {
    CommandKind kind = CommandKind::Help;
    // Identity, label, 1-based list index or "all".
    QString target;
    std::optional<bool> power;
    std::optional<int> brightness;
    std::optional<int> kelvin;
    bool syncBrightness = false;
    bool syncTemperature = false;
    SyncMode mode = SyncMode::Off;
    QString text;

    bool targetsAll() const { return target.compare(QLatin1String("all"), Qt::CaseInsensitive) == 0; }
};

// Parses one console line. Blank lines return false with an empty error.
bool parseCommand(const QString &line, Command *out, QString *error = nullptr);
QString commandHelp();

// Line-oriented control surface over stdin.
class ConsoleController : public QObject
{
    Q_OBJECT
public:
    ConsoleController(DeviceRegistry *registry,
                      DeviceLabelStore *labels,
                      QObject *parent = nullptr);
    ~ConsoleController() override;

    bool start(QString *error = nullptr);
    void stop();

    // Runs a parsed command and returns the text to print. Results of
    // device reads arrive later through output().
    QString execute(const Command &command);
    DeviceSession *resolve(const QString &target, QString *identity = nullptr) const;

signals:
    void output(const QString &text);
    void quitRequested();

private slots:
    void onReadable();

private:
    QString listDevices() const;
    QString applySet(const Command &command);
    QString applyToggle(const Command &command);
    QString applyFetch(const Command &command);
    QString applySync(const Command &command);
    QString applyLabel(const Command &command);
    QString applyUnlabel(const Command &command);
    QString applyLock(const Command &command, bool locked);
    QString applySyncMode(const Command &command);

    DeviceRegistry *m_registry = nullptr;
    DeviceLabelStore *m_labels = nullptr;
    QFile *m_input = nullptr;
    QSocketNotifier *m_notifier = nullptr;
};

} // namespace keylight::control
