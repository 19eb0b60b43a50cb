#include "keylight_console.h"

#include <cstdio>
#include <utility>

#include <QFile>
#include <QPointer>
#include <QRegularExpression>
#include <QSocketNotifier>

#include "keylight_config.h"
#include "keylight_registry.h"
#include "keylight_session.h"

namespace keylight::control {

namespace {

bool parseIntValue(const QString &token, const QString &key, int *out, QString *error)
{
    bool ok = false;
    const int value = token.mid(key.size() + 1).toInt(&ok);
    if (!ok) {
        if (error)
            *error = QStringLiteral("Invalid number in '%1'").arg(token);
        return false;
    }
    *out = value;
    return true;
}

bool needsTarget(CommandKind kind)
{
    switch (kind) {
    case CommandKind::Set:
    case CommandKind::Toggle:
    case CommandKind::Fetch:
    case CommandKind::Sync:
    case CommandKind::Label:
    case CommandKind::Unlabel:
    case CommandKind::Lock:
    case CommandKind::Unlock:
        return true;
    default:
        return false;
    }
}

QString describeState(const DeviceState &state)
{
    return QStringLiteral("%1 %2% %3K")
        .arg(state.on ? QStringLiteral("on") : QStringLiteral("off"))
        .arg(state.brightness)
        .arg(state.temperatureKelvin);
}

} // namespace

QString commandHelp()
{
    return QStringLiteral(
        "Commands:\n"
        "  list\n"
        "  set <device|all> [on|off] [brightness=N] [kelvin=N]\n"
        "  toggle <device|all>\n"
        "  fetch <device>\n"
        "  sync <device> [brightness] [temperature]\n"
        "  label <device> <text>\n"
        "  unlabel <device>\n"
        "  lock <device> / unlock <device>\n"
        "  syncmode <off|brightness|temperature|all>\n"
        "  help\n"
        "  quit\n"
        "Devices are addressed by name, label or list number.");
}

bool parseCommand(const QString &line, Command *out, QString *error)
{
    if (error)
        error->clear();
    if (!out)
        return false;

    static const QRegularExpression whitespace(QStringLiteral("\\s+"));
    const QStringList tokens = line.trimmed().split(whitespace, Qt::SkipEmptyParts);
    if (tokens.isEmpty())
        return false;

    Command cmd;
    const QString verb = tokens.first().toLower();
    if (verb == QLatin1String("list") || verb == QLatin1String("ls"))
        cmd.kind = CommandKind::List;
    else if (verb == QLatin1String("set"))
        cmd.kind = CommandKind::Set;
    else if (verb == QLatin1String("toggle"))
        cmd.kind = CommandKind::Toggle;
    else if (verb == QLatin1String("fetch"))
        cmd.kind = CommandKind::Fetch;
    else if (verb == QLatin1String("sync"))
        cmd.kind = CommandKind::Sync;
    else if (verb == QLatin1String("label"))
        cmd.kind = CommandKind::Label;
    else if (verb == QLatin1String("unlabel"))
        cmd.kind = CommandKind::Unlabel;
    else if (verb == QLatin1String("lock"))
        cmd.kind = CommandKind::Lock;
    else if (verb == QLatin1String("unlock"))
        cmd.kind = CommandKind::Unlock;
    else if (verb == QLatin1String("syncmode"))
        cmd.kind = CommandKind::SyncMode;
    else if (verb == QLatin1String("help") || verb == QLatin1String("?"))
        cmd.kind = CommandKind::Help;
    else if (verb == QLatin1String("quit") || verb == QLatin1String("exit"))
        cmd.kind = CommandKind::Quit;
    else {
        if (error)
            *error = QStringLiteral("Unknown command '%1'").arg(tokens.first());
        return false;
    }

    if (needsTarget(cmd.kind)) {
        if (tokens.size() < 2) {
            if (error)
                *error = QStringLiteral("'%1' needs a device").arg(verb);
            return false;
        }
        cmd.target = tokens.at(1);
        if (cmd.targetsAll() && cmd.kind != CommandKind::Set && cmd.kind != CommandKind::Toggle) {
            if (error)
                *error = QStringLiteral("'%1' works on a single device").arg(verb);
            return false;
        }
    }

    const QStringList rest = tokens.mid(needsTarget(cmd.kind) ? 2 : 1);
    switch (cmd.kind) {
    case CommandKind::Set:
        for (const QString &token : rest) {
            const QString lower = token.toLower();
            if (lower == QLatin1String("on")) {
                cmd.power = true;
            } else if (lower == QLatin1String("off")) {
                cmd.power = false;
            } else if (lower.startsWith(QLatin1String("brightness="))) {
                int value = 0;
                if (!parseIntValue(lower, QStringLiteral("brightness"), &value, error))
                    return false;
                cmd.brightness = value;
            } else if (lower.startsWith(QLatin1String("kelvin="))) {
                int value = 0;
                if (!parseIntValue(lower, QStringLiteral("kelvin"), &value, error))
                    return false;
                cmd.kelvin = value;
            } else {
                if (error)
                    *error = QStringLiteral("Unexpected argument '%1'").arg(token);
                return false;
            }
        }
        if (!cmd.power && !cmd.brightness && !cmd.kelvin) {
            if (error)
                *error = QStringLiteral("'set' needs on, off, brightness= or kelvin=");
            return false;
        }
        break;
    case CommandKind::Sync:
        for (const QString &token : rest) {
            const QString lower = token.toLower();
            if (lower == QLatin1String("brightness")) {
                cmd.syncBrightness = true;
            } else if (lower == QLatin1String("temperature") || lower == QLatin1String("kelvin")) {
                cmd.syncTemperature = true;
            } else {
                if (error)
                    *error = QStringLiteral("Unexpected argument '%1'").arg(token);
                return false;
            }
        }
        if (!cmd.syncBrightness && !cmd.syncTemperature) {
            cmd.syncBrightness = true;
            cmd.syncTemperature = true;
        }
        break;
    case CommandKind::Label:
        if (rest.isEmpty()) {
            if (error)
                *error = QStringLiteral("'label' needs a name");
            return false;
        }
        cmd.text = rest.join(QLatin1Char(' '));
        break;
    case CommandKind::SyncMode:
        if (rest.size() != 1 || !parseSyncMode(rest.first(), &cmd.mode)) {
            if (error)
                *error = QStringLiteral("'syncmode' needs one of off, brightness, temperature, all");
            return false;
        }
        break;
    default:
        if (!rest.isEmpty()) {
            if (error)
                *error = QStringLiteral("Unexpected argument '%1'").arg(rest.first());
            return false;
        }
        break;
    }

    *out = cmd;
    return true;
}

ConsoleController::ConsoleController(DeviceRegistry *registry,
                                     DeviceLabelStore *labels,
                                     QObject *parent)
    : QObject(parent)
    , m_registry(registry)
    , m_labels(labels)
{
}

ConsoleController::~ConsoleController()
{
    stop();
}

bool ConsoleController::start(QString *error)
{
    if (m_notifier)
        return true;

    auto *input = new QFile(this);
    if (!input->open(stdin, QIODevice::ReadOnly | QIODevice::Text)) {
        if (error)
            *error = QStringLiteral("Cannot read stdin: %1").arg(input->errorString());
        delete input;
        return false;
    }

    m_input = input;
    m_notifier = new QSocketNotifier(fileno(stdin), QSocketNotifier::Read, this);
    connect(m_notifier, &QSocketNotifier::activated, this, &ConsoleController::onReadable);
    return true;
}

void ConsoleController::stop()
{
    if (m_notifier) {
        m_notifier->setEnabled(false);
        m_notifier->deleteLater();
        m_notifier = nullptr;
    }
    if (m_input) {
        m_input->close();
        m_input->deleteLater();
        m_input = nullptr;
    }
}

void ConsoleController::onReadable()
{
    if (!m_input)
        return;

    const QByteArray raw = m_input->readLine();
    if (raw.isEmpty()) {
        // stdin closed; keep running on discovery alone.
        stop();
        return;
    }

    Command cmd;
    QString error;
    if (!parseCommand(QString::fromUtf8(raw), &cmd, &error)) {
        if (!error.isEmpty())
            emit output(error + QStringLiteral(" (try 'help')"));
        return;
    }

    const QString text = execute(cmd);
    if (!text.isEmpty())
        emit output(text);
}

DeviceSession *ConsoleController::resolve(const QString &target, QString *identity) const
{
    if (!m_registry)
        return nullptr;

    const QStringList ids = m_registry->identities();
    QString match;
    if (ids.contains(target)) {
        match = target;
    } else {
        bool isIndex = false;
        const int index = target.toInt(&isIndex);
        if (isIndex && index >= 1 && index <= ids.size()) {
            match = ids.at(index - 1);
        } else {
            for (const QString &id : ids) {
                if (m_registry->displayName(id).compare(target, Qt::CaseInsensitive) == 0
                    || id.compare(target, Qt::CaseInsensitive) == 0) {
                    match = id;
                    break;
                }
            }
        }
    }

    if (match.isEmpty())
        return nullptr;
    if (identity)
        *identity = match;
    return m_registry->session(match);
}

QString ConsoleController::execute(const Command &command)
{
    switch (command.kind) {
    case CommandKind::List:
        return listDevices();
    case CommandKind::Set:
        return applySet(command);
    case CommandKind::Toggle:
        return applyToggle(command);
    case CommandKind::Fetch:
        return applyFetch(command);
    case CommandKind::Sync:
        return applySync(command);
    case CommandKind::Label:
        return applyLabel(command);
    case CommandKind::Unlabel:
        return applyUnlabel(command);
    case CommandKind::Lock:
        return applyLock(command, true);
    case CommandKind::Unlock:
        return applyLock(command, false);
    case CommandKind::SyncMode:
        return applySyncMode(command);
    case CommandKind::Help:
        return commandHelp();
    case CommandKind::Quit:
        emit quitRequested();
        return {};
    }
    return {};
}

QString ConsoleController::listDevices() const
{
    if (!m_registry || m_registry->size() == 0)
        return QStringLiteral("No devices discovered yet.");

    QStringList lines;
    const QList<DeviceSnapshot> devices = m_registry->snapshot();
    for (int i = 0; i < devices.size(); ++i) {
        const DeviceSnapshot &d = devices.at(i);
        QString line = QStringLiteral("%1. %2 [%3] %4:%5 ")
                           .arg(i + 1)
                           .arg(d.label, d.record.identity, d.record.host)
                           .arg(d.record.port);
        line += d.hasState || d.hasPendingChange ? describeState(d.state) : QStringLiteral("state unknown");
        if (d.hasPendingChange)
            line += QStringLiteral(" (pending)");
        if (d.locked)
            line += QStringLiteral(" (locked)");
        if (d.degraded)
            line += QStringLiteral(" (unreachable: %1)").arg(d.lastError);
        lines.append(line);
    }
    return lines.join(QLatin1Char('\n'));
}

QString ConsoleController::applySet(const Command &command)
{
    if (!m_registry)
        return {};

    StatePatch patch;
    patch.on = command.power;
    patch.brightness = command.brightness;
    patch.temperatureKelvin = command.kelvin;

    QStringList problems;
    int changed = 0;
    if (command.targetsAll()) {
        changed = m_registry->applyToAll(patch, &problems);
    } else {
        QString identity;
        if (!resolve(command.target, &identity))
            return QStringLiteral("Unknown device '%1'").arg(command.target);

        QString error;
        if (m_registry->requestState(identity, patch, &error))
            changed = 1;
        else
            problems.append(QStringLiteral("%1: %2").arg(m_registry->displayName(identity), error));
    }

    QString text = QStringLiteral("Updated %1 device(s)").arg(changed);
    if (!problems.isEmpty())
        text += QLatin1Char('\n') + problems.join(QLatin1Char('\n'));
    return text;
}

QString ConsoleController::applyToggle(const Command &command)
{
    if (!m_registry)
        return {};

    if (command.targetsAll())
        return QStringLiteral("Toggled %1 device(s)").arg(m_registry->toggleAll());

    QString identity;
    DeviceSession *s = resolve(command.target, &identity);
    if (!s)
        return QStringLiteral("Unknown device '%1'").arg(command.target);

    StatePatch patch;
    patch.on = !s->effectiveState().on;
    QString error;
    if (!m_registry->requestState(identity, patch, &error))
        return error;
    return QStringLiteral("%1 -> %2").arg(m_registry->displayName(identity),
                                         *patch.on ? QStringLiteral("on") : QStringLiteral("off"));
}

QString ConsoleController::applyFetch(const Command &command)
{
    QString identity;
    DeviceSession *s = resolve(command.target, &identity);
    if (!s)
        return QStringLiteral("Unknown device '%1'").arg(command.target);

    const QString name = m_registry->displayName(identity);
    QPointer<ConsoleController> self(this);
    s->fetchState([self, name](const FetchResult &result) {
        if (!self)
            return;
        if (result.ok)
            emit self->output(QStringLiteral("%1: %2").arg(name, describeState(result.state)));
        else
            emit self->output(QStringLiteral("%1: %2 (%3)").arg(name, deviceErrorName(result.error), result.message));
    });
    return QStringLiteral("Fetching %1...").arg(name);
}

QString ConsoleController::applySync(const Command &command)
{
    QString identity;
    if (!resolve(command.target, &identity))
        return QStringLiteral("Unknown device '%1'").arg(command.target);

    QString error;
    const int changed = m_registry->syncFrom(identity, command.syncBrightness, command.syncTemperature, &error);
    if (changed < 0)
        return error;
    return QStringLiteral("Synced %1 device(s) from %2").arg(changed).arg(m_registry->displayName(identity));
}

QString ConsoleController::applyLabel(const Command &command)
{
    if (!m_labels)
        return QStringLiteral("Labels are not available");

    QString identity;
    DeviceSession *s = resolve(command.target, &identity);
    if (!s)
        return QStringLiteral("Unknown device '%1'").arg(command.target);

    QString original = s->accessoryInfo().displayName;
    if (original.isEmpty())
        original = identity;

    QString error;
    if (!m_labels->setLabel(m_registry->labelKey(identity), original, command.text, s->record().host, &error))
        return error;
    return QStringLiteral("%1 is now '%2'").arg(identity, command.text);
}

QString ConsoleController::applyUnlabel(const Command &command)
{
    if (!m_labels)
        return QStringLiteral("Labels are not available");

    QString identity;
    if (!resolve(command.target, &identity))
        return QStringLiteral("Unknown device '%1'").arg(command.target);

    QString error;
    if (!m_labels->removeLabel(m_registry->labelKey(identity), &error))
        return error.isEmpty() ? QStringLiteral("No label for %1").arg(identity) : error;
    return QStringLiteral("Removed label for %1").arg(identity);
}

QString ConsoleController::applyLock(const Command &command, bool locked)
{
    QString identity;
    if (!resolve(command.target, &identity))
        return QStringLiteral("Unknown device '%1'").arg(command.target);

    QString error;
    if (!m_registry->setLocked(identity, locked, &error))
        return error;
    return QStringLiteral("%1 %2").arg(m_registry->displayName(identity),
                                      locked ? QStringLiteral("locked") : QStringLiteral("unlocked"));
}

QString ConsoleController::applySyncMode(const Command &command)
{
    if (!m_registry)
        return {};
    m_registry->setSyncMode(command.mode);
    return QStringLiteral("Sync mode: %1").arg(syncModeName(command.mode));
}

} // namespace keylight::control
