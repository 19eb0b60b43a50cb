#include "keylight_config.h"

#include <algorithm>

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QLoggingCategory>
#include <QStandardPaths>
#include <QStringList>
#include <QVariant>

Q_LOGGING_CATEGORY(configLog, "keylight.config")

namespace keylight::control {

namespace {

constexpr auto kLabelsVersion = "1.0";

int readInt(const QJsonObject &obj, const QString &key, int fallback)
{
    if (!obj.contains(key))
        return fallback;
    bool ok = false;
    const int value = obj.value(key).toVariant().toInt(&ok);
    return ok ? value : fallback;
}

bool readBool(const QJsonObject &obj, const QString &key, bool fallback)
{
    const QJsonValue value = obj.value(key);
    if (value.isBool())
        return value.toBool();
    if (value.isDouble())
        return value.toDouble() != 0.0;
    return fallback;
}

bool ensureDirectory(const QString &filePath, QString *error)
{
    const QString dirPath = QFileInfo(filePath).absolutePath();
    QDir dir(dirPath);
    if (dir.exists())
        return true;
    if (!dir.mkpath(QStringLiteral("."))) {
        if (error)
            *error = QStringLiteral("Cannot create directory %1").arg(dirPath);
        return false;
    }
    QFile::setPermissions(dirPath, QFileDevice::ReadOwner | QFileDevice::WriteOwner | QFileDevice::ExeOwner);
    return true;
}

bool writeJson(const QString &path, const QJsonObject &obj, QString *error)
{
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        if (error)
            *error = QStringLiteral("Cannot write %1: %2").arg(path, file.errorString());
        return false;
    }
    const QByteArray bytes = QJsonDocument(obj).toJson(QJsonDocument::Indented);
    if (file.write(bytes) != bytes.size()) {
        if (error)
            *error = QStringLiteral("Short write to %1: %2").arg(path, file.errorString());
        return false;
    }
    file.close();
    file.setPermissions(QFileDevice::ReadOwner | QFileDevice::WriteOwner);
    return true;
}

bool readJsonObject(const QString &path, QJsonObject *out, QString *error)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        if (error)
            *error = QStringLiteral("Cannot read %1: %2").arg(path, file.errorString());
        return false;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        if (error)
            *error = QStringLiteral("Invalid JSON in %1: %2").arg(path, parseError.errorString());
        return false;
    }

    *out = doc.object();
    return true;
}

QJsonObject emptyLabels()
{
    QJsonObject obj;
    obj.insert(QStringLiteral("version"), QString::fromLatin1(kLabelsVersion));
    obj.insert(QStringLiteral("devices"), QJsonObject());
    return obj;
}

QString timestampNow()
{
    return QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs);
}

std::int64_t lastSeenMs(const QJsonValue &value)
{
    if (value.isDouble())
        return static_cast<std::int64_t>(value.toDouble() * 1000.0);
    if (!value.isString())
        return 0;

    QDateTime dt = QDateTime::fromString(value.toString(), Qt::ISODateWithMs);
    if (!dt.isValid())
        dt = QDateTime::fromString(value.toString(), Qt::ISODate);
    return dt.isValid() ? dt.toMSecsSinceEpoch() : 0;
}

} // namespace

QString defaultConfigDirectory()
{
    QString base = QStandardPaths::writableLocation(QStandardPaths::GenericConfigLocation);
    if (base.isEmpty())
        base = QDir::homePath() + QStringLiteral("/.config");
    return base + QStringLiteral("/keylight-control");
}

QString defaultSettingsPath()
{
    return defaultConfigDirectory() + QStringLiteral("/settings.json");
}

QString defaultLabelsPath()
{
    return defaultConfigDirectory() + QStringLiteral("/device-labels.json");
}

ControllerSettings settingsFromJson(const QJsonObject &obj)
{
    ControllerSettings out;
    SessionSettings &session = out.session;

    session.flushIntervalMs = std::clamp(readInt(obj, QStringLiteral("flushIntervalMs"), session.flushIntervalMs), 20, 5000);
    session.requestTimeoutMs = std::clamp(readInt(obj, QStringLiteral("requestTimeoutMs"), session.requestTimeoutMs), 200, 30000);
    session.degradedRetryMs = std::clamp(readInt(obj, QStringLiteral("degradedRetryMs"), session.degradedRetryMs), 500, 60000);

    const int reconcile = readInt(obj, QStringLiteral("reconcileIntervalMs"), session.reconcileIntervalMs);
    session.reconcileIntervalMs = reconcile <= 0 ? 0 : std::clamp(reconcile, 1000, 600000);

    const QString serviceType = obj.value(QStringLiteral("serviceType")).toString().trimmed();
    if (!serviceType.isEmpty())
        out.serviceType = serviceType;

    out.enableDiscovery = readBool(obj, QStringLiteral("enableDiscovery"), out.enableDiscovery);
    out.singleInstance = readBool(obj, QStringLiteral("singleInstance"), out.singleInstance);
    out.debugLogging = readBool(obj, QStringLiteral("debugLogging"), out.debugLogging);
    out.ignoreLocks = readBool(obj, QStringLiteral("masterIgnoreLocks"), out.ignoreLocks);

    const QString semantics = obj.value(QStringLiteral("masterPowerSemantics")).toString();
    if (!semantics.isEmpty() && !parsePowerSemantics(semantics, &out.powerSemantics))
        qCWarning(configLog).noquote() << "unknown masterPowerSemantics" << semantics << "- using AnyOn";

    const QString syncMode = obj.value(QStringLiteral("syncMode")).toString();
    if (!syncMode.isEmpty() && !parseSyncMode(syncMode, &out.syncMode))
        qCWarning(configLog).noquote() << "unknown syncMode" << syncMode << "- sync stays off";
    return out;
}

QJsonObject settingsToJson(const ControllerSettings &settings)
{
    QJsonObject obj;
    obj.insert(QStringLiteral("flushIntervalMs"), settings.session.flushIntervalMs);
    obj.insert(QStringLiteral("requestTimeoutMs"), settings.session.requestTimeoutMs);
    obj.insert(QStringLiteral("reconcileIntervalMs"), settings.session.reconcileIntervalMs);
    obj.insert(QStringLiteral("degradedRetryMs"), settings.session.degradedRetryMs);
    obj.insert(QStringLiteral("serviceType"), settings.serviceType);
    obj.insert(QStringLiteral("enableDiscovery"), settings.enableDiscovery);
    obj.insert(QStringLiteral("singleInstance"), settings.singleInstance);
    obj.insert(QStringLiteral("debugLogging"), settings.debugLogging);
    obj.insert(QStringLiteral("masterPowerSemantics"), powerSemanticsName(settings.powerSemantics));
    obj.insert(QStringLiteral("masterIgnoreLocks"), settings.ignoreLocks);
    obj.insert(QStringLiteral("syncMode"), syncModeName(settings.syncMode));
    return obj;
}

bool loadSettings(const QString &path, ControllerSettings *settings, QString *error)
{
    if (!settings)
        return false;

    *settings = ControllerSettings{};
    if (!QFileInfo::exists(path)) {
        qCDebug(configLog).noquote() << "no settings at" << path << "- using defaults";
        if (error)
            error->clear();
        return true;
    }

    QJsonObject obj;
    QString readError;
    if (!readJsonObject(path, &obj, &readError)) {
        qCWarning(configLog).noquote() << readError << "- using defaults";
        if (error)
            *error = readError;
        return false;
    }

    *settings = settingsFromJson(obj);
    if (error)
        error->clear();
    return true;
}

bool saveSettings(const QString &path, const ControllerSettings &settings, QString *error)
{
    if (!ensureDirectory(path, error))
        return false;
    return writeJson(path, settingsToJson(settings), error);
}

DeviceLabelStore::DeviceLabelStore(const QString &path)
    : m_path(path)
    , m_data(emptyLabels())
{
}

bool DeviceLabelStore::load(QString *error)
{
    m_data = emptyLabels();
    if (!QFileInfo::exists(m_path))
        return true;

    QJsonObject obj;
    QString readError;
    if (!readJsonObject(m_path, &obj, &readError)) {
        qCWarning(configLog).noquote() << readError << "- starting with no labels";
        if (error)
            *error = readError;
        return false;
    }

    if (!obj.contains(QStringLiteral("version")) || !obj.value(QStringLiteral("devices")).isObject()) {
        const QString message = QStringLiteral("Invalid label file structure in %1").arg(m_path);
        qCWarning(configLog).noquote() << message << "- starting with no labels";
        if (error)
            *error = message;
        return false;
    }

    m_data = obj;
    return true;
}

QJsonObject DeviceLabelStore::devices() const
{
    return m_data.value(QStringLiteral("devices")).toObject();
}

QString DeviceLabelStore::label(const QString &key, const QString &fallback) const
{
    if (key.isEmpty())
        return fallback;
    const QJsonObject entry = devices().value(key).toObject();
    const QString custom = entry.value(QStringLiteral("custom_label")).toString();
    return custom.isEmpty() ? fallback : custom;
}

bool DeviceLabelStore::hasLabel(const QString &key) const
{
    if (key.isEmpty())
        return false;
    return devices().value(key).toObject().contains(QStringLiteral("custom_label"));
}

bool DeviceLabelStore::setLabel(const QString &key,
                                const QString &originalName,
                                const QString &label,
                                const QString &currentIp,
                                QString *error)
{
    if (key.isEmpty()) {
        if (error)
            *error = QStringLiteral("Cannot set label without a hardware address");
        return false;
    }
    if (label.trimmed().isEmpty()) {
        if (error)
            *error = QStringLiteral("Label must not be empty");
        return false;
    }

    QJsonObject all = devices();
    QJsonObject entry = all.value(key).toObject();
    entry.insert(QStringLiteral("original_name"), originalName);
    entry.insert(QStringLiteral("custom_label"), label.trimmed());
    entry.insert(QStringLiteral("last_seen"), timestampNow());
    if (!currentIp.isEmpty())
        entry.insert(QStringLiteral("last_ip"), currentIp);

    all.insert(key, entry);
    m_data.insert(QStringLiteral("devices"), all);
    return save(error);
}

bool DeviceLabelStore::removeLabel(const QString &key, QString *error)
{
    if (key.isEmpty())
        return false;

    QJsonObject all = devices();
    if (!all.contains(key))
        return true;

    QJsonObject entry = all.value(key).toObject();
    if (entry.value(QStringLiteral("locked")).toBool()) {
        entry.remove(QStringLiteral("custom_label"));
        all.insert(key, entry);
    } else {
        all.remove(key);
    }
    m_data.insert(QStringLiteral("devices"), all);
    return save(error);
}

bool DeviceLabelStore::isLocked(const QString &key) const
{
    if (key.isEmpty())
        return false;
    return devices().value(key).toObject().value(QStringLiteral("locked")).toBool();
}

bool DeviceLabelStore::setLocked(const QString &key,
                                 const QString &originalName,
                                 bool locked,
                                 const QString &currentIp,
                                 QString *error)
{
    if (key.isEmpty()) {
        if (error)
            *error = QStringLiteral("Cannot lock a device without a hardware address");
        return false;
    }

    QJsonObject all = devices();
    if (!locked && !all.contains(key))
        return true;

    QJsonObject entry = all.value(key).toObject();
    if (!locked && !entry.contains(QStringLiteral("custom_label"))) {
        all.remove(key);
    } else {
        if (!entry.contains(QStringLiteral("original_name")))
            entry.insert(QStringLiteral("original_name"), originalName);
        entry.insert(QStringLiteral("locked"), locked);
        entry.insert(QStringLiteral("last_seen"), timestampNow());
        if (!currentIp.isEmpty())
            entry.insert(QStringLiteral("last_ip"), currentIp);
        all.insert(key, entry);
    }
    m_data.insert(QStringLiteral("devices"), all);
    return save(error);
}

bool DeviceLabelStore::touch(const QString &key, const QString &currentIp, QString *error)
{
    QJsonObject all = devices();
    if (key.isEmpty() || !all.contains(key))
        return true;

    QJsonObject entry = all.value(key).toObject();
    entry.insert(QStringLiteral("last_seen"), timestampNow());
    if (!currentIp.isEmpty())
        entry.insert(QStringLiteral("last_ip"), currentIp);
    all.insert(key, entry);
    m_data.insert(QStringLiteral("devices"), all);
    return save(error);
}

int DeviceLabelStore::cleanupOlderThan(int days, std::int64_t nowMs, QString *error)
{
    if (days <= 0)
        return 0;

    const std::int64_t cutoff = nowMs - static_cast<std::int64_t>(days) * 24 * 60 * 60 * 1000;
    QJsonObject all = devices();
    QStringList stale;
    for (auto it = all.constBegin(); it != all.constEnd(); ++it) {
        if (lastSeenMs(it.value().toObject().value(QStringLiteral("last_seen"))) < cutoff)
            stale.append(it.key());
    }
    if (stale.isEmpty())
        return 0;

    for (const QString &key : std::as_const(stale))
        all.remove(key);
    m_data.insert(QStringLiteral("devices"), all);
    if (!save(error))
        return -1;
    qCInfo(configLog) << "removed" << stale.size() << "stale label(s)";
    return stale.size();
}

bool DeviceLabelStore::exportTo(const QString &path, QString *error) const
{
    if (!ensureDirectory(path, error))
        return false;
    return writeJson(path, m_data, error);
}

bool DeviceLabelStore::importFrom(const QString &path, bool merge, QString *error)
{
    if (!QFileInfo::exists(path)) {
        if (error)
            *error = QStringLiteral("Import file does not exist: %1").arg(path);
        return false;
    }

    QJsonObject imported;
    if (!readJsonObject(path, &imported, error))
        return false;

    if (merge) {
        QJsonObject all = devices();
        const QJsonObject incoming = imported.value(QStringLiteral("devices")).toObject();
        for (auto it = incoming.constBegin(); it != incoming.constEnd(); ++it)
            all.insert(it.key(), it.value());
        m_data.insert(QStringLiteral("devices"), all);
    } else {
        if (!imported.value(QStringLiteral("devices")).isObject()) {
            if (error)
                *error = QStringLiteral("Imported file has no devices object");
            return false;
        }
        m_data = imported;
        if (!m_data.contains(QStringLiteral("version")))
            m_data.insert(QStringLiteral("version"), QString::fromLatin1(kLabelsVersion));
    }
    return save(error);
}

bool DeviceLabelStore::save(QString *error)
{
    if (!ensureDirectory(m_path, error))
        return false;

    if (QFileInfo::exists(m_path)) {
        const QString backup = m_path + QStringLiteral(".backup");
        QFile::remove(backup);
        if (!QFile::rename(m_path, backup))
            qCWarning(configLog).noquote() << "cannot keep backup" << backup;
    }

    QString writeError;
    if (!writeJson(m_path, m_data, &writeError)) {
        qCWarning(configLog).noquote() << writeError;
        if (error)
            *error = writeError;
        return false;
    }
    return true;
}

} // namespace keylight::control
