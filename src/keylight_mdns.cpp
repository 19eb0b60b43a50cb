#include "keylight_mdns.h"

#include <QStringList>
#include <QtEndian>

namespace keylight::control::mdns {

namespace {

constexpr int kHeaderSize = 12;
constexpr int kMaxNameLength = 255;
constexpr int kMaxLabelLength = 63;
constexpr int kMaxPointerJumps = 32;

class Reader
{
public:
    explicit Reader(const QByteArray &data)
        : m_data(data)
    {
    }

    int pos() const { return m_pos; }
    void seek(int pos) { m_pos = pos; }
    bool has(int count) const { return m_pos >= 0 && m_pos + count <= m_data.size(); }

    bool u16(quint16 *out)
    {
        if (!has(2))
            return false;
        *out = qFromBigEndian<quint16>(reinterpret_cast<const uchar *>(m_data.constData() + m_pos));
        m_pos += 2;
        return true;
    }

    bool u32(quint32 *out)
    {
        if (!has(4))
            return false;
        *out = qFromBigEndian<quint32>(reinterpret_cast<const uchar *>(m_data.constData() + m_pos));
        m_pos += 4;
        return true;
    }

    bool name(QString *out, QString *error)
    {
        QStringList labels;
        int pos = m_pos;
        int end = -1;
        int jumps = 0;
        int length = 0;

        while (true) {
            if (pos < 0 || pos >= m_data.size()) {
                *error = QStringLiteral("Name runs past end of packet");
                return false;
            }
            const quint8 len = static_cast<quint8>(m_data.at(pos));
            if (len == 0) {
                if (end < 0)
                    end = pos + 1;
                break;
            }
            if ((len & 0xC0) == 0xC0) {
                if (pos + 1 >= m_data.size()) {
                    *error = QStringLiteral("Truncated compression pointer");
                    return false;
                }
                const int pointer = ((len & 0x3F) << 8) | static_cast<quint8>(m_data.at(pos + 1));
                if (end < 0)
                    end = pos + 2;
                // Pointers must go backwards, which also rules out loops.
                if (pointer >= pos || ++jumps > kMaxPointerJumps) {
                    *error = QStringLiteral("Invalid compression pointer");
                    return false;
                }
                pos = pointer;
                continue;
            }
            if ((len & 0xC0) != 0) {
                *error = QStringLiteral("Unsupported label type");
                return false;
            }
            if (pos + 1 + len > m_data.size()) {
                *error = QStringLiteral("Label runs past end of packet");
                return false;
            }
            length += len + 1;
            if (length > kMaxNameLength) {
                *error = QStringLiteral("Name exceeds 255 bytes");
                return false;
            }
            QString label = QString::fromUtf8(m_data.constData() + pos + 1, len);
            label.replace(QLatin1Char('.'), QStringLiteral("\\."));
            labels.append(label);
            pos += 1 + len;
        }

        *out = labels.join(QLatin1Char('.'));
        m_pos = end;
        return true;
    }

private:
    const QByteArray &m_data;
    int m_pos = 0;
};

QStringList splitLabels(const QString &name)
{
    QStringList labels;
    QString current;
    for (int i = 0; i < name.size(); ++i) {
        const QChar c = name.at(i);
        if (c == QLatin1Char('\\') && i + 1 < name.size() && name.at(i + 1) == QLatin1Char('.')) {
            current.append(QLatin1Char('.'));
            ++i;
            continue;
        }
        if (c == QLatin1Char('.')) {
            if (!current.isEmpty())
                labels.append(current);
            current.clear();
            continue;
        }
        current.append(c);
    }
    if (!current.isEmpty())
        labels.append(current);
    return labels;
}

void appendU16(QByteArray &out, quint16 value)
{
    uchar buf[2];
    qToBigEndian<quint16>(value, buf);
    out.append(reinterpret_cast<const char *>(buf), 2);
}

void appendU32(QByteArray &out, quint32 value)
{
    uchar buf[4];
    qToBigEndian<quint32>(value, buf);
    out.append(reinterpret_cast<const char *>(buf), 4);
}

void appendName(QByteArray &out, const QString &name)
{
    const QStringList labels = splitLabels(name);
    for (const QString &label : labels) {
        const QByteArray utf8 = label.toUtf8().left(kMaxLabelLength);
        out.append(static_cast<char>(utf8.size()));
        out.append(utf8);
    }
    out.append('\0');
}

QByteArray encodeRdata(const ResourceRecord &record)
{
    QByteArray rdata;
    switch (record.type) {
    case RecordType::PTR:
        appendName(rdata, record.target);
        break;
    case RecordType::SRV:
        appendU16(rdata, record.priority);
        appendU16(rdata, record.weight);
        appendU16(rdata, record.port);
        appendName(rdata, record.target);
        break;
    case RecordType::TXT:
        for (auto it = record.txt.constBegin(); it != record.txt.constEnd(); ++it) {
            QByteArray entry = it.key().toUtf8();
            if (!it.value().isNull()) {
                entry.append('=');
                entry.append(it.value().toUtf8());
            }
            entry = entry.left(255);
            rdata.append(static_cast<char>(entry.size()));
            rdata.append(entry);
        }
        if (rdata.isEmpty())
            rdata.append('\0');
        break;
    case RecordType::A: {
        appendU32(rdata, record.address.toIPv4Address());
        break;
    }
    case RecordType::AAAA: {
        const Q_IPV6ADDR addr = record.address.toIPv6Address();
        rdata.append(reinterpret_cast<const char *>(addr.c), 16);
        break;
    }
    case RecordType::ANY:
        rdata = record.rdata;
        break;
    }
    if (rdata.isEmpty())
        rdata = record.rdata;
    return rdata;
}

void appendRecord(QByteArray &out, const ResourceRecord &record)
{
    appendName(out, record.name);
    appendU16(out, static_cast<quint16>(record.type));
    appendU16(out, static_cast<quint16>(record.rrClass | (record.cacheFlush ? kCacheFlushBit : 0)));
    appendU32(out, record.ttl);
    const QByteArray rdata = encodeRdata(record);
    appendU16(out, static_cast<quint16>(rdata.size()));
    out.append(rdata);
}

QHash<QString, QString> parseTxt(const QByteArray &data, int start, int length)
{
    QHash<QString, QString> txt;
    int pos = start;
    const int end = start + length;
    while (pos < end) {
        const int len = static_cast<quint8>(data.at(pos));
        ++pos;
        if (len == 0)
            continue;
        if (pos + len > end)
            break;
        const QString entry = QString::fromUtf8(data.constData() + pos, len);
        pos += len;
        const int eq = entry.indexOf(QLatin1Char('='));
        if (eq == 0)
            continue;
        if (eq < 0)
            txt.insert(entry.toLower(), QString());
        else
            txt.insert(entry.left(eq).toLower(), entry.mid(eq + 1));
    }
    return txt;
}

bool parseRecord(const QByteArray &data, Reader &reader, ResourceRecord *record, QString *error)
{
    if (!reader.name(&record->name, error))
        return false;

    quint16 type = 0;
    quint16 rrClass = 0;
    quint32 ttl = 0;
    quint16 rdLength = 0;
    if (!reader.u16(&type) || !reader.u16(&rrClass) || !reader.u32(&ttl) || !reader.u16(&rdLength)) {
        *error = QStringLiteral("Truncated resource record header");
        return false;
    }
    if (!reader.has(rdLength)) {
        *error = QStringLiteral("Truncated resource record data");
        return false;
    }

    const int rdStart = reader.pos();
    const int rdEnd = rdStart + rdLength;
    record->type = static_cast<RecordType>(type);
    record->cacheFlush = (rrClass & kCacheFlushBit) != 0;
    record->rrClass = static_cast<quint16>(rrClass & ~kCacheFlushBit);
    record->ttl = ttl;
    record->rdata = data.mid(rdStart, rdLength);

    switch (record->type) {
    case RecordType::PTR:
        if (!reader.name(&record->target, error))
            return false;
        break;
    case RecordType::SRV:
        if (!reader.u16(&record->priority) || !reader.u16(&record->weight) || !reader.u16(&record->port)) {
            *error = QStringLiteral("Truncated SRV record");
            return false;
        }
        if (!reader.name(&record->target, error))
            return false;
        break;
    case RecordType::TXT:
        record->txt = parseTxt(data, rdStart, rdLength);
        break;
    case RecordType::A:
        if (rdLength != 4) {
            *error = QStringLiteral("A record with %1 byte address").arg(rdLength);
            return false;
        }
        record->address = QHostAddress(qFromBigEndian<quint32>(reinterpret_cast<const uchar *>(data.constData() + rdStart)));
        break;
    case RecordType::AAAA:
        if (rdLength != 16) {
            *error = QStringLiteral("AAAA record with %1 byte address").arg(rdLength);
            return false;
        }
        record->address = QHostAddress(reinterpret_cast<const quint8 *>(data.constData() + rdStart));
        break;
    default:
        break;
    }

    if (reader.pos() > rdEnd) {
        *error = QStringLiteral("Record data overruns its length");
        return false;
    }
    reader.seek(rdEnd);
    return true;
}

bool parseSection(const QByteArray &data, Reader &reader, quint16 count, QList<ResourceRecord> *out, QString *error)
{
    for (quint16 i = 0; i < count; ++i) {
        ResourceRecord record;
        if (!parseRecord(data, reader, &record, error))
            return false;
        out->append(record);
    }
    return true;
}

} // namespace

QString canonicalName(const QString &name)
{
    QString out = name.trimmed().toLower();
    while (out.endsWith(QLatin1Char('.')) && !out.endsWith(QStringLiteral("\\.")))
        out.chop(1);
    return out;
}

QByteArray encodeMessage(const Message &message)
{
    QByteArray out;
    appendU16(out, message.id);
    appendU16(out, message.flags);
    appendU16(out, static_cast<quint16>(message.questions.size()));
    appendU16(out, static_cast<quint16>(message.answers.size()));
    appendU16(out, static_cast<quint16>(message.authorities.size()));
    appendU16(out, static_cast<quint16>(message.additionals.size()));

    for (const Question &question : message.questions) {
        appendName(out, question.name);
        appendU16(out, static_cast<quint16>(question.type));
        appendU16(out, static_cast<quint16>(kClassIn | (question.unicastResponse ? kUnicastResponseBit : 0)));
    }
    for (const ResourceRecord &record : message.answers)
        appendRecord(out, record);
    for (const ResourceRecord &record : message.authorities)
        appendRecord(out, record);
    for (const ResourceRecord &record : message.additionals)
        appendRecord(out, record);
    return out;
}

QByteArray buildQuery(const QList<Question> &questions)
{
    Message message;
    message.questions = questions;
    return encodeMessage(message);
}

bool parseMessage(const QByteArray &datagram, Message *message, QString *error)
{
    QString localError;
    auto fail = [error](const QString &reason) {
        if (error)
            *error = reason;
        return false;
    };

    if (!message)
        return fail(QStringLiteral("Message output is null"));
    if (datagram.size() < kHeaderSize)
        return fail(QStringLiteral("Packet shorter than DNS header"));

    Reader reader(datagram);
    Message out;
    quint16 qdCount = 0;
    quint16 anCount = 0;
    quint16 nsCount = 0;
    quint16 arCount = 0;
    reader.u16(&out.id);
    reader.u16(&out.flags);
    reader.u16(&qdCount);
    reader.u16(&anCount);
    reader.u16(&nsCount);
    reader.u16(&arCount);

    for (quint16 i = 0; i < qdCount; ++i) {
        Question question;
        if (!reader.name(&question.name, &localError))
            return fail(localError);
        quint16 type = 0;
        quint16 qClass = 0;
        if (!reader.u16(&type) || !reader.u16(&qClass))
            return fail(QStringLiteral("Truncated question"));
        question.type = static_cast<RecordType>(type);
        question.unicastResponse = (qClass & kUnicastResponseBit) != 0;
        out.questions.append(question);
    }

    if (!parseSection(datagram, reader, anCount, &out.answers, &localError)
        || !parseSection(datagram, reader, nsCount, &out.authorities, &localError)
        || !parseSection(datagram, reader, arCount, &out.additionals, &localError)) {
        return fail(localError);
    }

    *message = out;
    if (error)
        error->clear();
    return true;
}

} // namespace keylight::control::mdns
