#pragma once

#include <QByteArray>
#include <QHash>
#include <QHostAddress>
#include <QList>
#include <QString>

namespace keylight::control::mdns {

inline constexpr quint16 kPort = 5353;
inline constexpr const char kIpv4Group[] = "224.0.0.251";

inline constexpr quint16 kClassIn = 1;
inline constexpr quint16 kCacheFlushBit = 0x8000;
inline constexpr quint16 kUnicastResponseBit = 0x8000;
inline constexpr quint16 kResponseFlag = 0x8000;
inline constexpr quint16 kAuthoritativeFlag = 0x0400;

enum class RecordType : quint16 {
    A = 1,
    PTR = 12,
    TXT = 16,
    AAAA = 28,
    SRV = 33,
    ANY = 255,
};

struct Question {
    QString name;
    RecordType type = RecordType::PTR;
    bool unicastResponse = false;
};

struct ResourceRecord {
    QString name;
    RecordType type = RecordType::A;
    quint16 rrClass = kClassIn;
    bool cacheFlush = false;
    quint32 ttl = 0;

    // PTR target or SRV target host.
    QString target;
    quint16 priority = 0;
    quint16 weight = 0;
    quint16 port = 0;
    QHash<QString, QString> txt;
    QHostAddress address;
    // Raw rdata for types this codec does not interpret.
    QByteArray rdata;
};

struct Message {
    quint16 id = 0;
    quint16 flags = 0;
    QList<Question> questions;
    QList<ResourceRecord> answers;
    QList<ResourceRecord> authorities;
    QList<ResourceRecord> additionals;

    bool isResponse() const { return (flags & kResponseFlag) != 0; }
};

// Lower-cased name without a trailing dot; DNS names compare case-insensitively.
QString canonicalName(const QString &name);

QByteArray encodeMessage(const Message &message);
QByteArray buildQuery(const QList<Question> &questions);

bool parseMessage(const QByteArray &datagram, Message *message, QString *error = nullptr);

} // namespace keylight::control::mdns
