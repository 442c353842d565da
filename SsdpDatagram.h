#pragma once

#include <QByteArray>
#include <QList>
#include <QPair>
#include <QString>
#include "SsdpSearchParams.h"

struct SsdpParseError
{
    enum ParseError {
        NoError,
        EmptyDatagram,
        UnknownStartLine,
        MalformedHeader
    };

    ParseError error = NoError;
    int line = 0; // zero based line of the offending text

    QString errorString() const;
};

class SsdpDatagram
{
public:
    enum PacketType { Unknown, OkReply, MSearch, Notify };

    SsdpDatagram() = default;
    explicit SsdpDatagram(PacketType type) : m_type(type) {}

    static SsdpDatagram mSearch(const SsdpSearchParams &params);
    static SsdpDatagram fromByteArray(const QByteArray &data, SsdpParseError *error = nullptr);

    QByteArray toByteArray() const;

    PacketType packetType() const { return m_type; }
    bool isNull() const { return m_type == Unknown; }

    const QList<QPair<QString, QString>> &headers() const { return m_headers; }
    QString header(const QString &name) const;

    QString st() const { return header("st"); }
    QString location() const { return header("location"); }
    QString usn() const { return header("usn"); }
    QString server() const { return header("server"); }
    QString cacheControl() const { return header("cache-control"); }
    QString nt() const { return header("nt"); }
    QString nts() const { return header("nts"); }

private:
    PacketType m_type = Unknown;
    QList<QPair<QString, QString>> m_headers;
};
