#include "SsdpDatagram.h"
#include "SsdpError.h"

static const QByteArray okStartLine = "HTTP/1.1 200 OK";
static const QByteArray mSearchStartLine = "M-SEARCH * HTTP/1.1";
static const QByteArray notifyStartLine = "NOTIFY * HTTP/1.1";

QString SsdpParseError::errorString() const
{
    switch (error) {
    case NoError:
        return QStringLiteral("no error occurred");
    case EmptyDatagram:
        return QStringLiteral("empty datagram");
    case UnknownStartLine:
        return QStringLiteral("unknown start line");
    case MalformedHeader:
        return QStringLiteral("malformed header on line %1").arg(line);
    }
    return QString();
}

SsdpDatagram SsdpDatagram::mSearch(const SsdpSearchParams &params)
{
    SsdpDatagram datagram(MSearch);

    // HOST, MAN and MX are mandatory for M-SEARCH; fill whatever the caller left out
    if (!params.contains("host"))
        datagram.m_headers.append(qMakePair(QStringLiteral("HOST"),
                                            QStringLiteral("%1:%2").arg(QLatin1String(Ssdp::MulticastAddress)).arg(Ssdp::Port)));
    if (!params.contains("man"))
        datagram.m_headers.append(qMakePair(QStringLiteral("MAN"), QStringLiteral("\"ssdp:discover\"")));
    if (!params.contains("mx"))
        datagram.m_headers.append(qMakePair(QStringLiteral("MX"), QStringLiteral("1")));

    datagram.m_headers.append(params.headers);
    return datagram;
}

SsdpDatagram SsdpDatagram::fromByteArray(const QByteArray &data, SsdpParseError *error)
{
    SsdpParseError result;
    SsdpDatagram datagram;

    QList<QByteArray> lines = data.split('\n');
    // trailing blank lines carry nothing
    while (!lines.isEmpty() && lines.last().trimmed().isEmpty())
        lines.removeLast();

    if (lines.isEmpty()) {
        result.error = SsdpParseError::EmptyDatagram;
        if (error)
            *error = result;
        return SsdpDatagram();
    }

    const QByteArray startLine = lines.first().trimmed();
    if (startLine.compare(okStartLine, Qt::CaseInsensitive) == 0) {
        datagram.m_type = OkReply;
    } else if (startLine.compare(mSearchStartLine, Qt::CaseInsensitive) == 0) {
        datagram.m_type = MSearch;
    } else if (startLine.compare(notifyStartLine, Qt::CaseInsensitive) == 0) {
        datagram.m_type = Notify;
    } else {
        result.error = SsdpParseError::UnknownStartLine;
        if (error)
            *error = result;
        return SsdpDatagram();
    }

    for (int i = 1; i < lines.size(); ++i) {
        const QByteArray line = lines[i].trimmed();
        if (line.isEmpty())
            break;

        int colonIndex = line.indexOf(':');
        if (colonIndex <= 0) {
            result.error = SsdpParseError::MalformedHeader;
            result.line = i;
            if (error)
                *error = result;
            return SsdpDatagram();
        }

        QString name = QString::fromUtf8(line.left(colonIndex)).trimmed();
        QString value = QString::fromUtf8(line.mid(colonIndex + 1)).trimmed();
        datagram.m_headers.append(qMakePair(name, value));
    }

    if (error)
        *error = result;
    return datagram;
}

QByteArray SsdpDatagram::toByteArray() const
{
    QByteArray out;
    switch (m_type) {
    case OkReply:
        out += okStartLine;
        break;
    case MSearch:
        out += mSearchStartLine;
        break;
    case Notify:
        out += notifyStartLine;
        break;
    case Unknown:
        return QByteArray();
    }
    out += "\r\n";

    for (const auto &header : m_headers)
        out += header.first.toUtf8() + ": " + header.second.toUtf8() + "\r\n";
    out += "\r\n";
    return out;
}

QString SsdpDatagram::header(const QString &name) const
{
    for (const auto &header : m_headers) {
        if (header.first.compare(name, Qt::CaseInsensitive) == 0)
            return header.second;
    }
    return QString();
}
