#include "SearchPatterns.h"
#include "SsdpError.h"

namespace SearchPatterns {

QStringList defaultTargets()
{
    return {
        QStringLiteral("urn:schemas-upnp-org:device:InternetGatewayDevice:1"),
        QStringLiteral("urn:schemas-upnp-org:service:WANIPConnection:1"),
        QStringLiteral("urn:schemas-upnp-org:service:WANPPPConnection:1"),
        QStringLiteral("urn:schemas-upnp-org:device:InternetGatewayDevice:2"),
        QStringLiteral("urn:schemas-upnp-org:service:WANIPConnection:2"),
        QStringLiteral("urn:schemas-wifialliance-org:device:WFADevice:1"),
        QString::fromLatin1(Ssdp::RootDevice),
        QStringLiteral("ssdp:all")
    };
}

QList<SsdpSearchParams> generate(const QStringList &targets)
{
    const QString host = QStringLiteral("%1:%2").arg(QLatin1String(Ssdp::MulticastAddress)).arg(Ssdp::Port);

    QList<SsdpSearchParams> patterns;
    for (const QString &st : targets) {
        // UDA 1.0 style
        SsdpSearchParams uda;
        uda.append("HOST", host);
        uda.append("MAN", "\"ssdp:discover\"");
        uda.append("MX", "1");
        uda.append("ST", st);
        patterns.append(uda);

        // title-case names, ST before MAN
        SsdpSearchParams relaxed;
        relaxed.append("Host", host);
        relaxed.append("ST", st);
        relaxed.append("Man", "\"ssdp:discover\"");
        relaxed.append("MX", "3");
        patterns.append(relaxed);
    }
    return patterns;
}

}
