#include "SsdpProtocol.h"
#include "SearchResult.h"
#include "DiscoveryConfig.h"
#include <QTimer>
#include <QDebug>

SsdpProtocol::SsdpProtocol(SsdpTransport *transport, QObject *parent)
    : QObject(parent), m_transport(transport)
{
    connect(m_transport, &SsdpTransport::datagramReceived, this, &SsdpProtocol::onDatagramReceived);
}

SsdpProtocol *SsdpProtocol::listen(const TransportFactory &factory, const QHostAddress &lanAddress,
                                   const DiscoveryConfig &config, QObject *parent, QString *errorString)
{
    SsdpTransport *transport = factory(parent);

    bool ok = transport->open(lanAddress, config.bindPort)
              && transport->joinGroup(QHostAddress(QLatin1String(Ssdp::MulticastAddress)))
              && transport->setTtl(config.multicastTtl);
    if (!ok) {
        if (errorString) {
            *errorString = QStringLiteral("failed to set up SSDP transport on %1: %2")
                               .arg(lanAddress.toString(), transport->errorString());
        }
        transport->close();
        delete transport;
        return nullptr;
    }

    auto protocol = new SsdpProtocol(transport, parent);
    transport->setParent(protocol);
    qDebug() << "[SsdpProtocol] Listening on" << lanAddress.toString();
    return protocol;
}

void SsdpProtocol::close()
{
    if (m_transport->isOpen())
        qDebug() << "[SsdpProtocol] Closing transport on" << m_transport->localAddress().toString();
    m_transport->close();
}

void SsdpProtocol::sendSearchRequests(const QHostAddress &address, const QList<SsdpDatagram> &requests)
{
    for (const SsdpDatagram &request : requests) {
        qDebug() << "[SsdpProtocol] Send M-SEARCH to" << address.toString() << ":" << request.st();
        m_transport->send(request.toByteArray(), address, Ssdp::Port);
    }
}

SearchResult *SsdpProtocol::search(const QHostAddress &address, int timeoutMsec,
                                   const QList<SsdpSearchParams> &params)
{
    auto result = new SearchResult(this);

    for (const SsdpSearchParams &p : params) {
        if (p.st().isNull()) {
            qCritical() << "[SsdpProtocol] M-SEARCH parameters without ST:" << p.toJson();
            result->failLater(Ssdp::Error::InvalidRequestError);
            return result;
        }
    }

    QList<SsdpDatagram> requests;
    for (const SsdpSearchParams &p : params) {
        SsdpDatagram request = SsdpDatagram::mSearch(p);
        PendingSearch pending;
        pending.address = address;
        pending.st = request.st();
        pending.result = result;
        pending.timeout = result->startTimeout(timeoutMsec);
        m_registry.add(pending);
        requests.append(request);
    }

    connect(result, &SearchResult::finished, this, [this]() {
        m_registry.removeStale();
    });

    sendSearchRequests(address, requests);
    return result;
}

void SsdpProtocol::onDatagramReceived(const QByteArray &data, const QHostAddress &sender, quint16 senderPort)
{
    // our own multicast looped back
    if (sender.isEqual(m_transport->localAddress(), QHostAddress::TolerantConversion))
        return;

    SsdpParseError parseError;
    SsdpDatagram packet = SsdpDatagram::fromByteArray(data, &parseError);
    if (parseError.error != SsdpParseError::NoError) {
        qWarning().noquote() << "[SsdpProtocol] Failed to decode SSDP packet from"
                             << QStringLiteral("%1:%2").arg(sender.toString()).arg(senderPort)
                             << "(" + parseError.errorString() + "):" << data.toHex();
        return;
    }
    qDebug() << "[SsdpProtocol] Decoded packet from" << sender.toString() << ":" << senderPort
             << packet.packetType() << packet.st();

    if (packet.packetType() == SsdpDatagram::OkReply)
        onReplyMatched(sender, packet);
}

void SsdpProtocol::onReplyMatched(const QHostAddress &sender, const SsdpDatagram &reply)
{
    const QList<PendingSearch> matched = m_registry.matchAndDrain(sender, reply.st());

    for (const PendingSearch &search : matched) {
        if (search.timeout)
            search.timeout->stop();
        if (search.result && search.result->resolve(reply))
            qDebug() << "[SsdpProtocol] Reply from" << sender.toString() << "answers" << search.st;
    }
}
