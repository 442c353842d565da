#pragma once

#include <QObject>
#include <QHostAddress>
#include "PendingSearchRegistry.h"
#include "SsdpDatagram.h"
#include "SsdpSearchParams.h"
#include "SsdpTransport.h"

struct DiscoveryConfig;
class SearchResult;
class SsdpProtocol : public QObject
{
    Q_OBJECT
public:
    explicit SsdpProtocol(SsdpTransport *transport, QObject *parent = nullptr);

    // Opens a transport on lanAddress, joins the SSDP group and limits the TTL.
    // Returns a protocol owning the transport, or nullptr with errorString set.
    static SsdpProtocol *listen(const TransportFactory &factory, const QHostAddress &lanAddress,
                                const DiscoveryConfig &config, QObject *parent, QString *errorString);

    void close();

    void sendSearchRequests(const QHostAddress &address, const QList<SsdpDatagram> &requests);

    // Sends one M-SEARCH per parameter set and returns the result they share.
    // The result is a child of the protocol; callers may delete it early to abandon the search.
    SearchResult *search(const QHostAddress &address, int timeoutMsec, const QList<SsdpSearchParams> &params);

    const PendingSearchRegistry &registry() const { return m_registry; }

public slots:
    void onDatagramReceived(const QByteArray &data, const QHostAddress &sender, quint16 senderPort);

private:
    void onReplyMatched(const QHostAddress &sender, const SsdpDatagram &reply);

    SsdpTransport *m_transport;
    PendingSearchRegistry m_registry;
};
