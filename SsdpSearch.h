#pragma once

#include <QObject>
#include <QHostAddress>
#include <QPointer>
#include "DiscoveryConfig.h"
#include "SsdpDatagram.h"
#include "SsdpError.h"
#include "SsdpSearchParams.h"
#include "SsdpTransport.h"

class SearchResult;
class SsdpProtocol;

// A single M-SEARCH against one gateway. Owns its transport from start() until finished().
class SsdpSearch : public QObject
{
    Q_OBJECT
public:
    SsdpSearch(const QHostAddress &lanAddress, const QHostAddress &gatewayAddress,
               const SsdpSearchParams &params, int timeoutMsec = 1000, QObject *parent = nullptr);
    ~SsdpSearch() override;

    void setConfig(const DiscoveryConfig &config) { m_config = config; }
    void setTransportFactory(const TransportFactory &factory) { m_factory = factory; }

    void start();
    void abort();

    bool isFinished() const { return m_finished; }
    Ssdp::Error error() const { return m_error; }
    QString errorString() const { return m_errorString; }
    SsdpSearchParams params() const { return m_params; }
    SsdpDatagram reply() const { return m_reply; }

signals:
    void finished();

private slots:
    void onResultFinished();

private:
    void finish(Ssdp::Error error, const QString &errorString);
    void release();

    QHostAddress m_lanAddress;
    QHostAddress m_gatewayAddress;
    SsdpSearchParams m_params;
    int m_timeout;
    DiscoveryConfig m_config;
    TransportFactory m_factory;

    SsdpProtocol *m_protocol = nullptr;
    QPointer<SearchResult> m_result;
    bool m_finished = false;
    Ssdp::Error m_error = Ssdp::Error::NoError;
    QString m_errorString;
    SsdpDatagram m_reply;
};
