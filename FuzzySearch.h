#pragma once

#include <QObject>
#include <QHostAddress>
#include <QList>
#include <QPointer>
#include "DiscoveryConfig.h"
#include "SsdpDatagram.h"
#include "SsdpError.h"
#include "SsdpSearchParams.h"
#include "SsdpTransport.h"

class SearchResult;
class SsdpProtocol;
class SsdpSearch;

// Finds the M-SEARCH header set a gateway answers when the right one is unknown.
//
// Candidates are sent in small batches sharing one result, each batch getting an
// equal share of the timeout. A reply only tells which batch worked, so the
// candidates of that batch are then retried one by one with a fresh SsdpSearch.
class FuzzySearch : public QObject
{
    Q_OBJECT
public:
    FuzzySearch(const QHostAddress &lanAddress, const QHostAddress &gatewayAddress,
                int timeoutMsec = 30000, QObject *parent = nullptr);
    ~FuzzySearch() override;

    void setConfig(const DiscoveryConfig &config) { m_config = config; }
    void setTransportFactory(const TransportFactory &factory) { m_factory = factory; }
    // Replaces the generated patterns
    void setCandidates(const QList<SsdpSearchParams> &candidates) { m_candidates = candidates; }

    void start();
    void abort();

    bool isFinished() const { return m_finished; }
    Ssdp::Error error() const { return m_error; }
    QString errorString() const { return m_errorString; }
    SsdpSearchParams params() const { return m_params; }
    SsdpDatagram reply() const { return m_reply; }

    int batchTimeout() const { return m_batchTimeout; }
    QList<SsdpSearchParams> viableCandidates() const { return m_viable; }

signals:
    void finished();

private slots:
    void onBatchFinished();
    void onVerifyFinished();

private:
    void sendNextBatch();
    void verifyNextCandidate();
    void finish(Ssdp::Error error, const QString &errorString);
    void finishLater(Ssdp::Error error, const QString &errorString);
    void release();
    QString timeoutMessage() const;

    QHostAddress m_lanAddress;
    QHostAddress m_gatewayAddress;
    int m_timeout;
    DiscoveryConfig m_config;
    TransportFactory m_factory;
    QList<SsdpSearchParams> m_candidates;

    int m_batchTimeout = 0;
    QList<SsdpSearchParams> m_remaining;
    QList<SsdpSearchParams> m_batch;
    QList<SsdpSearchParams> m_viable;
    int m_verifyIndex = 0;

    SsdpProtocol *m_protocol = nullptr;
    QPointer<SearchResult> m_batchResult;
    QPointer<SsdpSearch> m_verify;

    bool m_started = false;
    bool m_finished = false;
    Ssdp::Error m_error = Ssdp::Error::NoError;
    QString m_errorString;
    SsdpSearchParams m_params;
    SsdpDatagram m_reply;
};
