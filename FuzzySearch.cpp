#include "FuzzySearch.h"
#include "MulticastTransport.h"
#include "SearchPatterns.h"
#include "SearchResult.h"
#include "SsdpProtocol.h"
#include "SsdpSearch.h"
#include <QTimer>
#include <QDebug>

FuzzySearch::FuzzySearch(const QHostAddress &lanAddress, const QHostAddress &gatewayAddress,
                         int timeoutMsec, QObject *parent)
    : QObject(parent),
      m_lanAddress(lanAddress),
      m_gatewayAddress(gatewayAddress),
      m_timeout(timeoutMsec),
      m_factory(MulticastTransport::factory())
{
}

FuzzySearch::~FuzzySearch()
{
    release();
}

void FuzzySearch::start()
{
    if (m_started)
        return;
    m_started = true;

    m_remaining = m_candidates;
    if (m_remaining.isEmpty()) {
        m_remaining = SearchPatterns::generate(m_config.searchTargets.isEmpty() ? SearchPatterns::defaultTargets()
                                                                                : m_config.searchTargets);
    }
    if (m_remaining.isEmpty()) {
        finishLater(Ssdp::Error::TimeoutError, timeoutMessage());
        return;
    }

    m_batchTimeout = qMax(1, m_timeout / m_remaining.size());
    qDebug() << "[FuzzySearch] Trying" << m_remaining.size() << "M-SEARCH patterns on"
             << m_gatewayAddress.toString() << ", batch timeout" << m_batchTimeout << "ms";

    QString setupError;
    m_protocol = SsdpProtocol::listen(m_factory, m_lanAddress, m_config, this, &setupError);
    if (!m_protocol) {
        qWarning() << "[FuzzySearch]" << setupError;
        finishLater(Ssdp::Error::TransportError, setupError);
        return;
    }

    sendNextBatch();
}

void FuzzySearch::abort()
{
    if (m_finished)
        return;

    if (m_verify) {
        disconnect(m_verify.data(), nullptr, this, nullptr);
        m_verify->abort();
    }
    finish(Ssdp::Error::OperationCanceledError, QStringLiteral("discovery of %1 aborted").arg(m_gatewayAddress.toString()));
}

void FuzzySearch::sendNextBatch()
{
    if (m_remaining.isEmpty()) {
        finish(Ssdp::Error::TimeoutError, timeoutMessage());
        return;
    }

    m_batch = m_remaining.mid(0, qMax(1, m_config.batchSize));
    m_remaining = m_remaining.mid(m_batch.size());

    qDebug() << "[FuzzySearch] Sending batch of" << m_batch.size() << "M-SEARCH attempts";
    m_batchResult = m_protocol->search(m_gatewayAddress, m_batchTimeout, m_batch);
    connect(m_batchResult, &SearchResult::finished, this, &FuzzySearch::onBatchFinished);
}

void FuzzySearch::onBatchFinished()
{
    SearchResult *result = m_batchResult;
    if (!result || m_finished)
        return;
    m_batchResult = nullptr;

    if (result->error() != Ssdp::Error::NoError) {
        if (result->error() == Ssdp::Error::InvalidRequestError)
            qWarning() << "[FuzzySearch] Skipping batch with invalid M-SEARCH parameters";
        result->deleteLater();
        sendNextBatch();
        return;
    }

    qDebug() << "[FuzzySearch] Batch answered by" << m_gatewayAddress.toString() << "with ST" << result->reply().st();
    m_viable = m_batch;
    m_verifyIndex = 0;
    release();
    verifyNextCandidate();
}

void FuzzySearch::verifyNextCandidate()
{
    if (m_verifyIndex >= m_viable.size()) {
        finish(Ssdp::Error::DiscoveryFailedError, QStringLiteral("failed to discover gateway"));
        return;
    }

    const SsdpSearchParams params = m_viable.at(m_verifyIndex++);
    m_verify = new SsdpSearch(m_lanAddress, m_gatewayAddress, params, m_config.verifyTimeout, this);
    m_verify->setConfig(m_config);
    m_verify->setTransportFactory(m_factory);
    connect(m_verify, &SsdpSearch::finished, this, &FuzzySearch::onVerifyFinished);
    m_verify->start();
}

void FuzzySearch::onVerifyFinished()
{
    SsdpSearch *search = m_verify;
    if (!search)
        return;
    m_verify = nullptr;
    search->deleteLater();

    if (search->error() == Ssdp::Error::NoError) {
        m_params = search->params();
        m_reply = search->reply();
        finish(Ssdp::Error::NoError, QString());
        return;
    }

    qDebug() << "[FuzzySearch] Candidate" << search->params().st() << "did not verify:" << search->errorString();
    verifyNextCandidate();
}

void FuzzySearch::finish(Ssdp::Error error, const QString &errorString)
{
    if (m_finished)
        return;

    m_finished = true;
    m_error = error;
    m_errorString = errorString;
    release();

    if (error == Ssdp::Error::NoError)
        qInfo() << "[FuzzySearch] Gateway" << m_gatewayAddress.toString() << "answers ST" << m_params.st();
    else
        qWarning() << "[FuzzySearch]" << errorString;
    emit finished();
}

void FuzzySearch::finishLater(Ssdp::Error error, const QString &errorString)
{
    m_finished = true;
    m_error = error;
    m_errorString = errorString;
    QTimer::singleShot(0, this, [this]() {
        emit finished();
    });
}

void FuzzySearch::release()
{
    if (m_batchResult) {
        disconnect(m_batchResult.data(), nullptr, this, nullptr);
        m_batchResult = nullptr;
    }
    if (!m_protocol)
        return;

    m_protocol->close();
    m_protocol->deleteLater();
    m_protocol = nullptr;
}

QString FuzzySearch::timeoutMessage() const
{
    return QStringLiteral("M-SEARCH for %1:%2 timed out").arg(m_gatewayAddress.toString()).arg(Ssdp::Port);
}
