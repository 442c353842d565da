#include "SsdpSearch.h"
#include "MulticastTransport.h"
#include "SearchResult.h"
#include "SsdpProtocol.h"
#include <QTimer>
#include <QDebug>

SsdpSearch::SsdpSearch(const QHostAddress &lanAddress, const QHostAddress &gatewayAddress,
                       const SsdpSearchParams &params, int timeoutMsec, QObject *parent)
    : QObject(parent),
      m_lanAddress(lanAddress),
      m_gatewayAddress(gatewayAddress),
      m_params(params),
      m_timeout(timeoutMsec),
      m_factory(MulticastTransport::factory())
{
}

SsdpSearch::~SsdpSearch()
{
    release();
}

void SsdpSearch::start()
{
    if (m_protocol || m_finished)
        return;

    QString setupError;
    m_protocol = SsdpProtocol::listen(m_factory, m_lanAddress, m_config, this, &setupError);
    if (!m_protocol) {
        // report from the event loop so callers connected after start() still see it
        m_finished = true;
        m_error = Ssdp::Error::TransportError;
        m_errorString = setupError;
        qWarning() << "[SsdpSearch]" << setupError;
        QTimer::singleShot(0, this, [this]() {
            emit finished();
        });
        return;
    }

    m_result = m_protocol->search(m_gatewayAddress, m_timeout, { m_params });
    connect(m_result, &SearchResult::finished, this, &SsdpSearch::onResultFinished);
}

void SsdpSearch::abort()
{
    if (m_finished)
        return;
    if (m_result)
        m_result->abort();
    else
        finish(Ssdp::Error::OperationCanceledError,
               QStringLiteral("M-SEARCH for %1:%2 aborted").arg(m_gatewayAddress.toString()).arg(Ssdp::Port));
}

void SsdpSearch::onResultFinished()
{
    switch (m_result->error()) {
    case Ssdp::Error::NoError:
        m_reply = m_result->reply();
        finish(Ssdp::Error::NoError, QString());
        break;
    case Ssdp::Error::TimeoutError:
        finish(Ssdp::Error::TimeoutError,
               QStringLiteral("M-SEARCH for %1:%2 timed out").arg(m_gatewayAddress.toString()).arg(Ssdp::Port));
        break;
    case Ssdp::Error::OperationCanceledError:
        finish(Ssdp::Error::OperationCanceledError,
               QStringLiteral("M-SEARCH for %1:%2 aborted").arg(m_gatewayAddress.toString()).arg(Ssdp::Port));
        break;
    default:
        finish(m_result->error(), QStringLiteral("invalid M-SEARCH parameters for %1").arg(m_gatewayAddress.toString()));
        break;
    }
}

void SsdpSearch::finish(Ssdp::Error error, const QString &errorString)
{
    if (m_finished)
        return;

    m_finished = true;
    m_error = error;
    m_errorString = errorString;
    release();

    if (error == Ssdp::Error::NoError)
        qDebug() << "[SsdpSearch] Gateway" << m_gatewayAddress.toString() << "answered" << m_params.st();
    else
        qDebug() << "[SsdpSearch]" << errorString;
    emit finished();
}

void SsdpSearch::release()
{
    if (!m_protocol)
        return;

    m_protocol->close();
    // may be inside the transport's own readyRead handler
    m_protocol->deleteLater();
    m_protocol = nullptr;
}
