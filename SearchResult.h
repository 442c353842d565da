#pragma once

#include <QObject>
#include <QList>
#include <QPointer>
#include "SsdpDatagram.h"
#include "SsdpError.h"

class QTimer;

// One-shot result shared by every request of a search.
// The first resolve() or cancel() wins, later calls return false and change nothing.
class SearchResult : public QObject
{
    Q_OBJECT
public:
    explicit SearchResult(QObject *parent = nullptr);

    bool isFinished() const { return m_finished; }
    Ssdp::Error error() const { return m_error; }
    SsdpDatagram reply() const { return m_reply; }

    // Starts a single-shot timer that cancels this result with TimeoutError
    QTimer *startTimeout(int msec);

    bool resolve(const SsdpDatagram &reply);
    bool cancel(Ssdp::Error reason = Ssdp::Error::OperationCanceledError);
    void abort() { cancel(Ssdp::Error::OperationCanceledError); }

    // Marks the result failed now but emits finished() from the event loop
    void failLater(Ssdp::Error reason);

signals:
    void finished();

private:
    bool finish(Ssdp::Error error);
    void stopTimers();

    bool m_finished = false;
    Ssdp::Error m_error = Ssdp::Error::NoError;
    SsdpDatagram m_reply;
    QList<QPointer<QTimer>> m_timers;
};
