#include "SearchResult.h"
#include <QTimer>

SearchResult::SearchResult(QObject *parent)
    : QObject(parent)
{
}

QTimer *SearchResult::startTimeout(int msec)
{
    auto timer = new QTimer(this);
    timer->setSingleShot(true);
    connect(timer, &QTimer::timeout, this, [this]() {
        cancel(Ssdp::Error::TimeoutError);
    });
    m_timers.append(timer);
    timer->start(msec);
    return timer;
}

bool SearchResult::resolve(const SsdpDatagram &reply)
{
    if (m_finished)
        return false;
    m_reply = reply;
    return finish(Ssdp::Error::NoError);
}

bool SearchResult::cancel(Ssdp::Error reason)
{
    if (m_finished)
        return false;
    return finish(reason);
}

void SearchResult::failLater(Ssdp::Error reason)
{
    if (m_finished)
        return;

    m_finished = true;
    m_error = reason;
    stopTimers();
    QTimer::singleShot(0, this, [this]() {
        emit finished();
    });
}

bool SearchResult::finish(Ssdp::Error error)
{
    m_finished = true;
    m_error = error;
    stopTimers();
    emit finished();
    return true;
}

void SearchResult::stopTimers()
{
    for (const auto &timer : qAsConst(m_timers)) {
        if (timer)
            timer->stop();
    }
}
