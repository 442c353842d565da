#pragma once

#include <QHostAddress>
#include <QList>
#include <QPointer>
#include <QString>
#include <QTimer>
#include "SearchResult.h"

struct PendingSearch
{
    QHostAddress address;
    QString st;
    QPointer<SearchResult> result;
    QPointer<QTimer> timeout;

    // stale once its result finished elsewhere or was deleted by its owner
    bool isStale() const { return !result || result->isFinished(); }
};

class PendingSearchRegistry
{
public:
    void add(const PendingSearch &search) { m_searches.append(search); }

    // Removes and returns every live entry the reply answers; stale entries are dropped on the way.
    // The remaining entries keep their relative order.
    QList<PendingSearch> matchAndDrain(const QHostAddress &sender, const QString &replySt);

    void removeStale();

    int size() const { return m_searches.size(); }
    bool isEmpty() const { return m_searches.isEmpty(); }
    const QList<PendingSearch> &entries() const { return m_searches; }

    static bool matches(const PendingSearch &search, const QHostAddress &sender, const QString &replySt);

private:
    QList<PendingSearch> m_searches;
};
