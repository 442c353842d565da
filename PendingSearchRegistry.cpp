#include "PendingSearchRegistry.h"
#include "SsdpError.h"

bool PendingSearchRegistry::matches(const PendingSearch &search, const QHostAddress &sender,
                                    const QString &replySt)
{
    if (!sender.isEqual(search.address, QHostAddress::TolerantConversion))
        return false;
    if (replySt.isNull())
        return false;
    return replySt == search.st || replySt == QLatin1String(Ssdp::RootDevice);
}

QList<PendingSearch> PendingSearchRegistry::matchAndDrain(const QHostAddress &sender, const QString &replySt)
{
    QList<PendingSearch> keep;
    QList<PendingSearch> matched;

    for (const PendingSearch &search : qAsConst(m_searches)) {
        if (matches(search, sender, replySt))
            matched.append(search);
        else if (!search.isStale())
            keep.append(search);
    }

    m_searches = keep;
    return matched;
}

void PendingSearchRegistry::removeStale()
{
    QList<PendingSearch> keep;
    for (const PendingSearch &search : qAsConst(m_searches)) {
        if (!search.isStale())
            keep.append(search);
    }
    m_searches = keep;
}
