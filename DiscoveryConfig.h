#pragma once

#include <QJsonObject>
#include <QString>
#include <QStringList>

struct DiscoveryConfig
{
    int searchTimeout = 1000;   // ms, single M-SEARCH
    int fuzzyTimeout = 30000;   // ms, whole batch phase
    int batchSize = 2;
    int verifyTimeout = 3000;   // ms, per candidate while disambiguating
    quint16 bindPort = 0;
    int multicastTtl = 1;
    QStringList searchTargets;  // empty means SearchPatterns::defaultTargets()

    QJsonObject toJson() const;
    static DiscoveryConfig fromJson(const QJsonObject &obj);
    static bool load(const QString &path, DiscoveryConfig *config, QString *errorString = nullptr);
};
