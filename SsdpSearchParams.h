#pragma once

#include <QList>
#include <QPair>
#include <QString>
#include <QJsonArray>

// Ordered header set for one M-SEARCH request
struct SsdpSearchParams
{
    QList<QPair<QString, QString>> headers;

    void append(const QString &name, const QString &value) {
        headers.append(qMakePair(name, value));
    }

    bool contains(const QString &name) const {
        for (const auto &header : headers) {
            if (header.first.compare(name, Qt::CaseInsensitive) == 0)
                return true;
        }
        return false;
    }

    // Null string when the header is absent
    QString value(const QString &name) const {
        for (const auto &header : headers) {
            if (header.first.compare(name, Qt::CaseInsensitive) == 0)
                return header.second;
        }
        return QString();
    }

    QString st() const { return value("st"); }

    bool operator==(const SsdpSearchParams &other) const {
        return headers == other.headers;
    }

    QJsonArray toJson() const {
        QJsonArray arr;
        for (const auto &header : headers)
            arr.append(QJsonArray{ header.first, header.second });
        return arr;
    }
};
