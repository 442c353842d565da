#include "DiscoveryConfig.h"
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QDebug>

static int positiveInt(const QJsonObject &obj, const QString &key, int fallback)
{
    if (!obj.contains(key))
        return fallback;

    int value = obj[key].toInt(0);
    if (value <= 0) {
        qWarning() << "[DiscoveryConfig] Ignoring invalid" << key << obj[key] << "- keeping" << fallback;
        return fallback;
    }
    return value;
}

QJsonObject DiscoveryConfig::toJson() const
{
    QJsonObject obj;
    obj["searchTimeout"] = searchTimeout;
    obj["fuzzyTimeout"] = fuzzyTimeout;
    obj["batchSize"] = batchSize;
    obj["verifyTimeout"] = verifyTimeout;
    obj["bindPort"] = int(bindPort);
    obj["multicastTtl"] = multicastTtl;
    obj["searchTargets"] = QJsonArray::fromStringList(searchTargets);
    return obj;
}

DiscoveryConfig DiscoveryConfig::fromJson(const QJsonObject &obj)
{
    DiscoveryConfig config;
    config.searchTimeout = positiveInt(obj, "searchTimeout", config.searchTimeout);
    config.fuzzyTimeout = positiveInt(obj, "fuzzyTimeout", config.fuzzyTimeout);
    config.batchSize = positiveInt(obj, "batchSize", config.batchSize);
    config.verifyTimeout = positiveInt(obj, "verifyTimeout", config.verifyTimeout);
    config.multicastTtl = positiveInt(obj, "multicastTtl", config.multicastTtl);

    if (obj.contains("bindPort")) {
        int port = obj["bindPort"].toInt(-1);
        if (port < 0 || port > 65535)
            qWarning() << "[DiscoveryConfig] Ignoring invalid bindPort" << obj["bindPort"];
        else
            config.bindPort = static_cast<quint16>(port);
    }

    const QJsonArray targets = obj["searchTargets"].toArray();
    for (const QJsonValue &target : targets) {
        if (target.isString() && !target.toString().isEmpty())
            config.searchTargets.append(target.toString());
    }
    return config;
}

bool DiscoveryConfig::load(const QString &path, DiscoveryConfig *config, QString *errorString)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        if (errorString)
            *errorString = file.errorString();
        return false;
    }

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        if (errorString)
            *errorString = parseError.error != QJsonParseError::NoError ? parseError.errorString()
                                                                       : QStringLiteral("not a JSON object");
        return false;
    }

    *config = fromJson(doc.object());
    return true;
}
