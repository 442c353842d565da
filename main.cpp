#include <QCoreApplication>
#include <QCommandLineParser>
#include <QJsonDocument>
#include <QLoggingCategory>
#include <QNetworkInterface>
#include <QTextStream>
#include <QDebug>

#include "DiscoveryConfig.h"
#include "FuzzySearch.h"
#include "SsdpSearch.h"

static QHostAddress defaultLanAddress()
{
    const auto interfaces = QNetworkInterface::allInterfaces();
    for (const QNetworkInterface &iface : interfaces) {
        if (!(iface.flags() & QNetworkInterface::IsUp) || (iface.flags() & QNetworkInterface::IsLoopBack))
            continue;
        for (const QNetworkAddressEntry &entry : iface.addressEntries()) {
            if (entry.ip().protocol() == QAbstractSocket::IPv4Protocol)
                return entry.ip();
        }
    }
    return QHostAddress();
}

static void printResult(const SsdpSearchParams &params, const SsdpDatagram &reply)
{
    QTextStream out(stdout);
    out << "M-SEARCH: " << QJsonDocument(params.toJson()).toJson(QJsonDocument::Compact) << "\n";
    for (const auto &header : reply.headers())
        out << header.first << ": " << header.second << "\n";
}

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("ssdp-discover");
    QCoreApplication::setApplicationVersion("1.0");

    QCommandLineParser parser;
    parser.setApplicationDescription("Find a UPnP gateway with SSDP M-SEARCH");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption lanOption(QStringList() << "l" << "lan",
                                 "Local address to send from (default: first IPv4 interface)", "address");
    QCommandLineOption gatewayOption(QStringList() << "g" << "gateway", "Gateway address", "address");
    QCommandLineOption stOption(QStringList() << "s" << "st",
                                "Search target; without it every known pattern is tried", "target");
    QCommandLineOption timeoutOption(QStringList() << "t" << "timeout", "Timeout in milliseconds", "ms");
    QCommandLineOption configOption(QStringList() << "c" << "config", "JSON configuration file", "file");
    QCommandLineOption verboseOption(QStringList() << "v" << "verbose", "Log every datagram");
    parser.addOption(lanOption);
    parser.addOption(gatewayOption);
    parser.addOption(stOption);
    parser.addOption(timeoutOption);
    parser.addOption(configOption);
    parser.addOption(verboseOption);
    parser.process(app);

    if (!parser.isSet(verboseOption))
        QLoggingCategory::setFilterRules("*.debug=false");

    DiscoveryConfig config;
    if (parser.isSet(configOption)) {
        QString error;
        if (!DiscoveryConfig::load(parser.value(configOption), &config, &error)) {
            qCritical() << "Failed to load" << parser.value(configOption) << ":" << error;
            return 1;
        }
    }

    QHostAddress gateway(parser.value(gatewayOption));
    if (gateway.isNull()) {
        qCritical() << "Specify --gateway <address>";
        return 1;
    }

    QHostAddress lan = parser.isSet(lanOption) ? QHostAddress(parser.value(lanOption)) : defaultLanAddress();
    if (lan.isNull()) {
        qCritical() << "No usable LAN address, specify --lan <address>";
        return 1;
    }

    int timeout = 0;
    if (parser.isSet(timeoutOption)) {
        bool ok = false;
        timeout = parser.value(timeoutOption).toInt(&ok);
        if (!ok || timeout <= 0) {
            qCritical() << "Invalid --timeout" << parser.value(timeoutOption);
            return 1;
        }
    }

    int exitCode = 1;

    if (parser.isSet(stOption)) {
        SsdpSearchParams params;
        params.append("ST", parser.value(stOption));

        auto search = new SsdpSearch(lan, gateway, params, timeout > 0 ? timeout : config.searchTimeout, &app);
        search->setConfig(config);
        QObject::connect(search, &SsdpSearch::finished, &app, [&app, &exitCode, search]() {
            if (search->error() == Ssdp::Error::NoError) {
                printResult(search->params(), search->reply());
                exitCode = 0;
            } else {
                qCritical().noquote() << search->errorString();
            }
            app.quit();
        });
        search->start();
    } else {
        auto search = new FuzzySearch(lan, gateway, timeout > 0 ? timeout : config.fuzzyTimeout, &app);
        search->setConfig(config);
        QObject::connect(search, &FuzzySearch::finished, &app, [&app, &exitCode, search]() {
            if (search->error() == Ssdp::Error::NoError) {
                printResult(search->params(), search->reply());
                exitCode = 0;
            } else {
                qCritical().noquote() << search->errorString();
            }
            app.quit();
        });
        search->start();
    }

    app.exec();
    return exitCode;
}
