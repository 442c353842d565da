#pragma once

#include <QByteArray>
#include <QHostAddress>
#include <QList>
#include <QPointer>
#include <QStringList>
#include <QTimer>
#include <functional>

#include "SsdpDatagram.h"
#include "SsdpError.h"
#include "SsdpTransport.h"

class FakeTransport;

// In-memory network shared by every transport a test creates.
// The responder plays the gateway: it sees each request sent to it and returns the replies.
class FakeNetwork : public QObject
{
    Q_OBJECT
public:
    struct Sent {
        QByteArray data;
        QHostAddress address;
        quint16 port;
    };
    using Responder = std::function<QList<QByteArray>(const SsdpDatagram &request)>;

    QList<Sent> sent;
    Responder responder;
    int replyDelay = 0;
    bool failOpen = false;
    bool failJoin = false;
    int lastTtl = -1;

    int created = 0;
    int openTransports = 0;
    int closeCount = 0;
    QList<QPointer<FakeTransport>> transports;

    inline TransportFactory factory();

    QStringList sentTargets() const {
        QStringList targets;
        for (const Sent &s : sent)
            targets.append(SsdpDatagram::fromByteArray(s.data).st());
        return targets;
    }
};

class FakeTransport : public SsdpTransport
{
    Q_OBJECT
public:
    FakeTransport(FakeNetwork *network, QObject *parent)
        : SsdpTransport(parent), m_network(network) {}

    ~FakeTransport() override { close(); }

    bool open(const QHostAddress &lanAddress, quint16) override {
        if (m_network->failOpen) {
            m_errorString = QStringLiteral("The address is not available");
            return false;
        }
        m_local = lanAddress;
        m_open = true;
        ++m_network->openTransports;
        return true;
    }

    bool joinGroup(const QHostAddress &) override {
        if (m_network->failJoin) {
            m_errorString = QStringLiteral("Unable to join multicast group");
            return false;
        }
        return true;
    }

    bool setTtl(int ttl) override {
        m_network->lastTtl = ttl;
        return true;
    }

    qint64 send(const QByteArray &data, const QHostAddress &address, quint16 port) override {
        if (!m_open)
            return -1;
        m_network->sent.append({ data, address, port });

        if (m_network->responder) {
            const QList<QByteArray> replies = m_network->responder(SsdpDatagram::fromByteArray(data));
            for (const QByteArray &reply : replies) {
                QTimer::singleShot(m_network->replyDelay, this, [this, reply, address]() {
                    deliver(reply, address);
                });
            }
        }
        return data.size();
    }

    void close() override {
        if (!m_open)
            return;
        m_open = false;
        --m_network->openTransports;
        ++m_network->closeCount;
    }

    bool isOpen() const override { return m_open; }
    QHostAddress localAddress() const override { return m_local; }
    QString errorString() const override { return m_errorString; }

    void deliver(const QByteArray &data, const QHostAddress &sender, quint16 senderPort = Ssdp::Port) {
        if (m_open)
            emit datagramReceived(data, sender, senderPort);
    }

private:
    FakeNetwork *m_network;
    QHostAddress m_local;
    bool m_open = false;
    QString m_errorString;
};

TransportFactory FakeNetwork::factory()
{
    return [this](QObject *parent) -> SsdpTransport * {
        auto transport = new FakeTransport(this, parent);
        ++created;
        transports.append(transport);
        return transport;
    };
}

inline QByteArray okReply(const QString &st, const QString &location = QStringLiteral("http://192.168.1.1:5000/rootDesc.xml"))
{
    QByteArray reply = "HTTP/1.1 200 OK\r\n"
                       "CACHE-CONTROL: max-age=1800\r\n"
                       "EXT:\r\n";
    reply += "LOCATION: " + location.toUtf8() + "\r\n";
    reply += "SERVER: Linux/3.14 UPnP/1.0 miniupnpd/2.1\r\n";
    reply += "ST: " + st.toUtf8() + "\r\n";
    reply += "USN: uuid:3e1b1f4c-2a8e-4d7b-9b0c-7a1d2f5c6e01::" + st.toUtf8() + "\r\n\r\n";
    return reply;
}
