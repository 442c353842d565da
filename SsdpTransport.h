#pragma once

#include <QObject>
#include <QHostAddress>
#include <functional>

// Datagram endpoint the SSDP engine talks through
class SsdpTransport : public QObject
{
    Q_OBJECT
public:
    explicit SsdpTransport(QObject *parent = nullptr) : QObject(parent) {}

    virtual bool open(const QHostAddress &lanAddress, quint16 port = 0) = 0;
    virtual bool joinGroup(const QHostAddress &group) = 0;
    virtual bool setTtl(int ttl) = 0;
    virtual qint64 send(const QByteArray &data, const QHostAddress &address, quint16 port) = 0;
    virtual void close() = 0;

    virtual bool isOpen() const = 0;
    virtual QHostAddress localAddress() const = 0;
    virtual QString errorString() const = 0;

signals:
    void datagramReceived(const QByteArray &data, const QHostAddress &sender, quint16 senderPort);
};

using TransportFactory = std::function<SsdpTransport *(QObject *parent)>;
