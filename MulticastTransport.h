#pragma once

#include "SsdpTransport.h"

class QUdpSocket;
class MulticastTransport : public SsdpTransport
{
    Q_OBJECT
public:
    explicit MulticastTransport(QObject *parent = nullptr);
    ~MulticastTransport() override;

    static TransportFactory factory();

    bool open(const QHostAddress &lanAddress, quint16 port = 0) override;
    bool joinGroup(const QHostAddress &group) override;
    bool setTtl(int ttl) override;
    qint64 send(const QByteArray &data, const QHostAddress &address, quint16 port) override;
    void close() override;

    bool isOpen() const override;
    QHostAddress localAddress() const override;
    QString errorString() const override;

private slots:
    void handleDatagrams();

private:
    QUdpSocket *m_socket;
    QHostAddress m_lanAddress;
    QString m_errorString;
};
