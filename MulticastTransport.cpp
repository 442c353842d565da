#include "MulticastTransport.h"
#include <QUdpSocket>
#include <QNetworkInterface>
#include <QDebug>

MulticastTransport::MulticastTransport(QObject *parent)
    : SsdpTransport(parent), m_socket(new QUdpSocket(this))
{
    connect(m_socket, &QUdpSocket::readyRead, this, &MulticastTransport::handleDatagrams);
}

MulticastTransport::~MulticastTransport()
{
    close();
}

TransportFactory MulticastTransport::factory()
{
    return [](QObject *parent) -> SsdpTransport * {
        return new MulticastTransport(parent);
    };
}

bool MulticastTransport::open(const QHostAddress &lanAddress, quint16 port)
{
    if (!m_socket->bind(lanAddress, port, QUdpSocket::ShareAddress | QUdpSocket::ReuseAddressHint)) {
        m_errorString = m_socket->errorString();
        qWarning() << "[MulticastTransport] Failed to bind" << lanAddress.toString() << ":" << port << m_errorString;
        return false;
    }
    m_lanAddress = lanAddress;
    qDebug() << "[MulticastTransport] Bound to" << lanAddress.toString() << ":" << m_socket->localPort();
    return true;
}

bool MulticastTransport::joinGroup(const QHostAddress &group)
{
    // Join on the interface that owns the LAN address, not on whatever the routing table picks
    QNetworkInterface iface;
    const auto interfaces = QNetworkInterface::allInterfaces();
    for (const QNetworkInterface &candidate : interfaces) {
        for (const QNetworkAddressEntry &entry : candidate.addressEntries()) {
            if (entry.ip() == m_lanAddress) {
                iface = candidate;
                break;
            }
        }
        if (iface.isValid())
            break;
    }

    bool ok = iface.isValid() ? m_socket->joinMulticastGroup(group, iface)
                              : m_socket->joinMulticastGroup(group);
    if (!ok) {
        m_errorString = m_socket->errorString();
        qWarning() << "[MulticastTransport] Failed to join" << group.toString() << m_errorString;
        return false;
    }
    if (iface.isValid())
        m_socket->setMulticastInterface(iface);
    return true;
}

bool MulticastTransport::setTtl(int ttl)
{
    m_socket->setSocketOption(QAbstractSocket::MulticastTtlOption, ttl);
    if (m_socket->socketOption(QAbstractSocket::MulticastTtlOption).toInt() != ttl) {
        m_errorString = QStringLiteral("failed to set multicast TTL to %1").arg(ttl);
        qWarning() << "[MulticastTransport]" << m_errorString;
        return false;
    }
    return true;
}

qint64 MulticastTransport::send(const QByteArray &data, const QHostAddress &address, quint16 port)
{
    qint64 written = m_socket->writeDatagram(data, address, port);
    if (written != data.size()) {
        qWarning() << "[MulticastTransport] Failed to send to" << address.toString() << ":" << port
                   << m_socket->errorString();
    }
    return written;
}

void MulticastTransport::close()
{
    if (m_socket->state() == QAbstractSocket::UnconnectedState)
        return;
    qDebug() << "[MulticastTransport] Closing" << m_lanAddress.toString();
    m_socket->close();
}

bool MulticastTransport::isOpen() const
{
    return m_socket->state() == QAbstractSocket::BoundState;
}

QHostAddress MulticastTransport::localAddress() const
{
    return m_lanAddress;
}

QString MulticastTransport::errorString() const
{
    return m_errorString;
}

void MulticastTransport::handleDatagrams()
{
    while (m_socket->hasPendingDatagrams()) {
        QByteArray buffer;
        buffer.resize(m_socket->pendingDatagramSize());

        QHostAddress sender;
        quint16 senderPort;

        if (m_socket->readDatagram(buffer.data(), buffer.size(), &sender, &senderPort) < 0) {
            qWarning() << "[MulticastTransport] Failed to read datagram:" << m_socket->errorString();
            return;
        }
        emit datagramReceived(buffer, sender, senderPort);

        // a receiver may have closed us from its slot
        if (!isOpen())
            return;
    }
}
