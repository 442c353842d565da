#pragma once

#include <QObject>

namespace Ssdp {
Q_NAMESPACE

enum class Error {
    NoError,
    TransportError,         // bind / multicast join / TTL setup failed
    TimeoutError,           // no matching reply before the timeout fired
    OperationCanceledError, // the caller aborted the search
    InvalidRequestError,    // a parameter set without ST
    DiscoveryFailedError    // no candidate verified during disambiguation
};
Q_ENUM_NS(Error)

constexpr quint16 Port = 1900;
constexpr const char *MulticastAddress = "239.255.255.250";
constexpr const char *RootDevice = "upnp:rootdevice";

}
