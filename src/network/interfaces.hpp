#pragma once

#include <QHostAddress>
#include <QList>
#include <QString>

namespace lantern::network {

/**
 * InterfaceChoice - One entry of the interface selector.
 *
 * The first entry is always "All interfaces" with a null address.
 */
struct InterfaceChoice {
    QString label;         // "eth0 (192.168.1.10)"
    QHostAddress address;  // null = all interfaces
};

// "All interfaces" followed by every IPv4 address of every interface that is up.
[[nodiscard]] QList<InterfaceChoice> list_interface_choices();

} // namespace lantern::network
