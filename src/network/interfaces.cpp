#include "network/interfaces.hpp"

#include <QNetworkInterface>

namespace lantern::network {

QList<InterfaceChoice> list_interface_choices() {
    QList<InterfaceChoice> choices;
    choices.append(InterfaceChoice{QStringLiteral("All interfaces"), QHostAddress{}});

    for (const auto& iface : QNetworkInterface::allInterfaces()) {
        if (!iface.flags().testFlag(QNetworkInterface::IsUp)) continue;

        for (const auto& entry : iface.addressEntries()) {
            const QHostAddress ip = entry.ip();
            if (ip.protocol() != QAbstractSocket::IPv4Protocol) continue;

            choices.append(InterfaceChoice{
                QStringLiteral("%1 (%2)").arg(iface.humanReadableName(), ip.toString()),
                ip});
        }
    }

    return choices;
}

} // namespace lantern::network
