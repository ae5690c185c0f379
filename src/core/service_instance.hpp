#pragma once

#include <QMetaType>
#include <QString>
#include <QStringList>
#include <cstdint>
#include <optional>
#include <vector>

namespace lantern {

/**
 * TxtProperty - One decoded TXT entry. A key without '=' has no value.
 */
struct TxtProperty {
    QString key;
    std::optional<QString> value;

    bool operator==(const TxtProperty& other) const = default;
};

/**
 * ServiceInstance - A resolved DNS-SD service instance.
 *
 * Plain value type: copies of it cross the thread boundary between the
 * discovery engine and the consumer, never references.
 */
struct ServiceInstance {
    QString name;                      // fully-qualified instance name, the unique key
    QString type;                      // e.g. "_http._tcp.local."
    QStringList addresses;             // "address:port", IPv6 bracketed
    uint16_t port = 0;
    std::optional<uint16_t> priority;  // SRV load-balancing hints, when known
    std::optional<uint16_t> weight;
    std::optional<QString> server;     // target host name
    std::vector<TxtProperty> properties;

    [[nodiscard]] const TxtProperty* property(const QString& key) const {
        for (const auto& prop : properties) {
            if (prop.key == key) return &prop;
        }
        return nullptr;
    }

    bool operator==(const ServiceInstance& other) const = default;
};

} // namespace lantern

Q_DECLARE_METATYPE(lantern::ServiceInstance)
